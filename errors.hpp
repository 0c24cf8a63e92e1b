#ifndef _REGREC_ERRORS_HPP_
#define _REGREC_ERRORS_HPP_

#include <stdexcept>

namespace Regrec {

// Base of everything thrown by the library on purpose.
// (std::regex_error is never let through: see TemplateSyntaxError.)
struct Error : std::runtime_error { using std::runtime_error::runtime_error; };

//---------------------------------------------------------------------------
// Registration-time (raised by Registry::define(), never deferred)
struct DuplicateToken      : Error { using Error::Error; };
struct MissingFieldPattern : Error { using Error::Error; };
struct InvalidSubtypeLink  : Error { using Error::Error; };
struct UnknownToken        : Error { using Error::Error; }; // Registry::lookup()

//---------------------------------------------------------------------------
// Compile-time
struct TemplateSyntaxError : Error { using Error::Error; }; // also: invalid resulting regex
struct CompileCycleError   : Error { using Error::Error; };

//---------------------------------------------------------------------------
// Reconstruction-time
struct ReconstructionError : Error { using Error::Error; };
struct UnknownOccurrence   : Error { using Error::Error; };

} // namespace Regrec

#endif // _REGREC_ERRORS_HPP_
