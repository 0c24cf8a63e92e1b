#ifndef _REGREC_INTERNAL_HPP_
#define _REGREC_INTERNAL_HPP_
//---------------------------------------------------------------------------
// The ad-hoc "ground-levelling" language layer of the implementation...
//
// Only for the .cpp files (and the tests)! The public headers must not
// depend on these (short, unprefixed) macros, as they would leak into the
// client code (and e.g. ERROR conflicts with the Windows headers).
//---------------------------------------------------------------------------
#include <format>
	using std::format;
#include <stdexcept>
#include <string>
	using std::string;
	using namespace std::literals::string_literals;
#include <string_view>
	using std::string_view;
#ifndef NDEBUG
#include <iostream>
	using std::cerr, std::endl;
#endif

#define CONST constexpr static auto
#define OUT

//! For variadic macros, e.g. for calling std::format(...):
//!
//! The old MSVC preproc. suppresses the extra ',' when no more args... But, it
//! doesn't understand __VA_OPT__, so the std. c++20 way of
//! __VA_OPT__(,) __VA_ARGS__ can't be unified.
#if defined(__GNUC__) \
	|| defined(_MSC_VER) && (!defined(_MSVC_TRADITIONAL) || !_MSVC_TRADITIONAL)
#  define _Sz_CONFORMANT_PREPROCESSOR 1
#elif defined(_MSC_VER) && defined(_MSVC_TRADITIONAL) && _MSVC_TRADITIONAL // Old MS prep.
#  define _Sz_OLD_MSVC_PREPROCESSOR 1
#endif

#ifndef NDEBUG
#  if defined(_Sz_CONFORMANT_PREPROCESSOR)
#    define DBG(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg __VA_OPT__(,) __VA_ARGS__)) << std::endl
     // Same as DBG(), but with no trailing \n (for continuation lines)
#    define DBG_(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg __VA_OPT__(,) __VA_ARGS__))
     // Continuation lines -- same as DBG(), but without the DBG prefix
#    define _DBG(msg, ...) std::cerr << std::format(msg __VA_OPT__(,) __VA_ARGS__) << std::endl
#  elif defined(_Sz_OLD_MSVC_PREPROCESSOR)
#    define DBG(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg, __VA_ARGS__)) << std::endl
#    define DBG_(msg, ...) std::cerr << std::format("DBG> {}", std::format(msg, __VA_ARGS__))
#    define _DBG(msg, ...) std::cerr << std::format(msg, __VA_ARGS__) << std::endl
#  else
#    error Unsupported compiler toolset (not MSVC or GCC/CLANG)!
#  endif

#  define DBG_DEFAULT_TRIM_LEN 40
   // Trim length is ignored as yet, just using the default:
#  define DBG_TRIM(str, ...) (std::string_view(str).length() > DBG_DEFAULT_TRIM_LEN - 3 ? \
		(std::string(std::string_view(str).substr(0, DBG_DEFAULT_TRIM_LEN - 3))) + "..." : \
		std::string(str))
#else
#  define DBG(msg, ...)
#  define DBG_(msg, ...)
#  define _DBG(msg, ...)
#  define DBG_TRIM(str, ...) std::string(str)
#endif


// Note: ERROR() and RAISE() below are _not_ debug features!
// ERROR() is for broken internal invariants, RAISE() for the typed errors
// of errors.hpp that the callers are expected to catch.
#if defined(_Sz_CONFORMANT_PREPROCESSOR)
#  define ERROR(msg, ...) throw std::runtime_error(std::format("- ERROR: {}", std::format(msg __VA_OPT__(,) __VA_ARGS__)))
#  define RAISE(Type, msg, ...) throw Type(std::format("- ERROR: {}", std::format(msg __VA_OPT__(,) __VA_ARGS__)))
#elif defined(_Sz_OLD_MSVC_PREPROCESSOR)
#  define ERROR(msg, ...) throw std::runtime_error(std::format("- ERROR: {}", std::format(msg, __VA_ARGS__)))
#  define RAISE(Type, msg, ...) throw Type(std::format("- ERROR: {}", std::format(msg, __VA_ARGS__)))
#else
#  error Unsupported compiler toolset (not MSVC or GCC/CLANG)!
#endif

#endif // _REGREC_INTERNAL_HPP_
