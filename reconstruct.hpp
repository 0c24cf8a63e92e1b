#ifndef _REGREC_RECONSTRUCT_HPP_
#define _REGREC_RECONSTRUCT_HPP_
//---------------------------------------------------------------------------
// Typed reconstruction: (match, Group-Map node) -> Value
//---------------------------------------------------------------------------
#include "groupmap.hpp"
#include "value.hpp"

namespace Regrec {

	// Did the node take part in the match `m`? (For POLY: any of its alternatives.)
	bool participated(const GroupMap& node, const MATCH& m);

	// None if the node didn't participate; otherwise the value of the field
	// (FIELD, CONSTANT, LIST) or the Record (RECORD, POLY -- the latter
	// yielding the most specific matched subtype).
	// Throws ReconstructionError if a captured text is rejected by its
	// type's parser, or a required field is missing from the match.
	Value reconstruct(const GroupMap& node, const MATCH& m);

} // namespace Regrec

#endif // _REGREC_RECONSTRUCT_HPP_
