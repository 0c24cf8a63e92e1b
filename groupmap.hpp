#ifndef _REGREC_GROUPMAP_HPP_
#define _REGREC_GROUPMAP_HPP_
//---------------------------------------------------------------------------
// Group-Map: the compile-time record of how each expanded unit (field,
// constant, list, token occurrence) maps onto the capture groups of the
// expanded pattern. Built by the Compiler, read by the reconstructor.
//
// Group numbers are the absolute ordinals of the regex program the node
// belongs to: the main pattern, or, for list items, the re-scan program of
// the list (see ListScan).
//---------------------------------------------------------------------------
#include "token.hpp"
#include "value.hpp"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace Regrec {

	using REGEX = std::regex; //! Changing it (e.g. to PCRE2) would need a light adapter for smatch & co.
	using MATCH = std::smatch;

struct ListScan;

struct GroupMap
{
	enum Type {
		FIELD,    // `group` captures the field's text
		CONSTANT, // `value` is the converted literal; `marker` (if nonzero) tells if its branch matched
		LIST,     // `marker`: presence; `group`: the whole segment; `scan`: the re-scan program
		RECORD,   // `group`: zero-width marker opening the token (matched iff the token took part)
		POLY,     // `children`: the alternative RECORDs, in alternation order
	} type = FIELD;

	const FieldDef* field = nullptr; // The field bound to this node (nullptr for an unbound token occurrence)
	const TokenDef* token = nullptr; // RECORD: the record type; POLY: the base type

	size_t group = 0;
	size_t marker = 0;

	string literal; // CONSTANT: the assigned text (unescaped), for diagnostics
	Value value;    // CONSTANT: converted (None if the literal didn't match the field's pattern)

	std::vector<GroupMap> children;        // RECORD: bindings (in emission order); POLY: alternatives
	std::shared_ptr<const ListScan> scan;  // LIST

	std::vector<string> ancestry; // RECORD: token name, then its supertypes up to the root
	size_t ordinal = 0;           // RECORD/POLY: 1-based occurrence number among its own class (0: not indexed, e.g. list items)

	bool is_a(string_view class_name) const {
		for (auto& a : ancestry) if (a == class_name) return true;
		return false;
	}
};

// Re-scanning a matched list segment, item by item:
//   program = ITEM (?: SEP ( ITEM (?: SEP ITEM )* ) )?
// fully matched against the remaining text; `item` is the Group-Map of the
// first ITEM, `rest` is the group of everything after the first separator.
struct ListScan
{
	REGEX program;
	size_t rest = 0;
	GroupMap item;
	FieldDef element; // Synthetic field for primitive items (the item GroupMap points here)
	std::optional<REGEX> empty; // The "no items" literal, if any
	string source;              // The program text, for diagnostics
};

} // namespace Regrec

#endif // _REGREC_GROUPMAP_HPP_
