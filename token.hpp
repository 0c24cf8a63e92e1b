#ifndef _REGREC_TOKEN_HPP_
#define _REGREC_TOKEN_HPP_
//---------------------------------------------------------------------------
// Token & field definitions (the input of Registry::define())
//---------------------------------------------------------------------------
#include "types.hpp"
#include "value.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Regrec {

// List-repeat configuration of a LIST field
struct Repeat
{
	string separator = R"(\s*,\s*)";
	bool required = false; // If true, the list segment can't match empty (needs an item, or the `empty` literal)
	string empty;          // Optional literal pattern standing for "no items" (e.g. "TBD")
};

struct FieldDef
{
	string name;
	FieldType type;
	std::optional<string> pattern; // Explicit override; else the type's default
	bool optional = false;         // May be absent (-> None) from a match
	std::optional<Repeat> repeat;  // LIST only (defaults to Repeat{} if unset)
	std::optional<Value> fallback; // Used (instead of None) when absent

	//-----------------------------------------------------------
	// Fluent painkillers, e.g.:
	//   Field("year", Kind::INTEGER, R"(\d{4})")
	//   Field("delivered_at", Kind::DATETIME).maybe()
	FieldDef& maybe() { optional = true; return *this; }
	FieldDef& otherwise(Value v) { fallback = std::move(v); return *this; }
	FieldDef& repeated(Repeat r) { repeat = std::move(r); return *this; }
};

	inline FieldDef Field(string name, FieldType type = Kind::TEXT) {
		return FieldDef{std::move(name), std::move(type)};
	}
	inline FieldDef Field(string name, FieldType type, string pattern) {
		auto f = Field(std::move(name), std::move(type));
		f.pattern = std::move(pattern);
		return f;
	}

	using ALIAS_MAP = std::map<string, string, std::less<>>;

struct TokenDef
{
	string name;                 // Case-sensitive; unique per registry
	string pattern;              // The template; may be empty for single-field tokens (-> "<field>")
	std::vector<FieldDef> fields;
	string supertype;            // Empty if none
	ALIAS_MAP aliases;           // Token-level aliases (override the registry-level ones)

	// After registration: the resolved (inherited + own) fields
	const FieldDef* field(string_view field_name) const {
		for (auto& f : fields) if (f.name == field_name) return &f;
		return nullptr;
	}
};

} // namespace Regrec

#endif // _REGREC_TOKEN_HPP_
