#ifndef _REGREC_TYPES_HPP_
#define _REGREC_TYPES_HPP_
//---------------------------------------------------------------------------
// Field types & the type-converter table
//
//   The declared semantic type of a field is a closed sum: a primitive
//   tag, a reference to a (registered) token, or a list of some element
//   type. Every primitive has a default pattern, a parser and a formatter.
//---------------------------------------------------------------------------
#include "value.hpp"

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace Regrec {

	enum class Kind {
		BOOLEAN,
		INTEGER,
		FLOAT,
		DECIMAL,
		DATE,
		DATETIME,
		TIME,
		UUID,
		TEXT,
		// Structured:
		TOKEN,  // nested record, by token name
		LIST,   // repeated element
	};

	const char* kind_name(Kind k);

struct FieldType
{
	Kind kind = Kind::TEXT;
	string token;                             // TOKEN only
	std::shared_ptr<const FieldType> element; // LIST only

	FieldType() = default;
	FieldType(Kind k) : kind(k) {} // For the primitives (implicit, for Field("x", Kind::INTEGER))

	static FieldType of_token(string name) { FieldType t(Kind::TOKEN); t.token = std::move(name); return t; }
	static FieldType list_of(FieldType elem) { FieldType t(Kind::LIST); t.element = std::make_shared<const FieldType>(std::move(elem)); return t; }

	bool is_primitive() const { return kind != Kind::TOKEN && kind != Kind::LIST; }
	string name() const; // e.g. "list<token Date>"
};

	// Shorthands for the field declarations
	inline FieldType Token(string name) { return FieldType::of_token(std::move(name)); }
	inline FieldType ListOf(FieldType elem) { return FieldType::list_of(std::move(elem)); }


//---------------------------------------------------------------------------
struct Converter
{
	string pattern;                                       // default pattern (std::regex ECMAScript)
	std::function<Value(string_view)> parse;             // throws std::invalid_argument/out_of_range on bad input
	std::function<string(const Value&)> format;           // canonical text (matched by `pattern`)
};

	void init(); // Sets up the converter table; called implicitly by converter(), but can be called upfront.

	// Primitive kinds only! (ERROR() for TOKEN and LIST)
	const Converter& converter(Kind k);

} // namespace Regrec

#endif // _REGREC_TYPES_HPP_
