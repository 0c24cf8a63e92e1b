#ifndef _REGREC_VALUE_HPP_
#define _REGREC_VALUE_HPP_
//---------------------------------------------------------------------------
// Reconstructed values
//
//   A Value is either None (absent: e.g. a field in an optional segment
//   that did not participate), one of the scalar types of the converter
//   table, a Record, or a List. There's no "untyped" case.
//---------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace Regrec {

	using std::string;
	using std::string_view;

//---------------------------------------------------------------------------
// Scalar carriers...

// Kept as written (sign normalized), so "12.50" stays "12.50".
//!! No arithmetics; convert with to_double() if you need the number.
struct Decimal
{
	string text;

	double to_double() const;
	bool operator==(const Decimal&) const = default;
};

struct Date
{
	int year = 1970, month = 1, day = 1;
	bool operator==(const Date&) const = default;
};

struct Time
{
	int hour = 0, minute = 0, second = 0;
	int microsecond = 0;
	bool operator==(const Time&) const = default;
};

struct DateTime
{
	Regrec::Date date;
	Regrec::Time time;
	bool operator==(const DateTime&) const = default;
};

struct Uuid
{
	std::array<std::uint8_t, 16> bytes{};
	bool operator==(const Uuid&) const = default;
};


//---------------------------------------------------------------------------
class Value;
using List = std::vector<Value>;

// One reconstructed record instance. `type` is the token name of the
// most specific matched record type (see polymorphic tokens).
struct Record
{
	string type;
	std::vector<string> names; // field names, in definition order
	List values;               // parallel to `names`

	bool has(string_view field) const;
	const Value& operator[](string_view field) const; // throws std::out_of_range for unknown fields
	void set(string field, Value value);

	template <class T> const T& get(string_view field) const;
	bool is_none(string_view field) const;

	bool operator==(const Record& other) const;
};


//---------------------------------------------------------------------------
class Value
{
public:
	using Data = std::variant<std::monostate, bool, std::int64_t, double,
	                          Decimal, Date, DateTime, Time, Uuid, string,
	                          Record, List>;

	Value() = default; // None
	Value(bool b) : _data(b) {}
	template <class T> requires (std::is_integral_v<T> && !std::is_same_v<T, bool>)
	Value(T n) : _data(std::int64_t(n)) {}
	Value(double d) : _data(d) {}
	Value(const char* s) : _data(string(s)) {} // Not bool, thank you!
	Value(string s) : _data(std::move(s)) {}
	Value(Decimal d) : _data(std::move(d)) {}
	Value(Date d) : _data(d) {}
	Value(DateTime dt) : _data(dt) {}
	Value(Time t) : _data(t) {}
	Value(Uuid u) : _data(u) {}
	Value(Record r) : _data(std::move(r)) {}
	Value(List l) : _data(std::move(l)) {}

	bool is_none() const { return std::holds_alternative<std::monostate>(_data); }
	explicit operator bool() const { return !is_none(); } // Not the bool *value*!

	template <class T> bool is() const { return std::holds_alternative<T>(_data); }
	template <class T> const T& as() const { return std::get<T>(_data); } // throws std::bad_variant_access

	const Data& data() const { return _data; }

	bool operator==(const Value& other) const;

private:
	Data _data;
};

// Canonical text of a scalar (what the type's pattern would match), e.g.
// "2025-12-29" for a Date; records and lists are rendered as by to_string().
string to_text(const Value& v);

// Diagnostic rendering, e.g. Date(year=2025, month=12, date=29)
//! Inside the namespace, always call std::to_string() qualified, or this
//! one wins for ints, too (via Value's implicit ctor)!
string to_string(const Value& v);


//---------------------------------------------------------------------------
template <class T> const T& Record::get(string_view field) const
{
	return (*this)[field].template as<T>();
}

} // namespace Regrec

#endif // _REGREC_VALUE_HPP_
