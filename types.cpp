#include "types.hpp"
#include "internal.hpp"

#include <cctype>
#include <charconv>
#include <chrono>
#include <mutex>
#include <unordered_map>

namespace Regrec {

const char* kind_name(Kind k)
{
	switch (k) {
	case Kind::BOOLEAN:  return "boolean";
	case Kind::INTEGER:  return "integer";
	case Kind::FLOAT:    return "float";
	case Kind::DECIMAL:  return "decimal";
	case Kind::DATE:     return "date";
	case Kind::DATETIME: return "datetime";
	case Kind::TIME:     return "time";
	case Kind::UUID:     return "uuid";
	case Kind::TEXT:     return "text";
	case Kind::TOKEN:    return "token";
	case Kind::LIST:     return "list";
	default:
		return "!!BUG: MISSING NAME FOR Kind!!";
	}
}

string FieldType::name() const
{
	if (kind == Kind::TOKEN) return format("token {}", token);
	if (kind == Kind::LIST)  return format("list<{}>", element ? element->name() : "?");
	return kind_name(kind);
}


//---------------------------------------------------------------------------
// Parsing helpers... They all throw (std::invalid_argument or std::out_of_range),
// and let the reconstructor translate that to ReconstructionError.
//---------------------------------------------------------------------------
namespace {

string_view unsigned_part(string_view s, OUT bool& negative)
{
	negative = false;
	if (!s.empty() && (s[0] == '+' || s[0] == '-')) {
		negative = s[0] == '-';
		s.remove_prefix(1);
	}
	return s;
}

int digits(string_view s, size_t pos, size_t n)
{
	if (pos + n > s.size()) throw std::invalid_argument(format("'{}' is too short", s));
	int x = 0;
	for (size_t i = pos; i < pos + n; ++i) {
		if (!std::isdigit((unsigned char)s[i])) throw std::invalid_argument(format("'{}': digit expected at {}", s, i));
		x = x * 10 + (s[i] - '0');
	}
	return x;
}

void expect(string_view s, size_t pos, char c)
{
	if (pos >= s.size() || s[pos] != c) throw std::invalid_argument(format("'{}': '{}' expected at {}", s, c, pos));
}

Date parse_date(string_view s)
{
	if (s.size() != 10) throw std::invalid_argument(format("'{}' is not a YYYY-MM-DD date", s));
	Date d{digits(s, 0, 4), (expect(s, 4, '-'), digits(s, 5, 2)), (expect(s, 7, '-'), digits(s, 8, 2))};
	using namespace std::chrono;
	if (!year_month_day{year{d.year}, month{unsigned(d.month)}, day{unsigned(d.day)}}.ok()) {
		throw std::out_of_range(format("'{}' is not a valid calendar date", s));
	}
	return d;
}

Time parse_time(string_view s)
{
	CONST FRACTION_DIGITS = 6u; // Microseconds
	if (s.size() < 8) throw std::invalid_argument(format("'{}' is not a HH:MM:SS time", s));
	Time t{digits(s, 0, 2), (expect(s, 2, ':'), digits(s, 3, 2)), (expect(s, 5, ':'), digits(s, 6, 2)), 0};
	if (s.size() > 8) {
		expect(s, 8, '.');
		auto frac = s.substr(9);
		if (frac.empty() || frac.size() > FRACTION_DIGITS) throw std::invalid_argument(format("'{}': bad fraction of seconds", s));
		t.microsecond = digits(frac, 0, frac.size());
		for (auto n = frac.size(); n < FRACTION_DIGITS; ++n) t.microsecond *= 10;
	}
	if (t.hour > 23 || t.minute > 59 || t.second > 59) {
		throw std::out_of_range(format("'{}' is not a valid time of day", s));
	}
	return t;
}

int hexdigit(char c)
{
	if (c >= '0' && c <= '9') return c - '0';
	if (c >= 'a' && c <= 'f') return c - 'a' + 10;
	if (c >= 'A' && c <= 'F') return c - 'A' + 10;
	throw std::invalid_argument(format("'{}' is not a hex digit", c));
}

} // namespace


//---------------------------------------------------------------------------
using CONVERTER_MAP = std::unordered_map<Kind, Converter>;
static CONVERTER_MAP CONVERTERS; //!! Alas, no constexpr init for dynamic containers... See init()!

void init()
{
	static std::once_flag initialized;
	std::call_once(initialized, [] {

	auto plain = [](const Value& v) { return to_text(v); };

	// Patterns for std::regex ECMAScript: no (?i:...) there, hence the [Tt]... for booleans.
#define CONVERTER(kind, rx, ...) CONVERTERS[kind] = Converter{rx, __VA_ARGS__, plain} // (The lambdas have commas of their own)
	CONVERTER(Kind::BOOLEAN, R"([Tt][Rr][Uu][Ee]|[Ff][Aa][Ll][Ss][Ee]|1|0)",
		[](string_view s) -> Value {
			string low;
			for (auto c : s) low += (char)std::tolower((unsigned char)c);
			if (low == "true"  || low == "1") return true;
			if (low == "false" || low == "0") return false;
			throw std::invalid_argument(format("'{}' is not a boolean", s));
		});

	CONVERTER(Kind::INTEGER, R"([-+]?\d+)",
		[](string_view s) -> Value {
			if (!s.empty() && s[0] == '+') s.remove_prefix(1);
			std::int64_t n = 0;
			auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
			if (ec == std::errc::result_out_of_range) throw std::out_of_range(format("'{}' does not fit in 64 bits", s));
			if (ec != std::errc() || end != s.data() + s.size()) throw std::invalid_argument(format("'{}' is not an integer", s));
			return n;
		});

	CONVERTER(Kind::FLOAT, R"([-+]?(?:\d+(?:\.\d*)?|\.\d+)(?:[eE][-+]?\d+)?)",
		[](string_view s) -> Value {
			if (!s.empty() && s[0] == '+') s.remove_prefix(1);
			double d = 0;
			auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), d);
			if (ec == std::errc::result_out_of_range) throw std::out_of_range(format("'{}' is out of range", s));
			if (ec != std::errc() || end != s.data() + s.size()) throw std::invalid_argument(format("'{}' is not a number", s));
			return d;
		});

	CONVERTER(Kind::DECIMAL, R"([-+]?(?:\d+(?:\.\d*)?|\.\d+))",
		[](string_view s) -> Value {
			bool negative;
			auto u = unsigned_part(s, negative);
			if (u.empty() || u.find_first_not_of("0123456789.") != u.npos || u.find('.') != u.rfind('.')) {
				throw std::invalid_argument(format("'{}' is not a decimal", s));
			}
			return Decimal{(negative ? "-" : "") + string(u)};
		});

	CONVERTER(Kind::DATE, R"(\d{4}-\d{2}-\d{2})",
		[](string_view s) -> Value { return parse_date(s); });

	CONVERTER(Kind::DATETIME, R"(\d{4}-\d{2}-\d{2}[ T]\d{2}:\d{2}:\d{2}(?:\.\d{1,6})?)",
		[](string_view s) -> Value {
			if (s.size() < 19 || (s[10] != ' ' && s[10] != 'T')) {
				throw std::invalid_argument(format("'{}' is not a date-time", s));
			}
			return DateTime{parse_date(s.substr(0, 10)), parse_time(s.substr(11))};
		});

	CONVERTER(Kind::TIME, R"(\d{2}:\d{2}:\d{2}(?:\.\d{1,6})?)",
		[](string_view s) -> Value { return parse_time(s); });

	CONVERTER(Kind::UUID, R"([0-9a-fA-F]{8}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{4}-[0-9a-fA-F]{12})",
		[](string_view s) -> Value {
			Uuid u;
			size_t n = 0;
			for (size_t i = 0; i < s.size(); ++i) {
				if (s[i] == '-' && (i == 8 || i == 13 || i == 18 || i == 23)) continue;
				if (n >= 32) throw std::invalid_argument(format("'{}' is too long for a UUID", s));
				int x = hexdigit(s[i]);
				u.bytes[n / 2] = std::uint8_t(n % 2 ? (u.bytes[n / 2] | x) : (x << 4));
				++n;
			}
			if (n != 32) throw std::invalid_argument(format("'{}' is not a UUID", s));
			return u;
		});

	CONVERTER(Kind::TEXT, R"(.+?)",
		[](string_view s) -> Value { return string(s); });
#undef CONVERTER

DBG("+++ Converter table init done ({} types). +++", CONVERTERS.size());
	});
}

const Converter& converter(Kind k)
{
	init();
	if (auto it = CONVERTERS.find(k); it != CONVERTERS.end()) {
		return it->second;
	}
	ERROR("No converter for {} (not a primitive type)", kind_name(k));
}

} // namespace Regrec
