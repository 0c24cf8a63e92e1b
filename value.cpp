#include "value.hpp"
#include "internal.hpp"

#include <charconv>
#include <stdexcept>

namespace Regrec {

//---------------------------------------------------------------------------
double Decimal::to_double() const
{
	string_view s = text;
	if (!s.empty() && s[0] == '+') s.remove_prefix(1);
	double d = 0;
	auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), d);
	if (ec != std::errc() || end != s.data() + s.size()) {
		ERROR("Decimal '{}' is not a number", text);
	}
	return d;
}


//---------------------------------------------------------------------------
bool Record::has(string_view field) const
{
	for (auto& n : names) if (n == field) return true;
	return false;
}

const Value& Record::operator[](string_view field) const
{
	for (size_t i = 0; i < names.size(); ++i) {
		if (names[i] == field) return values[i];
	}
	throw std::out_of_range(format("- ERROR: {} has no field '{}'", type, field));
}

void Record::set(string field, Value value)
{
	for (size_t i = 0; i < names.size(); ++i) {
		if (names[i] == field) { values[i] = std::move(value); return; }
	}
	names.push_back(std::move(field));
	values.push_back(std::move(value));
}

bool Record::is_none(string_view field) const
{
	return (*this)[field].is_none();
}

bool Record::operator==(const Record& other) const
{
	return type == other.type && names == other.names && values == other.values;
}

bool Value::operator==(const Value& other) const
{
	return _data == other._data;
}


//---------------------------------------------------------------------------
static string time_text(const Time& t)
{
	auto s = format("{:02}:{:02}:{:02}", t.hour, t.minute, t.second);
	if (t.microsecond) s += format(".{:06}", t.microsecond);
	return s;
}

string to_text(const Value& v)
{
	const auto& d = v.data();
	switch (d.index()) {
	case 0: return "";
	case 1: return std::get<bool>(d) ? "true" : "false";
	case 2: return std::to_string(std::get<std::int64_t>(d));
	case 3: return format("{}", std::get<double>(d)); // shortest round-trip form
	case 4: return std::get<Decimal>(d).text;
	case 5: { auto& x = std::get<Date>(d);
		return format("{:04}-{:02}-{:02}", x.year, x.month, x.day); }
	case 6: { auto& x = std::get<DateTime>(d);
		return to_text(x.date) + " " + time_text(x.time); }
	case 7: return time_text(std::get<Time>(d));
	case 8: {
		auto& b = std::get<Uuid>(d).bytes;
		string s;
		for (size_t i = 0; i < b.size(); ++i) {
			if (i == 4 || i == 6 || i == 8 || i == 10) s += '-';
			s += format("{:02x}", b[i]);
		}
		return s;
	}
	case 9: return std::get<string>(d);
	default:
		return to_string(v);
	}
}

string to_string(const Value& v)
{
	if (v.is_none()) return "None";
	if (v.is<string>()) return format("'{}'", v.as<string>());
	if (v.is<List>()) {
		string s = "[";
		for (auto& item : v.as<List>()) {
			if (s.size() > 1) s += ", ";
			s += to_string(item);
		}
		return s + "]";
	}
	if (v.is<Record>()) {
		auto& r = v.as<Record>();
		string s = r.type + "(";
		for (size_t i = 0; i < r.names.size(); ++i) {
			if (i) s += ", ";
			s += r.names[i] + "=" + to_string(r.values[i]);
		}
		return s + ")";
	}
	return to_text(v);
}

} // namespace Regrec
