//---------------------------------------------------------------------------
// regrec-demo PATTERN TEXT
//
//   Matches TEXT with PATTERN (anchored at the start), using a few showcase
//   tokens (DATE, To, Period, Pair & its subtypes, Delivery, Schedule), and
//   prints every record occurrence of the pattern.
//
//   E.g.: regrec-demo "<DATE> <To> <DATE>" "2025-12-29 to 2026/01/01"
//---------------------------------------------------------------------------
#include "regrec.hpp"
#include "internal.hpp"

#include <cstdlib>
#include <iostream>
	using std::cout, std::cerr;

using namespace Regrec;

void define_showcase(Registry& r)
{
	r.define({"DATE", R"(<year>-<month>-<date>|<year>/<month>/<date>)", {
		Field("year",  Kind::INTEGER, R"(\d{4})"),
		Field("month", Kind::INTEGER, R"(\d{2})"),
		Field("date",  Kind::INTEGER, R"(\d{2})"),
	}});
	r.define({"To", "", {Field("direction", Kind::TEXT, "to|down to")}});
	r.define({"Period", R"(<from_date>\s+<To>\s+<to_date>)", {
		Field("from_date", Token("DATE")),
		Field("to_date",   Token("DATE")),
	}});

	r.define({"Pair", "<x>, <y>", {Field("x", Kind::INTEGER), Field("y", Kind::INTEGER)}});
	r.define({"Coordinate", "x=<x>, y=<y>", {}, "Pair"});
	r.define({"Point3D", "<Coordinate>, z=<z>", {Field("z", Kind::INTEGER)}, "Coordinate"});
	r.define({"Complex", R"(<x> \+ <y>i)", {}, "Pair"});

	r.define({"Delivery", R"(order <order_id> shipped <shipped_at>(?: delivered <delivered_at>)?)", {
		Field("order_id", Kind::INTEGER),
		Field("shipped_at", Kind::DATETIME),
		Field("delivered_at", Kind::DATETIME).maybe(),
	}});

	r.define({"Schedule", R"(<subject>(?:\s+dates\s*=\s*\[<dates>\])?$)", {
		Field("subject"),
		Field("dates", ListOf(Token("DATE"))).maybe(),
	}});
}

//===========================================================================
int main(int argc, char** argv)
//===========================================================================
{
	if (argc < 3) {
		cerr << "Usage: " << argv[0] << " PATTERN TEXT\n";
		return 1;
	}

	try {
		auto& registry = default_registry();
		define_showcase(registry);

		auto rx = registry.compile(argv[1]);
		cout << "Pattern:  " << rx->pattern() << "\n";

		auto m = rx->match(argv[2]);
		if (!m) {
			cout << "No match.\n";
			return 2;
		}
		cout << format("Matched:  \"{}\"\n", m->str());

		for (size_t n = 1; n <= rx->groups(); ++n) {
			cout << format("  ${} = {}\n", n, m->matched(n) ? "\"" + m->group(n) + "\"" : "None"s);
		}
		for (auto& name : registry.names()) {
			for (size_t i = 1; i <= rx->occurrences(name); ++i) {
				cout << format("  {} #{}: {}\n", name, i, to_string(m->get(name, i)));
			}
		}
	}
	catch(Regrec::Error& x)
	{
		cerr << x.what() << "\n";
		exit(-1);
	}
	catch(std::exception& x)
	{
		cerr << "- C++ runtime error: " << x.what() << "\n";
		exit(-2);
	}
}
