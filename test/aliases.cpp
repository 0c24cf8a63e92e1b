#include "../regrec.hpp"

//---------------------------------------------------------------------------
// TEST CASES
//---------------------------------------------------------------------------
#include "./fw/doctest-setup.hpp"

using namespace Regrec;

static void define_ranges(Registry& r)
{
	r.alias("bound", "(?:min <min>|max <max>)");
	r.define({"TemperatureRange", "temperature <bound>", {
		Field("min", Kind::FLOAT).maybe(),
		Field("max", Kind::FLOAT).maybe(),
	}});
	r.define({"SpeedRange", "speed <bound>(?: <bound>)?", {
		Field("min", Kind::FLOAT).maybe(),
		Field("max", Kind::FLOAT).maybe(),
	}});
}

CASE("aliases: registry-level alias, expanded with the token's fields") {
	Registry r;
	define_ranges(r);

	auto t = r.construct("TemperatureRange", "temperature min 10");
	REQUIRE(t.is<Record>());
	CHECK(t.as<Record>()["min"] == 10.0);
	CHECK(t.as<Record>()["max"].is_none());

	auto s = r.construct("SpeedRange", "speed max 120.5 min 40.0");
	REQUIRE(s.is<Record>());
	CHECK(s.as<Record>()["min"] == 40.0);
	CHECK(s.as<Record>()["max"] == 120.5);
}

CASE("aliases: token-level alias") {
	Registry r;
	TokenDef budget{"BudgetRange", "budget <range>", {Field("min", Kind::INTEGER), Field("max", Kind::INTEGER)}};
	budget.aliases["range"] = "from <min> to <max>";
	r.define(budget);

	auto v = r.construct("BudgetRange", "budget from 100 to 250");
	REQUIRE(v.is<Record>());
	CHECK(to_string(v) == "BudgetRange(min=100, max=250)");

	// Not visible outside the token
	CHECK(r.compile("<range>")->pattern() == "<range>");
}

CASE("aliases: same alias name, different tokens") {
	Registry r;
	TokenDef color{"Color", R"(rgb\(<pair>, <b>\))", {
		Field("r", Kind::INTEGER), Field("g", Kind::INTEGER), Field("b", Kind::INTEGER)}};
	color.aliases["pair"] = "<r>, <g>";
	TokenDef address{"Address", "<pair>", {
		Field("number", Kind::INTEGER), Field("street", Kind::TEXT, R"([A-Z]\w*(?: [A-Z]\w*)*)")}};
	address.aliases["pair"] = "<number> <street>";
	r.define(color);
	r.define(address);

	auto m = r.match("<Color> at <Address>", "rgb(1, 2, 3) at 12 Main St");
	REQUIRE(m);
	CHECK(to_string(m->get("Color")) == "Color(r=1, g=2, b=3)");
	CHECK(m->get("Address").as<Record>()["street"] == "Main St");
}

CASE("aliases: resolution order") {
	Registry r;
	r.alias("unit", "kg|lb");
	TokenDef weight{"Weight", "<amount> ?<unit>", {Field("amount", Kind::DECIMAL)}};
	weight.aliases["unit"] = "g";
	r.define(weight);
	r.define({"Item", "<unit>: <unit_name>", {Field("unit", Kind::TEXT, "[a-z]+"), Field("unit_name", Kind::TEXT, R"(\w+)")}});

	// The token-level alias wins over the registry-level one
	CHECK(r.construct("Weight", "12.5 g").as<Record>()["amount"] == Decimal{"12.5"});
	CHECK(r.construct("Weight", "12.5 kg").is_none());

	// A field wins over an alias
	CHECK(r.construct("Item", "box: crate").as<Record>()["unit"] == "box");

	// At the top level, the registry-level one is used
	CHECK(r.fullmatch("5 ?<unit>", "5 lb"));
}

CASE("aliases: groups of a top-level alias are not user groups") {
	Registry r;
	r.alias("num", R"((\d+))");

	auto rx = r.compile("<num>-(x)");
	CHECK(rx->pattern() == R"((?:(\d+))-(x))");
	CHECK(rx->groups() == 1);
	CHECK(rx->actual_group(1) == 2);

	auto m = rx->fullmatch("42-x");
	REQUIRE(m);
	CHECK(m->group(1) == "x");
}

CASE("aliases: backreferences are local to the alias") {
	Registry r;
	r.alias("quoted", R"((['"])\w*\1)");

	auto rx = r.compile(R"((a)<quoted>\1)");
	CHECK(rx->pattern() == R"((a)(?:(['"])\w*\2)\1)");
	CHECK(rx->fullmatch(R"(a"xy"a)"));
	CHECK(!rx->fullmatch(R"(a"xy'a)"));
}

CASE("aliases: an alias may refer to tokens") {
	Registry r;
	r.define({"Num", "", {Field("n", Kind::INTEGER)}});
	r.alias("couple", "<Num> & <Num>");

	auto m = r.fullmatch("<couple>", "1 & 2");
	REQUIRE(m);
	CHECK(m->matcher().occurrences("Num") == 2);
	CHECK(m->get("Num", 2).as<Record>()["n"] == 2);
}

CASE("aliases: cycles") {
	Registry r;
	TokenDef t{"Loopy", "<a>", {Field("x")}};
	t.aliases["a"] = "<b>";
	t.aliases["b"] = "x<a>";
	r.define(t);
	CHECK_THROWS_AS(r.compile("<Loopy>"), CompileCycleError);

	r.alias("self", "<self>");
	CHECK_THROWS_AS(r.compile("<self>"), CompileCycleError);
}
