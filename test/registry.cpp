#include "../regrec.hpp"

//---------------------------------------------------------------------------
// TEST CASES
//---------------------------------------------------------------------------
#include "./fw/doctest-setup.hpp"

using namespace Regrec;

static void define_pairs(Registry& r)
{
	r.define({"Pair", "<x>, <y>", {Field("x", Kind::INTEGER), Field("y", Kind::INTEGER)}});
	r.define({"Coordinate", "x=<x>, y=<y>", {}, "Pair"});
	r.define({"Point3D", "<Coordinate>, z=<z>", {Field("z", Kind::INTEGER)}, "Coordinate"});
	r.define({"Complex", R"(<x> \+ <y>i)", {}, "Pair"});
}

static std::vector<string> names_of(const std::vector<std::shared_ptr<const TokenDef>>& defs)
{
	std::vector<string> names;
	for (auto& d : defs) names.push_back(d->name);
	return names;
}

CASE("registry: define & lookup") {
	Registry r;
	auto& def = r.define({"To", "", {Field("direction", Kind::TEXT, "to|down to")}});
	CHECK(def.pattern == "<direction>"); // Single field: the template defaults to it
	CHECK(&r.lookup("To") == &def);
	CHECK(r.find("To") == &def);
	CHECK(r.find("to") == nullptr); // Case-sensitive
	CHECK(r.size() == 1);
	CHECK_THROWS_AS(r.lookup("Nope"), UnknownToken);
}

CASE("registry: subtype links & resolved fields") {
	Registry r;
	define_pairs(r);

	auto& p3 = r.lookup("Point3D");
	REQUIRE(p3.fields.size() == 3);
	CHECK(p3.fields[0].name == "x");
	CHECK(p3.fields[1].name == "y");
	CHECK(p3.fields[2].name == "z");

	CHECK(r.is_a("Point3D", "Pair"));
	CHECK(r.is_a("Point3D", "Point3D"));
	CHECK(!r.is_a("Pair", "Point3D"));
	CHECK(!r.is_a("Complex", "Coordinate"));
	CHECK(r.ancestry("Point3D") == std::vector<string>{"Point3D", "Coordinate", "Pair"});
	CHECK(r.subtypes("Pair") == std::vector<string>{"Coordinate", "Complex"});
	CHECK(r.subtypes("Complex").empty());
}

CASE("registry: family order -- deepest first, then registration order, base last") {
	Registry r;
	define_pairs(r);
	CHECK(names_of(r.family("Pair")) == std::vector<string>{"Point3D", "Coordinate", "Complex", "Pair"});
	CHECK(names_of(r.family("Coordinate")) == std::vector<string>{"Point3D", "Coordinate"});
	CHECK(names_of(r.family("Complex")) == std::vector<string>{"Complex"});
}

CASE("registry: redefined field replaces the inherited one in place") {
	Registry r;
	r.define({"Base", "<a>:<b>", {Field("a", Kind::INTEGER, R"(\d)"), Field("b")}});
	r.define({"Derived", "<a>:<b>:<c>", {Field("c"), Field("a", Kind::TEXT)}, "Base"});

	auto& d = r.lookup("Derived");
	REQUIRE(d.fields.size() == 3);
	CHECK(d.fields[0].name == "a");
	CHECK(d.fields[0].type.kind == Kind::TEXT);
	CHECK(d.fields[0].pattern == R"(\d)"); // Inherited explicit pattern
	CHECK(d.fields[2].name == "c");

	auto v = r.construct("Derived", "7:x:y");
	CHECK(v.as<Record>()["a"] == "7");
}

CASE("registry: registration errors") {
	Registry r;
	r.define({"Pair", "<x>, <y>", {Field("x", Kind::INTEGER), Field("y", Kind::INTEGER)}});

	CHECK_THROWS_AS((r.define({"Pair", "<x>", {Field("x")}})), DuplicateToken);
	CHECK_THROWS_AS((r.define({"Orphan", "<x>", {Field("x")}, "Nobody"})), InvalidSubtypeLink);
	CHECK_THROWS_AS((r.define({"Box", "<origin>", {Field("origin", Token("Point"))}})), MissingFieldPattern);
	CHECK_THROWS_AS((r.define({"Bag", "<items>", {Field("items", FieldType(Kind::LIST))}})), MissingFieldPattern);
	CHECK_THROWS_AS((r.define({"Blank", "<x>", {Field("x", Kind::TEXT, "")}})), MissingFieldPattern);
	CHECK_THROWS_AS((r.define({"", "x", {}})), Error);
	CHECK_THROWS_AS((r.define({"Twice", "<x>", {Field("x"), Field("x")}})), Error);
	CHECK_THROWS_AS((r.define({"Vague", "", {Field("x"), Field("y")}})), TemplateSyntaxError);

	// None of the failed ones got in
	CHECK(r.size() == 1);
	CHECK(!r.find("Orphan"));
}

CASE("registry: independent registries") {
	Registry travel, billing;
	travel.define({"TripDate", "<year>/<month>/<date>",
		{Field("year", Kind::INTEGER), Field("month", Kind::INTEGER), Field("date", Kind::INTEGER)}});
	travel.define({"TripPeriod", "<from_date> to <to_date>",
		{Field("from_date", Token("TripDate")), Field("to_date", Token("TripDate"))}});
	billing.define({"TripDate", "<year>-<month>-<date>",
		{Field("year", Kind::INTEGER), Field("month", Kind::INTEGER), Field("date", Kind::INTEGER)}});
	billing.define({"TripPeriod", "<from_date> to <to_date>",
		{Field("from_date", Token("TripDate")), Field("to_date", Token("TripDate"))}});

	const string tmpl = "summer vacation is <TripPeriod>";
	auto t = travel.match(tmpl, "summer vacation is 2025/06/01 to 2025/08/31");
	auto b = billing.match(tmpl, "summer vacation is 2025-06-01 to 2025-08-31");
	REQUIRE(t);
	REQUIRE(b);
	CHECK(t->get("TripPeriod") == b->get("TripPeriod")); // Same values, different syntax
	CHECK(!travel.match(tmpl, "summer vacation is 2025-06-01 to 2025-08-31"));
	CHECK(to_string(t->get("TripDate", 2)) == "TripDate(year=2025, month=8, date=31)");
}

CASE("registry: cache") {
	Registry r;
	r.define({"Num", "", {Field("n", Kind::INTEGER)}});

	auto a = r.compile("<Num>");
	auto b = r.compile("<Num>");
	CHECK(a == b);
	CHECK(r.cache().size() == 1);

	auto icase = r.compile("<Num>", REGEX::ECMAScript | REGEX::icase);
	CHECK(icase != a);
	CHECK(r.cache().size() == 2);

	// Registration may change the expansion of anything
	r.define({"Word", "", {Field("w")}});
	CHECK(r.cache().size() == 0);
	auto c = r.compile("<Num>");
	CHECK(c != a);
	CHECK(c->pattern() == a->pattern());

	// The old matcher still works (the results keep it alive)
	auto m = a->match("12");
	REQUIRE(m);
	CHECK(m->get("Num").as<Record>()["n"] == 12);
}

CASE("registry: failed compilations are not cached") {
	Registry r;
	CHECK_THROWS_AS(r.compile("(unbalanced"), TemplateSyntaxError);
	CHECK(r.cache().size() == 0);
}

CASE("registry: the default registry") {
	auto& r = default_registry();
	CHECK(&r == &default_registry());

	if (!r.find("DefaultRegistryProbe")) {
		define({"DefaultRegistryProbe", "probe <n>", {Field("n", Kind::INTEGER)}});
	}
	auto m = match("<DefaultRegistryProbe>", "probe 5");
	REQUIRE(m);
	CHECK(m->get("DefaultRegistryProbe").as<Record>()["n"] == 5);
	CHECK(findall("<DefaultRegistryProbe>", "probe 1, probe 2").size() == 2);
	CHECK(!fullmatch("<DefaultRegistryProbe>", "probe 5!"));
	CHECK(search("<DefaultRegistryProbe>", "!probe 5"));
}
