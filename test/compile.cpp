#include "../regrec.hpp"

//---------------------------------------------------------------------------
// TEST CASES
//---------------------------------------------------------------------------
#include "./fw/doctest-setup.hpp"

using namespace Regrec;

CASE("compile: expansion of a single-field token") {
	Registry r;
	r.define({"Num", "", {Field("n", Kind::INTEGER)}});

	auto rx = r.compile("<Num>");
	CHECK(rx->source() == "<Num>");
	CHECK(rx->pattern() == R"((?:()(?:([-+]?\d+))))");
	CHECK(rx->groups() == 0);
	CHECK(rx->roots().size() == 1);
	CHECK(rx->occurrences("Num") == 1);
}

CASE("compile: plain regex passes through") {
	Registry r;
	auto rx = r.compile(R"(\d+-[a-z]{2,3}(?:x|y)?)");
	CHECK(rx->pattern() == R"(\d+-[a-z]{2,3}(?:x|y)?)");
	CHECK(rx->roots().empty());
	CHECK(rx->fullmatch("42-ab"));
	CHECK(rx->findall("1-ab 22-cdx") == std::vector<Value>{"1-ab", "22-cdx"}); // No elements: the whole match
}

CASE("compile: '<' not starting a known name is literal") {
	Registry r;
	r.define({"Num", "", {Field("n", Kind::INTEGER)}});

	CHECK(r.compile("a<b")->pattern() == "a<b");
	CHECK(r.compile("x <3 y")->pattern() == "x <3 y");
	CHECK(r.compile("<a b>")->pattern() == "<a b>");
	CHECK(r.compile("<nope>")->pattern() == "<nope>");
	CHECK(r.fullmatch("<nope>", "<nope>"));

	// Unterminated, but not a known name either
	CHECK(r.compile("<nope")->pattern() == "<nope");
	CHECK(r.fullmatch("a <nope", "a <nope"));
	CHECK(r.compile("<x=1")->pattern() == "<x=1");

	// Inside a character class, or escaped: never a placeholder
	CHECK(r.compile("[<Num>]")->pattern() == "[<Num>]");
	CHECK(r.compile(R"(\<Num>)")->pattern() == R"(\<Num>)");

	// Unknown tags in a token template
	r.define({"Bold", "<b><text></b>", {Field("text")}});
	auto m = r.fullmatch("<Bold>", "<b>hi there</b>");
	REQUIRE(m);
	CHECK(m->get("Bold").as<Record>()["text"] == "hi there");
}

CASE("compile: malformed placeholders") {
	Registry r;
	r.define({"Num", "", {Field("n", Kind::INTEGER)}});
	r.define({"Const", "c<n=1", {Field("n", Kind::INTEGER)}});

	CHECK_THROWS_AS(r.compile("<Num"), TemplateSyntaxError);
	CHECK_THROWS_AS(r.compile("x <Num"), TemplateSyntaxError);
	CHECK_NOTHROW(r.compile("x <Nu"));
	r.alias("sep", ",");
	CHECK_THROWS_AS(r.compile("a<sep"), TemplateSyntaxError);
	CHECK_THROWS_AS(r.compile("<Const>"), TemplateSyntaxError);
}

CASE("compile: invalid regex is a TemplateSyntaxError (not std::regex_error)") {
	Registry r;
	r.define({"Bad", "<x>", {Field("x", Kind::TEXT, "[a-")}});

	CHECK_THROWS_AS(r.compile("(abc"), TemplateSyntaxError);
	CHECK_THROWS_AS(r.compile("abc)"), TemplateSyntaxError);
	CHECK_THROWS_AS(r.compile("[a-"), TemplateSyntaxError);
	CHECK_THROWS_AS(r.compile("<Bad>"), TemplateSyntaxError);
	try {
		r.compile("*");
		FAIL("no exception");
	} catch (std::regex_error&) {
		FAIL("std::regex_error leaked");
	} catch (TemplateSyntaxError& x) {
		CHECK(string(x.what()).starts_with("- ERROR: "));
	}
}

CASE("compile: quantifiers apply to the whole expansion") {
	Registry r;
	r.define({"AB", "ab", {}});
	r.define({"Digit", "", {Field("d", Kind::INTEGER, R"(\d)")}});

	CHECK(r.fullmatch("<AB>+", "ababab"));
	CHECK(!r.fullmatch("<AB>+", "abb"));
	CHECK(r.fullmatch("<AB>{2}", "abab"));
	CHECK(!r.fullmatch("<AB>{2}", "ab"));
	CHECK(r.fullmatch("x<AB>?y", "xy"));

	auto m = r.fullmatch("<Digit>{3}", "123");
	REQUIRE(m);
	CHECK(m->get("Digit").as<Record>()["d"] == 3); // The last repetition
}

CASE("compile: alternation inside a token template") {
	Registry r;
	r.define({"YesNo", "yes|no", {}});
	r.define({"Answer", "<YesNo>!", {}});

	CHECK(r.fullmatch("<YesNo>", "no"));
	// The template is grouped: not "yes" or "no!"
	CHECK(r.fullmatch("<Answer>", "yes!"));
	CHECK(!r.fullmatch("<Answer>", "yes"));
	CHECK(r.fullmatch("a<YesNo>b", "anob"));
}

CASE("compile: cycles") {
	Registry r;
	r.define({"Ping", "ping <Pong>", {}});
	r.define({"Pong", "pong <Ping>", {}});
	r.define({"Self", "x<Self>", {}});
	r.alias("loop", "a<loop>");
	r.alias("left", "<right>");
	r.alias("right", "<left>");

	CHECK_THROWS_AS(r.compile("<Ping>"), CompileCycleError);
	CHECK_THROWS_AS(r.compile("<Pong>"), CompileCycleError);
	CHECK_THROWS_AS(r.compile("<Self>"), CompileCycleError);
	CHECK_THROWS_AS(r.compile("<loop>"), CompileCycleError);
	CHECK_THROWS_AS(r.compile("<left>"), CompileCycleError);
	CHECK(r.cache().size() == 0);
}

CASE("compile: nesting limit") {
	Registry r;
	const size_t depth = Compiler::RECURSION_LIMIT + 10;
	for (size_t i = depth; i > 0; --i) {
		r.define({format("T{}", i), i == depth ? "end" : format("<T{}>", i + 1), {}});
	}
	CHECK_THROWS_AS(r.compile("<T1>"), CompileCycleError);
	CHECK(r.fullmatch(format("<T{}>", depth - 10), "end"));
}

CASE("compile: required fields must be bound") {
	Registry r;
	r.define({"Half", "<a>", {Field("a"), Field("b")}});
	r.define({"HalfOk", "<a>", {Field("a"), Field("b").maybe()}});
	r.define({"HalfDefault", "<a>", {Field("a"), Field("b").otherwise("B")}});

	CHECK_THROWS_AS(r.compile("<Half>"), TemplateSyntaxError);
	CHECK(r.construct("HalfOk", "x").as<Record>()["b"].is_none());
	CHECK(r.construct("HalfDefault", "x").as<Record>()["b"] == "B");
}

CASE("compile: user groups & elements") {
	Registry r;
	r.define({"Num", "", {Field("n", Kind::INTEGER)}});

	auto rx = r.compile(R"((\w+)=<Num>;(?:x)(y)?)");
	CHECK(rx->groups() == 2);
	CHECK(rx->actual_group(1) == 1);
	CHECK(rx->actual_group(2) == 4); // After the record marker & the field
	CHECK(rx->actual_group(0) == 0);
	CHECK_THROWS_AS(rx->actual_group(3), std::out_of_range);

	REQUIRE(rx->elements().size() == 3);
	CHECK(rx->elements()[0].kind == Matcher::Element::GROUP);
	CHECK(rx->elements()[1].kind == Matcher::Element::TOKEN);
	CHECK(rx->elements()[2].kind == Matcher::Element::GROUP);
	CHECK(rx->elements()[2].index == 2);
}

CASE("compile: flags") {
	Registry r;
	r.define({"Greeting", "hello <name>", {Field("name", Kind::TEXT, "[a-z]+")}});

	CHECK(!r.fullmatch("<Greeting>", "HELLO Bob"));
	auto m = r.fullmatch("<Greeting>", "HELLO Bob", REGEX::ECMAScript | REGEX::icase);
	REQUIRE(m);
	CHECK(m->get("Greeting").as<Record>()["name"] == "Bob");
	CHECK(m->matcher().flags() == (REGEX::ECMAScript | REGEX::icase));
}

CASE("compile: token field pattern overrides are ignored") {
	Registry r;
	r.define({"Num", "", {Field("n", Kind::INTEGER)}});
	r.define({"Wrap", R"(\[<inner>\])", {Field("inner", Token("Num"), "NEVER")}});

	auto m = r.fullmatch("<Wrap>", "[7]");
	REQUIRE(m);
	CHECK(m->get("Num").as<Record>()["n"] == 7);
}
