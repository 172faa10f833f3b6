#include "../peg.hpp"

//---------------------------------------------------------------------------
// TEST CASES
//---------------------------------------------------------------------------
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "./fw/doctest-setup.hpp"

#include <sstream>

// Global env. for the test cases...
using namespace Peg;

// expr = term (('+'|'-') term)*, term = number (('*'|'/') number)*, number = digit+
static Grammar arithmetic()
{
	Grammar g;
	g.define("expr",   sequence(ref("term"), any(sequence(choice(literal("+"), literal("-")), ref("term")))));
	g.define("term",   sequence(ref("number"), any(sequence(choice(literal("*"), literal("/")), ref("number")))));
	g.define("number", regex("[0-9]+"));
	return g;
}

CASE("expression tree") {
	auto g = arithmetic();
	State s("3*7-4");
	REQUIRE(g.parse(s));
	CHECK(s.at_end());
	CHECK(s.root().to_string() == R"(expr{term{number:"3", "*", number:"7"}, "-", term{number:"4"}})");
}

CASE("idempotent") {
	auto g = arithmetic();
	string first;
	for (int i = 0; i < 3; ++i) {
		State s("3*7-4");
		REQUIRE(g.parse(s));
		if (i == 0) first = s.root().to_string();
		CHECK(s.root().to_string() == first);
	}

	State s("3*7-4");
	REQUIRE(g.parse(s));
	s.reset();
	REQUIRE(g.parse(s));
	CHECK(s.ast.size() == 1);
	CHECK(s.root().to_string() == first);
}

CASE("node structure & spans") {
	auto g = arithmetic();
	State s("3*7-4");
	REQUIRE(g.parse(s));

	const Node& expr = s.root();
	CHECK(expr.name == "expr");
	CHECK(!expr.terminal);
	REQUIRE(expr.size() == 3);
	CHECK(expr.span.begin == 0);
	CHECK(expr.span.end == 5);

	const Node& term = expr[0];
	CHECK(term.name == "term");
	REQUIRE(term.size() == 3);
	CHECK(term[1].terminal);
	CHECK(term[1].text == "*");
	CHECK(term[2].name == "number");
	CHECK(term[2].is_leaf_rule());
	CHECK(term[2].span.begin == 2);
	CHECK(term[2].span.end == 3);

	CHECK(expr[1].text == "-");
	CHECK(expr[2][0][0].text == "4");
	CHECK_THROWS(expr[3]);
}

CASE("dump") {
	auto g = arithmetic();
	State s("3*7-4");
	REQUIRE(g.parse(s));

	std::ostringstream out;
	s.root().dump(out);
	CHECK(out.str() ==
		"expr:\n"
		"    term:\n"
		"        number: \"3\"\n"
		"        \"*\"\n"
		"        number: \"7\"\n"
		"    \"-\"\n"
		"    term:\n"
		"        number: \"4\"\n");

	std::ostringstream narrow;
	s.root()[2].dump(narrow, 1, 2);
	CHECK(narrow.str() == " term:\n   number: \"4\"\n");
}

CASE("anonymous combinators make no nodes") {
	Grammar g;
	g.define("pair", sequence(optional(sequence(literal("("), literal(")"))), many(choice(literal("a"), literal("b")))));
	State s("()ab");
	REQUIRE(g.parse(s));
	CHECK(s.root().to_string() == R"(pair{"(", ")", "a", "b"})");
}

CASE("named rule without captures still makes a node") {
	Grammar g;
	g.define("blank", regex(" +", NO_CAPTURE));
	g.define("empty", always());

	State s("   x");
	REQUIRE(g.parse(s));
	CHECK(s.root().name == "blank");
	CHECK(s.root().size() == 0);
	CHECK(s.root().span.begin == 0);
	CHECK(s.root().span.end == 3);
	CHECK(s.root().to_string() == "blank{}");

	State e("x");
	REQUIRE(g.parse(e, "empty"));
	CHECK(e.root().size() == 0);
	CHECK(e.root().span.end == 0);

	std::ostringstream out;
	e.root().dump(out);
	CHECK(out.str() == "empty:\n");
}

CASE("captured text is escaped in dump & to_string") {
	State s(TokenStream{{"normal", "say \"hi\""}, {"normal", "a\\b\tc\n"}, {"normal", "\x01"}});
	Grammar g;
	g.define("lines", many(token([](const Token&) { return true; })));
	REQUIRE(g.parse(s));
	CHECK(s.root().to_string() == R"(lines{"say \"hi\"", "a\\b\tc\n", "\x01"})");

	std::ostringstream out;
	s.root().dump(out);
	CHECK(out.str() ==
		"lines:\n"
		"    \"say \\\"hi\\\"\"\n"
		"    \"a\\\\b\\tc\\n\"\n"
		"    \"\\x01\"\n");

	Grammar leaf;
	leaf.define("quote", pattern("_QUOTE"));
	State q("\"");
	REQUIRE(leaf.parse(q));
	CHECK(q.root().to_string() == R"(quote:"\"")");
}

CASE("root() without a tree") {
	State s("x");
	CHECK_THROWS_AS(s.root(), GrammarError);
}
