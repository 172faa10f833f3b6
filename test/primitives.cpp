#include "../peg.hpp"

//---------------------------------------------------------------------------
// TEST CASES
//---------------------------------------------------------------------------
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "./fw/doctest-setup.hpp"

#include <cctype>

// Global env. for the test cases...
using namespace Peg;

Grammar nothing; // The matchers don't need any rules

CASE("literal: prefix match advances & captures") {
	Parser p(nothing);
	State s("hello world");
	CHECK(p.match(s, literal("hello")));
	CHECK(s.pos == 5);
	REQUIRE(s.ast.size() == 1);
	CHECK(s.ast[0].terminal);
	CHECK(s.ast[0].text == "hello");
	CHECK(s.ast[0].span.begin == 0);
	CHECK(s.ast[0].span.end == 5);
}

CASE("literal: mismatch leaves the state alone") {
	Parser p(nothing);
	State s("help");
	CHECK(!p.match(s, literal("hello")));
	CHECK(s.pos == 0);
	CHECK(s.ast.empty());
}

CASE("literal: longer than the rest of the input") {
	Parser p(nothing);
	State s("he");
	CHECK(!p.match(s, literal("hello")));
	CHECK(s.pos == 0);
}

CASE("regex: anchored at the cursor") {
	Parser p(nothing);
	State s("abc123");
	CHECK(!p.match(s, regex("[0-9]+"))); // No searching ahead!
	CHECK(s.pos == 0);

	State s2("123abc");
	CHECK(p.match(s2, regex("[0-9]+")));
	CHECK(s2.pos == 3);
	CHECK(s2.ast[0].text == "123");
}

CASE("regex: from the middle of the input") {
	Parser p(nothing);
	State s("ab12");
	CHECK(p.match(s, literal("ab")));
	CHECK(p.match(s, regex("[0-9]")));
	CHECK(s.pos == 3);
	CHECK(s.ast.back().text == "1");
	CHECK(s.ast.back().span.begin == 2);
}

CASE("regex: invalid pattern is a grammar error") {
	CHECK_THROWS_AS(regex("[unclosed"), GrammarError);
}

CASE("predicate: one char") {
	Parser p(nothing);
	auto upper = predicate([](char c) { return std::isupper((unsigned char)c) != 0; });
	State s("Ab");
	CHECK(p.match(s, upper));
	CHECK(s.pos == 1);
	CHECK(s.ast[0].text == "A");
	CHECK(!p.match(s, upper));
	CHECK(s.pos == 1);
	CHECK(s.ast.size() == 1);
}

CASE("empty input: every matcher fails, none throws") {
	Parser p(nothing);
	State s("");
	CHECK(!p.match(s, literal("")));
	CHECK(!p.match(s, literal("x")));
	CHECK(!p.match(s, regex(" *")));
	CHECK(!p.match(s, predicate([](char) { return true; })));
	CHECK(s.pos == 0);
	CHECK(s.ast.empty());
}

CASE("end of input after consuming everything") {
	Parser p(nothing);
	State s("ab");
	CHECK(p.match(s, literal("ab")));
	CHECK(!p.match(s, regex(".*")));
	CHECK(s.pos == 2);
}

CASE("SKIP_SPACES") {
	Parser p(nothing);
	State s("   x");
	CHECK(p.match(s, literal("x", SKIP_SPACES)));
	CHECK(s.pos == 4);
	CHECK(s.ast[0].text == "x");
	CHECK(s.ast[0].span.begin == 3);

	State s2("   y");
	CHECK(!p.match(s2, literal("x", SKIP_SPACES)));
	CHECK(s2.pos == 0); // The skipped spaces are given back, too

	State s3("    ");
	CHECK(!p.match(s3, regex("[0-9]+", SKIP_SPACES)));
	CHECK(s3.pos == 0);
}

CASE("NO_CAPTURE") {
	Parser p(nothing);
	State s("key=1");
	CHECK(p.match(s, pattern("_ID")));
	CHECK(p.match(s, literal("=", NO_CAPTURE)));
	CHECK(p.match(s, pattern("_DIGITS")));
	CHECK(s.pos == 5);
	REQUIRE(s.ast.size() == 2);
	CHECK(s.ast[0].text == "key");
	CHECK(s.ast[1].text == "1");
}

CASE("curated patterns") {
	Parser p(nothing);
	{ State s("foo_1 bar"); CHECK(p.match(s, pattern("_ID"))); CHECK(s.ast[0].text == "foo_1"); }
	{ State s("\\"); CHECK(p.match(s, pattern("_BACKSLASH"))); }
	{ State s("/"); CHECK(!p.match(s, pattern("_BACKSLASH"))); }
	{ State s("\t"); CHECK(p.match(s, pattern("_TAB"))); }
	{ State s("-12.5x"); CHECK(p.match(s, pattern("_NUMBER"))); CHECK(s.ast[0].text == "-12.5"); }
	{ State s(" \t\nx"); CHECK(p.match(s, pattern("_WHITESPACES"))); CHECK(s.pos == 3); }
	{ State s("\t \"'/\\");
		CHECK(p.match(s, sequence(pattern("_TAB"), pattern("_SPACE"), pattern("_QUOTE"),
		                          pattern("_APOSTROPHE"), pattern("_SLASH"), pattern("_BACKSLASH"))));
		CHECK(s.at_end());
	}
}

CASE("long input: bounded regex, repeated by the grammar") {
	Parser p(nothing);
	State s(string(50000, '7') + "x");
	CHECK(p.match(s, many(regex("[0-9]{1,64}", NO_CAPTURE))));
	CHECK(s.pos == 50000);
	CHECK(s.ast.empty());
}

CASE("curated pattern: unknown name") {
	CHECK_THROWS_AS(pattern("_NO_SUCH_THING"), GrammarError);
}

CASE("always, never, eof") {
	Parser p(nothing);
	State s("a");
	CHECK(p.match(s, always()));
	CHECK(!p.match(s, never()));
	CHECK(!p.match(s, eof()));
	CHECK(p.match(s, literal("a")));
	CHECK(p.match(s, eof()));
	CHECK(p.match(s, always())); // Still true at the end
	CHECK(s.pos == 1);
	CHECK(s.ast.size() == 1);
}
