// Block structure of Markdown text, parsed from a stream of classified lines
//
//	peg-mdblocks [file.md]    (reads stdin without a file name)
//
// Blocks: headings, ``` fenced blocks, ::: sections (extension), block
// quotes, loose & tight (ordered/unordered) lists, paragraphs, blanks.
//
#include "../peg.hpp"

#include <regex>
#include <iostream>
	using std::cout, std::cerr;
#include <fstream>
#include <cstdlib>

using namespace Peg;

//---------------------------------------------------------------------------
// Line classification
//---------------------------------------------------------------------------
string classify(const string& line)
{
	static const std::regex olist_start("[0-9]\\. ");
	static const std::regex ulist_start("[-*+] ");
	static const std::regex blank(" *");

	auto starts = [&](const std::regex& rx) {
		return std::regex_search(line, rx, std::regex_constants::match_continuous);
	};

	// The order matters!
	if (line.starts_with("```")) return "fence";
	if (line.starts_with(":::")) return "section";
	if (line.starts_with(">"))   return "quote";
	if (line.starts_with("#"))   return "header";
	if (starts(olist_start))     return "olist_start";
	if (starts(ulist_start))     return "ulist_start";
	if (std::regex_match(line, blank)) return "blank";
	return "normal";
}

TokenStream tokenize(std::istream& in)
{
	TokenStream tokens;
	string line;
	while (std::getline(in, line)) {
		if (!line.empty() && line.back() == '\r') line.pop_back();
		tokens.push_back({classify(line), line});
	}
	return tokens;
}

//---------------------------------------------------------------------------
// Block grammar
//---------------------------------------------------------------------------
Expr is(const string& kind)    { return token([kind](const Token& t) { return t.kind == kind; }); }
Expr isnot(const string& kind) { return token([kind](const Token& t) { return t.kind != kind; }); }

Grammar md_blocks()
{
	Grammar g;
	g.define("blocks", any(choice(Prod{
		ref("heading"),
		ref("fence"),
		ref("section"),
		ref("blockquote"),
		ref("ulistloose"), ref("ulisttight"),
		ref("olistloose"), ref("olisttight"),
		ref("paragraph"),
		ref("blank"),
	})));

	g.define("heading", is("header"));

	// No nested fences (yet)
	g.define("fence",   sequence(is("fence"), any(isnot("fence")), require(is("fence"), "unterminated fenced block")));
	g.define("section", sequence(is("section"), any(isnot("section")), require(is("section"), "unterminated section")));

	g.define("blockquote", many(is("quote")));

	// Loose lists have blanks between the items
	g.define("ulisttight", many(ref("ulistelem")));
	g.define("ulistloose", sequence(ref("ulistelem"), many(sequence(is("blank"), ref("ulistelem")))));
	g.define("ulistelem",  sequence(is("ulist_start"), any(is("normal"))));

	g.define("olisttight", many(ref("olistelem")));
	g.define("olistloose", sequence(ref("olistelem"), many(sequence(is("blank"), ref("olistelem")))));
	g.define("olistelem",  sequence(is("olist_start"), any(is("normal"))));

	g.define("paragraph", many(is("normal")));
	g.define("blank",     many(is("blank")));
	return g;
}

//===========================================================================
int main(int argc, char** argv)
//===========================================================================
{
	try {
		TokenStream tokens;
		if (argc > 1) {
			std::ifstream f(argv[1]);
			if (!f) {
				cerr << "- ERROR: Can't open \"" << argv[1] << "\"\n";
				return 1;
			}
			tokens = tokenize(f);
		} else {
			tokens = tokenize(std::cin);
		}
DBG("{} lines read", tokens.size());

		auto g = md_blocks();
		State s(std::move(tokens));

		if (!g.parse(s)) { // Can't really happen with `blocks` being any(...)
			cerr << "- No match\n";
			return 1;
		}
		s.root().dump(cout);

		if (!s.at_end()) {
			cerr << "- Unparsed input from line " << s.pos + 1 << ": \"" << s.tokens[s.pos].value << "\"\n";
			return 2;
		}

	} catch(Peg::FatalFailure& x) {
		cerr << "- ERROR: " << x.code << " (at line " << x.position + 1 << ")\n";
		exit(-1);
	} catch(std::runtime_error& x) {
		cerr << x.what() << "\n";
		exit(-1);
	} catch(std::exception& x) {
		cerr << "- C++ runtime error: " << x.what() << "\n";
		exit(-2);
	}
}
