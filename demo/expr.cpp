// Arithmetic expressions, with right-associative ^ and bracketed sub-expressions
//
//	peg-expr ["expression"]
//
#include "../peg.hpp"

#include <iostream>
	using std::cout, std::cerr;
#include <cstdlib>

using namespace Peg;

Grammar arithmetic()
{
	Grammar g;
	g.define("expr",    sequence(ref("term"), any(sequence(ref("add_op"), ref("term")))));
	g.define("add_op",  choice(literal("+", SKIP_SPACES), literal("-", SKIP_SPACES)));
	g.define("term",    sequence(ref("factor"), any(sequence(ref("mul_op"), ref("factor")))));
	g.define("mul_op",  choice(literal("*", SKIP_SPACES), literal("/", SKIP_SPACES)));
	g.define("factor",  choice(ref("power"), ref("number"), ref("bracket")));
	g.define("power",   sequence(ref("number"), literal("^", SKIP_SPACES), ref("factor")));
	g.define("number",  regex("[0-9]+", SKIP_SPACES));
	g.define("bracket", sequence(literal("(", SKIP_SPACES), ref("expr"),
	                             require(literal(")", SKIP_SPACES), "missing closing bracket")));
	return g;
}

//===========================================================================
int main(int argc, char** argv)
//===========================================================================
{
	string input = argc > 1 ? argv[1] : "  (1+345^2) / 3*7-4";

	try {
		auto g = arithmetic();
		State s(input);
		Parser p(g);

		if (!p.parse(s)) {
			cerr << "- No match: \"" << input << "\"\n";
			return 1;
		}
		s.root().dump(cout);

DBG("rules tried: {}, terminals tried: {}, max. depth: {}", p.rules_tried, p.terminals_tried, p.depth_reached);

		if (!s.at_end()) {
			cerr << "- Unparsed input at position " << s.pos << ": \"" << input.substr(s.pos) << "\"\n";
			return 2;
		}

	} catch(Peg::FatalFailure& x) {
		cerr << x.what() << "\n" << "    " << input << "\n    " << string(x.position, ' ') << "^\n";
		exit(-1);
	} catch(std::runtime_error& x) {
		cerr << x.what() << "\n";
		exit(-1);
	} catch(std::exception& x) {
		cerr << "- C++ runtime error: " << x.what() << "\n";
		exit(-2);
	}
}
