#ifndef _PEG_HPP_
#define _PEG_HPP_
/*****************************************************************************
  Parsing expression grammar (PEG) engine for small tasks

    A Grammar is a registry of named rules. Each rule is an Expr tree built
    from matchers (literal, regex, predicate) and combinators (sequence,
    ordered choice, optional, bounded repetition), plus references to other
    rules by name. A Parser runs a rule against a State (text or a token
    stream) by backtracking recursive descent, and leaves an AST in the
    State: one Node per successful named rule, with the captured terminals
    and sub-rule nodes as its children.

  NOTE:

  - Rule references are resolved by name at match time, never earlier, so
    rules can be defined in any order, and can be (mutually) recursive.

  - Every expression is matched between a checkpoint and a restore of the
    State, so failed attempts leave no trace (neither in the position,
    nor in the AST).

  - Ordinary match failure is just a `false` result. Malformed grammars
    (e.g. undefined rules) and require() failures are thrown instead.

  - A Grammar can be shared by parsers in several threads, as long as
    nobody define()s rules in the meantime. A State must not be shared.

  - Known hazard: left recursion never terminates by itself; the rule
    nesting limit of Parser (RECURSION_LIMIT by default) stops it with TooDeep.

  - Known hazard: std::regex (at least in libstdc++) recurses once per
    character matched, so e.g. regex("[0-9]+") over tens of thousands of
    digits can overflow the stack (with std::regex_search alone, too). Keep
    the inputs of unbounded regexes small, or use bounded ones, and leave
    the repetition to the grammar: many(regex("[0-9]{1,64}")).

  - If you need to #include this in more than one translation units, then
    #define PEG_DEDUP for all but the first one. (This way the most
    common use case of only including it once can be kept the simplest.)

 *****************************************************************************/

//=============================================================================
//---------------------------------------------------------------------------
// "Ground-levelling" base layer...
//---------------------------------------------------------------------------
#include <cassert>
#include <exception>
#include <stdexcept>
#include <fmt/core.h>
#include <string>
	using std::string;
	using namespace std::literals::string_literals;
#ifndef NDEBUG
#include <iostream>
#endif

//!!
//!! These plain, undecorated macros conflict with the Windows headers (included by DocTest), and who knows what else...
//!! (So they get #undef'ed at the end.)
//!!
#define CONST constexpr static auto

//! For variadic macros, e.g. for calling fmt::format(...):
//!
//! The old MSVC preproc. suppresses the extra ',' when no more args... But, it
//! doesn't understand __VA_OPT__, so the std. c++20 way of
//! __VA_OPT__(,) __VA_ARGS__ can't be used there.
//!
//! (GCC is OK with that, as is the new MCVC preproc, activated by /Zc:preprocessor)
#if defined(__GNUC__) \
	|| defined(_MSC_VER) && (!defined(_MSVC_TRADITIONAL) || !_MSVC_TRADITIONAL)
#  define _PEG_CONFORMANT_PREPROCESSOR 1
#elif defined(_MSC_VER) && defined(_MSVC_TRADITIONAL) && _MSVC_TRADITIONAL // Old MS prep.
#  define _PEG_OLD_MSVC_PREPROCESSOR 1
#endif

#ifndef NDEBUG
#  if defined(_PEG_CONFORMANT_PREPROCESSOR)
#    define DBG(msg, ...) std::cerr << fmt::format("DBG> {}", fmt::format(msg __VA_OPT__(,) __VA_ARGS__)) << std::endl
     // Same as DBG(), but with no trailing \n (for continuation lines)
#    define DBG_(msg, ...) std::cerr << fmt::format("DBG> {}", fmt::format(msg __VA_OPT__(,) __VA_ARGS__))
     // Continuation lines -- same as DBG(), but without the DBG prefix
#    define _DBG(msg, ...) std::cerr << fmt::format(msg __VA_OPT__(,) __VA_ARGS__) << std::endl
     // Line fragment -- neither DBG prefix, no trailing \n
#    define _DBG_(msg, ...) std::cerr << fmt::format(msg __VA_OPT__(,) __VA_ARGS__)
#  elif defined(_PEG_OLD_MSVC_PREPROCESSOR)
#    define DBG(msg, ...) std::cerr << fmt::format("DBG> {}", fmt::format(msg, __VA_ARGS__)) << std::endl
#    define DBG_(msg, ...) std::cerr << fmt::format("DBG> {}", fmt::format(msg, __VA_ARGS__))
#    define _DBG(msg, ...) std::cerr << fmt::format(msg, __VA_ARGS__) << std::endl
#    define _DBG_(msg, ...) std::cerr << fmt::format(msg, __VA_ARGS__)
#  else
#    error Unsupported compiler toolset (not MSVC or GCC/CLANG)!
#  endif

#  define DBG_DEFAULT_TRIM_LEN 30
   // Trim length is ignored as yet, just using the default:
#  define DBG_TRIM(str, ...) (std::string_view(str).length() > DBG_DEFAULT_TRIM_LEN - 3 ? \
		(std::string(std::string_view(str).substr(0, DBG_DEFAULT_TRIM_LEN - 3))) + "..." : \
		std::string(str))
#else
#  define DBG(msg, ...)
#  define DBG_(msg, ...)
#  define _DBG(msg, ...)
#  define _DBG_(msg, ...)
#  define DBG_TRIM(str, ...) (str)
#endif


// Note: ERROR() below is _not_ a debug feature!
// It reports malformed grammars (and API misuse), via Peg::GrammarError.
#if defined(_PEG_CONFORMANT_PREPROCESSOR)
#  define ERROR(msg, ...) throw GrammarError(fmt::format("- ERROR: {}", fmt::format(msg __VA_OPT__(,) __VA_ARGS__)))
#elif defined(_PEG_OLD_MSVC_PREPROCESSOR)
#  define ERROR(msg, ...) throw GrammarError(fmt::format("- ERROR: {}", fmt::format(msg, __VA_ARGS__)))
#else
#  error Unsupported compiler toolset (not MSVC or GCC/CLANG)!
#endif

// Tame MSVC -Wall just a little
#ifdef _MSC_VER
#  pragma warning(disable:5045) // Compiler will insert Spectre mitigation for memory load if /Qspectre switch specified
#  pragma warning(disable:4514) // unreferenced inline function has been removed
#  pragma warning(disable:4464) // relative include path contains '..'
#endif
//---------------------------------------------------------------------------
//=============================================================================


//---------------------------------------------------------------------------
#include <cstddef> // ptrdiff_t
#include <string_view>
	using std::string_view;
#include <regex>
#include <functional> // function
#include <utility> // move
#include <memory> // shared_ptr
#include <iterator> // make_move_iterator
#include <type_traits>
#include <ostream>
#include <vector>
#include <unordered_map>


//---------------------------------------------------------------------------
namespace Peg {

	void init(); // Sets up the lookup tables; called implicitly by the builders and Parser()

	inline const string EMPTY_STRING;

	//-------------------------------------------------------------------
	// Errors...
	//
	// Ordinary match failure is never an exception, only these are:
	struct Error : std::runtime_error { using std::runtime_error::runtime_error; };

	// Malformed grammar (or misuse of the API)
	struct GrammarError : Error { using Error::Error; };

	// A rule was referenced, but never defined; never recovered by backtracking
	struct UndefinedRule : GrammarError
	{
		string rule;
		explicit UndefinedRule(const string& name);
	};

	// A require()-d expression failed to match: aborts the whole parse
	struct FatalFailure : Error
	{
		string code;
		size_t position;
		FatalFailure(const string& code, size_t position);
	};

	// Nesting limit (see Parser::RECURSION_LIMIT) exceeded
	struct TooDeep : Error { using Error::Error; };


	//-------------------------------------------------------------------
	// Input units...
	struct Token
	{
		string kind;
		string value;
	};
	using TokenStream = std::vector<Token>;

	using REGEX = std::regex; //!! When changing it (e.g. to PCRE2), a light adapter class would be nice!
	using CHAR_PREDICATE  = std::function<bool(char)>;
	using TOKEN_PREDICATE = std::function<bool(const Token&)>;

	using STRING_MAP = std::unordered_map<string, string>;
	using PATTERN_MAP = STRING_MAP;
	extern PATTERN_MAP NAMED_PATTERNS; // "Curated" regexes, for pattern(name)

	// Matcher flags
	CONST SKIP_SPACES = 1u; // Skip leading ' ' chars before matching (text input only)
	CONST NO_CAPTURE  = 2u; // Consume, but leave no terminal in the AST


	//-------------------------------------------------------------------
	// Opcodes...
	//
	// Can be freely extended by users (in sync with CONST_OPERATORS below).
	using OPCODE = int;

	CONST _NIL     = OPCODE('0');  // never matches
	CONST _T       = OPCODE('1');  // always matches, consuming nothing
	CONST _ATOM    = OPCODE('#');  // Fake opcode for the matchers (which are not operators; only defined for a cleaner Parser::match() impl.)
	CONST _SEQ     = OPCODE(',');
	CONST _OR      = OPCODE('|');  // Ordered choice: the first matching alternative wins
	CONST _OPT     = OPCODE('?');  // 0 or 1; expects 1 argument
	CONST _REPEAT  = OPCODE('*');  // `min` or more (greedy!); expects 1 argument
	CONST _USE     = OPCODE('`');  // Invoke named rule (atom: "Name")
	CONST _REQUIRE = OPCODE('^');  // Match, or throw FatalFailure (atom: error code); expects 1 argument
	CONST _EOF     = OPCODE('$');  // matches only at the end of the input

	struct Expr;
	struct Node;
	class State;
	class Parser;
	class Grammar;

	using CONST_OPERATOR = std::function<bool(Parser&, State&, const Expr&)>;
	using CONSTOP_MAP = std::unordered_map<OPCODE, CONST_OPERATOR>;
	extern CONSTOP_MAP CONST_OPERATORS;
		// These are populated by init(), as e.g.:
		// CONST_OPERATORS[SOME_OPCODE] = [](Parser&, State&, const Expr&) { ... return matched; }
		// Can be freely extended by users (respecting the opcode list above).


//---------------------------------------------------------------------------
// Grammar expressions...
//---------------------------------------------------------------------------
struct Expr
{
	using Production = std::vector<Expr>;

	enum Type {
		OP,
		LITERAL,
		USER_REGEX,
		CURATED_REGEX, // built-in "atomic" regex pattern (see NAMED_PATTERNS)
		CHAR_TEST,
		TOKEN_TEST,
	} type;

#ifndef NDEBUG
	static const char* _type_to_cstr(Type t) {
		switch (t) {
		case OP: return "OP";
		case LITERAL: return "LITERAL";
		case USER_REGEX: return "USER_REGEX";
		case CURATED_REGEX: return "CURATED_REGEX";
		case CHAR_TEST: return "CHAR_TEST";
		case TOKEN_TEST: return "TOKEN_TEST";
		default:
			return "!!BUG: MISSING NAME FOR Expr TYPE!!";
		}
	}
	const char* _type_cstr() const { return _type_to_cstr(type); }
#endif

	OPCODE opcode = _ATOM;

	string atom;     // literal text, regex source, name of the rule to _USE, or _REQUIRE error code
	std::shared_ptr<const REGEX> rx;
	CHAR_PREDICATE  char_test;
	TOKEN_PREDICATE token_test;
	size_t min = 0;  // _REPEAT only
	unsigned flags = 0;

	Production prod;

	string d_memo;   // Diagnostic note (e.g. NAMED_PATTERNS key)


	//-----------------------------------------------------------
	// Construction...
	explicit Expr(OPCODE opcode, Production prod = {}) : type(OP), opcode(opcode), prod(std::move(prod)) {}
	Expr(Type type, string atom, unsigned flags = 0) : type(type), atom(std::move(atom)), flags(flags) {}

	//-----------------------------------------------------------
	// Queries...
	bool is_atom() const { return type != OP; }
	bool is_op() const { return type == OP; }
	bool is_regex() const { return type == USER_REGEX || type == CURATED_REGEX; }

	//-----------------------------------------------------------
	// Diagnostics...
private:
	void _dump(unsigned level = 0) const;
#ifndef NDEBUG
	public: void DUMP() const { _dump(); }
#else
	public: void DUMP() const {}
#endif
};

	//-------------------------------------------------------------------
	// Builders...
	//
	// Every matcher is constructed explicitly: there's no implicit
	// string -> matcher conversion anywhere.

	inline Expr literal(string text, unsigned flags = 0)
	{
		return Expr(Expr::LITERAL, std::move(text), flags);
	}

	Expr regex(const string& pattern, unsigned flags = 0);  // Throws GrammarError for invalid patterns
	Expr pattern(const string& name, unsigned flags = 0);   // Named regex from NAMED_PATTERNS

	inline Expr predicate(CHAR_PREDICATE test, unsigned flags = 0)
	{
		Expr e(Expr::CHAR_TEST, ""s, flags);
		e.char_test = std::move(test);
		return e;
	}

	inline Expr token(TOKEN_PREDICATE test, unsigned flags = 0)
	{
		Expr e(Expr::TOKEN_TEST, ""s, flags);
		e.token_test = std::move(test);
		return e;
	}

	inline Expr _wrap(OPCODE opcode, Expr target)
	{
		Expr::Production prod;
		prod.push_back(std::move(target));
		return Expr(opcode, std::move(prod));
	}

	inline Expr sequence(Expr::Production items) { return Expr(_SEQ, std::move(items)); }
	inline Expr choice(Expr::Production alternatives) { return Expr(_OR, std::move(alternatives)); }

	template <class... Items>
	Expr sequence(Expr first, Items... rest)
	{
		static_assert((std::is_same_v<Items, Expr> && ...), "sequence() items must be Expr objects");
		Expr::Production items;
		items.reserve(1 + sizeof...(rest));
		items.push_back(std::move(first));
		(items.push_back(std::move(rest)), ...);
		return sequence(std::move(items));
	}

	template <class... Items>
	Expr choice(Expr first, Items... rest)
	{
		static_assert((std::is_same_v<Items, Expr> && ...), "choice() alternatives must be Expr objects");
		Expr::Production items;
		items.reserve(1 + sizeof...(rest));
		items.push_back(std::move(first));
		(items.push_back(std::move(rest)), ...);
		return choice(std::move(items));
	}

	inline Expr optional(Expr target) { return _wrap(_OPT, std::move(target)); }

	inline Expr repeat(Expr target, size_t min)
	{
		Expr e = _wrap(_REPEAT, std::move(target));
		e.min = min;
		return e;
	}
	inline Expr any(Expr target)  { return repeat(std::move(target), 0); } // {A}
	inline Expr many(Expr target) { return repeat(std::move(target), 1); }

	inline Expr ref(const string& name)
	{
		Expr e(_USE);
		e.atom = name;
		return e;
	}

	inline Expr require(Expr target, const string& error_code)
	{
		Expr e = _wrap(_REQUIRE, std::move(target));
		e.atom = error_code;
		return e;
	}

	inline Expr always() { return Expr(_T); }
	inline Expr never()  { return Expr(_NIL); }
	inline Expr eof()    { return Expr(_EOF); }


//---------------------------------------------------------------------------
// Parse tree...
//---------------------------------------------------------------------------
struct Span
{
	size_t begin = 0; // in input units (chars or tokens)
	size_t end = 0;
};

struct Node
{
	string name;                 // Rule name (empty for terminals)
	string text;                 // Captured input (terminals only)
	std::vector<Node> children;
	Span span;
	bool terminal = false;

	size_t size() const { return children.size(); }
	const Node& operator[](size_t i) const { return children.at(i); }

	// A named node with nothing but a single terminal, printed as `name: "text"`
	bool is_leaf_rule() const { return !terminal && children.size() == 1 && children[0].terminal; }

	void dump(std::ostream& out, unsigned level = 0, unsigned indent = 4) const;
	string to_string() const; // Compact one-liner: name{child, "terminal", ...}
};


//---------------------------------------------------------------------------
// Parse state...
//---------------------------------------------------------------------------
class State
{
public:
	enum Kind { TEXT, TOKENS };

	// Input:
	const Kind kind;
	const string text;
	const TokenStream tokens;

	// Cursor & results:
	size_t pos = 0;
	std::vector<Node> ast; // Nodes produced so far, in input order

	struct Checkpoint
	{
		size_t pos;
		size_t ast_len;
	};

	explicit State(string txt) : kind(TEXT), text(std::move(txt)) {}
	explicit State(TokenStream toks) : kind(TOKENS), tokens(std::move(toks)) {}

	State(const State&) = delete;
	State& operator=(const State&) = delete;

	size_t length() const { return kind == TEXT ? text.length() : tokens.size(); }
	bool at_end() const { return pos >= length(); }

	Checkpoint checkpoint() const { return {pos, ast.size()}; }
	void restore(const Checkpoint& cp)
	{
		assert(cp.pos <= length());
		assert(cp.ast_len <= ast.size());
		pos = cp.pos;
		ast.erase(ast.begin() + ptrdiff_t(cp.ast_len), ast.end());
	}

	void reset() { pos = 0; ast.clear(); }

	// Add a terminal for the input consumed from `from` to the current pos
	void capture(string txt, size_t from);

	// Fold the nodes added since `ast_mark` into a new node called `name`
	void group(const string& name, size_t ast_mark, size_t from);

	// The tree of a successful parse (of a fresh State)
	const Node& root() const;
};


//---------------------------------------------------------------------------
// Rule registry...
//---------------------------------------------------------------------------
class Grammar
{
public:
	// Registers, or silently replaces (last definition wins) a named rule.
	// The first rule ever defined is the default entry rule.
	Grammar& define(const string& name, Expr expr);

	// Throws UndefinedRule if there's no such rule (yet)
	const Expr& get(const string& name) const;

	bool defined(const string& name) const { return rules.find(name) != rules.end(); }
	const string& entry() const { return names.empty() ? EMPTY_STRING : names.front(); }
	size_t size() const { return rules.size(); }

	// Shortcut for Parser(grammar).parse(...)
	bool parse(State& state, const string& rule = ""s) const;

#ifndef NDEBUG
	void DUMP() const;
#else
	void DUMP() const {}
#endif

private:
	std::unordered_map<string, Expr> rules;
	std::vector<string> names; // in order of (first) definition
};


//---------------------------------------------------------------------------
class Parser
//---------------------------------------------------------------------------
{
public:
	const Grammar& grammar;

	// Diagnostics (reset by each parse()):
	//   depth_reached: deepest rule nesting seen; rules_tried: expressions evaluated
	int loopguard;
	int depth_reached;
	int rules_tried;
	int terminals_tried;

	const int maxnest;

	// Max. nesting of rule invocations (not of all expressions!)
	CONST RECURSION_LIMIT = 2000; // Hopefully this'd be hit before a stack overflow...

	void _reset_counters()
	{
		loopguard = maxnest;
		depth_reached = 0;
		rules_tried = 0;
		terminals_tried = 0;
	}

	//-------------------------------------------------------------------
	Parser(const Grammar& grammar, int maxnest = RECURSION_LIMIT):
		// Sync with _reset_counters()!
		grammar(grammar),
		loopguard(maxnest),
		depth_reached(0),
		rules_tried(0),
		terminals_tried(0),
		maxnest(maxnest)
	{
		Peg::init();
	}

	Parser(const Parser& other) = delete;
	Parser& operator=(const Parser& other) = delete;
	Parser(Parser&&) = delete;

	//-------------------------------------------------------------------
	// Run `rule` (or the entry rule of the grammar) from the current
	// position of `state`. On success, the rule's node is appended to
	// state.ast; on failure, state is left intact.
	bool parse(State& state, const string& rule = ""s)
	{
		_reset_counters();
		const string& name = rule.empty() ? grammar.entry() : rule;
		if (name.empty()) {
			ERROR("Empty grammar: no rule to start with");
		}
DBG("parse: rule '{}' at pos {}...", name, state.pos);
		return match(state, ref(name));
	}

	//-------------------------------------------------------------------
	bool match(State& state, const Expr& expr)
	// Returns true, if `expr` matched at state.pos (then state.pos is past
	// the match, and state.ast has the new nodes), or false (and then state
	// is exactly as it was before).
	//-------------------------------------------------------------------
	{
#ifndef NDEBUG
		_trace(state, expr); // Kept out of here, for lean recursive frames
#endif

		// Only rule invocations count as nesting; the guard gives the level
		// back on every exit, including exceptions.
		const bool nesting = expr.is_op() && expr.opcode == _USE;
		struct NestingGuard {
			int& level; bool active;
			~NestingGuard() { if (active) ++level; }
		} guard{loopguard, nesting};

		if (nesting) {
			if (--loopguard <= 0) {
				throw TooDeep(fmt::format("- ERROR: Rule nesting level {} is too deep (in match())!", maxnest));
			}
			if (maxnest - loopguard > depth_reached)
			    depth_reached = maxnest - loopguard;
		}
		++rules_tried;

		const CONST_OPERATOR& f = handler(expr); // Throws via ERROR() if not found!

		auto checkpoint = state.checkpoint();
		bool res = f(*this, state, expr);
		if (!res) {
			state.restore(checkpoint);
		}
		return res;
	}

private:
#ifndef NDEBUG
	void _trace(const State& state, const Expr& expr) const
	{
DBG("match({}, {} '{}')... // loopguard: {}", state.pos,
			expr._type_cstr(),
			expr.is_atom() ? expr.atom : string(1, (char)expr.opcode),
			loopguard);
	}
#endif

	const CONST_OPERATOR& handler(const Expr& expr) const
	{
		assert(!CONST_OPERATORS.empty());

		OPCODE opcode = expr.is_atom() ? _ATOM : expr.opcode;

		if (auto it = CONST_OPERATORS.find(opcode); it != CONST_OPERATORS.end()) {
			return it->second;
		} else {
			ERROR("Unimplemented opcode: {} ('{}')", opcode, (char)opcode);
		}
	}
};


	// Simple painkiller for grammar-building:
	using Prod = Expr::Production;

} // namespace


//
//--------------------------------------------<< C U T  H E R E ! >>--------------------------------------------
//


#ifndef PEG_DEDUP
//===========================================================================
namespace Peg {

	PATTERN_MAP NAMED_PATTERNS = {};
	CONSTOP_MAP CONST_OPERATORS = {};

//---------------------------------------------------------------------------
UndefinedRule::UndefinedRule(const string& name)
	: GrammarError(fmt::format("- ERROR: Undefined rule '{}'", name)),
	  rule(name)
{
}

FatalFailure::FatalFailure(const string& code, size_t position)
	: Error(fmt::format("- ERROR: {} (at position {})", code, position)),
	  code(code),
	  position(position)
{
}


//---------------------------------------------------------------------------
static void _init_tables()
{
	//-------------------------------------------------------------------
	// Initialize the predefined "atomic" patterns
	//-------------------------------------------------------------------
	// "Curated atoms" (named terminal pattens) are "metasyntactic sugar" only,
	// as they could as well be just user regexes. But fancy random regex
	// literals could confuse the parsing, so these "officially" nicely behaving
	// ones are just named & groomed here. (ECMAScript syntax; the matching
	// itself is always anchored to the current position.)
	//
#define PATTERN(name, rx) {name, rx}
	NAMED_PATTERNS = { //!! Alas, no constexpr init for dynamic containers; have to do it here...
		PATTERN( "_SPACE"      , " " ),
		PATTERN( "_SPACES"     , " +" ),
		PATTERN( "_TAB"        , "\t" ),
		PATTERN( "_QUOTE"      , "\"" ),
		PATTERN( "_APOSTROPHE" , "'" ),
		PATTERN( "_SLASH"      , "/" ),
		PATTERN( "_BACKSLASH"  , "\\\\" ),
		PATTERN( "_IDCHAR"     , "[A-Za-z0-9_]" ),
		PATTERN( "_ID"         , "[A-Za-z_][A-Za-z0-9_]*" ),
		PATTERN( "_DIGIT"      , "[0-9]" ),
		PATTERN( "_DIGITS"     , "[0-9]+" ),
		PATTERN( "_HEXDIGIT"   , "[0-9A-Fa-f]" ),
		PATTERN( "_HEXDIGITS"  , "[0-9A-Fa-f]+" ),
		PATTERN( "_LETTER"     , "[A-Za-z]" ),
		PATTERN( "_LETTERS"    , "[A-Za-z]+" ),
		PATTERN( "_ALNUM"      , "[A-Za-z0-9]" ),
		PATTERN( "_ALNUMS"     , "[A-Za-z0-9]+" ),
		PATTERN( "_WHITESPACE" , "\\s" ),
		PATTERN( "_WHITESPACES", "\\s+" ),
		PATTERN( "_NUMBER"     , "[+-]?[0-9]+(\\.[0-9]+)?" ),
	};
#undef PATTERN

	//-------------------------------------------------------------------
	// Initialize the operation map
	//-------------------------------------------------------------------
	//! Not asserting emptiness: users may have registered their own
	//! opcodes already, and those must survive.

	//-------------------------------------------------------------------
	CONST_OPERATORS[_NIL] = [](Parser&, State&, const Expr&) -> bool
	{
DBG("NIL: no op. (returning false)");
		return false;
	};

	//-------------------------------------------------------------------
	CONST_OPERATORS[_T] = [](Parser&, State&, const Expr&) -> bool
	{
DBG("T: 'true' op. (returning true)");
		return true;
	};

	//-------------------------------------------------------------------
	CONST_OPERATORS[_EOF] = [](Parser&, State& s, const Expr&) -> bool
	{
		return s.at_end();
	};

	//-------------------------------------------------------------------
	CONST_OPERATORS[_ATOM] = [](Parser& p, State& s, const Expr& e) -> bool
	{
		assert(e.is_atom());

		++p.terminals_tried;

		if ((e.flags & SKIP_SPACES) && s.kind == State::TEXT) {
			while (s.pos < s.text.length() && s.text[s.pos] == ' ') ++s.pos;
		}

		if (s.at_end()) { // Nothing ever matches here, not even empty patterns
DBG("ATOM: end of input at {}", s.pos);
			return false;
		}

		size_t from = s.pos;
		string matched;

		if (s.kind == State::TEXT)
		{
			switch (e.type) {
			case Expr::LITERAL:
				if (string_view(s.text).substr(s.pos, e.atom.length()) != e.atom) {
					return false;
				}
				matched = e.atom;
				break;

			case Expr::USER_REGEX:
			case Expr::CURATED_REGEX: {
				assert(e.rx);
				std::smatch m;
				// match_continuous anchors the pattern at the cursor, so
				// regex_search won't go hunting through the rest of the text.
				if (!std::regex_search(s.text.cbegin() + ptrdiff_t(s.pos), s.text.cend(), m, *e.rx,
				                       std::regex_constants::match_continuous)) {
DBG("REGEX \"{}\": ---NOT--- MATCHED \"{}\"", e.atom, DBG_TRIM(s.text.c_str() + s.pos));
					return false;
				}
				matched = m.str(0);
				break;
			}

			case Expr::CHAR_TEST:
				if (!e.char_test(s.text[s.pos])) {
					return false;
				}
				matched = string(1, s.text[s.pos]);
				break;

			case Expr::TOKEN_TEST:
				ERROR("Token predicate applied to text input (at position {})", s.pos);

			default:
				ERROR("Invalid terminal: '{}'", e.d_memo);
			}
			s.pos += matched.length();
		}
		else // Token input: every matcher takes exactly one token
		{
			const Token& tok = s.tokens[s.pos];

			switch (e.type) {
			case Expr::LITERAL:
				if (!tok.value.starts_with(e.atom)) {
					return false;
				}
				break;

			case Expr::USER_REGEX:
			case Expr::CURATED_REGEX: {
				assert(e.rx);
				std::smatch m;
				if (!std::regex_search(tok.value, m, *e.rx, std::regex_constants::match_continuous)) {
					return false;
				}
				break;
			}

			case Expr::TOKEN_TEST:
				if (!e.token_test(tok)) {
					return false;
				}
				break;

			case Expr::CHAR_TEST:
				ERROR("Character predicate applied to token input (at token {})", s.pos);

			default:
				ERROR("Invalid terminal: '{}'", e.d_memo);
			}
			matched = tok.value;
			++s.pos;
		}

DBG("ATOM: MATCHED \"{}\" at {}", DBG_TRIM(matched), from);
		if (!(e.flags & NO_CAPTURE)) {
			s.capture(std::move(matched), from);
		}
		return true;
	};

	//-------------------------------------------------------------------
	CONST_OPERATORS[_SEQ] = [](Parser& p, State& s, const Expr& e) -> bool
	{
		for (const auto& r : e.prod) {
			if (!p.match(s, r)) return false; // match() has already undone the failed part; ours is undone by our caller
		}
		return true;
	};

	//-------------------------------------------------------------------
	CONST_OPERATORS[_OR] = [](Parser& p, State& s, const Expr& e) -> bool
	{
		for (const auto& r : e.prod)
		{
			if (p.match(s, r)) {
				return true;
			}
DBG("_OR: alternative [{}] failed, trying the next one...", (void*)&r);
		}
		return false;
	};

	//-------------------------------------------------------------------
	CONST_OPERATORS[_OPT] = [](Parser& p, State& s, const Expr& e) -> bool
	{
		assert(e.prod.size() == 1);

		if (!p.match(s, e.prod[0])) {
DBG("_OPT: no match, succeeding empty");
		}
		return true;
	};

	//-------------------------------------------------------------------
	CONST_OPERATORS[_REPEAT] = [](Parser& p, State& s, const Expr& e) -> bool
	{
		assert(e.prod.size() == 1);

		auto const& r = e.prod[0];
		size_t count = 0;
		for (;;) {
			size_t before = s.pos;
			if (!p.match(s, r)) {
				break;
			}
			++count;
			if (s.pos == before) { // We'd be stuck forever if not progressing!
DBG("_REPEAT: empty iteration #{} at {}, stopping", count, before);
				// ...and every further iteration would be the same, too:
				if (count < e.min) count = e.min;
				break;
			}
		}
		return count >= e.min;
	};

	//-------------------------------------------------------------------
	CONST_OPERATORS[_USE] = [](Parser& p, State& s, const Expr& e) -> bool
	{
		const Expr& target = p.grammar.get(e.atom); // Throws UndefinedRule if not defined by now

		auto mark = s.ast.size();
		auto from = s.pos;

DBG("_USE: trying rule '{}' at pos {}...", e.atom, from);
		if (!p.match(s, target)) {
			return false;
		}
		s.group(e.atom, mark, from);
		return true;
	};

	//-------------------------------------------------------------------
	CONST_OPERATORS[_REQUIRE] = [](Parser& p, State& s, const Expr& e) -> bool
	{
		assert(e.prod.size() == 1);

		if (p.match(s, e.prod[0])) {
			return true;
		}
DBG("_REQUIRE: '{}' failed at pos {}", e.atom, s.pos);
		throw FatalFailure(e.atom, s.pos);
	};

DBG("+++ Static init done. +++");
}

void init()
{
	// Once-only, and safe to call from parsers in several threads
	static const bool initialized = (_init_tables(), true);
	(void)initialized;
	assert(!NAMED_PATTERNS.empty());
	assert(!CONST_OPERATORS.empty());
}


//---------------------------------------------------------------------------
Expr regex(const string& pattern, unsigned flags)
{
	init();

	Expr e(Expr::USER_REGEX, pattern, flags);
	try {
		e.rx = std::make_shared<const REGEX>(pattern);
	}
	catch (const std::regex_error& x) {
		ERROR("Invalid regex \"{}\": {}", pattern, x.what());
	}
	return e;
}

Expr pattern(const string& name, unsigned flags)
{
	init();

	auto it = NAMED_PATTERNS.find(name);
	if (it == NAMED_PATTERNS.end()) {
		ERROR("Unknown named pattern: '{}'", name);
	}
	Expr e = regex(it->second, flags);
	e.type = Expr::CURATED_REGEX;
	e.d_memo = name; // Save the pattern name for diagnostics
DBG("Expr initialized as named pattern '{}' (\"{}\")", e.d_memo, e.atom);
	return e;
}


//---------------------------------------------------------------------------
void Expr::_dump([[maybe_unused]] unsigned level) const
{
#ifndef NDEBUG
	auto p   [[maybe_unused]] = [&](const string& x) { string prefix(level * 2, ' ');
		   std::cerr << "     " << prefix << x << std::endl; };
	auto p_  [[maybe_unused]] = [&](const string& x) { string prefix(level * 2, ' ');
		   std::cerr << "     " << prefix << x; };
	auto _p  [[maybe_unused]] = [&](const string& x) { std::cerr << x << std::endl; };

	if (!level) p("/------------------------------------------------------------------\\");
	p_(fmt::format("[{}] {}", (void*)this, _type_cstr()));
	if (is_atom()) {
		_p(fmt::format(" \"{}\"{}{}", atom,
			flags & SKIP_SPACES ? " +SKIP_SPACES" : "",
			flags & NO_CAPTURE ? " +NO_CAPTURE" : "")
		   + (d_memo.empty() ? "" : fmt::format(" // {}", d_memo)));
	} else {
		string extra = opcode == _REPEAT ? fmt::format(" min = {}", min)
		             : !atom.empty()     ? fmt::format(" \"{}\"", atom)
		             : ""s;
		_p(fmt::format(" opcode = {} ('{}'){}", opcode, (char)opcode, extra));
		if (!prod.empty()) {
			p("{");
			for (const auto& r : prod) { r._dump(level + 1); }
			p("}");
		}
	}
	if (!level) p("\\------------------------------------------------------------------/\n");
#endif
}

#ifndef NDEBUG
void Grammar::DUMP() const
{
	std::cerr << fmt::format("Grammar: {} rule(s), entry: '{}'", names.size(), entry()) << std::endl;
	for (const auto& name : names) {
		std::cerr << fmt::format("  {} :=", name) << std::endl;
		rules.at(name).DUMP();
	}
}
#endif


//---------------------------------------------------------------------------
Grammar& Grammar::define(const string& name, Expr expr)
{
	if (name.empty()) {
		ERROR("Rule name must not be empty");
	}
	init();

	if (auto it = rules.find(name); it != rules.end()) {
DBG("Grammar: redefining rule '{}' (last definition wins)", name);
		it->second = std::move(expr);
	} else {
		names.push_back(name);
		rules.emplace(name, std::move(expr));
	}
	return *this;
}

const Expr& Grammar::get(const string& name) const
{
	if (auto it = rules.find(name); it != rules.end()) {
		return it->second;
	}
	throw UndefinedRule(name);
}

bool Grammar::parse(State& state, const string& rule) const
{
	return Parser(*this).parse(state, rule);
}


//---------------------------------------------------------------------------
void State::capture(string txt, size_t from)
{
	assert(from <= pos);
	Node leaf;
	leaf.text = std::move(txt);
	leaf.span = {from, pos};
	leaf.terminal = true;
	ast.push_back(std::move(leaf));
}

void State::group(const string& name, size_t ast_mark, size_t from)
{
	assert(ast_mark <= ast.size());

	Node node;
	node.name = name;
	node.children.assign(std::make_move_iterator(ast.begin() + ptrdiff_t(ast_mark)),
	                     std::make_move_iterator(ast.end()));
	ast.erase(ast.begin() + ptrdiff_t(ast_mark), ast.end());

	node.span = node.children.empty() ? Span{from, pos}
	          : Span{node.children.front().span.begin, node.children.back().span.end};
DBG("group: '{}' with {} child(ren), span [{}, {})", name, node.children.size(), node.span.begin, node.span.end);
	ast.push_back(std::move(node));
}

const Node& State::root() const
{
	if (ast.size() != 1) {
		ERROR("No single root node in the parse state (found {} top-level nodes)", ast.size());
	}
	return ast.front();
}


//---------------------------------------------------------------------------
// Captured text in double quotes, with ", \ and control chars escaped
static string _quoted(const string& text)
{
	string res = "\"";
	for (char c : text) {
		switch (c) {
		case '"':  res += "\\\""; break;
		case '\\': res += "\\\\"; break;
		case '\n': res += "\\n"; break;
		case '\r': res += "\\r"; break;
		case '\t': res += "\\t"; break;
		default:
			if ((unsigned char)c < 0x20 || c == '\x7f') {
				res += fmt::format("\\x{:02x}", (unsigned)(unsigned char)c);
			} else {
				res += c;
			}
		}
	}
	return res + "\"";
}

void Node::dump(std::ostream& out, unsigned level, unsigned indent) const
{
	string prefix(level, ' ');
	if (terminal) {
		out << prefix << _quoted(text) << "\n";
	} else if (is_leaf_rule()) {
		out << prefix << name << ": " << _quoted(children[0].text) << "\n";
	} else {
		out << prefix << name << ":\n";
		for (const auto& c : children) {
			c.dump(out, level + indent, indent);
		}
	}
}

string Node::to_string() const
{
	if (terminal) return _quoted(text);
	if (is_leaf_rule()) return name + ":" + _quoted(children[0].text);

	string res = name + "{";
	for (size_t i = 0; i < children.size(); ++i) {
		if (i) res += ", ";
		res += children[i].to_string();
	}
	return res + "}";
}

} // namespace Peg

#endif // PEG_DEDUP

//!! These little macros conflict with e.g. the Windows headers (included by DocTest)!
#undef CONST
#undef ERROR
#endif // _PEG_HPP_
