#include <gll/engine.hpp>
#include <gll/errors.hpp>
#include <gll/notation_lowering.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <sstream>
#include <string>

using namespace gll;

// E -> E "+" N | N ;  N -> ['0'-'9']
static grammar
left_recursive() {
  grammar_builder b;
  auto plus = b.literal("+");
  auto digit = b.range('0', '9');
  b.production("E", {b.ref("E"), plus, b.ref("N")});
  b.production("E", {b.ref("N")});
  b.production("N", {digit});
  b.start("E");
  return b.build();
}

// S -> S S | "a"
static grammar
catalan() {
  grammar_builder b;
  b.production("S", {b.ref("S"), b.ref("S")});
  b.production("S", {b.literal("a")});
  b.start("S");
  return b.build();
}

static grammar
sequence(std::vector<std::string> literals) {
  grammar_builder b;
  std::vector<symbol> rhs;
  for (auto& l : literals)
    rhs.push_back(b.literal(std::move(l)));
  b.production("S", std::move(rhs));
  b.start("S");
  return b.build();
}

// == Successful parses =======================================================

TEST_CASE("engine: left recursion", "[engine]") {
  auto g = left_recursive();
  auto r = parse(g, "1+2+3");

  REQUIRE(r.ok());
  const auto& f = *r.forest();
  CHECK(f.describe(r.root()) == "E[0,5)");
  CHECK(f.count_derivations(r.root()) == 1);
  CHECK(f.find_symbol(*g.find_nonterminal("E"), 0, 3).has_value());
  CHECK(f.input() == "1+2+3");
}

TEST_CASE("engine: hidden left recursion through a nullable prefix",
          "[engine]") {
  // S -> A S "b" | "x" ;  A -> | "a"
  grammar_builder b;
  b.production("S", {b.ref("A"), b.ref("S"), b.literal("b")});
  b.production("S", {b.literal("x")});
  b.production("A", {});
  b.production("A", {b.literal("a")});
  b.start("S");
  auto g = b.build();

  CHECK(parse(g, "xbb").ok());
  CHECK(parse(g, "aaxbb").ok());
  CHECK(parse(g, "axbb").ok());
  CHECK(parse(g, "xbbb").ok());
  CHECK_FALSE(parse(g, "xbx").ok());
}

TEST_CASE("engine: cyclic grammar terminates", "[engine]") {
  // A -> A | "a"
  grammar_builder b;
  b.production("A", {b.ref("A")});
  b.production("A", {b.literal("a")});
  b.start("A");
  auto g = b.build();

  auto r = parse(g, "a");
  REQUIRE(r.ok());
  CHECK(r.forest()->count_derivations(r.root()) ==
        std::numeric_limits<std::uint64_t>::max());
}

TEST_CASE("engine: highly ambiguous grammar stays polynomial", "[engine]") {
  auto g = catalan();
  auto r = parse(g, std::string(12, 'a'));

  REQUIRE(r.ok());
  // Catalan(11) binary bracketings of twelve leaves
  CHECK(r.forest()->count_derivations(r.root()) == 58786);

  const auto& st = r.statistics();
  CHECK(st.symbol_nodes == 12 * 13 / 2);
  CHECK(st.terminal_nodes == 12);
  CHECK(st.intermediate_nodes == 0);
  CHECK(st.descriptors > 0);
  CHECK(st.gss_nodes > 1);
  CHECK(st.gss_edges >= st.gss_nodes - 1);
}

TEST_CASE("engine: empty productions", "[engine]") {
  // S -> A "b" ; A ->
  grammar_builder b;
  b.production("S", {b.ref("A"), b.literal("b")});
  b.production("A", {});
  b.start("S");
  auto g = b.build();

  auto r = parse(g, "b");
  REQUIRE(r.ok());
  CHECK(r.statistics().epsilon_nodes == 1);
  CHECK(r.forest()->find_symbol(*g.find_nonterminal("A"), 0, 0).has_value());
}

TEST_CASE("engine: empty input", "[engine]") {
  grammar_builder b;
  b.production("S", {});
  b.production("S", {b.literal("a")});
  b.start("S");
  auto g = b.build();

  auto r = parse(g, "");
  REQUIRE(r.ok());
  CHECK(r.forest()->describe(r.root()) == "S[0,0)");
}

TEST_CASE("engine: lookahead does not change the result", "[engine]") {
  auto g = left_recursive();
  parse_options opts;
  opts.lookahead = false;

  auto with = parse(g, "1+2+3");
  auto without = parse(g, "1+2+3", opts);
  REQUIRE(without.ok());
  CHECK(without.forest()->count_derivations(without.root()) ==
        with.forest()->count_derivations(with.root()));
  CHECK_FALSE(parse(g, "1+", opts).ok());
}

TEST_CASE("engine: layout grammar accepts whitespace and comments",
          "[engine]") {
  auto g = load_notation(R"(
    Expr = | Add: Expr "+" Term | Term ;
    Term = LITERAL ;
  )");
  CHECK(parse(g, "1 + 2").ok());
  CHECK(parse(g, "  1+2 // trailing\n").ok());
  CHECK(parse(g, "1 /* a */ + /* b */ 2").ok());
  CHECK_FALSE(parse(g, "1 + + 2").ok());
}

// == Failures ================================================================

TEST_CASE("engine: failure reports the furthest offset", "[engine]") {
  auto g = sequence({"a", "b"});
  auto r = parse(g, "ac");

  REQUIRE_FALSE(r.ok());
  const auto& f = r.failure();
  CHECK(f.offset == 1);
  CHECK(f.line == 1);
  CHECK(f.column == 2);
  CHECK_FALSE(f.end_of_input_expected);
  REQUIRE(f.expected.size() == 1);
  CHECK(f.expected.front().description == "\"b\"");
  CHECK(f.message() ==
        "expected one of {\"b\"} at position 1 (line 1, column 2)");
}

TEST_CASE("engine: trailing input expects the end", "[engine]") {
  auto g = sequence({"a"});
  auto r = parse(g, "ab");

  REQUIRE_FALSE(r);
  CHECK(r.failure().offset == 1);
  CHECK(r.failure().end_of_input_expected);
  CHECK(r.failure().expected.empty());
  CHECK(r.failure().message() ==
        "expected one of {end of input} at position 1 (line 1, column 2)");
}

TEST_CASE("engine: expected terminals and end of input together",
          "[engine]") {
  auto g = left_recursive();
  auto r = parse(g, "1+2\n+x");

  REQUIRE_FALSE(r.ok());
  const auto& f = r.failure();
  CHECK(f.offset == 3);
  CHECK(f.end_of_input_expected);
  REQUIRE(f.expected.size() == 1);
  CHECK(f.expected.front().description == "\"+\"");
  CHECK(f.message() ==
        "expected one of {\"+\", end of input} at position 3 (line 1, column 4)");
}

TEST_CASE("engine: incomplete input", "[engine]") {
  auto g = left_recursive();
  auto r = parse(g, "1+");

  REQUIRE_FALSE(r.ok());
  CHECK(r.failure().offset == 2);
  CHECK_FALSE(r.failure().end_of_input_expected);
  REQUIRE(r.failure().expected.size() == 1);
  CHECK(r.failure().expected.front().description == "['0'-'9']");
}

TEST_CASE("engine: failure line and column count newlines", "[engine]") {
  auto g = load_notation(R"(
    Expr = | Add: Expr "+" Term | Term ;
    Term = LITERAL ;
  )");
  auto r = parse(g, "1 +\n  *");

  REQUIRE_FALSE(r.ok());
  CHECK(r.failure().offset == 6);
  CHECK(r.failure().line == 2);
  CHECK(r.failure().column == 3);
}

TEST_CASE("engine: layout terminals are left out of the expected set",
          "[engine]") {
  auto g = load_notation(R"(
    Expr = | Add: Expr "+" Term | Term ;
    Term = LITERAL ;
  )");

  auto missing_operand = parse(g, "1 +\n  *");
  REQUIRE_FALSE(missing_operand.ok());
  CHECK(missing_operand.failure().message() ==
        "expected one of {LITERAL} at position 6 (line 2, column 3)");

  auto missing_operator = parse(g, "1 2");
  REQUIRE_FALSE(missing_operator.ok());
  CHECK(missing_operator.failure().message() ==
        "expected one of {\"+\", end of input} at position 2 (line 1, "
        "column 3)");
}

TEST_CASE("engine: layout terminals are reported when nothing else fits",
          "[engine]") {
  lowering_options opts;
  opts.layout = false;
  auto g = load_notation(R"(S = "a" WHITESPACE "b";)", opts);

  auto r = parse(g, "ab");
  REQUIRE_FALSE(r.ok());
  CHECK(r.failure().message() ==
        "expected one of {WHITESPACE} at position 1 (line 1, column 2)");
}

TEST_CASE("engine: result accessors", "[engine]") {
  auto g = sequence({"a"});

  auto good = parse(g, "a");
  CHECK(static_cast<bool>(good));
  CHECK_THROWS_AS(good.failure(), std::logic_error);

  auto bad = parse(g, "b");
  CHECK_THROWS_AS(bad.success(), parse_error);
  CHECK_THROWS_AS(bad.forest(), parse_error);
  try {
    bad.root();
    FAIL("expected parse_error");
  } catch (const parse_error& e) {
    CHECK(e.failure().offset == 0);
    CHECK(std::string(e.what()).rfind("parse failed: ", 0) == 0);
  }
}

// == Limits and instrumentation ==============================================

TEST_CASE("engine: descriptor budget aborts the parse", "[engine]") {
  auto g = catalan();
  parse_options opts;
  opts.max_descriptors = 10;

  try {
    parse(g, std::string(12, 'a'), opts);
    FAIL("expected parse_aborted");
  } catch (const parse_aborted& e) {
    CHECK(std::string(e.what()) ==
          "parse aborted: descriptor budget of 10 exceeded");
  }
}

TEST_CASE("engine: a budget that is not reached is harmless", "[engine]") {
  auto g = sequence({"a", "b"});
  parse_options opts;
  opts.max_descriptors = 1000;
  CHECK(parse(g, "ab", opts).ok());
}

TEST_CASE("engine: expired deadline aborts the parse", "[engine]") {
  auto g = catalan();
  parse_options opts;
  opts.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);
  CHECK_THROWS_AS(parse(g, std::string(12, 'a'), opts), parse_aborted);
}

TEST_CASE("engine: trace writes one line per descriptor", "[engine]") {
  auto g = sequence({"a", "b"});
  std::ostringstream trace;
  parse_options opts;
  opts.trace = &trace;

  auto r = parse(g, "ab", opts);
  REQUIRE(r.ok());
  auto text = trace.str();
  CHECK(text.find("descriptor S ::= . \"a\" \"b\" gss=0 offset=0 node=-") !=
        std::string::npos);

  std::size_t lines = 0;
  for (char c : text) {
    if (c == '\n') ++lines;
  }
  CHECK(lines == r.statistics().descriptors);
}

TEST_CASE("engine: an engine parses once", "[engine]") {
  auto g = sequence({"a"});
  engine e(g);
  CHECK(e.parse("a").ok());
  CHECK_THROWS_AS(e.parse("a"), std::logic_error);
}
