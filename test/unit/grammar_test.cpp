#include <gll/errors.hpp>
#include <gll/grammar.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <string>

using namespace gll;

static std::string
build_error(const grammar_builder& b) {
  try {
    b.build();
  } catch (const grammar_error& e) {
    return e.what();
  }
  return {};
}

// E -> left:E "+" right:T | T ;  T -> ['0'-'9']
static grammar
expr_grammar() {
  grammar_builder b;
  auto plus = b.literal("+");
  auto digit = b.range('0', '9');
  b.production("E", {b.ref("E"), plus, b.ref("T")}, "add", {"left", "", "right"});
  b.production("E", {b.ref("T")});
  b.production("T", {digit});
  b.start("E");
  return b.build();
}

// == Builder ==================================================================

TEST_CASE("grammar: builder resolves names", "[grammar]") {
  auto g = expr_grammar();

  REQUIRE(g.nonterminals().size() == 2);
  REQUIRE(g.terminals().size() == 2);
  CHECK(g.start_symbol().name == "E");
  CHECK(g.find_nonterminal("T").has_value());
  CHECK_FALSE(g.find_nonterminal("X").has_value());
  CHECK(g.find_terminal("\"+\"").has_value());
  CHECK(g.find_terminal("['0'-'9']").has_value());
}

TEST_CASE("grammar: productions keep declaration order", "[grammar]") {
  auto g = expr_grammar();
  auto prods = g.productions_of("E");

  REQUIRE(prods.size() == 2);
  CHECK(prods[0]->index == 0);
  CHECK(prods[0]->label == "add");
  CHECK(prods[0]->rhs.size() == 3);
  CHECK(prods[1]->index == 1);
  CHECK(prods[1]->label.empty());
  CHECK(&g.production_of("E", 1) == prods[1]);
}

TEST_CASE("grammar: field labels parallel the right-hand side", "[grammar]") {
  auto g = expr_grammar();
  const auto& add = g.production_of("E", 0);
  CHECK(add.field_labels == std::vector<std::string>{"left", "", "right"});

  const auto& term = g.production_of("E", 1);
  CHECK(term.field_labels == std::vector<std::string>{""});
}

TEST_CASE("grammar: production ids are grouped by nonterminal", "[grammar]") {
  grammar_builder b;
  auto a = b.literal("a");
  b.production("S", {a});
  b.production("A", {a});
  b.production("S", {b.ref("A")});
  b.start("S");
  auto g = b.build();

  auto s = g.productions_of("S");
  CHECK(s[0]->id + 1 == s[1]->id);
  for (const auto& p : g.productions())
    CHECK(&g.productions()[p.id] == &p);
}

TEST_CASE("grammar: anonymous terminals are interned", "[grammar]") {
  grammar_builder b;
  auto x = b.literal("x");
  auto y = b.literal("x");
  CHECK(x == y);
  CHECK(b.range('a', 'z') == b.range('a', 'z'));
  CHECK(b.builtin(builtin_rule::ident) == b.builtin(builtin_rule::ident));
  CHECK_FALSE(b.literal("y") == x);
}

TEST_CASE("grammar: built-in whitespace is trivia", "[grammar]") {
  grammar_builder b;
  auto ws = b.builtin(builtin_rule::whitespace);
  auto id = b.builtin(builtin_rule::ident);
  b.production("S", {id, ws});
  b.start("S");
  auto g = b.build();
  CHECK(g.terminals()[ws.index].trivia);
  CHECK_FALSE(g.terminals()[id.index].trivia);
}

TEST_CASE("grammar: named terminals", "[grammar]") {
  grammar_builder b;
  auto num = b.terminal("num", char_class_matcher{{{'0', '9'}}, false, 1, 0});
  CHECK(b.token("num") == num);
  CHECK_THROWS_AS(b.token("missing"), grammar_error);
  CHECK_THROWS_AS(b.terminal("num", literal_matcher{"1"}), grammar_error);
}

// == Validation ===============================================================

TEST_CASE("grammar: start symbol is required", "[grammar]") {
  grammar_builder b;
  b.production("S", {b.literal("a")});
  CHECK(build_error(b) == "no start symbol");

  b.start("T");
  CHECK(build_error(b) == "start symbol is not defined: T");
}

TEST_CASE("grammar: undefined nonterminal names its referrer", "[grammar]") {
  grammar_builder b;
  b.production("S", {b.literal("a")});
  b.production("S", {b.ref("Missing")});
  b.start("S");
  CHECK(build_error(b) ==
        "undefined nonterminal Missing referenced from S production 1");
}

TEST_CASE("grammar: a nonterminal without productions is rejected",
          "[grammar]") {
  grammar_builder b;
  b.define("Empty");
  b.production("S", {b.ref("Empty")});
  b.start("S");
  CHECK(build_error(b) == "nonterminal Empty has no productions");
}

TEST_CASE("grammar: duplicate definitions are rejected", "[grammar]") {
  grammar_builder b;
  b.define("S");
  CHECK(b.defined("S"));
  CHECK_THROWS_AS(b.define("S"), grammar_error);
}

TEST_CASE("grammar: invalid matchers are rejected at build", "[grammar]") {
  grammar_builder b;
  b.production("S", {b.range('z', 'a')});
  b.start("S");
  CHECK_THROWS_AS(b.build(), grammar_error);
}

TEST_CASE("grammar: empty productions can be disallowed", "[grammar]") {
  grammar_builder b;
  b.allow_empty_productions(false);
  b.production("S", {b.ref("A")});
  b.production("A", {});
  b.start("S");
  CHECK(build_error(b) == "empty production 0 of A is not allowed");

  grammar_builder ok;
  ok.allow_empty_productions(false);
  ok.define("A", nonterminal_options{nonterminal_origin::declared, false, true});
  ok.production("S", {ok.ref("A")});
  ok.production("A", {});
  ok.start("S");
  CHECK_NOTHROW(ok.build());
}

TEST_CASE("grammar: more field labels than symbols is an error",
          "[grammar]") {
  grammar_builder b;
  CHECK_THROWS_AS(b.production("S", {b.literal("a")}, "", {"x", "y"}),
                  grammar_error);
}

TEST_CASE("grammar: unknown nonterminal lookups throw", "[grammar]") {
  auto g = expr_grammar();
  CHECK_THROWS_AS(g.productions_of("Nope"), grammar_error);
  CHECK_THROWS_AS(g.production_of("E", 2), grammar_error);
}

// == Slots and analysis ======================================================

TEST_CASE("grammar: slots", "[grammar]") {
  auto g = expr_grammar();
  const auto& add = g.production_of("E", 0);
  auto s = g.slot(add.id, 1);

  CHECK(&g.slot_production(s) == &add);
  CHECK(g.slot_dot(s) == 1);
  CHECK_FALSE(g.slot_at_end(s));
  CHECK(g.slot_at_end(g.slot(add.id, 3)));
  CHECK(g.slot_to_string(s) == "E ::= E . \"+\" T");
  CHECK(g.slot_to_string(g.slot(add.id, 3)) == "E ::= E \"+\" T .");
  CHECK(g.slot_count() == 4 + 2 + 2);
}

TEST_CASE("grammar: nullable and FIRST sets", "[grammar]") {
  // S -> A "b" ; A -> | "a"
  grammar_builder b;
  auto a = b.literal("a");
  auto bt = b.literal("b");
  b.production("S", {b.ref("A"), bt});
  b.production("A", {});
  b.production("A", {a});
  b.start("S");
  auto g = b.build();

  auto s = *g.find_nonterminal("S");
  auto A = *g.find_nonterminal("A");
  CHECK(g.nullable(A));
  CHECK_FALSE(g.nullable(s));

  const auto& sp = g.production_of("S", 0);
  auto first = g.first_terminals(g.slot(sp.id, 0));
  CHECK(first.size() == 2);
  CHECK(std::find(first.begin(), first.end(), a.index) != first.end());
  CHECK(std::find(first.begin(), first.end(), bt.index) != first.end());
  CHECK_FALSE(g.suffix_nullable(g.slot(sp.id, 0)));
  CHECK(g.suffix_nullable(g.slot(sp.id, 2)));

  const auto& empty = g.production_of("A", 0);
  CHECK(g.suffix_nullable(g.slot(empty.id, 0)));
  CHECK(g.first_terminals(g.slot(empty.id, 0)).empty());
}

TEST_CASE("grammar: FIRST sets through left recursion", "[grammar]") {
  auto g = expr_grammar();
  const auto& add = g.production_of("E", 0);
  auto first = g.first_terminals(g.slot(add.id, 0));
  REQUIRE(first.size() == 1);
  CHECK(g.terminals()[first.front()].name == "['0'-'9']");
}
