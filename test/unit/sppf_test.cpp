#include <gll/grammar.hpp>
#include <gll/sppf.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>

using namespace gll;
using namespace gll::sppf;

// S -> "a" "b" "c" | "a" B ;  B -> "b" "c"
static grammar
abc_grammar() {
  grammar_builder b;
  auto a = b.literal("a");
  auto bt = b.literal("b");
  auto c = b.literal("c");
  b.production("S", {a, bt, c});
  b.production("S", {a, b.ref("B")});
  b.production("B", {bt, c});
  b.start("S");
  return b.build();
}

TEST_CASE("sppf: nodes are interned", "[sppf]") {
  auto g = abc_grammar();
  forest_builder fb(g, "abc");

  auto t1 = fb.terminal_node(0, 0, 1);
  auto t2 = fb.terminal_node(0, 0, 1);
  CHECK(t1 == t2);
  CHECK(fb.terminal_node(1, 1, 2) != t1);
  CHECK(fb.epsilon_node(3) == fb.epsilon_node(3));
  CHECK(fb.symbol_node(0, 0, 3) == fb.symbol_node(0, 0, 3));
  CHECK(fb.view().find_terminal(0, 0, 1) == t1);
  CHECK_FALSE(fb.view().find_terminal(0, 1, 2).has_value());
}

TEST_CASE("sppf: extend builds a binarised derivation", "[sppf]") {
  auto g = abc_grammar();
  const auto& p = g.production_of("S", 0);
  forest_builder fb(g, "abc");

  auto ta = fb.terminal_node(0, 0, 1);
  auto tb = fb.terminal_node(1, 1, 2);
  auto tc = fb.terminal_node(2, 2, 3);

  // A first terminal stands for itself
  CHECK(fb.extend(g.slot(p.id, 1), no_node, ta) == ta);

  auto mid = fb.extend(g.slot(p.id, 2), ta, tb);
  const auto& f = fb.view();
  CHECK(f.at(mid).kind == node_kind::intermediate);
  CHECK(f.at(mid).start == 0);
  CHECK(f.at(mid).end == 2);
  CHECK(f.describe(mid) == "S ::= \"a\" \"b\" . \"c\" [0,2)");

  auto root = fb.extend(g.slot(p.id, 3), mid, tc);
  CHECK(f.at(root).kind == node_kind::symbol);
  CHECK(f.describe(root) == "S[0,3)");
  REQUIRE(f.at(root).packed.size() == 1);

  const auto& packed = f.at(f.at(root).packed.front());
  CHECK(packed.kind == node_kind::packed);
  CHECK(packed.pivot == 2);
  CHECK(packed.left == mid);
  CHECK(packed.right == tc);
  CHECK(f.text(root) == "abc");
  CHECK(f.count_derivations(root) == 1);
  CHECK_FALSE(f.ambiguous(root));
}

TEST_CASE("sppf: packed nodes are unique per slot and pivot", "[sppf]") {
  auto g = abc_grammar();
  const auto& p = g.production_of("S", 0);
  forest_builder fb(g, "abc");
  auto s = fb.symbol_node(0, 0, 3);
  auto ta = fb.terminal_node(0, 0, 1);

  auto first = fb.add_packed(s, g.slot(p.id, 3), 1, ta, no_node);
  auto again = fb.add_packed(s, g.slot(p.id, 3), 1, ta, no_node);
  CHECK(first == again);
  CHECK(fb.view().at(s).packed.size() == 1);
  CHECK(fb.view().count(node_kind::packed) == 1);
}

TEST_CASE("sppf: two derivations of one span make it ambiguous", "[sppf]") {
  auto g = abc_grammar();
  const auto& direct = g.production_of("S", 0);
  const auto& nested = g.production_of("S", 1);
  const auto& bp = g.production_of("B", 0);
  forest_builder fb(g, "abc");

  auto ta = fb.terminal_node(0, 0, 1);
  auto tb = fb.terminal_node(1, 1, 2);
  auto tc = fb.terminal_node(2, 2, 3);

  auto mid = fb.extend(g.slot(direct.id, 2), ta, tb);
  auto root = fb.extend(g.slot(direct.id, 3), mid, tc);

  auto b_first = fb.extend(g.slot(bp.id, 1), no_node, tb);
  auto bnode = fb.extend(g.slot(bp.id, 2), b_first, tc);
  auto root2 = fb.extend(g.slot(nested.id, 2), ta, bnode);

  CHECK(root == root2);
  auto f = fb.finish();
  CHECK(f->ambiguous(root));
  CHECK(f->ambiguous_nodes() == std::vector<node_id>{root});
  CHECK(f->count_derivations(root) == 2);
  CHECK(f->count(node_kind::symbol) == 2);
  CHECK(f->packed_production(f->at(root).packed[1]).index == 1);
  CHECK(f->describe(f->at(root).packed[1]) == "(S ::= \"a\" B ., 1)");
}

TEST_CASE("sppf: epsilon derivations", "[sppf]") {
  grammar_builder b;
  b.production("S", {});
  b.start("S");
  auto g = b.build();
  const auto& p = g.production_of("S", 0);

  forest_builder fb(g, "");
  auto eps = fb.epsilon_node(0);
  auto root = fb.extend(g.slot(p.id, 0), no_node, eps);
  const auto& f = fb.view();
  CHECK(f.at(root).kind == node_kind::symbol);
  CHECK(f.at(root).start == 0);
  CHECK(f.at(root).end == 0);
  CHECK(f.describe(eps) == "epsilon[0,0)");
  CHECK(f.count_derivations(root) == 1);
}

TEST_CASE("sppf: cyclic derivations saturate the count", "[sppf]") {
  // A -> A | "a"
  grammar_builder b;
  b.production("A", {b.ref("A")});
  b.production("A", {b.literal("a")});
  b.start("A");
  auto g = b.build();
  const auto& loop = g.production_of("A", 0);
  const auto& leaf = g.production_of("A", 1);

  forest_builder fb(g, "a");
  auto ta = fb.terminal_node(0, 0, 1);
  auto root = fb.extend(g.slot(leaf.id, 1), no_node, ta);
  CHECK(fb.extend(g.slot(loop.id, 1), no_node, root) == root);

  const auto& f = fb.view();
  CHECK(f.at(root).packed.size() == 2);
  CHECK(f.count_derivations(root) ==
        std::numeric_limits<std::uint64_t>::max());
}
