#include <gll/gss.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace gll;

TEST_CASE("gss: starts with the root node", "[gss]") {
  gss stack;
  REQUIRE(stack.size() == 1);
  CHECK(stack.root() == 0);
  CHECK(stack.at(stack.root()).slot == no_slot);
  CHECK(stack.edge_count() == 0);
}

TEST_CASE("gss: nodes are identified by slot and offset", "[gss]") {
  gss stack;
  auto [a, created_a] = stack.get_or_create(3, 0);
  auto [b, created_b] = stack.get_or_create(3, 0);
  auto [c, created_c] = stack.get_or_create(3, 1);

  CHECK(created_a);
  CHECK_FALSE(created_b);
  CHECK(created_c);
  CHECK(a == b);
  CHECK(a != c);
  CHECK(stack.size() == 3);
  CHECK(stack.at(c).slot == 3);
  CHECK(stack.at(c).offset == 1);
}

TEST_CASE("gss: edges are deduplicated", "[gss]") {
  gss stack;
  auto node = stack.get_or_create(1, 0).first;

  CHECK(stack.add_edge(node, stack.root(), 7));
  CHECK_FALSE(stack.add_edge(node, stack.root(), 7));
  CHECK(stack.add_edge(node, stack.root(), 8));
  CHECK(stack.edge_count() == 2);
  CHECK(stack.at(node).edges.size() == 2);
  CHECK(stack.at(node).edges.front() == gss_edge{stack.root(), 7});
}

TEST_CASE("gss: one popped result per right extent", "[gss]") {
  gss stack;
  auto node = stack.get_or_create(1, 0).first;

  CHECK(stack.add_popped(node, 10, 2));
  CHECK_FALSE(stack.add_popped(node, 10, 2));
  CHECK(stack.add_popped(node, 11, 4));
  CHECK(stack.at(node).popped == std::vector<sppf::node_id>{10, 11});
}
