#include <gll/cst.hpp>

#include <stdexcept>
#include <utility>

namespace gll {

  cst_node::~cst_node() {
    if (children.empty()) return;
    auto pending = std::move(children);
    while (!pending.empty()) {
      auto last = std::move(pending.back());
      pending.pop_back();
      for (auto& c : last.children)
        pending.push_back(std::move(c));
      last.children.clear();
    }
  }

  namespace {

    bool
    same_fields(const cst_node& a, const cst_node& b) {
      return a.kind == b.kind && a.symbol == b.symbol &&
             a.production == b.production && a.start == b.start &&
             a.end == b.end && a.text == b.text && a.trivia == b.trivia &&
             a.children.size() == b.children.size();
    }

  } // namespace

  bool
  cst_node::operator==(const cst_node& other) const {
    std::vector<std::pair<const cst_node*, const cst_node*>> pending{
        {this, &other}};
    while (!pending.empty()) {
      auto [a, b] = pending.back();
      pending.pop_back();
      if (!same_fields(*a, *b)) return false;
      for (std::size_t i = 0; i < a->children.size(); ++i)
        pending.emplace_back(&a->children[i], &b->children[i]);
    }
    return true;
  }

  std::string
  cst_text(const cst_node& node) {
    std::string out;
    for (const auto* token : cst_tokens(node))
      out += token->text;
    return out;
  }

  std::vector<const cst_node*>
  cst_tokens(const cst_node& node, bool include_trivia) {
    std::vector<const cst_node*> out;
    std::vector<const cst_node*> pending{&node};
    while (!pending.empty()) {
      const auto* n = pending.back();
      pending.pop_back();
      if (n->is_token()) {
        if (include_trivia || !n->trivia) out.push_back(n);
        continue;
      }
      if (n->trivia && !include_trivia) continue;
      for (auto it = n->children.rbegin(); it != n->children.rend(); ++it)
        pending.push_back(&*it);
    }
    return out;
  }

  const std::string&
  cst_name(const grammar& g, const cst_node& node) {
    if (node.is_token()) return g.terminals()[node.symbol].name;
    return g.nonterminals()[node.symbol].name;
  }

  const production&
  cst_production(const grammar& g, const cst_node& node) {
    if (node.is_token()) {
      throw std::invalid_argument("cst: token " + cst_name(g, node) +
                                  " has no production");
    }
    return g.productions()[node.production];
  }

} // namespace gll
