#include <gll/sppf.hpp>

#include <optional>
#include <utility>

namespace gll::sppf {

  namespace {

    void
    hash_combine(std::size_t& seed, std::size_t value) {
      seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }

    constexpr std::uint64_t saturated = std::numeric_limits<std::uint64_t>::max();

    std::uint64_t
    saturating_add(std::uint64_t a, std::uint64_t b) {
      return a > saturated - b ? saturated : a + b;
    }

    std::uint64_t
    saturating_mul(std::uint64_t a, std::uint64_t b) {
      if (a == 0 || b == 0) return 0;
      return a > saturated / b ? saturated : a * b;
    }

    std::string
    span(std::size_t start, std::size_t end) {
      return "[" + std::to_string(start) + "," + std::to_string(end) + ")";
    }

  } // namespace

  // ===========================================================================
  // forest
  // ===========================================================================

  std::size_t
  forest::key_hash::operator()(const key& k) const noexcept {
    std::size_t seed = static_cast<std::size_t>(k.kind);
    hash_combine(seed, k.label);
    hash_combine(seed, k.start);
    hash_combine(seed, k.end);
    return seed;
  }

  std::size_t
  forest::packed_key_hash::operator()(const packed_key& k) const noexcept {
    std::size_t seed = k.parent;
    hash_combine(seed, k.slot);
    hash_combine(seed, k.pivot);
    return seed;
  }

  std::optional<node_id>
  forest::find(const key& k) const {
    auto it = index_.find(k);
    if (it == index_.end()) return std::nullopt;
    return it->second;
  }

  std::optional<node_id>
  forest::find_symbol(std::uint32_t nonterminal, std::size_t start,
                      std::size_t end) const {
    return find({node_kind::symbol, nonterminal, start, end});
  }

  std::optional<node_id>
  forest::find_intermediate(slot_id slot, std::size_t start,
                            std::size_t end) const {
    return find({node_kind::intermediate, slot, start, end});
  }

  std::optional<node_id>
  forest::find_terminal(std::uint32_t terminal, std::size_t start,
                        std::size_t end) const {
    return find({node_kind::terminal, terminal, start, end});
  }

  std::size_t
  forest::count(node_kind kind) const {
    std::size_t n = 0;
    for (const auto& nd : nodes_) {
      if (nd.kind == kind) ++n;
    }
    return n;
  }

  std::string_view
  forest::text(node_id id) const {
    const auto& nd = nodes_[id];
    if (nd.kind == node_kind::packed) return {};
    return std::string_view(input_).substr(nd.start, nd.end - nd.start);
  }

  const production&
  forest::packed_production(node_id packed) const {
    return grammar_->slot_production(nodes_[packed].label);
  }

  std::string
  forest::describe(node_id id) const {
    const auto& nd = nodes_[id];
    switch (nd.kind) {
      case node_kind::symbol:
        return grammar_->nonterminals()[nd.label].name + span(nd.start, nd.end);
      case node_kind::intermediate:
        return grammar_->slot_to_string(nd.label) + " " +
               span(nd.start, nd.end);
      case node_kind::terminal:
        return grammar_->terminals()[nd.label].name + span(nd.start, nd.end);
      case node_kind::epsilon:
        return "epsilon" + span(nd.start, nd.end);
      case node_kind::packed:
        return "(" + grammar_->slot_to_string(nd.label) + ", " +
               std::to_string(nd.pivot) + ")";
    }
    return {};
  }

  std::vector<node_id>
  forest::ambiguous_nodes() const {
    std::vector<node_id> result;
    for (node_id id = 0; id < nodes_.size(); ++id) {
      if (nodes_[id].packed.size() > 1) result.push_back(id);
    }
    return result;
  }

  std::uint64_t
  forest::count_derivations(node_id id) const {
    if (id == no_node) return 1;
    if (nodes_[id].kind == node_kind::packed) {
      return saturating_mul(count_derivations(nodes_[id].left),
                            count_derivations(nodes_[id].right));
    }

    std::unordered_map<node_id, std::uint64_t> memo;
    std::vector<bool> active(nodes_.size(), false);

    auto known = [&](node_id n) -> std::optional<std::uint64_t> {
      if (n == no_node) return 1;
      const auto& nd = nodes_[n];
      if (nd.kind == node_kind::terminal || nd.kind == node_kind::epsilon)
        return 1;
      if (auto it = memo.find(n); it != memo.end()) return it->second;
      if (active[n]) return saturated;
      return std::nullopt;
    };

    // A symbol or intermediate node whose packed children are being summed.
    struct frame {
      node_id node;
      std::size_t packed = 0;
      bool right = false;
      std::uint64_t product = 1;
      std::uint64_t total = 0;
    };

    auto take = [](frame& f, std::uint64_t count) {
      f.product = saturating_mul(f.product, count);
      if (!f.right) {
        f.right = true;
        return;
      }
      f.total = saturating_add(f.total, f.product);
      f.product = 1;
      f.right = false;
      ++f.packed;
    };

    if (auto count = known(id)) return *count;
    std::vector<frame> stack;
    active[id] = true;
    stack.push_back({id});
    while (true) {
      auto& f = stack.back();
      const auto& nd = nodes_[f.node];
      if (f.packed == nd.packed.size()) {
        const auto total = f.total;
        active[f.node] = false;
        memo.emplace(f.node, total);
        stack.pop_back();
        if (stack.empty()) return total;
        take(stack.back(), total);
        continue;
      }
      const auto& p = nodes_[nd.packed[f.packed]];
      const auto child = f.right ? p.right : p.left;
      if (auto count = known(child)) {
        take(f, *count);
        continue;
      }
      active[child] = true;
      stack.push_back({child});
    }
  }

  // ===========================================================================
  // forest_builder
  // ===========================================================================

  forest_builder::forest_builder(const gll::grammar& g, std::string input)
      : forest_(std::make_shared<forest>()) {
    forest_->grammar_ = &g;
    forest_->input_ = std::move(input);
  }

  node_id
  forest_builder::intern(node_kind kind, std::uint32_t label, std::size_t start,
                         std::size_t end) {
    forest::key k{kind, label, start, end};
    auto [it, inserted] = forest_->index_.try_emplace(
        k, static_cast<node_id>(forest_->nodes_.size()));
    if (inserted) {
      node nd;
      nd.kind = kind;
      nd.label = label;
      nd.start = start;
      nd.end = end;
      forest_->nodes_.push_back(std::move(nd));
    }
    return it->second;
  }

  node_id
  forest_builder::terminal_node(std::uint32_t terminal, std::size_t start,
                                std::size_t end) {
    return intern(node_kind::terminal, terminal, start, end);
  }

  node_id
  forest_builder::epsilon_node(std::size_t offset) {
    return intern(node_kind::epsilon, 0, offset, offset);
  }

  node_id
  forest_builder::symbol_node(std::uint32_t nonterminal, std::size_t start,
                              std::size_t end) {
    return intern(node_kind::symbol, nonterminal, start, end);
  }

  node_id
  forest_builder::intermediate_node(slot_id slot, std::size_t start,
                                    std::size_t end) {
    return intern(node_kind::intermediate, slot, start, end);
  }

  node_id
  forest_builder::add_packed(node_id parent, slot_id slot, std::size_t pivot,
                             node_id left, node_id right) {
    forest::packed_key k{parent, slot, pivot};
    auto [it, inserted] = forest_->packed_index_.try_emplace(
        k, static_cast<node_id>(forest_->nodes_.size()));
    if (inserted) {
      const auto& owner = forest_->nodes_[parent];
      node nd;
      nd.kind = node_kind::packed;
      nd.label = slot;
      nd.start = owner.start;
      nd.end = owner.end;
      nd.pivot = pivot;
      nd.left = left;
      nd.right = right;
      forest_->nodes_.push_back(std::move(nd));
      forest_->nodes_[parent].packed.push_back(it->second);
    }
    return it->second;
  }

  node_id
  forest_builder::extend(slot_id slot, node_id left, node_id right) {
    const auto& g = *forest_->grammar_;
    const auto& p = g.slot_production(slot);
    const auto dot = g.slot_dot(slot);
    const bool at_end = dot == p.rhs.size();

    // X ::= a . beta with a single non-nullable symbol before the dot and a
    // non-empty beta needs no node of its own.
    if (dot == 1 && !at_end) {
      const auto& first = p.rhs[0];
      if (first.is_terminal() || !g.nullable(first.index)) return right;
    }

    const auto& r = forest_->nodes_[right];
    std::size_t end = r.end;
    std::size_t start = r.start;
    std::size_t pivot = r.start;
    if (left != no_node) start = forest_->nodes_[left].start;

    node_id parent = at_end ? symbol_node(p.lhs, start, end)
                            : intermediate_node(slot, start, end);
    add_packed(parent, slot, pivot, left, right);
    return parent;
  }

  std::shared_ptr<const forest>
  forest_builder::finish() {
    return std::move(forest_);
  }

} // namespace gll::sppf
