#pragma once

#include <gll/grammar.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gll::sppf {

  using node_id = std::uint32_t;

  inline constexpr node_id no_node = std::numeric_limits<node_id>::max();

  enum class node_kind : std::uint8_t {
    symbol,       // label: nonterminal index
    intermediate, // label: slot
    terminal,     // label: terminal index
    epsilon,      // label unused, start == end
    packed,       // label: slot of the completed position
  };

  struct node {
    node_kind kind = node_kind::symbol;
    std::uint32_t label = 0;
    std::size_t start = 0;
    std::size_t end = 0;

    // Symbol and intermediate nodes: packed children, in creation order.
    std::vector<node_id> packed;

    // Packed nodes: split offset and children. `left` is no_node when the
    // derivation has no prefix.
    std::size_t pivot = 0;
    node_id left = no_node;
    node_id right = no_node;
  };

  // Frozen forest of one parse. Owns a copy of the input. The grammar must
  // outlive the forest.
  class forest {
  public:
    const gll::grammar&
    grammar() const {
      return *grammar_;
    }

    std::string_view
    input() const {
      return input_;
    }

    std::size_t
    size() const {
      return nodes_.size();
    }

    const node&
    at(node_id id) const {
      return nodes_[id];
    }

    std::optional<node_id>
    find_symbol(std::uint32_t nonterminal, std::size_t start,
                std::size_t end) const;

    std::optional<node_id>
    find_intermediate(slot_id slot, std::size_t start, std::size_t end) const;

    std::optional<node_id>
    find_terminal(std::uint32_t terminal, std::size_t start,
                  std::size_t end) const;

    std::size_t
    count(node_kind kind) const;

    // Input covered by a node.
    std::string_view
    text(node_id id) const;

    // "Expr[0,5)", "Expr ::= Expr . '+' Term [0,2)", "\"+\"[1,2)"
    std::string
    describe(node_id id) const;

    // Production slot of a packed node.
    const production&
    packed_production(node_id packed) const;

    bool
    ambiguous(node_id id) const {
      return nodes_[id].packed.size() > 1;
    }

    // Symbol and intermediate nodes with more than one packed child.
    std::vector<node_id>
    ambiguous_nodes() const;

    // Number of distinct derivations below `id`, saturating at the maximum
    // value. Cyclic forests saturate.
    std::uint64_t
    count_derivations(node_id id) const;

  private:
    friend class forest_builder;

    struct key {
      node_kind kind;
      std::uint32_t label;
      std::size_t start;
      std::size_t end;

      bool
      operator==(const key&) const = default;
    };

    struct key_hash {
      std::size_t
      operator()(const key& k) const noexcept;
    };

    struct packed_key {
      node_id parent;
      slot_id slot;
      std::size_t pivot;

      bool
      operator==(const packed_key&) const = default;
    };

    struct packed_key_hash {
      std::size_t
      operator()(const packed_key& k) const noexcept;
    };

    const gll::grammar* grammar_ = nullptr;
    std::string input_;
    std::vector<node> nodes_;
    std::unordered_map<key, node_id, key_hash> index_;
    std::unordered_map<packed_key, node_id, packed_key_hash> packed_index_;

    std::optional<node_id>
    find(const key& k) const;
  };

  // Interns forest nodes during one parse.
  class forest_builder {
  public:
    forest_builder(const gll::grammar& g, std::string input);

    const forest&
    view() const {
      return *forest_;
    }

    node_id
    terminal_node(std::uint32_t terminal, std::size_t start, std::size_t end);

    node_id
    epsilon_node(std::size_t offset);

    node_id
    symbol_node(std::uint32_t nonterminal, std::size_t start, std::size_t end);

    node_id
    intermediate_node(slot_id slot, std::size_t start, std::size_t end);

    // Adds a packed child to `parent` unless one with the same slot and
    // pivot exists. Returns the packed node.
    node_id
    add_packed(node_id parent, slot_id slot, std::size_t pivot, node_id left,
               node_id right);

    // The binarised-SPPF getNodeP step for slot X ::= alpha . beta, where
    // `left` covers alpha minus its last symbol (or is no_node) and `right`
    // covers that last symbol.
    node_id
    extend(slot_id slot, node_id left, node_id right);

    // Hands the forest over. The builder must not be used afterwards.
    std::shared_ptr<const forest>
    finish();

  private:
    std::shared_ptr<forest> forest_;

    node_id
    intern(node_kind kind, std::uint32_t label, std::size_t start,
           std::size_t end);
  };

} // namespace gll::sppf
