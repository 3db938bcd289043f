#pragma once

#include <gll/grammar.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gll {

  enum class cst_kind { nonterminal, token };

  // One node of a concrete syntax tree. A nonterminal node has one child per
  // right-hand-side position of its production. Left-recursive lists make
  // trees as deep as the input is long, so teardown and comparison do not
  // recurse.
  struct cst_node {
    cst_kind kind = cst_kind::nonterminal;
    // Nonterminal index, or terminal index for tokens.
    std::uint32_t symbol = 0;
    // Production id; unused for tokens.
    std::uint32_t production = 0;
    std::size_t start = 0;
    std::size_t end = 0;
    // Matched text of a token.
    std::string text;
    bool trivia = false;
    std::vector<cst_node> children;

    cst_node() = default;
    cst_node(const cst_node&) = default;
    cst_node(cst_node&&) noexcept = default;
    cst_node&
    operator=(const cst_node&) = default;
    cst_node&
    operator=(cst_node&&) noexcept = default;
    ~cst_node();

    bool
    is_token() const {
      return kind == cst_kind::token;
    }

    bool
    operator==(const cst_node& other) const;
  };

  // Concatenated text of every token under `node`, in order.
  std::string
  cst_text(const cst_node& node);

  // Tokens under `node` in input order.
  std::vector<const cst_node*>
  cst_tokens(const cst_node& node, bool include_trivia = true);

  // Nonterminal or terminal name.
  const std::string&
  cst_name(const grammar& g, const cst_node& node);

  // Production of a nonterminal node.
  const production&
  cst_production(const grammar& g, const cst_node& node);

} // namespace gll
