#pragma once

#include <gll/grammar.hpp>
#include <gll/notation.hpp>

#include <string>
#include <string_view>

namespace gll {

  // Names of the nonterminals the lowering adds.
  inline constexpr std::string_view layout_symbol = "$layout";
  inline constexpr std::string_view start_symbol = "$start";
  inline constexpr std::string_view token_tree_symbol = "TOKEN_TREE";

  struct lowering_options {
    // Insert optional whitespace and comments before every terminal and
    // after the start symbol.
    bool layout = true;
    // Start symbol; the first symbol of the document when empty.
    std::string start;
  };

  // Lowers the notation tree to BNF productions. Group, option and
  // repetition nodes become fresh nonterminals named after the enclosing
  // symbol: Expr.grp1, Expr.opt2, Expr.rep3. Throws grammar_error.
  grammar
  lower_notation(const notation::document& doc,
                 const lowering_options& opts = {});

  // Parses and lowers grammar notation text.
  grammar
  load_notation(std::string_view text, const lowering_options& opts = {});

} // namespace gll
