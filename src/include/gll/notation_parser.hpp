#pragma once

#include <gll/notation.hpp>

#include <string_view>

namespace gll {

  // Parses grammar notation:
  //
  //   Expr =
  //     | Add: Expr "+" right:Term
  //     | Term
  //     ;
  //   Args = Expr* % ",";
  //   Digit = '0'..'9';
  //
  // At the start of an alternative, `Name:` names the alternative. Inside
  // it, `label:item` labels one item. Throws notation_error.
  class notation_parser {
  public:
    notation::document
    parse(std::string_view source);
  };

} // namespace gll
