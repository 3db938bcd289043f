#pragma once

#include <gll/ast_rewriter.hpp>
#include <gll/cst.hpp>
#include <gll/grammar.hpp>

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gll {

  // Grammar-derived AST with no hand-written rules.

  struct generic_field;

  // A declared nonterminal, or an anonymous group (empty type).
  struct generic_node {
    std::string type;
    std::string variant;
    std::vector<generic_field> fields;

    bool
    operator==(const generic_node& other) const;
  };

  class generic_value {
  public:
    using list_type = std::vector<generic_value>;
    using variant_type =
        std::variant<std::monostate, bool, std::string, list_type, generic_node>;

    generic_value() = default;

    generic_value(variant_type v) : data_(std::move(v)) {}

    generic_value(bool v) : data_(v) {}

    generic_value(std::string v) : data_(std::move(v)) {}

    generic_value(const char* v) : data_(std::string(v)) {}

    generic_value(list_type v) : data_(std::move(v)) {}

    generic_value(generic_node v) : data_(std::move(v)) {}

    const variant_type&
    data() const {
      return data_;
    }

    template <typename T>
    bool
    holds() const {
      return std::holds_alternative<T>(data_);
    }

    template <typename T>
    const T&
    get() const {
      return std::get<T>(data_);
    }

    template <typename T>
    T&
    get() {
      return std::get<T>(data_);
    }

    bool
    empty() const {
      return holds<std::monostate>();
    }

    // Field `name` of a node value. Throws std::out_of_range when absent.
    const generic_value&
    operator[](std::string_view name) const;

    bool
    operator==(const generic_value& other) const;

  private:
    variant_type data_;
  };

  struct generic_field {
    std::string name;
    generic_value value;

    bool
    operator==(const generic_field& other) const;
  };

  // Rules for every production of `g`, keyed on nonterminal origin:
  //   declared   node {type, variant = label, fields}
  //   optional   the inner value, nothing, or a bool over literal-only items
  //   repeat     a list of item values
  //   group      the single value of the chosen branch, or an anonymous node
  //   builtin    matched text
  //   start      value of the wrapped start symbol
  ast_rewriter<generic_value>
  make_generic_rewriter(const grammar& g);

  generic_value
  lower_generic(const grammar& g, const cst_node& root);

  // Expr.Add{left: Expr.Term{field_0: "1"}, right: "2"}
  std::string
  to_string(const generic_value& value);

} // namespace gll
