#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace gll::notation {

  // Tree of one grammar notation document, before lowering to the grammar
  // model.

  class rule_node;

  // ---------------------------------------------------------------------------
  // Rule node types
  // ---------------------------------------------------------------------------

  struct string_literal {
    std::string text;
  };

  // 'a'..'z'; a single 'a' is the range 'a'..'a'
  struct char_range {
    unsigned char first = 0;
    unsigned char last = 0;
  };

  // Reference to a symbol or a built-in rule.
  struct symbol_name {
    std::string name;
  };

  struct concatenation {
    std::vector<rule_node> items;
  };

  struct alternation {
    std::vector<rule_node> items;
  };

  // name:item
  struct labeled {
    std::string label;
    std::unique_ptr<rule_node> item;
  };

  // item?
  struct option {
    std::unique_ptr<rule_node> item;
  };

  // item* or item+, optionally separated: item* % ",", item+ %% ";"
  struct repeated {
    bool at_least_one = false;
    std::unique_ptr<rule_node> item;
    std::unique_ptr<rule_node> separator;
    // %%: one trailing separator is accepted
    bool allow_trailing = false;
  };

  // ---------------------------------------------------------------------------
  // Rule node
  // ---------------------------------------------------------------------------

  class rule_node {
  public:
    using variant_type =
        std::variant<string_literal, char_range, symbol_name, concatenation,
                     alternation, labeled, option, repeated>;

    rule_node(variant_type v) : data_(std::move(v)) {}

    rule_node(string_literal v) : data_(std::move(v)) {}

    rule_node(char_range v) : data_(v) {}

    rule_node(symbol_name v) : data_(std::move(v)) {}

    rule_node(concatenation v) : data_(std::move(v)) {}

    rule_node(alternation v) : data_(std::move(v)) {}

    rule_node(labeled v) : data_(std::move(v)) {}

    rule_node(option v) : data_(std::move(v)) {}

    rule_node(repeated v) : data_(std::move(v)) {}

    rule_node(const rule_node&) = delete;
    rule_node&
    operator=(const rule_node&) = delete;
    rule_node(rule_node&&) = default;
    rule_node&
    operator=(rule_node&&) = default;

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

  private:
    variant_type data_;
  };

  template <typename T>
  std::unique_ptr<rule_node>
  make_rule(T&& node) {
    return std::make_unique<rule_node>(std::forward<T>(node));
  }

  // ---------------------------------------------------------------------------
  // Document
  // ---------------------------------------------------------------------------

  // One alternative of a symbol. `name` is empty for unnamed alternatives.
  struct named_rule {
    std::string name;
    rule_node body;
    std::size_t line = 0;
  };

  struct symbol_def {
    std::string name;
    std::vector<named_rule> rules;
    std::size_t line = 0;
  };

  struct document {
    std::vector<symbol_def> symbols;
  };

} // namespace gll::notation
