#pragma once

#include <gll/matcher.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gll {

  enum class symbol_kind : std::uint8_t { terminal, nonterminal };

  // Reference to an entry of the grammar's terminal or nonterminal table.
  struct symbol {
    symbol_kind kind = symbol_kind::terminal;
    std::uint32_t index = 0;

    bool
    is_terminal() const {
      return kind == symbol_kind::terminal;
    }

    bool
    is_nonterminal() const {
      return kind == symbol_kind::nonterminal;
    }

    bool
    operator==(const symbol&) const = default;
  };

  struct terminal {
    std::string name;
    matcher match;
    bool trivia = false;
  };

  // Where a nonterminal came from. Front-ends record this so that generic
  // lowering can tell user symbols from desugared ones.
  enum class nonterminal_origin {
    declared,
    group,
    optional,
    repeat,
    layout,
    builtin,
    start,
  };

  struct nonterminal {
    std::string name;
    std::vector<std::uint32_t> productions;
    nonterminal_origin origin = nonterminal_origin::declared;
    bool trivia = false;
    bool allow_empty = true;
  };

  struct production {
    std::uint32_t id = 0;
    std::uint32_t lhs = 0;
    // Position among the alternatives of lhs, in declaration order.
    std::uint32_t index = 0;
    std::string label;
    std::vector<symbol> rhs;
    // Parallel to rhs; empty strings for unlabelled positions.
    std::vector<std::string> field_labels;
    std::uint32_t first_slot = 0;
  };

  // A grammar position X ::= alpha . beta
  using slot_id = std::uint32_t;

  inline constexpr slot_id no_slot = std::numeric_limits<slot_id>::max();

  class grammar {
  public:
    const std::vector<nonterminal>&
    nonterminals() const {
      return nonterminals_;
    }

    const std::vector<terminal>&
    terminals() const {
      return terminals_;
    }

    const std::vector<production>&
    productions() const {
      return productions_;
    }

    std::uint32_t
    start() const {
      return start_;
    }

    const nonterminal&
    start_symbol() const {
      return nonterminals_[start_];
    }

    std::optional<std::uint32_t>
    find_nonterminal(std::string_view name) const;

    std::optional<std::uint32_t>
    find_terminal(std::string_view name) const;

    // Productions of `name` in declaration order. Throws grammar_error for
    // an unknown nonterminal.
    std::vector<const production*>
    productions_of(std::string_view name) const;

    const production&
    production_of(std::string_view name, std::size_t index) const;

    std::string
    symbol_name(symbol s) const;

    // -- Grammar positions ----------------------------------------------------

    std::size_t
    slot_count() const {
      return slot_production_.size();
    }

    slot_id
    slot(std::uint32_t production_id, std::size_t dot) const {
      return productions_[production_id].first_slot +
             static_cast<slot_id>(dot);
    }

    const production&
    slot_production(slot_id s) const {
      return productions_[slot_production_[s]];
    }

    std::size_t
    slot_dot(slot_id s) const {
      return s - productions_[slot_production_[s]].first_slot;
    }

    bool
    slot_at_end(slot_id s) const {
      return slot_dot(s) == slot_production(s).rhs.size();
    }

    // "Expr ::= Expr . '+' Term"
    std::string
    slot_to_string(slot_id s) const;

    // -- Analysis -------------------------------------------------------------

    bool
    nullable(std::uint32_t nt) const {
      return nullable_[nt];
    }

    // Terminals that can begin the remainder beta of slot X ::= alpha . beta
    const std::vector<std::uint32_t>&
    first_terminals(slot_id s) const {
      return slot_first_[s];
    }

    // Whether beta derives the empty string.
    bool
    suffix_nullable(slot_id s) const {
      return slot_nullable_[s];
    }

  private:
    friend class grammar_builder;

    std::vector<nonterminal> nonterminals_;
    std::vector<terminal> terminals_;
    std::vector<production> productions_;
    std::uint32_t start_ = 0;

    std::unordered_map<std::string, std::uint32_t> nonterminal_index_;
    std::unordered_map<std::string, std::uint32_t> terminal_index_;

    std::vector<std::uint32_t> slot_production_;
    std::vector<bool> nullable_;
    std::vector<std::vector<std::uint32_t>> slot_first_;
    std::vector<bool> slot_nullable_;

    void
    analyse();
  };

  struct nonterminal_options {
    nonterminal_origin origin = nonterminal_origin::declared;
    bool trivia = false;
    // Unset: the builder-wide default.
    std::optional<bool> allow_empty;
  };

  // Collects terminals, nonterminals and productions by name; build()
  // resolves references and validates.
  class grammar_builder {
  public:
    grammar_builder&
    start(std::string name);

    grammar_builder&
    allow_empty_productions(bool allow);

    // Named terminal. Throws grammar_error if the name is taken.
    symbol
    terminal(std::string name, matcher m, bool trivia = false);

    // Reference to a previously added named terminal.
    symbol
    token(std::string_view name) const;

    // Anonymous terminals, interned by their description.
    symbol
    literal(std::string text);

    symbol
    range(unsigned char first, unsigned char last);

    symbol
    builtin(builtin_rule rule);

    // Reference to a nonterminal, which may be defined later.
    symbol
    ref(const std::string& name);

    // Declares a nonterminal. Throws grammar_error if it was already
    // declared, explicitly or by an earlier production().
    grammar_builder&
    define(const std::string& name, nonterminal_options opts = {});

    bool
    defined(const std::string& name) const;

    // Appends an alternative to `lhs`, declaring it with default options if
    // needed.
    grammar_builder&
    production(const std::string& lhs, std::vector<symbol> rhs,
               std::string label = {}, std::vector<std::string> fields = {});

    grammar
    build() const;

  private:
    struct pending_nonterminal {
      std::string name;
      nonterminal_options options;
      bool defined = false;
      std::vector<std::uint32_t> productions;
    };

    struct pending_production {
      std::uint32_t lhs;
      std::string label;
      std::vector<symbol> rhs;
      std::vector<std::string> fields;
    };

    std::string start_;
    bool allow_empty_ = true;
    std::vector<gll::terminal> terminals_;
    std::unordered_map<std::string, std::uint32_t> terminal_index_;
    std::vector<pending_nonterminal> nonterminals_;
    std::unordered_map<std::string, std::uint32_t> nonterminal_index_;
    std::vector<pending_production> productions_;

    std::uint32_t
    intern_nonterminal(const std::string& name);

    symbol
    intern_terminal(matcher m, bool trivia);
  };

} // namespace gll
