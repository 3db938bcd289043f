#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace gll {

  // Malformed grammar, detected while building the grammar model or while
  // registering rules against it.
  class grammar_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // Malformed grammar notation text.
  class notation_error : public grammar_error {
  public:
    notation_error(const std::string& message, std::size_t line);

    std::size_t
    line() const {
      return line_;
    }

  private:
    std::size_t line_;
  };

  // The parse was abandoned at a deadline or descriptor budget.
  class parse_aborted : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  class ambiguity_error : public std::runtime_error {
  public:
    ambiguity_error(std::string symbol, std::size_t start, std::size_t end,
                    std::vector<std::string> alternatives);

    const std::string&
    symbol() const {
      return symbol_;
    }

    std::size_t
    start() const {
      return start_;
    }

    std::size_t
    end() const {
      return end_;
    }

    // Competing derivations, one description each. Empty when every
    // candidate was rejected as cyclic.
    const std::vector<std::string>&
    alternatives() const {
      return alternatives_;
    }

  private:
    std::string symbol_;
    std::size_t start_;
    std::size_t end_;
    std::vector<std::string> alternatives_;
  };

  class unhandled_production_error : public std::runtime_error {
  public:
    unhandled_production_error(std::string nonterminal,
                               std::size_t production_index,
                               std::size_t start, std::size_t end);

    const std::string&
    nonterminal() const {
      return nonterminal_;
    }

    std::size_t
    production_index() const {
      return production_index_;
    }

    std::size_t
    start() const {
      return start_;
    }

    std::size_t
    end() const {
      return end_;
    }

  private:
    std::string nonterminal_;
    std::size_t production_index_;
    std::size_t start_;
    std::size_t end_;
  };

  // A lowering transform broke the consume-once contract for its children.
  class lowering_error : public std::runtime_error {
  public:
    lowering_error(const std::string& reason, std::string nonterminal,
                   std::size_t production_index, std::size_t child);

    const std::string&
    nonterminal() const {
      return nonterminal_;
    }

    std::size_t
    production_index() const {
      return production_index_;
    }

    std::size_t
    child() const {
      return child_;
    }

  private:
    std::string nonterminal_;
    std::size_t production_index_;
    std::size_t child_;
  };

} // namespace gll
