#pragma once

#include <gll/grammar.hpp>
#include <gll/sppf.hpp>

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace gll {

  struct parse_options {
    // Skip productions whose FIRST set cannot match at the current offset.
    bool lookahead = true;
    std::optional<std::chrono::steady_clock::time_point> deadline;
    // 0 = unlimited
    std::size_t max_descriptors = 0;
    // One line per processed descriptor.
    std::ostream* trace = nullptr;
  };

  struct parse_statistics {
    std::size_t descriptors = 0;
    std::size_t gss_nodes = 0;
    std::size_t gss_edges = 0;
    std::size_t symbol_nodes = 0;
    std::size_t intermediate_nodes = 0;
    std::size_t terminal_nodes = 0;
    std::size_t epsilon_nodes = 0;
    std::size_t packed_nodes = 0;
  };

  struct expected_symbol {
    symbol sym;
    std::string description;

    bool
    operator==(const expected_symbol&) const = default;
  };

  // Where and why the input stopped matching. `expected` holds the terminals
  // attempted at the furthest offset reached, sorted by terminal index.
  struct parse_failure {
    std::size_t offset = 0;
    std::size_t line = 1;
    std::size_t column = 1;
    std::vector<expected_symbol> expected;
    // A complete derivation of the start symbol ended at `offset`.
    bool end_of_input_expected = false;

    // "expected one of {"+", end of input} at position 3 (line 1, column 4)"
    std::string
    message() const;
  };

  class parse_error : public std::runtime_error {
  public:
    explicit parse_error(parse_failure failure);

    const parse_failure&
    failure() const {
      return failure_;
    }

  private:
    parse_failure failure_;
  };

  struct parse_success {
    std::shared_ptr<const sppf::forest> forest;
    // Symbol node of the start nonterminal spanning the whole input.
    sppf::node_id root = sppf::no_node;
  };

  class parse_result {
  public:
    parse_result(std::variant<parse_success, parse_failure> outcome,
                 parse_statistics stats)
        : outcome_(std::move(outcome)), stats_(stats) {}

    bool
    ok() const {
      return std::holds_alternative<parse_success>(outcome_);
    }

    explicit
    operator bool() const {
      return ok();
    }

    // Throw parse_error on a failed result.
    const parse_success&
    success() const;

    const std::shared_ptr<const sppf::forest>&
    forest() const {
      return success().forest;
    }

    sppf::node_id
    root() const {
      return success().root;
    }

    // Throws std::logic_error on a successful result.
    const parse_failure&
    failure() const;

    const parse_statistics&
    statistics() const {
      return stats_;
    }

  private:
    std::variant<parse_success, parse_failure> outcome_;
    parse_statistics stats_;
  };

  // One parse of one input. The grammar must outlive the engine and every
  // forest it produces.
  class engine {
  public:
    explicit engine(const grammar& g, parse_options opts = {});
    ~engine();

    engine(const engine&) = delete;
    engine&
    operator=(const engine&) = delete;
    engine(engine&&) noexcept;
    engine&
    operator=(engine&&) noexcept;

    // May be called once per engine. Throws parse_aborted when the deadline
    // or descriptor budget is exceeded.
    parse_result
    parse(std::string_view text);

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

  parse_result
  parse(const grammar& g, std::string_view text, parse_options opts = {});

} // namespace gll
