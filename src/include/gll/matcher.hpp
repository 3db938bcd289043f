#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace gll {

  // Lexical rules built into the engine. The forms follow Rust tokens.
  enum class builtin_rule {
    ident,
    lifetime,
    punct,
    literal,
    whitespace,
    comment,
  };

  std::string_view
  to_string(builtin_rule rule);

  std::optional<builtin_rule>
  builtin_rule_from_name(std::string_view name);

  // Whitespace and comments are trivia by default.
  bool
  is_trivia_rule(builtin_rule rule);

  // ---------------------------------------------------------------------------
  // Matcher kinds
  // ---------------------------------------------------------------------------

  struct literal_matcher {
    std::string text;

    bool
    operator==(const literal_matcher&) const = default;
  };

  struct byte_range {
    unsigned char first = 0;
    unsigned char last = 0;

    bool
    operator==(const byte_range&) const = default;
  };

  // A run of bytes drawn from a set of ranges. max == 0 means unbounded.
  // Matching is greedy.
  struct char_class_matcher {
    std::vector<byte_range> ranges;
    bool negated = false;
    std::size_t min = 1;
    std::size_t max = 1;

    bool
    operator==(const char_class_matcher&) const = default;
  };

  struct builtin_matcher {
    builtin_rule rule = builtin_rule::ident;

    bool
    operator==(const builtin_matcher&) const = default;
  };

  using matcher =
      std::variant<literal_matcher, char_class_matcher, builtin_matcher>;

  // Length of the match of `m` at `offset`, or nullopt. Every matcher is
  // deterministic and never matches the empty string.
  std::optional<std::size_t>
  match(const matcher& m, std::string_view input, std::size_t offset);

  std::optional<std::size_t>
  match_builtin(builtin_rule rule, std::string_view input, std::size_t offset);

  // Human-readable form used in diagnostics: "+" quoted, ['0'-'9'], IDENT.
  std::string
  describe(const matcher& m);

  // Throws grammar_error when the matcher could match the empty string or is
  // otherwise malformed.
  void
  validate(const matcher& m, std::string_view terminal_name);

} // namespace gll
