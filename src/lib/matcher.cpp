#include <gll/errors.hpp>
#include <gll/matcher.hpp>

#include <array>
#include <cctype>
#include <type_traits>

namespace gll {

  namespace {

    bool
    is_alpha(char c) {
      return std::isalpha(static_cast<unsigned char>(c)) != 0;
    }

    bool
    is_digit(char c) {
      return c >= '0' && c <= '9';
    }

    bool
    is_ident_char(char c) {
      return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
    }

    bool
    at(std::string_view in, std::size_t pos, char c) {
      return pos < in.size() && in[pos] == c;
    }

    // [a-zA-Z][a-zA-Z0-9_]* | _[a-zA-Z0-9_]+
    std::optional<std::size_t>
    plain_identifier(std::string_view in, std::size_t pos) {
      if (pos >= in.size()) return std::nullopt;
      std::size_t end = pos;
      if (is_alpha(in[end])) {
        ++end;
      } else if (in[end] == '_') {
        ++end;
        if (end >= in.size() || !is_ident_char(in[end])) return std::nullopt;
      } else {
        return std::nullopt;
      }
      while (end < in.size() && is_ident_char(in[end]))
        ++end;
      return end - pos;
    }

    std::optional<std::size_t>
    identifier(std::string_view in, std::size_t pos) {
      if (in.substr(pos, 2) == "r#") {
        if (auto rest = plain_identifier(in, pos + 2)) return *rest + 2;
      }
      return plain_identifier(in, pos);
    }

    std::optional<std::size_t>
    lifetime(std::string_view in, std::size_t pos) {
      if (!at(in, pos, '\'')) return std::nullopt;
      auto id = plain_identifier(in, pos + 1);
      if (!id) return std::nullopt;
      std::size_t end = pos + 1 + *id;
      // 'a' is a char literal, not a lifetime
      if (at(in, end, '\'')) return std::nullopt;
      return end - pos;
    }

    constexpr std::string_view punct_chars = ";,.@#~?:$=!<>-&+*/^%";

    std::optional<std::size_t>
    punct(std::string_view in, std::size_t pos) {
      if (pos < in.size() &&
          punct_chars.find(in[pos]) != std::string_view::npos)
        return 1;
      return std::nullopt;
    }

    // Optional [fui][0-9]+ type suffix.
    std::size_t
    numeric_suffix(std::string_view in, std::size_t pos) {
      if (pos < in.size() &&
          (in[pos] == 'f' || in[pos] == 'u' || in[pos] == 'i')) {
        std::size_t end = pos + 1;
        while (end < in.size() && is_digit(in[end]))
          ++end;
        if (end > pos + 1) return end - pos;
      }
      return 0;
    }

    template <typename IsDigit>
    std::optional<std::size_t>
    radix_number(std::string_view in, std::size_t pos, std::string_view prefix,
                 IsDigit is_radix_digit) {
      if (in.substr(pos, prefix.size()) != prefix) return std::nullopt;
      std::size_t end = pos + prefix.size();
      std::size_t before = 0;
      while (end < in.size() && (is_radix_digit(in[end]) || in[end] == '_')) {
        ++end;
        ++before;
      }
      std::size_t after = 0;
      bool dot = false;
      if (at(in, end, '.')) {
        dot = true;
        ++end;
        while (end < in.size() &&
               (is_radix_digit(in[end]) || in[end] == '_')) {
          ++end;
          ++after;
        }
      }
      if (before == 0 && !(dot && after > 0)) return std::nullopt;
      end += numeric_suffix(in, end);
      return end - pos;
    }

    std::optional<std::size_t>
    decimal_number(std::string_view in, std::size_t pos) {
      std::size_t end = pos;
      if (pos < in.size() && is_digit(in[pos])) {
        ++end;
        while (end < in.size() && (is_digit(in[end]) || in[end] == '_'))
          ++end;
        if (at(in, end, '.')) {
          ++end;
          while (end < in.size() && (is_digit(in[end]) || in[end] == '_'))
            ++end;
        }
      } else if (at(in, pos, '.')) {
        ++end;
        std::size_t digits = 0;
        while (end < in.size() && (is_digit(in[end]) || in[end] == '_')) {
          ++end;
          ++digits;
        }
        if (digits == 0) return std::nullopt;
      } else {
        return std::nullopt;
      }
      end += numeric_suffix(in, end);
      return end - pos;
    }

    // b?'x' or b?'\x'
    std::optional<std::size_t>
    char_literal(std::string_view in, std::size_t pos) {
      std::size_t end = pos;
      if (at(in, end, 'b')) ++end;
      if (!at(in, end, '\'')) return std::nullopt;
      ++end;
      if (end >= in.size()) return std::nullopt;
      if (in[end] == '\\') {
        end += 2;
      } else if (in[end] == '\'') {
        return std::nullopt;
      } else {
        ++end;
      }
      if (!at(in, end, '\'')) return std::nullopt;
      return end + 1 - pos;
    }

    // b?"..." with backslash escapes
    std::optional<std::size_t>
    string_literal(std::string_view in, std::size_t pos) {
      std::size_t end = pos;
      if (at(in, end, 'b')) ++end;
      if (!at(in, end, '"')) return std::nullopt;
      ++end;
      while (end < in.size() && in[end] != '"') {
        if (in[end] == '\\') ++end;
        ++end;
      }
      if (end >= in.size()) return std::nullopt;
      return end + 1 - pos;
    }

    std::optional<std::size_t>
    literal(std::string_view in, std::size_t pos) {
      auto is_bin = [](char c) { return c == '0' || c == '1'; };
      auto is_hex = [](char c) {
        return is_digit(c) || (c >= 'a' && c <= 'f');
      };
      if (auto n = radix_number(in, pos, "0b", is_bin)) return n;
      if (auto n = radix_number(in, pos, "0x", is_hex)) return n;
      if (auto n = decimal_number(in, pos)) return n;
      if (auto n = char_literal(in, pos)) return n;
      return string_literal(in, pos);
    }

    std::optional<std::size_t>
    whitespace(std::string_view in, std::size_t pos) {
      std::size_t end = pos;
      while (end < in.size() &&
             std::isspace(static_cast<unsigned char>(in[end])) != 0)
        ++end;
      if (end == pos) return std::nullopt;
      return end - pos;
    }

    // Line comment up to (not including) the newline, or a nested block
    // comment. An unterminated block comment does not match.
    std::optional<std::size_t>
    comment(std::string_view in, std::size_t pos) {
      if (in.substr(pos, 2) == "//") {
        std::size_t end = pos + 2;
        while (end < in.size() && in[end] != '\n')
          ++end;
        return end - pos;
      }
      if (in.substr(pos, 2) != "/*") return std::nullopt;
      std::size_t end = pos + 2;
      int depth = 1;
      while (end < in.size() && depth > 0) {
        if (in.substr(end, 2) == "/*") {
          ++depth;
          end += 2;
        } else if (in.substr(end, 2) == "*/") {
          --depth;
          end += 2;
        } else {
          ++end;
        }
      }
      if (depth > 0) return std::nullopt;
      return end - pos;
    }

    bool
    in_class(const char_class_matcher& m, unsigned char c) {
      bool hit = false;
      for (const auto& r : m.ranges) {
        if (c >= r.first && c <= r.last) {
          hit = true;
          break;
        }
      }
      return hit != m.negated;
    }

    std::string
    quote_byte(unsigned char c) {
      switch (c) {
        case '\n':
          return "'\\n'";
        case '\t':
          return "'\\t'";
        case '\r':
          return "'\\r'";
        case '\'':
          return "'\\''";
        case '\\':
          return "'\\\\'";
        default:
          break;
      }
      if (c < 0x20 || c >= 0x7f) {
        constexpr std::array<char, 16> hex = {'0', '1', '2', '3', '4', '5',
                                              '6', '7', '8', '9', 'a', 'b',
                                              'c', 'd', 'e', 'f'};
        return std::string("'\\x") + hex[c >> 4] + hex[c & 0xf] + "'";
      }
      return std::string("'") + static_cast<char>(c) + "'";
    }

  } // namespace

  std::string_view
  to_string(builtin_rule rule) {
    switch (rule) {
      case builtin_rule::ident:
        return "IDENT";
      case builtin_rule::lifetime:
        return "LIFETIME";
      case builtin_rule::punct:
        return "PUNCT";
      case builtin_rule::literal:
        return "LITERAL";
      case builtin_rule::whitespace:
        return "WHITESPACE";
      case builtin_rule::comment:
        return "COMMENT";
    }
    return "?";
  }

  std::optional<builtin_rule>
  builtin_rule_from_name(std::string_view name) {
    for (auto rule : {builtin_rule::ident, builtin_rule::lifetime,
                      builtin_rule::punct, builtin_rule::literal,
                      builtin_rule::whitespace, builtin_rule::comment}) {
      if (to_string(rule) == name) return rule;
    }
    return std::nullopt;
  }

  bool
  is_trivia_rule(builtin_rule rule) {
    return rule == builtin_rule::whitespace || rule == builtin_rule::comment;
  }

  std::optional<std::size_t>
  match_builtin(builtin_rule rule, std::string_view input, std::size_t offset) {
    switch (rule) {
      case builtin_rule::ident:
        return identifier(input, offset);
      case builtin_rule::lifetime:
        return lifetime(input, offset);
      case builtin_rule::punct:
        return punct(input, offset);
      case builtin_rule::literal:
        return literal(input, offset);
      case builtin_rule::whitespace:
        return whitespace(input, offset);
      case builtin_rule::comment:
        return comment(input, offset);
    }
    return std::nullopt;
  }

  std::optional<std::size_t>
  match(const matcher& m, std::string_view input, std::size_t offset) {
    if (offset > input.size()) return std::nullopt;
    return std::visit(
        [&](const auto& node) -> std::optional<std::size_t> {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, literal_matcher>) {
            if (node.text.empty()) return std::nullopt;
            if (input.substr(offset, node.text.size()) != node.text)
              return std::nullopt;
            return node.text.size();
          } else if constexpr (std::is_same_v<T, char_class_matcher>) {
            std::size_t n = 0;
            while (offset + n < input.size() &&
                   (node.max == 0 || n < node.max) &&
                   in_class(node,
                            static_cast<unsigned char>(input[offset + n])))
              ++n;
            if (n == 0 || n < node.min) return std::nullopt;
            return n;
          } else {
            return match_builtin(node.rule, input, offset);
          }
        },
        m);
  }

  std::string
  describe(const matcher& m) {
    return std::visit(
        [](const auto& node) -> std::string {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, literal_matcher>) {
            return "\"" + node.text + "\"";
          } else if constexpr (std::is_same_v<T, char_class_matcher>) {
            std::string out = node.negated ? "[^" : "[";
            for (std::size_t i = 0; i < node.ranges.size(); ++i) {
              if (i > 0) out += ' ';
              out += quote_byte(node.ranges[i].first);
              if (node.ranges[i].last != node.ranges[i].first) {
                out += '-';
                out += quote_byte(node.ranges[i].last);
              }
            }
            out += ']';
            if (node.min == 1 && node.max == 0) {
              out += '+';
            } else if (node.min != 1 || node.max != 1) {
              out += '{' + std::to_string(node.min) + ',' +
                     (node.max == 0 ? std::string() : std::to_string(node.max)) +
                     '}';
            }
            return out;
          } else {
            return std::string(to_string(node.rule));
          }
        },
        m);
  }

  void
  validate(const matcher& m, std::string_view terminal_name) {
    auto fail = [&](const std::string& why) {
      throw grammar_error("terminal " + std::string(terminal_name) + ": " +
                          why);
    };
    if (const auto* lit = std::get_if<literal_matcher>(&m)) {
      if (lit->text.empty()) fail("empty literal");
    } else if (const auto* cls = std::get_if<char_class_matcher>(&m)) {
      if (cls->ranges.empty() && !cls->negated) fail("empty character class");
      for (const auto& r : cls->ranges) {
        if (r.first > r.last) {
          fail("inverted range " + quote_byte(r.first) + ".." +
               quote_byte(r.last));
        }
      }
      if (cls->min == 0) fail("repetition minimum must be at least 1");
      if (cls->max != 0 && cls->max < cls->min)
        fail("repetition maximum is below its minimum");
    }
  }

} // namespace gll
