#include <gll/errors.hpp>
#include <gll/notation_parser.hpp>

#include <cctype>
#include <string>
#include <unordered_set>
#include <vector>

namespace gll {

  namespace {

    // -----------------------------------------------------------------------
    // Token types
    // -----------------------------------------------------------------------

    enum class token_kind {
      eof,
      name,
      string,    // "..."
      range,     // 'a' or 'a'..'z'
      eq,        // =
      pipe,      // |
      colon,     // :
      semicolon, // ;
      lbrace,    // {
      rbrace,    // }
      question,  // ?
      star,      // *
      plus,      // +
      percent,   // %
      percent2,  // %%
    };

    struct token {
      token_kind kind = token_kind::eof;
      std::string value;
      unsigned char first = 0;
      unsigned char last = 0;
      std::size_t line = 1;
    };

    std::string
    describe(const token& t) {
      switch (t.kind) {
        case token_kind::eof:
          return "end of input";
        case token_kind::name:
          return "name '" + t.value + "'";
        case token_kind::string:
          return "string \"" + t.value + "\"";
        case token_kind::range:
          return "character range";
        default:
          return "'" + t.value + "'";
      }
    }

    // -----------------------------------------------------------------------
    // Lexer
    // -----------------------------------------------------------------------

    bool
    is_name_start(char c) {
      return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
    }

    bool
    is_name_char(char c) {
      return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    int
    hex_value(char c) {
      if (c >= '0' && c <= '9') return c - '0';
      if (c >= 'a' && c <= 'f') return c - 'a' + 10;
      if (c >= 'A' && c <= 'F') return c - 'A' + 10;
      return -1;
    }

    class lexer {
    public:
      explicit lexer(std::string_view source) : src_(source) {}

      std::size_t
      line() const {
        return line_;
      }

      token
      next() {
        skip_whitespace_and_comments();
        token t;
        t.line = line_;
        if (pos_ >= src_.size()) return t;

        char c = src_[pos_];
        if (is_name_start(c)) {
          t.kind = token_kind::name;
          while (pos_ < src_.size() && is_name_char(src_[pos_]))
            t.value += src_[pos_++];
          return t;
        }
        if (c == '"') return read_string(t);
        if (c == '\'') return read_range(t);

        ++pos_;
        t.value = std::string(1, c);
        switch (c) {
          case '=':
            t.kind = token_kind::eq;
            return t;
          case '|':
            t.kind = token_kind::pipe;
            return t;
          case ':':
            t.kind = token_kind::colon;
            return t;
          case ';':
            t.kind = token_kind::semicolon;
            return t;
          case '{':
            t.kind = token_kind::lbrace;
            return t;
          case '}':
            t.kind = token_kind::rbrace;
            return t;
          case '?':
            t.kind = token_kind::question;
            return t;
          case '*':
            t.kind = token_kind::star;
            return t;
          case '+':
            t.kind = token_kind::plus;
            return t;
          case '%':
            if (pos_ < src_.size() && src_[pos_] == '%') {
              ++pos_;
              t.kind = token_kind::percent2;
              t.value = "%%";
            } else {
              t.kind = token_kind::percent;
            }
            return t;
          default:
            throw notation_error(std::string("unexpected character '") + c +
                                     "'",
                                 line_);
        }
      }

    private:
      std::string_view src_;
      std::size_t pos_ = 0;
      std::size_t line_ = 1;

      void
      advance_char() {
        if (src_[pos_] == '\n') ++line_;
        ++pos_;
      }

      void
      skip_whitespace_and_comments() {
        while (pos_ < src_.size()) {
          char c = src_[pos_];
          if (std::isspace(static_cast<unsigned char>(c))) {
            advance_char();
            continue;
          }
          if (c == '/' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '/') {
            while (pos_ < src_.size() && src_[pos_] != '\n')
              ++pos_;
            continue;
          }
          if (c == '/' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '*') {
            auto start_line = line_;
            pos_ += 2;
            while (pos_ + 1 < src_.size() &&
                   !(src_[pos_] == '*' && src_[pos_ + 1] == '/'))
              advance_char();
            if (pos_ + 1 >= src_.size())
              throw notation_error("unterminated block comment", start_line);
            pos_ += 2;
            continue;
          }
          break;
        }
      }

      // Reads one possibly escaped character of a quoted form.
      unsigned char
      read_char(char quote) {
        if (pos_ >= src_.size() || src_[pos_] == '\n')
          throw notation_error(std::string("unterminated ") +
                                   (quote == '"' ? "string" : "character"),
                               line_);
        char c = src_[pos_++];
        if (c != '\\') return static_cast<unsigned char>(c);
        if (pos_ >= src_.size())
          throw notation_error("unterminated escape sequence", line_);
        char e = src_[pos_++];
        switch (e) {
          case 'n':
            return '\n';
          case 't':
            return '\t';
          case 'r':
            return '\r';
          case '0':
            return '\0';
          case '\\':
          case '\'':
          case '"':
            return static_cast<unsigned char>(e);
          case 'x': {
            if (pos_ + 1 >= src_.size())
              throw notation_error("truncated \\x escape", line_);
            int hi = hex_value(src_[pos_]);
            int lo = hex_value(src_[pos_ + 1]);
            if (hi < 0 || lo < 0)
              throw notation_error("invalid \\x escape", line_);
            pos_ += 2;
            return static_cast<unsigned char>(hi * 16 + lo);
          }
          default:
            throw notation_error(std::string("unknown escape sequence \\") + e,
                                 line_);
        }
      }

      token
      read_string(token t) {
        ++pos_;
        t.kind = token_kind::string;
        while (pos_ < src_.size() && src_[pos_] != '"')
          t.value += static_cast<char>(read_char('"'));
        if (pos_ >= src_.size()) throw notation_error("unterminated string", t.line);
        ++pos_;
        return t;
      }

      unsigned char
      read_quoted_char() {
        ++pos_;
        if (pos_ < src_.size() && src_[pos_] == '\'')
          throw notation_error("empty character", line_);
        auto c = read_char('\'');
        if (pos_ >= src_.size() || src_[pos_] != '\'')
          throw notation_error("unterminated character", line_);
        ++pos_;
        return c;
      }

      token
      read_range(token t) {
        t.kind = token_kind::range;
        t.first = read_quoted_char();
        t.last = t.first;
        if (src_.substr(pos_, 2) == "..") {
          pos_ += 2;
          if (pos_ >= src_.size() || src_[pos_] != '\'')
            throw notation_error("expected character after '..'", line_);
          t.last = read_quoted_char();
        }
        t.value = "'" + std::string(1, static_cast<char>(t.first)) + "'";
        return t;
      }
    };

    // -----------------------------------------------------------------------
    // Parser
    // -----------------------------------------------------------------------

    using namespace notation;

    class parser {
    public:
      explicit parser(std::string_view source) : lex_(source) {
        current_ = lex_.next();
        lookahead_ = lex_.next();
      }

      document
      parse_document() {
        document doc;
        std::unordered_set<std::string> names;
        while (current_.kind != token_kind::eof) {
          auto def = parse_symbol();
          if (!names.insert(def.name).second)
            throw notation_error("duplicate symbol: " + def.name, def.line);
          doc.symbols.push_back(std::move(def));
        }
        return doc;
      }

    private:
      lexer lex_;
      token current_;
      token lookahead_;

      void
      advance() {
        current_ = std::move(lookahead_);
        lookahead_ = lex_.next();
      }

      [[noreturn]] void
      error(const std::string& msg) {
        throw notation_error(msg, current_.line);
      }

      void
      expect(token_kind k, const std::string& what) {
        if (current_.kind != k)
          error("expected " + what + ", got " + describe(current_));
        advance();
      }

      bool
      match(token_kind k) {
        if (current_.kind == k) {
          advance();
          return true;
        }
        return false;
      }

      // Name = alternative ( | alternative )* ;
      symbol_def
      parse_symbol() {
        symbol_def def;
        def.line = current_.line;
        if (current_.kind != token_kind::name)
          error("expected symbol name, got " + describe(current_));
        def.name = current_.value;
        advance();
        expect(token_kind::eq, "'='");
        match(token_kind::pipe);

        std::unordered_set<std::string> rule_names;
        for (;;) {
          named_rule r{{}, concatenation{}, current_.line};
          if (current_.kind == token_kind::name &&
              lookahead_.kind == token_kind::colon) {
            r.name = current_.value;
            if (!rule_names.insert(r.name).second)
              error("duplicate rule for symbol " + def.name + ": " + r.name);
            advance();
            advance();
          }
          r.body = parse_sequence();
          def.rules.push_back(std::move(r));
          if (match(token_kind::pipe)) continue;
          if (current_.kind == token_kind::eof) error("missing ';' after " + def.name);
          expect(token_kind::semicolon, "'|' or ';'");
          break;
        }
        return def;
      }

      bool
      starts_item() const {
        switch (current_.kind) {
          case token_kind::name:
          case token_kind::string:
          case token_kind::range:
          case token_kind::lbrace:
            return true;
          default:
            return false;
        }
      }

      // item* ; one item stands alone, any other count is a concatenation
      rule_node
      parse_sequence() {
        std::vector<rule_node> items;
        while (starts_item())
          items.push_back(parse_item());
        if (items.size() == 1) return std::move(items.front());
        return concatenation{std::move(items)};
      }

      // (label :)? postfix
      rule_node
      parse_item() {
        if (current_.kind == token_kind::name &&
            lookahead_.kind == token_kind::colon) {
          auto label = current_.value;
          advance();
          advance();
          if (!starts_item()) error("expected item after label " + label);
          return labeled{label, make_rule(parse_postfix())};
        }
        return parse_postfix();
      }

      // primary ( ? | * | + )* with an optional separator after * or +
      rule_node
      parse_postfix() {
        auto node = parse_primary();
        for (;;) {
          if (match(token_kind::question)) {
            node = option{make_rule(std::move(node))};
            continue;
          }
          if (current_.kind == token_kind::star ||
              current_.kind == token_kind::plus) {
            repeated rep;
            rep.at_least_one = current_.kind == token_kind::plus;
            advance();
            rep.item = make_rule(std::move(node));
            if (current_.kind == token_kind::percent ||
                current_.kind == token_kind::percent2) {
              rep.allow_trailing = current_.kind == token_kind::percent2;
              advance();
              rep.separator = make_rule(parse_primary());
            }
            node = std::move(rep);
            continue;
          }
          return node;
        }
      }

      rule_node
      parse_primary() {
        switch (current_.kind) {
          case token_kind::name: {
            symbol_name n{current_.value};
            advance();
            return n;
          }
          case token_kind::string: {
            if (current_.value.empty()) error("empty string");
            string_literal s{current_.value};
            advance();
            return s;
          }
          case token_kind::range: {
            if (current_.first > current_.last)
              error("inverted character range");
            char_range r{current_.first, current_.last};
            advance();
            return r;
          }
          case token_kind::lbrace:
            return parse_group();
          default:
            error("expected an item, got " + describe(current_));
        }
      }

      // { sequence ( | sequence )* }
      rule_node
      parse_group() {
        auto line = current_.line;
        advance();
        std::vector<rule_node> alternatives;
        for (;;) {
          if (!starts_item()) {
            if (current_.kind == token_kind::rbrace && alternatives.empty())
              throw notation_error("empty group", line);
            error("expected an item, got " + describe(current_));
          }
          alternatives.push_back(parse_sequence());
          if (!match(token_kind::pipe)) break;
        }
        expect(token_kind::rbrace, "'}'");
        if (alternatives.size() == 1) return std::move(alternatives.front());
        return alternation{std::move(alternatives)};
      }
    };

  } // namespace

  notation::document
  notation_parser::parse(std::string_view source) {
    parser p(source);
    return p.parse_document();
  }

} // namespace gll
