#include <gll/errors.hpp>
#include <gll/expat_reader.hpp>
#include <gll/xml_grammar_reader.hpp>

#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace gll {

  namespace {

    enum class item_kind { ref, token, literal, range, builtin };

    struct item {
      item_kind kind = item_kind::ref;
      std::string name; // ref/token name, literal text
      unsigned char first = 0;
      unsigned char last = 0;
      builtin_rule rule = builtin_rule::ident;
      std::string field;
      std::size_t line = 0;
    };

    struct pending_production {
      std::string lhs;
      std::string label;
      std::vector<item> items;
    };

    bool
    is_blank(std::string_view text) {
      for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) return false;
      }
      return true;
    }

    class reader {
    public:
      explicit reader(xml_reader& r) : r_(r) {}

      grammar
      run() {
        if (!next_element()) error("expected <grammar>");
        if (r_.name() != "grammar")
          error("expected <grammar>, got <" + std::string(r_.name()) + ">");
        auto start = std::string(required("start"));
        if (r_.has_attribute("allow-empty"))
          b_.allow_empty_productions(flag("allow-empty"));

        while (next_element()) {
          auto name = r_.name();
          if (name == "terminal") {
            read_terminal();
          } else if (name == "nonterminal") {
            read_nonterminal();
          } else {
            error("unexpected <" + std::string(name) + "> in <grammar>");
          }
        }

        for (auto& p : productions_) {
          std::vector<symbol> rhs;
          std::vector<std::string> fields;
          for (const auto& it : p.items) {
            rhs.push_back(resolve(it));
            fields.push_back(it.field);
          }
          b_.production(p.lhs, std::move(rhs), p.label, std::move(fields));
        }
        b_.start(start);
        return b_.build();
      }

    private:
      xml_reader& r_;
      grammar_builder b_;
      std::unordered_set<std::string> terminal_names_;
      std::vector<pending_production> productions_;

      [[noreturn]] void
      error(const std::string& msg, std::optional<std::size_t> line = {}) const {
        throw grammar_error("xml grammar (line " +
                            std::to_string(line.value_or(r_.line())) +
                            "): " + msg);
      }

      // Advances to the next start tag among the current element's children.
      // False at the closing tag of the current element.
      bool
      next_element() {
        while (r_.read()) {
          switch (r_.node_type()) {
            case xml_node_type::start_element:
              return true;
            case xml_node_type::end_element:
              return false;
            case xml_node_type::characters:
              if (!is_blank(r_.text()))
                error("unexpected text '" + std::string(r_.text()) + "'");
              break;
          }
        }
        return false;
      }

      // Skips to the end of an element with no children.
      void
      expect_empty() {
        auto element = std::string(r_.name());
        if (next_element())
          error("unexpected <" + std::string(r_.name()) + "> in <" + element +
                ">");
      }

      std::string_view
      required(std::string_view attr) {
        if (!r_.has_attribute(attr))
          error("<" + std::string(r_.name()) + "> needs a " +
                std::string(attr) + " attribute");
        return r_.attribute_value(attr);
      }

      bool
      flag(std::string_view attr) {
        auto v = r_.attribute_value(attr);
        if (v == "true" || v == "1") return true;
        if (v == "false" || v == "0") return false;
        error("attribute " + std::string(attr) + " is not a boolean: " +
              std::string(v));
      }

      std::size_t
      number(std::string_view attr, std::size_t fallback) {
        if (!r_.has_attribute(attr)) return fallback;
        auto v = r_.attribute_value(attr);
        std::size_t out = 0;
        auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
        if (ec != std::errc() || ptr != v.data() + v.size())
          error("attribute " + std::string(attr) + " is not a number: " +
                std::string(v));
        return out;
      }

      unsigned char
      byte(std::string_view attr) {
        auto v = required(attr);
        if (v.size() != 1)
          error("attribute " + std::string(attr) +
                " must be a single character: '" + std::string(v) + "'");
        return static_cast<unsigned char>(v.front());
      }

      builtin_rule
      rule() {
        auto v = required("rule");
        auto r = builtin_rule_from_name(v);
        if (!r) error("unknown built-in rule: " + std::string(v));
        return *r;
      }

      byte_range
      read_range() {
        byte_range r{byte("from"), byte("to")};
        expect_empty();
        return r;
      }

      // <terminal name trivia> matcher </terminal>
      void
      read_terminal() {
        auto name = std::string(required("name"));
        bool trivia = r_.has_attribute("trivia") && flag("trivia");
        if (!next_element()) error("terminal " + name + " has no matcher");

        auto kind = r_.name();
        matcher m;
        if (kind == "literal") {
          m = literal_matcher{std::string(required("text"))};
          expect_empty();
        } else if (kind == "builtin") {
          m = builtin_matcher{rule()};
          expect_empty();
        } else if (kind == "class") {
          char_class_matcher cls;
          cls.negated = r_.has_attribute("negated") && flag("negated");
          cls.min = number("min", 1);
          cls.max = number("max", 1);
          while (next_element()) {
            if (r_.name() != "range")
              error("unexpected <" + std::string(r_.name()) + "> in <class>");
            cls.ranges.push_back(read_range());
          }
          m = std::move(cls);
        } else {
          error("unknown matcher <" + std::string(kind) + ">");
        }
        if (next_element())
          error("terminal " + name + " has more than one matcher");

        terminal_names_.insert(name);
        b_.terminal(std::move(name), std::move(m), trivia);
      }

      // <nonterminal name trivia allow-empty> production* </nonterminal>
      void
      read_nonterminal() {
        auto name = std::string(required("name"));
        nonterminal_options opts;
        opts.trivia = r_.has_attribute("trivia") && flag("trivia");
        if (r_.has_attribute("allow-empty")) opts.allow_empty = flag("allow-empty");
        if (b_.defined(name)) error("duplicate nonterminal: " + name);
        b_.define(name, opts);

        while (next_element()) {
          if (r_.name() != "production")
            error("unexpected <" + std::string(r_.name()) + "> in <nonterminal>");
          pending_production p;
          p.lhs = name;
          p.label = std::string(r_.attribute_value("label"));
          while (next_element())
            p.items.push_back(read_item());
          productions_.push_back(std::move(p));
        }
      }

      item
      read_item() {
        item it;
        it.line = r_.line();
        it.field = std::string(r_.attribute_value("field"));
        auto kind = r_.name();
        if (kind == "ref") {
          it.kind = item_kind::ref;
          it.name = std::string(required("name"));
        } else if (kind == "token") {
          it.kind = item_kind::token;
          it.name = std::string(required("name"));
        } else if (kind == "literal") {
          it.kind = item_kind::literal;
          it.name = std::string(required("text"));
        } else if (kind == "range") {
          it.kind = item_kind::range;
          it.first = byte("from");
          it.last = byte("to");
        } else if (kind == "builtin") {
          it.kind = item_kind::builtin;
          it.rule = rule();
        } else {
          error("unknown production item <" + std::string(kind) + ">");
        }
        expect_empty();
        return it;
      }

      symbol
      resolve(const item& it) {
        switch (it.kind) {
          case item_kind::ref:
            return b_.ref(it.name);
          case item_kind::token:
            if (!terminal_names_.count(it.name))
              error("undefined terminal: " + it.name, it.line);
            return b_.token(it.name);
          case item_kind::literal:
            return b_.literal(it.name);
          case item_kind::range:
            return b_.range(it.first, it.last);
          case item_kind::builtin:
            return b_.builtin(it.rule);
        }
        error("unknown production item", it.line);
      }
    };

  } // namespace

  grammar
  read_xml_grammar(xml_reader& r) {
    reader impl(r);
    return impl.run();
  }

  grammar
  load_xml_grammar(std::string_view xml) {
    std::optional<expat_reader> r;
    try {
      r.emplace(xml);
    } catch (const std::runtime_error& e) {
      throw grammar_error(e.what());
    }
    return read_xml_grammar(*r);
  }

} // namespace gll
