#include <gll/errors.hpp>
#include <gll/notation_lowering.hpp>
#include <gll/notation_parser.hpp>

#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gll {

  namespace {

    using namespace notation;

    struct sequence {
      std::vector<symbol> rhs;
      std::vector<std::string> fields;

      void
      push(symbol s, std::string field) {
        rhs.push_back(s);
        fields.push_back(std::move(field));
      }

      void
      append(const sequence& other) {
        rhs.insert(rhs.end(), other.rhs.begin(), other.rhs.end());
        fields.insert(fields.end(), other.fields.begin(), other.fields.end());
      }
    };

    // TOKEN_TREE: a single non-delimiter token, or a delimited run of token
    // trees.
    alternation
    token_tree_body() {
      auto delimited = [](const char* open, const char* close) {
        repeated inner;
        inner.item = make_rule(symbol_name{std::string(token_tree_symbol)});
        concatenation c;
        c.items.emplace_back(string_literal{open});
        c.items.emplace_back(std::move(inner));
        c.items.emplace_back(string_literal{close});
        return c;
      };
      alternation alt;
      alt.items.emplace_back(symbol_name{"IDENT"});
      alt.items.emplace_back(symbol_name{"LIFETIME"});
      alt.items.emplace_back(symbol_name{"PUNCT"});
      alt.items.emplace_back(symbol_name{"LITERAL"});
      alt.items.emplace_back(delimited("(", ")"));
      alt.items.emplace_back(delimited("[", "]"));
      alt.items.emplace_back(delimited("{", "}"));
      return alt;
    }

    class lowerer {
    public:
      lowerer(const document& doc, const lowering_options& opts)
          : doc_(doc), opts_(opts) {}

      grammar
      run() {
        if (doc_.symbols.empty()) throw grammar_error("grammar has no symbols");

        for (const auto& def : doc_.symbols) {
          if (builtin_rule_from_name(def.name) || def.name == token_tree_symbol)
            throw notation_error("symbol " + def.name +
                                     " shadows a built-in rule",
                                 def.line);
          declared_.insert(def.name);
        }

        for (const auto& def : doc_.symbols) {
          owner_ = def.name;
          b_.define(def.name);
          for (const auto& r : def.rules) {
            line_ = r.line;
            add_production(def.name, r.body, r.name);
          }
        }

        if (token_tree_used_) {
          owner_ = std::string(token_tree_symbol);
          b_.define(owner_, nonterminal_options{nonterminal_origin::builtin});
          auto body = token_tree_body();
          for (const auto& alt : body.items)
            add_production(owner_, alt, "");
        }

        const auto start =
            opts_.start.empty() ? doc_.symbols.front().name : opts_.start;
        if (!declared_.count(start))
          throw grammar_error("unknown start symbol: " + start);

        if (opts_.layout) {
          const std::string layout(layout_symbol);
          b_.define(layout, nonterminal_options{nonterminal_origin::layout, true});
          b_.production(layout, {});
          b_.production(layout,
                        {b_.ref(layout), b_.builtin(builtin_rule::whitespace)});
          b_.production(layout,
                        {b_.ref(layout), b_.builtin(builtin_rule::comment)});

          const std::string wrapper(start_symbol);
          b_.define(wrapper, nonterminal_options{nonterminal_origin::start});
          b_.production(wrapper, {b_.ref(start), b_.ref(layout)});
          b_.start(wrapper);
        } else {
          b_.start(start);
        }
        return b_.build();
      }

    private:
      const document& doc_;
      const lowering_options& opts_;
      grammar_builder b_;
      std::unordered_set<std::string> declared_;
      std::unordered_map<std::string, std::size_t> counters_;
      std::string owner_;
      std::size_t line_ = 0;
      bool token_tree_used_ = false;

      std::string
      fresh(const char* kind, nonterminal_origin origin) {
        auto name = owner_ + "." + kind + std::to_string(++counters_[owner_]);
        b_.define(name, nonterminal_options{origin});
        return name;
      }

      void
      add_production(const std::string& lhs, const rule_node& body,
                     const std::string& label) {
        sequence s;
        if (body.holds<concatenation>()) {
          for (const auto& item : body.get<concatenation>().items)
            emit(item, "", s);
        } else {
          emit(body, "", s);
        }
        b_.production(lhs, std::move(s.rhs), label, std::move(s.fields));
      }

      void
      push_terminal(sequence& out, symbol t, const std::string& field) {
        if (opts_.layout) out.push(b_.ref(std::string(layout_symbol)), "");
        out.push(t, field);
      }

      void
      emit(const rule_node& item, const std::string& field, sequence& out) {
        if (item.holds<labeled>()) {
          const auto& l = item.get<labeled>();
          emit(*l.item, l.label, out);
        } else if (item.holds<string_literal>()) {
          push_terminal(out, b_.literal(item.get<string_literal>().text), field);
        } else if (item.holds<char_range>()) {
          const auto& r = item.get<char_range>();
          push_terminal(out, b_.range(r.first, r.last), field);
        } else if (item.holds<symbol_name>()) {
          emit_name(item.get<symbol_name>().name, field, out);
        } else if (item.holds<concatenation>()) {
          const auto& c = item.get<concatenation>();
          if (field.empty()) {
            for (const auto& i : c.items)
              emit(i, "", out);
          } else {
            auto name = fresh("grp", nonterminal_origin::group);
            add_production(name, item, "");
            out.push(b_.ref(name), field);
          }
        } else if (item.holds<alternation>()) {
          auto name = fresh("grp", nonterminal_origin::group);
          for (const auto& alt : item.get<alternation>().items)
            add_production(name, alt, "");
          out.push(b_.ref(name), field);
        } else if (item.holds<option>()) {
          auto name = fresh("opt", nonterminal_origin::optional);
          add_production(name, *item.get<option>().item, "");
          b_.production(name, {});
          out.push(b_.ref(name), field);
        } else {
          out.push(b_.ref(emit_repeat(item.get<repeated>())), field);
        }
      }

      void
      emit_name(const std::string& name, const std::string& field,
                sequence& out) {
        if (auto rule = builtin_rule_from_name(name)) {
          if (is_trivia_rule(*rule)) {
            out.push(b_.builtin(*rule), field);
          } else {
            push_terminal(out, b_.builtin(*rule), field);
          }
          return;
        }
        if (name == token_tree_symbol) {
          token_tree_used_ = true;
        } else if (!declared_.count(name)) {
          throw notation_error("undefined symbol " + name + " referenced from " +
                                   owner_,
                               line_);
        }
        out.push(b_.ref(name), field);
      }

      // R -> item | R sep item, or R -> item | R item without a separator.
      // The item and separator are lowered once; `separator` receives the
      // lowered separator.
      std::string
      one_or_more(const repeated& r, sequence* separator = nullptr) {
        auto name = fresh("rep", nonterminal_origin::repeat);
        sequence item;
        emit(*r.item, "item", item);
        sequence sep;
        if (r.separator) emit(*r.separator, "sep", sep);

        sequence next;
        next.push(b_.ref(name), "");
        next.append(sep);
        next.append(item);
        b_.production(name, std::move(item.rhs), "", std::move(item.fields));
        b_.production(name, std::move(next.rhs), "", std::move(next.fields));
        if (separator) *separator = std::move(sep);
        return name;
      }

      std::string
      emit_repeat(const repeated& r) {
        if (!r.separator) {
          if (r.at_least_one) return one_or_more(r);
          auto name = fresh("rep", nonterminal_origin::repeat);
          b_.production(name, {});
          sequence next;
          next.push(b_.ref(name), "");
          emit(*r.item, "item", next);
          b_.production(name, std::move(next.rhs), "", std::move(next.fields));
          return name;
        }
        if (r.at_least_one && !r.allow_trailing) return one_or_more(r);

        auto outer = fresh("rep", nonterminal_origin::repeat);
        sequence sep;
        auto inner = one_or_more(r, &sep);
        if (!r.at_least_one) b_.production(outer, {});
        b_.production(outer, {b_.ref(inner)});
        if (r.allow_trailing) {
          sequence trailing;
          trailing.push(b_.ref(inner), "");
          trailing.append(sep);
          b_.production(outer, std::move(trailing.rhs), "",
                        std::move(trailing.fields));
        }
        return outer;
      }
    };

  } // namespace

  grammar
  lower_notation(const notation::document& doc, const lowering_options& opts) {
    lowerer l(doc, opts);
    return l.run();
  }

  grammar
  load_notation(std::string_view text, const lowering_options& opts) {
    notation_parser p;
    auto doc = p.parse(text);
    return lower_notation(doc, opts);
  }

} // namespace gll
