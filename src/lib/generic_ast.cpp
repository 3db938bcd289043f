#include <gll/generic_ast.hpp>

#include <optional>
#include <stdexcept>

namespace gll {

  bool
  generic_node::operator==(const generic_node& other) const {
    return type == other.type && variant == other.variant &&
           fields == other.fields;
  }

  bool
  generic_value::operator==(const generic_value& other) const {
    return data_ == other.data_;
  }

  bool
  generic_field::operator==(const generic_field& other) const {
    return name == other.name && value == other.value;
  }

  const generic_value&
  generic_value::operator[](std::string_view name) const {
    if (const auto* node = std::get_if<generic_node>(&data_)) {
      for (const auto& f : node->fields) {
        if (f.name == name) return f.value;
      }
    }
    throw std::out_of_range("generic_value: no field " + std::string(name));
  }

  namespace {

    using context = lowering_context<generic_value>;

    bool
    is_literal(const grammar& g, symbol s) {
      return s.is_terminal() &&
             std::holds_alternative<literal_matcher>(g.terminals()[s.index].match);
    }

    // Whether a symbol only ever matches fixed text, so that its presence is
    // all that matters.
    bool
    valueless(const grammar& g, symbol s, std::vector<bool>& seen) {
      if (s.is_terminal()) return is_literal(g, s) || g.terminals()[s.index].trivia;
      const auto& nt = g.nonterminals()[s.index];
      if (nt.trivia) return true;
      if (nt.origin != nonterminal_origin::group) return false;
      if (seen[s.index]) return true;
      seen[s.index] = true;
      for (auto pid : nt.productions) {
        for (const auto& r : g.productions()[pid].rhs) {
          if (!valueless(g, r, seen)) return false;
        }
      }
      return true;
    }

    bool
    optional_is_flag(const grammar& g, std::uint32_t nt) {
      std::vector<bool> seen(g.nonterminals().size(), false);
      for (auto pid : g.nonterminals()[nt].productions) {
        for (const auto& r : g.productions()[pid].rhs) {
          if (!valueless(g, r, seen)) return false;
        }
      }
      return true;
    }

    generic_value
    value_of(context& ctx, std::size_t i) {
      if (ctx.peek(i).is_token()) return ctx.text(i);
      return ctx.lower(i);
    }

    std::vector<std::size_t>
    significant(const context& ctx) {
      std::vector<std::size_t> out;
      for (std::size_t i = 0; i < ctx.size(); ++i) {
        if (!ctx.peek(i).trivia) out.push_back(i);
      }
      return out;
    }

    // Labelled positions by label, other valued positions as field_<n>,
    // unlabelled literals dropped.
    generic_node
    fields_node(context& ctx, std::string type) {
      generic_node node{std::move(type), ctx.production().label, {}};
      const auto& labels = ctx.production().field_labels;
      std::size_t n = 0;
      for (auto i : significant(ctx)) {
        const auto& label = labels[i];
        if (!label.empty()) {
          node.fields.push_back({label, value_of(ctx, i)});
        } else if (ctx.peek(i).is_token() &&
                   is_literal(ctx.grammar(), ctx.production().rhs[i])) {
          ctx.skip(i);
        } else {
          node.fields.push_back({"field_" + std::to_string(n), value_of(ctx, i)});
        }
        ++n;
      }
      return node;
    }

    generic_value
    lower_declared(context& ctx) {
      const auto& g = ctx.grammar();
      return fields_node(ctx, g.nonterminals()[ctx.production().lhs].name);
    }

    generic_value
    lower_group(context& ctx) {
      auto positions = significant(ctx);
      if (positions.size() == 1 &&
          ctx.production().field_labels[positions.front()].empty())
        return value_of(ctx, positions.front());
      return fields_node(ctx, "");
    }

    generic_value
    lower_optional(context& ctx) {
      auto positions = significant(ctx);
      if (optional_is_flag(ctx.grammar(), ctx.production().lhs)) {
        for (auto i : positions)
          ctx.skip(i);
        return !positions.empty();
      }
      if (positions.empty()) return {};
      return lower_group(ctx);
    }

    // Position of the left-recursive child of a repeat node, if any.
    std::optional<std::size_t>
    spine_child(const grammar& g, const cst_node& node) {
      const auto& labels = cst_production(g, node).field_labels;
      for (std::size_t i = 0; i < node.children.size(); ++i) {
        const auto& c = node.children[i];
        if (c.trivia) continue;
        if (!c.is_token() && c.symbol == node.symbol && labels[i].empty())
          return i;
        break;
      }
      return std::nullopt;
    }

    void
    append_items(context& ctx, generic_value::list_type& items) {
      const auto& g = ctx.grammar();
      const auto& labels = ctx.production().field_labels;
      const auto spine = spine_child(g, ctx.node());
      for (auto i : significant(ctx)) {
        const auto& c = ctx.peek(i);
        if (labels[i] == "sep" || i == spine) {
          ctx.skip(i);
        } else if (!c.is_token() && g.nonterminals()[c.symbol].origin ==
                                         nonterminal_origin::repeat &&
                   labels[i] != "item") {
          auto nested = ctx.lower(i);
          for (auto& v : nested.get<generic_value::list_type>())
            items.push_back(std::move(v));
        } else {
          items.push_back(value_of(ctx, i));
        }
      }
    }

    // R -> R sep item nests once per item, so the left spine is walked down
    // to its first item instead of being lowered recursively.
    generic_value
    lower_repeat(context& ctx) {
      std::vector<const cst_node*> spine;
      const auto* node = &ctx.node();
      while (auto i = spine_child(ctx.grammar(), *node)) {
        node = &node->children[*i];
        spine.push_back(node);
      }

      generic_value::list_type items;
      for (auto it = spine.rbegin(); it != spine.rend(); ++it) {
        context sub(ctx.rewriter(), **it);
        append_items(sub, items);
        sub.finish();
      }
      append_items(ctx, items);
      return items;
    }

    generic_value
    lower_text(context& ctx) {
      for (std::size_t i = 0; i < ctx.size(); ++i)
        ctx.skip(i);
      return cst_text(ctx.node());
    }

    generic_value
    lower_start(context& ctx) {
      generic_value result;
      bool found = false;
      for (auto i : significant(ctx)) {
        if (!found) {
          result = value_of(ctx, i);
          found = true;
        } else {
          ctx.skip(i);
        }
      }
      return result;
    }

    generic_value
    lower_layout(context& ctx) {
      for (std::size_t i = 0; i < ctx.size(); ++i)
        ctx.skip(i);
      return {};
    }

    void
    append_quoted(std::string& out, const std::string& s) {
      out += '"';
      for (char c : s) {
        switch (c) {
          case '"':
            out += "\\\"";
            break;
          case '\\':
            out += "\\\\";
            break;
          case '\n':
            out += "\\n";
            break;
          case '\t':
            out += "\\t";
            break;
          default:
            out += c;
        }
      }
      out += '"';
    }

    void
    write_value(std::string& out, const generic_value& v) {
      if (v.holds<std::monostate>()) {
        out += "none";
      } else if (v.holds<bool>()) {
        out += v.get<bool>() ? "true" : "false";
      } else if (v.holds<std::string>()) {
        append_quoted(out, v.get<std::string>());
      } else if (v.holds<generic_value::list_type>()) {
        out += '[';
        bool first = true;
        for (const auto& item : v.get<generic_value::list_type>()) {
          if (!first) out += ", ";
          first = false;
          write_value(out, item);
        }
        out += ']';
      } else {
        const auto& node = v.get<generic_node>();
        out += node.type;
        if (!node.variant.empty()) {
          if (!node.type.empty()) out += '.';
          out += node.variant;
        }
        out += '{';
        bool first = true;
        for (const auto& f : node.fields) {
          if (!first) out += ", ";
          first = false;
          out += f.name;
          out += ": ";
          write_value(out, f.value);
        }
        out += '}';
      }
    }

  } // namespace

  ast_rewriter<generic_value>
  make_generic_rewriter(const grammar& g) {
    ast_rewriter<generic_value> rw(g);
    for (const auto& nt : g.nonterminals()) {
      ast_rewriter<generic_value>::transform fn;
      switch (nt.origin) {
        case nonterminal_origin::declared:
          fn = lower_declared;
          break;
        case nonterminal_origin::group:
          fn = lower_group;
          break;
        case nonterminal_origin::optional:
          fn = lower_optional;
          break;
        case nonterminal_origin::repeat:
          fn = lower_repeat;
          break;
        case nonterminal_origin::builtin:
          fn = lower_text;
          break;
        case nonterminal_origin::start:
          fn = lower_start;
          break;
        case nonterminal_origin::layout:
          fn = lower_layout;
          break;
      }
      rw.on_all(nt.name, fn);
    }
    return rw;
  }

  generic_value
  lower_generic(const grammar& g, const cst_node& root) {
    return make_generic_rewriter(g).lower(root);
  }

  std::string
  to_string(const generic_value& value) {
    std::string out;
    write_value(out, value);
    return out;
  }

} // namespace gll
