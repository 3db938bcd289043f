#include <gll/cst_writer.hpp>

#include <sstream>
#include <vector>

namespace gll {

  namespace {

    void
    write_quoted(std::ostream& os, std::string_view text) {
      os << '"';
      for (char c : text) {
        switch (c) {
          case '"':
            os << "\\\"";
            break;
          case '\\':
            os << "\\\\";
            break;
          case '\n':
            os << "\\n";
            break;
          case '\r':
            os << "\\r";
            break;
          case '\t':
            os << "\\t";
            break;
          default:
            os << c;
        }
      }
      os << '"';
    }

    std::vector<const cst_node*>
    visible_children(const cst_node& node, const cst_write_options& opts) {
      std::vector<const cst_node*> out;
      for (const auto& c : node.children) {
        if (opts.trivia || !c.trivia) out.push_back(&c);
      }
      return out;
    }

    // Pending output of an iterative walk. A null node closes the most
    // recently opened one.
    struct pending_node {
      const cst_node* node;
      std::size_t depth;
      // Written before the node: none at the root, then a space or a newline.
      enum { none, space, newline } lead;
    };

    void
    write_node(std::ostream& os, const grammar& g, const cst_node& root,
               const cst_write_options& opts) {
      std::vector<pending_node> pending{{&root, 0, pending_node::none}};
      while (!pending.empty()) {
        auto [node, depth, lead] = pending.back();
        pending.pop_back();
        if (!node) {
          os << ')';
          continue;
        }
        if (lead == pending_node::space) {
          os << ' ';
        } else if (lead == pending_node::newline) {
          os << '\n' << std::string(depth * 2, ' ');
        }
        if (node->is_token()) {
          write_quoted(os, node->text);
          continue;
        }
        os << '(' << cst_name(g, *node);
        const auto& label = cst_production(g, *node).label;
        if (!label.empty()) os << ':' << label;

        auto children = visible_children(*node, opts);
        bool nested = false;
        for (const auto* c : children) {
          if (!c->is_token()) nested = true;
        }
        const auto child_lead = opts.indent && nested ? pending_node::newline
                                                      : pending_node::space;
        pending.push_back({nullptr, depth, pending_node::none});
        for (auto it = children.rbegin(); it != children.rend(); ++it)
          pending.push_back({*it, depth + 1, child_lead});
      }
    }

    void
    write_token(xml_writer& w, const grammar& g, const cst_node& node) {
      w.start_element("token");
      w.attribute("terminal", cst_name(g, node));
      w.attribute("start", std::to_string(node.start));
      w.attribute("end", std::to_string(node.end));
      if (node.trivia) w.attribute("trivia", "true");
      w.characters(node.text);
      w.end_element();
    }

    void
    write_xml_node(xml_writer& w, const grammar& g, const cst_node& root,
                   const cst_write_options& opts) {
      // Null entries close an element.
      std::vector<const cst_node*> pending{&root};
      while (!pending.empty()) {
        const auto* node = pending.back();
        pending.pop_back();
        if (!node) {
          w.end_element();
          continue;
        }
        if (node->is_token()) {
          write_token(w, g, *node);
          continue;
        }
        const auto& p = cst_production(g, *node);
        w.start_element("node");
        w.attribute("symbol", cst_name(g, *node));
        w.attribute("production", std::to_string(p.index));
        if (!p.label.empty()) w.attribute("label", p.label);
        w.attribute("start", std::to_string(node->start));
        w.attribute("end", std::to_string(node->end));
        if (node->trivia) w.attribute("trivia", "true");
        pending.push_back(nullptr);
        auto children = visible_children(*node, opts);
        for (auto it = children.rbegin(); it != children.rend(); ++it)
          pending.push_back(*it);
      }
    }

  } // namespace

  void
  write_sexpr(std::ostream& os, const grammar& g, const cst_node& node,
              const cst_write_options& opts) {
    write_node(os, g, node, opts);
  }

  std::string
  to_sexpr(const grammar& g, const cst_node& node,
           const cst_write_options& opts) {
    std::ostringstream os;
    write_sexpr(os, g, node, opts);
    return os.str();
  }

  void
  write_xml(xml_writer& writer, const grammar& g, const cst_node& node,
            const cst_write_options& opts) {
    write_xml_node(writer, g, node, opts);
  }

} // namespace gll
