#include <gll/cst_extractor.hpp>
#include <gll/errors.hpp>

#include <algorithm>
#include <optional>
#include <utility>

namespace gll {

  disambiguation_policy
  default_policy() {
    return [](const sppf::forest& f, sppf::node_id a, sppf::node_id b) {
      auto pa = f.packed_production(a).index;
      auto pb = f.packed_production(b).index;
      if (pa != pb) return std::weak_ordering(pa <=> pb);
      return std::weak_ordering(f.at(b).pivot <=> f.at(a).pivot);
    };
  }

  disambiguation_policy
  strict_policy() {
    return [](const sppf::forest&, sppf::node_id, sppf::node_id) {
      return std::weak_ordering::equivalent;
    };
  }

  namespace {

    using children = std::vector<cst_node>;

    // Resolution of one symbol or intermediate node. Candidates are tried in
    // policy order, one group of equivalent candidates at a time.
    struct frame {
      sppf::node_id id = sppf::no_node;
      std::vector<sppf::node_id> candidates;
      std::size_t next = 0;
      std::size_t group_end = 0;
      // 0 before the left child, 1 before the right child, 2 when expanded.
      int side = 0;
      // The current candidate leads back onto the path.
      bool failed = false;
      children current;
      std::vector<std::pair<sppf::node_id, children>> built;
    };

    class extractor {
    public:
      extractor(const sppf::forest& f, const disambiguation_policy& policy)
          : forest_(f), policy_(policy), on_path_(f.size(), false) {}

      // Nullopt when every derivation of `root` leads back onto the path.
      std::optional<cst_node>
      run(sppf::node_id root) {
        enter(root);
        while (true) {
          auto& f = stack_.back();
          if (f.next < f.group_end) {
            advance(f);
            continue;
          }
          if (f.built.size() > 1) ambiguous(f);

          std::optional<std::pair<sppf::node_id, children>> chosen;
          if (f.built.size() == 1) {
            chosen = std::move(f.built.front());
          } else if (f.group_end < f.candidates.size()) {
            open_group(f, f.group_end);
            continue;
          }

          const auto id = f.id;
          on_path_[id] = false;
          stack_.pop_back();

          if (stack_.empty()) {
            if (!chosen) return std::nullopt;
            return symbol(id, std::move(*chosen));
          }
          auto& parent = stack_.back();
          if (!chosen) {
            parent.failed = true;
          } else if (forest_.at(id).kind == sppf::node_kind::symbol) {
            parent.current.push_back(symbol(id, std::move(*chosen)));
          } else {
            for (auto& c : chosen->second)
              parent.current.push_back(std::move(c));
          }
        }
      }

    private:
      const sppf::forest& forest_;
      const disambiguation_policy& policy_;
      std::vector<bool> on_path_;
      std::vector<frame> stack_;

      cst_node
      symbol(sppf::node_id id,
             std::pair<sppf::node_id, children>&& chosen) const {
        const auto& nd = forest_.at(id);
        cst_node n;
        n.kind = cst_kind::nonterminal;
        n.symbol = nd.label;
        n.production = forest_.packed_production(chosen.first).id;
        n.start = nd.start;
        n.end = nd.end;
        n.trivia = forest_.grammar().nonterminals()[nd.label].trivia;
        n.children = std::move(chosen.second);
        return n;
      }

      void
      enter(sppf::node_id id) {
        on_path_[id] = true;
        frame f;
        f.id = id;
        f.candidates = forest_.at(id).packed;
        std::stable_sort(f.candidates.begin(), f.candidates.end(),
                         [this](sppf::node_id a, sppf::node_id b) {
                           return policy_(forest_, a, b) < 0;
                         });
        stack_.push_back(std::move(f));
        open_group(stack_.back(), 0);
      }

      void
      open_group(frame& f, std::size_t begin) {
        f.built.clear();
        f.next = begin;
        f.group_end = begin;
        if (begin == f.candidates.size()) return;
        f.group_end = begin + 1;
        while (f.group_end < f.candidates.size() &&
               policy_(forest_, f.candidates[begin],
                       f.candidates[f.group_end]) == 0)
          ++f.group_end;
      }

      // Takes one step on the current candidate of `f`. May push a frame,
      // which invalidates `f`.
      void
      advance(frame& f) {
        if (f.failed || f.side == 2) {
          if (!f.failed)
            f.built.emplace_back(f.candidates[f.next], std::move(f.current));
          f.current.clear();
          f.failed = false;
          f.side = 0;
          ++f.next;
          return;
        }
        const auto& p = forest_.at(f.candidates[f.next]);
        const auto child = f.side == 0 ? p.left : p.right;
        ++f.side;
        flatten(f, child);
      }

      // Appends the CST children contributed by one child of a packed node,
      // or enters it when it needs resolving.
      void
      flatten(frame& f, sppf::node_id id) {
        if (id == sppf::no_node) return;
        const auto& nd = forest_.at(id);
        switch (nd.kind) {
          case sppf::node_kind::epsilon:
            return;
          case sppf::node_kind::terminal: {
            cst_node token;
            token.kind = cst_kind::token;
            token.symbol = nd.label;
            token.start = nd.start;
            token.end = nd.end;
            token.text = std::string(forest_.text(id));
            token.trivia = forest_.grammar().terminals()[nd.label].trivia;
            f.current.push_back(std::move(token));
            return;
          }
          case sppf::node_kind::symbol:
          case sppf::node_kind::intermediate:
            if (on_path_[id]) {
              f.failed = true;
              return;
            }
            enter(id);
            return;
          case sppf::node_kind::packed:
            break;
        }
        f.failed = true;
      }

      std::string
      owner_name(sppf::node_id id) const {
        const auto& nd = forest_.at(id);
        const auto& g = forest_.grammar();
        if (nd.kind == sppf::node_kind::symbol)
          return g.nonterminals()[nd.label].name;
        return g.nonterminals()[g.slot_production(nd.label).lhs].name;
      }

      [[noreturn]] void
      ambiguous(const frame& f) const {
        std::vector<std::string> alternatives;
        for (const auto& b : f.built)
          alternatives.push_back(forest_.describe(b.first));
        const auto& nd = forest_.at(f.id);
        throw ambiguity_error(owner_name(f.id), nd.start, nd.end,
                              std::move(alternatives));
      }
    };

  } // namespace

  cst_node
  extract_cst(const sppf::forest& forest, sppf::node_id root,
              const extract_options& opts) {
    const auto& nd = forest.at(root);
    if (nd.kind != sppf::node_kind::symbol) {
      throw std::invalid_argument("extract_cst: root " + forest.describe(root) +
                                  " is not a symbol node");
    }
    const auto policy = opts.policy ? opts.policy : default_policy();
    extractor x(forest, policy);
    auto tree = x.run(root);
    if (!tree) {
      throw ambiguity_error(forest.grammar().nonterminals()[nd.label].name,
                            nd.start, nd.end, {});
    }
    return std::move(*tree);
  }

  cst_node
  extract_cst(const parse_result& result, const extract_options& opts) {
    const auto& s = result.success();
    return extract_cst(*s.forest, s.root, opts);
  }

} // namespace gll
