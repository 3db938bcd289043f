#include <gll/engine.hpp>
#include <gll/errors.hpp>
#include <gll/gss.hpp>

#include <algorithm>
#include <ostream>
#include <unordered_map>
#include <unordered_set>

namespace gll {

  namespace {

    struct descriptor {
      slot_id slot;
      gss_node_id node;
      std::size_t offset;
      sppf::node_id forest_node;

      bool
      operator==(const descriptor&) const = default;
    };

    struct descriptor_hash {
      std::size_t
      operator()(const descriptor& d) const noexcept {
        std::size_t seed = d.slot;
        seed = seed * 1000003u ^ d.node;
        seed = seed * 1000003u ^ d.offset;
        seed = seed * 1000003u ^ d.forest_node;
        return seed;
      }
    };

    constexpr std::size_t deadline_check_interval = 1024;

  } // namespace

  // ---------------------------------------------------------------------------
  // Results
  // ---------------------------------------------------------------------------

  std::string
  parse_failure::message() const {
    std::string items;
    for (const auto& e : expected) {
      if (!items.empty()) items += ", ";
      items += e.description;
    }
    if (end_of_input_expected) {
      if (!items.empty()) items += ", ";
      items += "end of input";
    }
    std::string where = "position " + std::to_string(offset) + " (line " +
                        std::to_string(line) + ", column " +
                        std::to_string(column) + ")";
    if (items.empty()) return "no derivation reaches " + where;
    return "expected one of {" + items + "} at " + where;
  }

  parse_error::parse_error(parse_failure failure)
      : std::runtime_error("parse failed: " + failure.message()),
        failure_(std::move(failure)) {}

  const parse_success&
  parse_result::success() const {
    if (const auto* s = std::get_if<parse_success>(&outcome_)) return *s;
    throw parse_error(std::get<parse_failure>(outcome_));
  }

  const parse_failure&
  parse_result::failure() const {
    if (const auto* f = std::get_if<parse_failure>(&outcome_)) return *f;
    throw std::logic_error("parse_result: the parse succeeded");
  }

  // ---------------------------------------------------------------------------
  // engine
  // ---------------------------------------------------------------------------

  struct engine::impl {
    const grammar& g;
    parse_options opts;
    bool used = false;

    std::unique_ptr<sppf::forest_builder> forest;
    gss stack;
    std::string_view input;

    std::vector<descriptor> worklist;
    std::unordered_set<descriptor, descriptor_hash> processed;
    std::size_t descriptor_count = 0;

    // Terminal match lengths by (offset, terminal); -1 for no match.
    std::unordered_map<std::size_t, std::ptrdiff_t> match_memo;

    std::size_t furthest_failure = 0;
    std::vector<std::uint32_t> furthest_expected;
    std::optional<std::size_t> furthest_root_end;

    impl(const grammar& gr, parse_options o) : g(gr), opts(std::move(o)) {}

    std::optional<std::size_t>
    match_terminal(std::uint32_t t, std::size_t offset) {
      auto key = offset * g.terminals().size() + t;
      auto [it, inserted] = match_memo.try_emplace(key, -1);
      if (inserted) {
        if (auto len = match(g.terminals()[t].match, input, offset))
          it->second = static_cast<std::ptrdiff_t>(*len);
      }
      if (it->second < 0) return std::nullopt;
      return static_cast<std::size_t>(it->second);
    }

    void
    record_failure(std::uint32_t t, std::size_t offset) {
      if (offset < furthest_failure) return;
      if (offset > furthest_failure) {
        furthest_failure = offset;
        furthest_expected.clear();
      }
      if (std::find(furthest_expected.begin(), furthest_expected.end(), t) ==
          furthest_expected.end())
        furthest_expected.push_back(t);
    }

    // Whether the production starting at `slot` can begin at `offset`.
    bool
    admits(slot_id slot, std::size_t offset) {
      if (!opts.lookahead || g.suffix_nullable(slot)) return true;
      bool any = false;
      for (auto t : g.first_terminals(slot)) {
        if (match_terminal(t, offset)) {
          any = true;
        } else {
          record_failure(t, offset);
        }
      }
      return any;
    }

    void
    add(slot_id slot, gss_node_id node, std::size_t offset,
        sppf::node_id forest_node) {
      descriptor d{slot, node, offset, forest_node};
      if (processed.insert(d).second) worklist.push_back(d);
    }

    gss_node_id
    create(slot_id ret, gss_node_id caller, std::size_t offset,
           sppf::node_id prefix) {
      auto [callee, created] = stack.get_or_create(ret, offset);
      if (stack.add_edge(callee, caller, prefix)) {
        // Resume the new edge with results already found for this call.
        const auto popped = stack.at(callee).popped;
        for (auto z : popped) {
          auto y = forest->extend(ret, prefix, z);
          add(ret, caller, forest->view().at(z).end, y);
        }
      }
      return callee;
    }

    void
    pop(gss_node_id node, std::size_t offset, sppf::node_id result) {
      if (node == stack.root()) {
        if (!furthest_root_end || offset > *furthest_root_end)
          furthest_root_end = offset;
        return;
      }
      if (!stack.add_popped(node, result, offset)) return;
      const auto& n = stack.at(node);
      for (const auto& e : n.edges) {
        auto y = forest->extend(n.slot, e.label, result);
        add(n.slot, e.target, offset, y);
      }
    }

    void
    call(std::uint32_t nt, slot_id ret, gss_node_id caller, std::size_t offset,
         sppf::node_id prefix) {
      auto callee = create(ret, caller, offset, prefix);
      for (auto pid : g.nonterminals()[nt].productions) {
        auto first = g.slot(pid, 0);
        if (admits(first, offset)) add(first, callee, offset, sppf::no_node);
      }
    }

    void
    trace(const descriptor& d) {
      auto& out = *opts.trace;
      out << "descriptor " << g.slot_to_string(d.slot) << " gss=" << d.node
          << " offset=" << d.offset << " node=";
      if (d.forest_node == sppf::no_node) {
        out << "-";
      } else {
        out << forest->view().describe(d.forest_node);
      }
      out << '\n';
    }

    // Runs one descriptor, continuing inline across terminals.
    void
    process(descriptor d) {
      auto slot = d.slot;
      auto offset = d.offset;
      auto w = d.forest_node;
      for (;;) {
        const auto& p = g.slot_production(slot);
        const auto dot = g.slot_dot(slot);

        if (dot == p.rhs.size()) {
          if (p.rhs.empty()) {
            w = forest->extend(slot, sppf::no_node,
                               forest->epsilon_node(offset));
          }
          pop(d.node, offset, w);
          return;
        }

        const auto& s = p.rhs[dot];
        if (s.is_nonterminal()) {
          call(s.index, slot + 1, d.node, offset, w);
          return;
        }

        auto len = match_terminal(s.index, offset);
        if (!len) {
          record_failure(s.index, offset);
          return;
        }
        auto leaf = forest->terminal_node(s.index, offset, offset + *len);
        ++slot;
        w = forest->extend(slot, w, leaf);
        offset += *len;
      }
    }

    void
    check_limits() {
      if (opts.max_descriptors != 0 &&
          descriptor_count >= opts.max_descriptors) {
        throw parse_aborted("parse aborted: descriptor budget of " +
                            std::to_string(opts.max_descriptors) +
                            " exceeded");
      }
      if (opts.deadline && descriptor_count % deadline_check_interval == 0 &&
          std::chrono::steady_clock::now() >= *opts.deadline) {
        throw parse_aborted("parse aborted: deadline exceeded after " +
                            std::to_string(descriptor_count) + " descriptors");
      }
    }

    parse_failure
    make_failure() const {
      parse_failure f;
      const bool root_is_furthest =
          furthest_root_end &&
          (furthest_expected.empty() || *furthest_root_end >= furthest_failure);
      if (root_is_furthest) {
        f.offset = *furthest_root_end;
        f.end_of_input_expected = true;
      } else {
        f.offset = furthest_failure;
      }
      if (!furthest_expected.empty() && furthest_failure == f.offset) {
        auto terminals = furthest_expected;
        std::sort(terminals.begin(), terminals.end());
        // Trivia terminals are reported only when nothing else was expected.
        auto is_trivia = [this](std::uint32_t t) {
          return g.terminals()[t].trivia;
        };
        if (f.end_of_input_expected ||
            !std::all_of(terminals.begin(), terminals.end(), is_trivia)) {
          terminals.erase(
              std::remove_if(terminals.begin(), terminals.end(), is_trivia),
              terminals.end());
        }
        for (auto t : terminals) {
          f.expected.push_back(expected_symbol{
              symbol{symbol_kind::terminal, t}, g.terminals()[t].name});
        }
      }
      for (std::size_t i = 0; i < f.offset && i < input.size(); ++i) {
        if (input[i] == '\n') {
          ++f.line;
          f.column = 1;
        } else {
          ++f.column;
        }
      }
      return f;
    }

    parse_statistics
    statistics() const {
      const auto& view = forest->view();
      parse_statistics st;
      st.descriptors = descriptor_count;
      st.gss_nodes = stack.size();
      st.gss_edges = stack.edge_count();
      st.symbol_nodes = view.count(sppf::node_kind::symbol);
      st.intermediate_nodes = view.count(sppf::node_kind::intermediate);
      st.terminal_nodes = view.count(sppf::node_kind::terminal);
      st.epsilon_nodes = view.count(sppf::node_kind::epsilon);
      st.packed_nodes = view.count(sppf::node_kind::packed);
      return st;
    }

    parse_result
    run(std::string_view text) {
      if (used) throw std::logic_error("engine: parse() may only be called once");
      used = true;

      forest = std::make_unique<sppf::forest_builder>(g, std::string(text));
      input = forest->view().input();

      for (auto pid : g.start_symbol().productions) {
        auto first = g.slot(pid, 0);
        if (admits(first, 0)) add(first, stack.root(), 0, sppf::no_node);
      }

      while (!worklist.empty()) {
        check_limits();
        auto d = worklist.back();
        worklist.pop_back();
        ++descriptor_count;
        if (opts.trace) trace(d);
        process(d);
      }

      auto stats = statistics();
      auto root = forest->view().find_symbol(g.start(), 0, input.size());
      if (!root) return parse_result(make_failure(), stats);
      return parse_result(parse_success{forest->finish(), *root}, stats);
    }
  };

  engine::engine(const grammar& g, parse_options opts)
      : impl_(std::make_unique<impl>(g, std::move(opts))) {}

  engine::~engine() = default;
  engine::engine(engine&&) noexcept = default;
  engine&
  engine::operator=(engine&&) noexcept = default;

  parse_result
  engine::parse(std::string_view text) {
    return impl_->run(text);
  }

  parse_result
  parse(const grammar& g, std::string_view text, parse_options opts) {
    engine e(g, std::move(opts));
    return e.parse(text);
  }

} // namespace gll
