#include <gll/errors.hpp>
#include <gll/grammar.hpp>

#include <utility>

namespace gll {

  // ===========================================================================
  // grammar
  // ===========================================================================

  std::optional<std::uint32_t>
  grammar::find_nonterminal(std::string_view name) const {
    auto it = nonterminal_index_.find(std::string(name));
    if (it == nonterminal_index_.end()) return std::nullopt;
    return it->second;
  }

  std::optional<std::uint32_t>
  grammar::find_terminal(std::string_view name) const {
    auto it = terminal_index_.find(std::string(name));
    if (it == terminal_index_.end()) return std::nullopt;
    return it->second;
  }

  std::vector<const production*>
  grammar::productions_of(std::string_view name) const {
    auto nt = find_nonterminal(name);
    if (!nt) {
      throw grammar_error("unknown nonterminal: " + std::string(name));
    }
    std::vector<const production*> result;
    for (auto id : nonterminals_[*nt].productions)
      result.push_back(&productions_[id]);
    return result;
  }

  const production&
  grammar::production_of(std::string_view name, std::size_t index) const {
    auto prods = productions_of(name);
    if (index >= prods.size()) {
      throw grammar_error("nonterminal " + std::string(name) + " has no production " +
                          std::to_string(index));
    }
    return *prods[index];
  }

  std::string
  grammar::symbol_name(symbol s) const {
    if (s.is_terminal()) return terminals_[s.index].name;
    return nonterminals_[s.index].name;
  }

  std::string
  grammar::slot_to_string(slot_id s) const {
    const auto& p = slot_production(s);
    auto dot = slot_dot(s);
    std::string out = nonterminals_[p.lhs].name + " ::=";
    for (std::size_t i = 0; i <= p.rhs.size(); ++i) {
      if (i == dot) out += " .";
      if (i < p.rhs.size()) out += " " + symbol_name(p.rhs[i]);
    }
    return out;
  }

  void
  grammar::analyse() {
    const auto nt_count = nonterminals_.size();
    const auto t_count = terminals_.size();

    nullable_.assign(nt_count, false);
    bool changed = true;
    while (changed) {
      changed = false;
      for (const auto& p : productions_) {
        if (nullable_[p.lhs]) continue;
        bool all = true;
        for (const auto& s : p.rhs) {
          if (s.is_terminal() || !nullable_[s.index]) {
            all = false;
            break;
          }
        }
        if (all) {
          nullable_[p.lhs] = true;
          changed = true;
        }
      }
    }

    std::vector<std::vector<bool>> first(nt_count,
                                         std::vector<bool>(t_count, false));
    changed = true;
    while (changed) {
      changed = false;
      for (const auto& p : productions_) {
        auto& target = first[p.lhs];
        for (const auto& s : p.rhs) {
          if (s.is_terminal()) {
            if (!target[s.index]) {
              target[s.index] = true;
              changed = true;
            }
            break;
          }
          if (s.index != p.lhs) {
            const auto& source = first[s.index];
            for (std::size_t t = 0; t < t_count; ++t) {
              if (source[t] && !target[t]) {
                target[t] = true;
                changed = true;
              }
            }
          }
          if (!nullable_[s.index]) break;
        }
      }
    }

    slot_first_.assign(slot_production_.size(), {});
    slot_nullable_.assign(slot_production_.size(), false);
    for (const auto& p : productions_) {
      std::vector<bool> acc(t_count, false);
      bool acc_nullable = true;
      for (std::size_t dot = p.rhs.size() + 1; dot-- > 0;) {
        if (dot < p.rhs.size()) {
          const auto& s = p.rhs[dot];
          if (s.is_terminal()) {
            acc.assign(t_count, false);
            acc[s.index] = true;
            acc_nullable = false;
          } else {
            if (!nullable_[s.index]) {
              acc.assign(t_count, false);
              acc_nullable = false;
            }
            for (std::size_t t = 0; t < t_count; ++t) {
              if (first[s.index][t]) acc[t] = true;
            }
          }
        }
        auto slot_index = p.first_slot + dot;
        slot_nullable_[slot_index] = acc_nullable;
        for (std::size_t t = 0; t < t_count; ++t) {
          if (acc[t])
            slot_first_[slot_index].push_back(static_cast<std::uint32_t>(t));
        }
      }
    }
  }

  // ===========================================================================
  // grammar_builder
  // ===========================================================================

  grammar_builder&
  grammar_builder::start(std::string name) {
    start_ = std::move(name);
    return *this;
  }

  grammar_builder&
  grammar_builder::allow_empty_productions(bool allow) {
    allow_empty_ = allow;
    return *this;
  }

  symbol
  grammar_builder::terminal(std::string name, matcher m, bool trivia) {
    if (terminal_index_.count(name)) {
      throw grammar_error("duplicate terminal: " + name);
    }
    auto index = static_cast<std::uint32_t>(terminals_.size());
    terminal_index_.emplace(name, index);
    terminals_.push_back(gll::terminal{std::move(name), std::move(m), trivia});
    return {symbol_kind::terminal, index};
  }

  symbol
  grammar_builder::token(std::string_view name) const {
    auto it = terminal_index_.find(std::string(name));
    if (it == terminal_index_.end()) {
      throw grammar_error("undefined terminal: " + std::string(name));
    }
    return {symbol_kind::terminal, it->second};
  }

  symbol
  grammar_builder::intern_terminal(matcher m, bool trivia) {
    auto name = describe(m);
    auto it = terminal_index_.find(name);
    if (it != terminal_index_.end()) {
      if (!(terminals_[it->second].match == m)) {
        throw grammar_error("terminal name " + name +
                            " is already bound to a different matcher");
      }
      return {symbol_kind::terminal, it->second};
    }
    return terminal(std::move(name), std::move(m), trivia);
  }

  symbol
  grammar_builder::literal(std::string text) {
    return intern_terminal(literal_matcher{std::move(text)}, false);
  }

  symbol
  grammar_builder::range(unsigned char first, unsigned char last) {
    return intern_terminal(char_class_matcher{{{first, last}}, false, 1, 1},
                           false);
  }

  symbol
  grammar_builder::builtin(builtin_rule rule) {
    return intern_terminal(builtin_matcher{rule}, is_trivia_rule(rule));
  }

  std::uint32_t
  grammar_builder::intern_nonterminal(const std::string& name) {
    auto it = nonterminal_index_.find(name);
    if (it != nonterminal_index_.end()) return it->second;
    auto index = static_cast<std::uint32_t>(nonterminals_.size());
    nonterminal_index_.emplace(name, index);
    nonterminals_.push_back(pending_nonterminal{name, {}, false, {}});
    return index;
  }

  symbol
  grammar_builder::ref(const std::string& name) {
    return {symbol_kind::nonterminal, intern_nonterminal(name)};
  }

  grammar_builder&
  grammar_builder::define(const std::string& name, nonterminal_options opts) {
    auto index = intern_nonterminal(name);
    auto& nt = nonterminals_[index];
    if (nt.defined) throw grammar_error("duplicate nonterminal: " + name);
    nt.defined = true;
    nt.options = opts;
    return *this;
  }

  bool
  grammar_builder::defined(const std::string& name) const {
    auto it = nonterminal_index_.find(name);
    return it != nonterminal_index_.end() && nonterminals_[it->second].defined;
  }

  grammar_builder&
  grammar_builder::production(const std::string& lhs, std::vector<symbol> rhs,
                              std::string label,
                              std::vector<std::string> fields) {
    auto index = intern_nonterminal(lhs);
    nonterminals_[index].defined = true;
    if (fields.size() > rhs.size()) {
      throw grammar_error("production of " + lhs +
                          " has more field labels than symbols");
    }
    fields.resize(rhs.size());
    nonterminals_[index].productions.push_back(
        static_cast<std::uint32_t>(productions_.size()));
    productions_.push_back(
        pending_production{index, std::move(label), std::move(rhs),
                           std::move(fields)});
    return *this;
  }

  grammar
  grammar_builder::build() const {
    if (start_.empty()) throw grammar_error("no start symbol");
    auto start_it = nonterminal_index_.find(start_);
    if (start_it == nonterminal_index_.end() ||
        !nonterminals_[start_it->second].defined) {
      throw grammar_error("start symbol is not defined: " + start_);
    }

    for (const auto& t : terminals_)
      validate(t.match, t.name);

    for (const auto& nt : nonterminals_) {
      if (nt.defined) continue;
      // Report the first production that refers to it
      for (const auto& p : productions_) {
        const auto& owner = nonterminals_[p.lhs];
        for (const auto& s : p.rhs) {
          if (s.is_nonterminal() && nonterminals_[s.index].name == nt.name) {
            std::size_t alt = 0;
            while (&productions_[owner.productions[alt]] != &p)
              ++alt;
            throw grammar_error("undefined nonterminal " + nt.name +
                                " referenced from " + owner.name +
                                " production " + std::to_string(alt));
          }
        }
      }
      throw grammar_error("undefined nonterminal " + nt.name);
    }

    grammar g;
    g.terminals_ = terminals_;
    g.terminal_index_ = terminal_index_;
    g.nonterminal_index_ = nonterminal_index_;
    g.start_ = start_it->second;

    for (const auto& pending : nonterminals_) {
      if (pending.productions.empty()) {
        throw grammar_error("nonterminal " + pending.name +
                            " has no productions");
      }
      gll::nonterminal nt;
      nt.name = pending.name;
      nt.origin = pending.options.origin;
      nt.trivia = pending.options.trivia;
      nt.allow_empty = pending.options.allow_empty.value_or(allow_empty_);
      nt.productions = pending.productions;
      g.nonterminals_.push_back(std::move(nt));
    }

    // Production ids follow grouping by nonterminal so that slot ranges of
    // one nonterminal are contiguous.
    std::vector<std::uint32_t> remap(productions_.size());
    std::uint32_t next_slot = 0;
    for (auto& nt : g.nonterminals_) {
      for (std::uint32_t alt = 0; alt < nt.productions.size(); ++alt) {
        const auto& pending = productions_[nt.productions[alt]];
        if (pending.rhs.empty() && !nt.allow_empty) {
          throw grammar_error("empty production " + std::to_string(alt) +
                              " of " + nt.name + " is not allowed");
        }
        gll::production p;
        p.id = static_cast<std::uint32_t>(g.productions_.size());
        p.lhs = pending.lhs;
        p.index = alt;
        p.label = pending.label;
        p.rhs = pending.rhs;
        p.field_labels = pending.fields;
        p.first_slot = next_slot;
        for (std::size_t dot = 0; dot <= p.rhs.size(); ++dot)
          g.slot_production_.push_back(p.id);
        next_slot += static_cast<std::uint32_t>(p.rhs.size() + 1);
        remap[nt.productions[alt]] = p.id;
        g.productions_.push_back(std::move(p));
      }
      for (auto& id : nt.productions)
        id = remap[id];
    }

    g.analyse();
    return g;
  }

} // namespace gll
