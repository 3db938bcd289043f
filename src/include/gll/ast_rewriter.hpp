#pragma once

#include <gll/cst.hpp>
#include <gll/errors.hpp>
#include <gll/grammar.hpp>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gll {

  template <typename T>
  class ast_rewriter;

  // View of one nonterminal CST node handed to a transform. Every non-trivia
  // child must be consumed exactly once, through lower(), text(), child() or
  // skip(). Trivia children need not be consumed.
  template <typename T>
  class lowering_context {
  public:
    lowering_context(const ast_rewriter<T>& rewriter, const cst_node& node)
        : rewriter_(rewriter), node_(node),
          production_(cst_production(rewriter.grammar(), node)),
          consumed_(node.children.size(), false) {}

    const cst_node&
    node() const {
      return node_;
    }

    const gll::production&
    production() const {
      return production_;
    }

    const gll::grammar&
    grammar() const {
      return rewriter_.grammar();
    }

    const ast_rewriter<T>&
    rewriter() const {
      return rewriter_;
    }

    std::size_t
    size() const {
      return node_.children.size();
    }

    // Inspect a child without consuming it.
    const cst_node&
    peek(std::size_t i) const {
      check_index(i);
      return node_.children[i];
    }

    const cst_node&
    child(std::size_t i) {
      consume(i);
      return node_.children[i];
    }

    T
    lower(std::size_t i) {
      const auto& c = child(i);
      if (c.is_token()) fail("token child cannot be lowered", i);
      return rewriter_.lower(c);
    }

    std::string
    text(std::size_t i) {
      return cst_text(child(i));
    }

    void
    skip(std::size_t i) {
      consume(i);
    }

    // Consumes every remaining token child.
    void
    skip_tokens() {
      for (std::size_t i = 0; i < size(); ++i) {
        if (node_.children[i].is_token() && !consumed_[i]) consume(i);
      }
    }

    bool
    consumed(std::size_t i) const {
      check_index(i);
      return consumed_[i];
    }

    // Position carrying field label `label`. Throws grammar_error when the
    // production has none.
    std::size_t
    field(std::string_view label) const {
      for (std::size_t i = 0; i < production_.field_labels.size(); ++i) {
        if (production_.field_labels[i] == label) return i;
      }
      throw grammar_error("production " + std::to_string(production_.index) +
                          " of " + name() + " has no field " +
                          std::string(label));
    }

    T
    lower(std::string_view label) {
      return lower(field(label));
    }

    std::string
    text(std::string_view label) {
      return text(field(label));
    }

    // Throws lowering_error for a non-trivia child left unconsumed.
    void
    finish() const {
      for (std::size_t i = 0; i < size(); ++i) {
        if (!consumed_[i] && !node_.children[i].trivia)
          fail("child was not consumed", i);
      }
    }

  private:
    const ast_rewriter<T>& rewriter_;
    const cst_node& node_;
    const gll::production& production_;
    std::vector<bool> consumed_;

    const std::string&
    name() const {
      return cst_name(rewriter_.grammar(), node_);
    }

    [[noreturn]] void
    fail(const std::string& reason, std::size_t i) const {
      throw lowering_error(reason, name(), production_.index, i);
    }

    void
    check_index(std::size_t i) const {
      if (i >= size()) fail("no such child", i);
    }

    void
    consume(std::size_t i) {
      check_index(i);
      if (consumed_[i] && !node_.children[i].trivia)
        fail("child consumed twice", i);
      consumed_[i] = true;
    }
  };

  // Lowers a CST into values of T through transforms registered per
  // (nonterminal, production index).
  template <typename T>
  class ast_rewriter {
  public:
    using transform = std::function<T(lowering_context<T>&)>;

    explicit ast_rewriter(const gll::grammar& g)
        : grammar_(g), rules_(g.productions().size()) {}

    const gll::grammar&
    grammar() const {
      return grammar_;
    }

    // Throws grammar_error when `nonterminal` has no production `index`.
    ast_rewriter&
    on(std::string_view nonterminal, std::size_t index, transform fn) {
      const auto& p = grammar_.production_of(nonterminal, index);
      rules_[p.id] = std::move(fn);
      return *this;
    }

    // Registers `fn` for the production of `nonterminal` labelled `label`.
    ast_rewriter&
    on_label(std::string_view nonterminal, std::string_view label,
             transform fn) {
      for (const auto* p : grammar_.productions_of(nonterminal)) {
        if (p->label == label) {
          rules_[p->id] = std::move(fn);
          return *this;
        }
      }
      throw grammar_error("nonterminal " + std::string(nonterminal) +
                          " has no production labelled " + std::string(label));
    }

    // Same transform for every production of `nonterminal`.
    ast_rewriter&
    on_all(std::string_view nonterminal, const transform& fn) {
      for (const auto* p : grammar_.productions_of(nonterminal))
        rules_[p->id] = fn;
      return *this;
    }

    bool
    handles(std::uint32_t production_id) const {
      return static_cast<bool>(rules_[production_id]);
    }

    // Throws unhandled_production_error for a node with no rule.
    T
    lower(const cst_node& node) const {
      const auto& p = cst_production(grammar_, node);
      const auto& fn = rules_[p.id];
      if (!fn) {
        throw unhandled_production_error(grammar_.nonterminals()[p.lhs].name,
                                         p.index, node.start, node.end);
      }
      lowering_context<T> ctx(*this, node);
      T result = fn(ctx);
      ctx.finish();
      return result;
    }

  private:
    const gll::grammar& grammar_;
    std::vector<transform> rules_;
  };

} // namespace gll
