#include <gll/errors.hpp>

#include <utility>

namespace gll {

  namespace {

    std::string
    span_text(std::size_t start, std::size_t end) {
      return "[" + std::to_string(start) + "," + std::to_string(end) + ")";
    }

    std::string
    ambiguity_message(const std::string& symbol, std::size_t start,
                      std::size_t end,
                      const std::vector<std::string>& alternatives) {
      if (alternatives.empty()) {
        return "only cyclic derivations of " + symbol + " at " +
               span_text(start, end);
      }
      std::string msg =
          "ambiguous " + symbol + " at " + span_text(start, end) + ": ";
      for (std::size_t i = 0; i < alternatives.size(); ++i) {
        if (i > 0) msg += " | ";
        msg += alternatives[i];
      }
      return msg;
    }

  } // namespace

  notation_error::notation_error(const std::string& message, std::size_t line)
      : grammar_error("grammar notation error (line " + std::to_string(line) +
                      "): " + message),
        line_(line) {}

  ambiguity_error::ambiguity_error(std::string symbol, std::size_t start,
                                   std::size_t end,
                                   std::vector<std::string> alternatives)
      : std::runtime_error(
            ambiguity_message(symbol, start, end, alternatives)),
        symbol_(std::move(symbol)), start_(start), end_(end),
        alternatives_(std::move(alternatives)) {}

  unhandled_production_error::unhandled_production_error(
      std::string nonterminal, std::size_t production_index, std::size_t start,
      std::size_t end)
      : std::runtime_error("no lowering rule for " + nonterminal +
                           " production " + std::to_string(production_index) +
                           " at " + span_text(start, end)),
        nonterminal_(std::move(nonterminal)),
        production_index_(production_index), start_(start), end_(end) {}

  lowering_error::lowering_error(const std::string& reason,
                                 std::string nonterminal,
                                 std::size_t production_index,
                                 std::size_t child)
      : std::runtime_error("lowering " + nonterminal + " production " +
                           std::to_string(production_index) + ", child " +
                           std::to_string(child) + ": " + reason),
        nonterminal_(std::move(nonterminal)),
        production_index_(production_index), child_(child) {}

} // namespace gll
