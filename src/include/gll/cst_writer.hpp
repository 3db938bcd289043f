#pragma once

#include <gll/cst.hpp>
#include <gll/grammar.hpp>
#include <gll/xml_writer.hpp>

#include <ostream>
#include <string>

namespace gll {

  struct cst_write_options {
    // Include whitespace and comment tokens and trivia nonterminals.
    bool trivia = false;
    // One child per line for nodes with nonterminal children.
    bool indent = false;
  };

  // (Expr:Add (Expr:Term (Term "1")) "+" (Term "2"))
  void
  write_sexpr(std::ostream& os, const grammar& g, const cst_node& node,
              const cst_write_options& opts = {});

  std::string
  to_sexpr(const grammar& g, const cst_node& node,
           const cst_write_options& opts = {});

  // <node symbol="Expr" production="0" label="Add" start="0" end="3">
  //   <token terminal="&quot;+&quot;" start="1" end="2">+</token>
  // </node>
  void
  write_xml(xml_writer& writer, const grammar& g, const cst_node& node,
            const cst_write_options& opts = {});

} // namespace gll
