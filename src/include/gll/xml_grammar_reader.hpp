#pragma once

#include <gll/grammar.hpp>
#include <gll/xml_reader.hpp>

#include <string_view>

namespace gll {

  // Reads the XML grammar description:
  //
  //   <grammar start="E">
  //     <terminal name="num"><class min="1" max="0"><range from="0" to="9"/></class></terminal>
  //     <nonterminal name="E">
  //       <production label="add">
  //         <ref name="E" field="left"/><literal text="+"/><token name="num"/>
  //       </production>
  //       <production><token name="num"/></production>
  //     </nonterminal>
  //   </grammar>
  //
  // A terminal holds one <literal text>, <class negated min max> with
  // <range from to> children, or <builtin rule>. Production items are <ref>,
  // <token>, and inline <literal>, <range> and <builtin>; each takes an
  // optional `field` label. Throws grammar_error.
  grammar
  read_xml_grammar(xml_reader& reader);

  grammar
  load_xml_grammar(std::string_view xml);

} // namespace gll
