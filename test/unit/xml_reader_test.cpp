#include <gll/expat_reader.hpp>
#include <gll/xml_reader.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>

using namespace gll;

TEST_CASE("reader: empty element", "[xml_reader]") {
  expat_reader reader("<grammar/>");

  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::start_element);
  CHECK(reader.name() == "grammar");
  CHECK(reader.depth() == 1);

  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::end_element);
  CHECK(reader.name() == "grammar");
  CHECK(reader.depth() == 1);

  CHECK_FALSE(reader.read());
}

TEST_CASE("reader: element with text content", "[xml_reader]") {
  expat_reader reader("<literal>+</literal>");

  REQUIRE(reader.read());
  CHECK(reader.name() == "literal");

  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::characters);
  CHECK(reader.text() == "+");

  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::end_element);
  CHECK_FALSE(reader.read());
}

TEST_CASE("reader: nested elements track depth", "[xml_reader]") {
  expat_reader reader("<a><b><c/></b></a>");

  const char* names[] = {"a", "b", "c", "c", "b", "a"};
  const std::size_t depths[] = {1, 2, 3, 3, 2, 1};
  for (std::size_t i = 0; i < 6; ++i) {
    REQUIRE(reader.read());
    CHECK(reader.node_type() == (i < 3 ? xml_node_type::start_element
                                       : xml_node_type::end_element));
    CHECK(reader.name() == names[i]);
    CHECK(reader.depth() == depths[i]);
  }
  CHECK_FALSE(reader.read());
}

TEST_CASE("reader: attributes by index and by name", "[xml_reader]") {
  expat_reader reader(R"(<ref name="Expr" field="left"/>)");

  REQUIRE(reader.read());
  REQUIRE(reader.attribute_count() == 2);
  CHECK(reader.attribute_name(0) == "name");
  CHECK(reader.attribute_value(0) == "Expr");
  CHECK(reader.attribute_name(1) == "field");
  CHECK(reader.attribute_value("field") == "left");
  CHECK(reader.has_attribute("name"));
  CHECK_FALSE(reader.has_attribute("label"));
  CHECK(reader.attribute_value("label").empty());
  CHECK_THROWS_AS(reader.attribute_name(2), std::out_of_range);
}

TEST_CASE("reader: entities are decoded", "[xml_reader]") {
  expat_reader reader(R"(<literal text="&lt;&amp;&quot;">&gt;&#65;</literal>)");

  REQUIRE(reader.read());
  CHECK(reader.attribute_value("text") == "<&\"");
  REQUIRE(reader.read());
  CHECK(reader.text() == ">A");
}

TEST_CASE("reader: coalesce adjacent character data", "[xml_reader]") {
  expat_reader reader("<t>one &amp; two<![CDATA[ three]]></t>");

  REQUIRE(reader.read());
  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::characters);
  CHECK(reader.text() == "one & two three");
  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::end_element);
}

TEST_CASE("reader: events carry source lines", "[xml_reader]") {
  expat_reader reader("<grammar>\n  <rule/>\n\n  <rule/>\n</grammar>");

  REQUIRE(reader.read());
  CHECK(reader.line() == 1);
  REQUIRE(reader.read());
  CHECK(reader.node_type() == xml_node_type::characters);
  REQUIRE(reader.read());
  CHECK(reader.name() == "rule");
  CHECK(reader.line() == 2);
  REQUIRE(reader.read());
  REQUIRE(reader.read());
  REQUIRE(reader.read());
  CHECK(reader.name() == "rule");
  CHECK(reader.line() == 4);
}

TEST_CASE("reader: no current event before the first read",
          "[xml_reader]") {
  expat_reader reader("<e/>");
  CHECK_THROWS_AS(reader.node_type(), std::logic_error);
}

TEST_CASE("reader: throws on malformed XML", "[xml_reader]") {
  CHECK_THROWS_AS(expat_reader("<a><b></a>"), std::runtime_error);
}

TEST_CASE("reader: throws on empty input", "[xml_reader]") {
  CHECK_THROWS_AS(expat_reader(""), std::runtime_error);
}

TEST_CASE("reader: malformed XML reports the line", "[xml_reader]") {
  try {
    expat_reader reader("<a>\n<b>\n</a>");
    FAIL("expected runtime_error");
  } catch (const std::runtime_error& e) {
    CHECK(std::string(e.what()).rfind("XML parse error at line 3", 0) == 0);
  }
}
