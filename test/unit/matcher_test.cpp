#include <gll/errors.hpp>
#include <gll/matcher.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace gll;

static std::optional<std::size_t>
builtin(builtin_rule rule, std::string_view input, std::size_t offset = 0) {
  return match(builtin_matcher{rule}, input, offset);
}

// == Literals and classes ====================================================

TEST_CASE("matcher: literal matches at offset", "[matcher]") {
  literal_matcher m{"+="};
  CHECK(match(m, "a+=b", 1) == 2u);
  CHECK_FALSE(match(m, "a+b", 1));
  CHECK_FALSE(match(m, "+", 0));
}

TEST_CASE("matcher: offset past the end never matches", "[matcher]") {
  CHECK_FALSE(match(literal_matcher{"a"}, "a", 1));
  CHECK_FALSE(match(literal_matcher{"a"}, "a", 5));
}

TEST_CASE("matcher: character class is greedy", "[matcher]") {
  char_class_matcher digits{{{'0', '9'}}, false, 1, 0};
  CHECK(match(digits, "123a", 0) == 3u);
  CHECK(match(digits, "123a", 2) == 1u);
  CHECK_FALSE(match(digits, "a123", 0));
}

TEST_CASE("matcher: character class honours min and max", "[matcher]") {
  char_class_matcher two{{{'a', 'z'}}, false, 1, 2};
  CHECK(match(two, "abc", 0) == 2u);

  char_class_matcher at_least_two{{{'a', 'z'}}, false, 2, 0};
  CHECK_FALSE(match(at_least_two, "a1", 0));
  CHECK(match(at_least_two, "ab1", 0) == 2u);
}

TEST_CASE("matcher: negated class", "[matcher]") {
  char_class_matcher not_quote{{{'"', '"'}}, true, 1, 0};
  CHECK(match(not_quote, "abc\"", 0) == 3u);
  CHECK_FALSE(match(not_quote, "\"", 0));
}

TEST_CASE("matcher: several ranges", "[matcher]") {
  char_class_matcher hex{{{'0', '9'}, {'a', 'f'}}, false, 1, 0};
  CHECK(match(hex, "c0ffee!", 0) == 6u);
}

// == Built-in rules ==========================================================

TEST_CASE("builtin: IDENT", "[matcher]") {
  CHECK(builtin(builtin_rule::ident, "foo_bar1 x") == 8u);
  CHECK(builtin(builtin_rule::ident, "r#type") == 6u);
  CHECK(builtin(builtin_rule::ident, "_x") == 2u);
  CHECK_FALSE(builtin(builtin_rule::ident, "_"));
  CHECK_FALSE(builtin(builtin_rule::ident, "1abc"));
}

TEST_CASE("builtin: LIFETIME", "[matcher]") {
  CHECK(builtin(builtin_rule::lifetime, "'a ") == 2u);
  CHECK(builtin(builtin_rule::lifetime, "'static") == 7u);
  CHECK_FALSE(builtin(builtin_rule::lifetime, "'a'"));
}

TEST_CASE("builtin: PUNCT is one character", "[matcher]") {
  CHECK(builtin(builtin_rule::punct, "+=") == 1u);
  CHECK(builtin(builtin_rule::punct, ";") == 1u);
  CHECK_FALSE(builtin(builtin_rule::punct, "("));
  CHECK_FALSE(builtin(builtin_rule::punct, "a"));
}

TEST_CASE("builtin: LITERAL numbers", "[matcher]") {
  CHECK(builtin(builtin_rule::literal, "42+") == 2u);
  CHECK(builtin(builtin_rule::literal, "1_000") == 5u);
  CHECK(builtin(builtin_rule::literal, "1.5f32") == 6u);
  CHECK(builtin(builtin_rule::literal, "0x1f") == 4u);
  CHECK(builtin(builtin_rule::literal, "0b1010u8") == 8u);
  CHECK(builtin(builtin_rule::literal, ".5") == 2u);
  CHECK_FALSE(builtin(builtin_rule::literal, "."));
}

TEST_CASE("builtin: LITERAL characters and strings", "[matcher]") {
  CHECK(builtin(builtin_rule::literal, "'x'") == 3u);
  CHECK(builtin(builtin_rule::literal, "b'x'") == 4u);
  CHECK(builtin(builtin_rule::literal, "'\\n'") == 4u);

  std::string s = "\"a\\\"b\"";
  CHECK(builtin(builtin_rule::literal, s + " rest") == s.size());
  CHECK_FALSE(builtin(builtin_rule::literal, "\"open"));
}

TEST_CASE("builtin: WHITESPACE", "[matcher]") {
  CHECK(builtin(builtin_rule::whitespace, " \t\nx") == 3u);
  CHECK_FALSE(builtin(builtin_rule::whitespace, "x "));
}

TEST_CASE("builtin: COMMENT", "[matcher]") {
  CHECK(builtin(builtin_rule::comment, "// hi\nx") == 5u);

  std::string nested = "/* a /* b */ c */";
  CHECK(builtin(builtin_rule::comment, nested + "x") == nested.size());
  CHECK_FALSE(builtin(builtin_rule::comment, "/* open"));
  CHECK_FALSE(builtin(builtin_rule::comment, "/ not"));
}

TEST_CASE("builtin: names round-trip", "[matcher]") {
  CHECK(builtin_rule_from_name("IDENT") == builtin_rule::ident);
  CHECK(builtin_rule_from_name("COMMENT") == builtin_rule::comment);
  CHECK_FALSE(builtin_rule_from_name("ident"));
  CHECK(to_string(builtin_rule::lifetime) == "LIFETIME");
}

TEST_CASE("builtin: trivia rules", "[matcher]") {
  CHECK(is_trivia_rule(builtin_rule::whitespace));
  CHECK(is_trivia_rule(builtin_rule::comment));
  CHECK_FALSE(is_trivia_rule(builtin_rule::ident));
}

// == Descriptions and validation =============================================

TEST_CASE("matcher: describe", "[matcher]") {
  CHECK(describe(literal_matcher{"+"}) == "\"+\"");
  CHECK(describe(char_class_matcher{{{'0', '9'}}, false, 1, 1}) ==
        "['0'-'9']");
  CHECK(describe(char_class_matcher{{{'0', '9'}}, false, 1, 0}) ==
        "['0'-'9']+");
  CHECK(describe(char_class_matcher{{{'\n', '\n'}}, true, 1, 1}) ==
        "[^'\\n']");
  CHECK(describe(char_class_matcher{{{'a', 'z'}}, false, 2, 4}) ==
        "['a'-'z']{2,4}");
  CHECK(describe(builtin_matcher{builtin_rule::ident}) == "IDENT");
}

TEST_CASE("matcher: validate rejects matchers of the empty string",
          "[matcher]") {
  CHECK_THROWS_AS(validate(literal_matcher{""}, "t"), grammar_error);
  CHECK_THROWS_AS(validate(char_class_matcher{{}, false, 1, 1}, "t"),
                  grammar_error);
  CHECK_THROWS_AS(validate(char_class_matcher{{{'a', 'z'}}, false, 0, 1}, "t"),
                  grammar_error);
}

TEST_CASE("matcher: validate rejects malformed classes", "[matcher]") {
  CHECK_THROWS_AS(validate(char_class_matcher{{{'z', 'a'}}, false, 1, 1}, "t"),
                  grammar_error);
  CHECK_THROWS_AS(validate(char_class_matcher{{{'a', 'z'}}, false, 3, 2}, "t"),
                  grammar_error);
  CHECK_NOTHROW(validate(char_class_matcher{{}, true, 1, 1}, "any"));
  CHECK_NOTHROW(validate(builtin_matcher{builtin_rule::punct}, "p"));
}
