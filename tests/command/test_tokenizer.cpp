#define BOOST_TEST_MODULE TokenizerTests
#include <boost/test/unit_test.hpp>

#include "sigil/command/text.hpp"
#include "sigil/command/tokenizer.hpp"

using namespace sigil::command;

using Tokens = std::vector<std::string>;

BOOST_AUTO_TEST_SUITE(TokenizerTestSuite)

BOOST_AUTO_TEST_CASE(test_whitespace_collapses) {
    BOOST_CHECK((tokenize("  warp   set\thome ") == Tokens{"warp", "set", "home"}));
    BOOST_CHECK(tokenize("").empty());
    BOOST_CHECK(tokenize("   ").empty());
}

BOOST_AUTO_TEST_CASE(test_quotes_group_words) {
    BOOST_CHECK((tokenize(R"(msg Alex "hello there" !)") ==
                 Tokens{"msg", "Alex", "hello there", "!"}));
    BOOST_CHECK((tokenize(R"(a ""  b)") == Tokens{"a", "", "b"}));
    BOOST_CHECK((tokenize(R"(pre"fix mid"post)") == Tokens{"prefix midpost"}));
}

BOOST_AUTO_TEST_CASE(test_escapes_only_inside_quotes) {
    BOOST_CHECK((tokenize(R"("say \"hi\"")") == Tokens{R"(say "hi")"}));
    BOOST_CHECK((tokenize(R"(C:\path)") == Tokens{R"(C:\path)"}));
}

BOOST_AUTO_TEST_CASE(test_unterminated_quote_runs_to_end) {
    BOOST_CHECK((tokenize(R"(a "b c)") == Tokens{"a", "b c"}));
}

BOOST_AUTO_TEST_CASE(test_trailing_empty_token) {
    BOOST_CHECK((tokenize("warp ", true) == Tokens{"warp", ""}));
    BOOST_CHECK((tokenize("warp", true) == Tokens{"warp"}));
    BOOST_CHECK((tokenize("warp ", false) == Tokens{"warp"}));
}

BOOST_AUTO_TEST_CASE(test_retokenize_joins_host_arguments) {
    BOOST_CHECK((retokenize({"\"hello", "world\"", "x"}) ==
                 Tokens{"hello world", "x"}));
    BOOST_CHECK(retokenize({}).empty());
}

BOOST_AUTO_TEST_CASE(test_retokenize_keeps_in_progress_word) {
    BOOST_CHECK((retokenize({"set", ""}, true) == Tokens{"set", ""}));
    BOOST_CHECK((retokenize({""}, true) == Tokens{""}));
    BOOST_CHECK((retokenize({"set", "ho"}, true) == Tokens{"set", "ho"}));
}

BOOST_AUTO_TEST_CASE(test_split_command_line_keeps_quotes) {
    auto parts = split_command_line(R"(  /msg Alex "hi there")");
    BOOST_CHECK_EQUAL(parts.label, "msg");
    BOOST_CHECK(parts.has_rest);
    BOOST_CHECK((retokenize({parts.rest}) == Tokens{"Alex", "hi there"}));

    auto bare = split_command_line("warp");
    BOOST_CHECK_EQUAL(bare.label, "warp");
    BOOST_CHECK(!bare.has_rest);

    auto trailing = split_command_line("warp ");
    BOOST_CHECK(trailing.has_rest);
    BOOST_CHECK((retokenize({trailing.rest}, true) == Tokens{""}));

    BOOST_CHECK(split_command_line("   ").label.empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(TextTestSuite)

BOOST_AUTO_TEST_CASE(test_numeric_detection) {
    BOOST_CHECK(text::is_numeric("-5"));
    BOOST_CHECK(text::is_numeric("+0.25"));
    BOOST_CHECK(text::is_numeric(".5"));
    BOOST_CHECK(!text::is_numeric("-"));
    BOOST_CHECK(!text::is_numeric("1.2.3"));
    BOOST_CHECK(!text::is_numeric("-f"));
}

BOOST_AUTO_TEST_CASE(test_number_parsing_signs) {
    BOOST_CHECK_EQUAL(*text::parse_integer("+12"), 12);
    BOOST_CHECK_EQUAL(*text::parse_integer("-5"), -5);
    BOOST_CHECK(!text::parse_integer("+-5"));
    BOOST_CHECK(!text::parse_integer("++5"));
    BOOST_CHECK(!text::parse_integer("+"));
    BOOST_CHECK_EQUAL(*text::parse_decimal("+0.5"), 0.5);
    BOOST_CHECK(!text::parse_decimal("+-0.5"));
    BOOST_CHECK(!text::parse_decimal("++1"));
}

BOOST_AUTO_TEST_CASE(test_case_insensitive_helpers) {
    BOOST_CHECK(text::starts_with_ignore_case("WorldEdit", "world"));
    BOOST_CHECK(!text::starts_with_ignore_case("w", "world"));
    BOOST_CHECK(text::less_ignore_case("alpha", "Beta"));
    BOOST_CHECK(!text::less_ignore_case("Beta", "alpha"));
    BOOST_CHECK_EQUAL(text::join({"a", "b", "c"}, 1), "b c");
}

BOOST_AUTO_TEST_SUITE_END()
