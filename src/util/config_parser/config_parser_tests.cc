#include "config_parser.hpp"

#include <doctest.h>

#include <string>

using namespace gogrep;

TEST_CASE("config_parser") {
    SUBCASE("empty") {
        ParseResult result;
        ConfigTable table;
        REQUIRE(cfg_parse_value_tree("", result, table));
        REQUIRE(result.is_ok());
        REQUIRE(table.sections.empty());
    }

    SUBCASE("sections_and_values") {
        const std::string input = R"(# gogrep settings

[general]
    recursive = yes     # follow imports
    aggressive = off
    color = 'always'
    depth = -3

[style]
position = "#ff8800"
position_attr = bold
)";
        ParseResult result;
        ConfigTable table;
        REQUIRE(cfg_parse_value_tree(input, result, table));
        REQUIRE(table.sections.size() == 2);

        auto recursive = table.lookup("general.recursive");
        REQUIRE(recursive);
        REQUIRE(recursive->is_bool());
        REQUIRE(recursive->as_bool());

        REQUIRE_FALSE(table.lookup("general.aggressive")->as_bool());
        REQUIRE(table.lookup("general.color")->as_string() == "always");
        REQUIRE(table.lookup("general.depth")->as_int() == -3);
        REQUIRE(table.lookup("style.position")->as_string() == "#ff8800");
        REQUIRE(table.lookup("style.position_attr")->is_string());
        REQUIRE(table.lookup("style.position_attr")->as_string() == "bold");

        REQUIRE_FALSE(table.lookup("general.missing"));
        REQUIRE_FALSE(table.lookup("nosection.color"));
    }

    SUBCASE("keys_without_section") {
        ParseResult result;
        ConfigTable table;
        REQUIRE(cfg_parse_value_tree("debug = true\n", result, table));
        REQUIRE(table.lookup("debug")->as_bool());
    }

    SUBCASE("quoted_strings") {
        ParseResult result;
        ConfigTable table;
        REQUIRE(cfg_parse_value_tree("a = 'x # not a comment'\nb = \"q\\\"q\"\nc = '123'\n", result, table));
        REQUIRE(table.lookup("a")->as_string() == "x # not a comment");
        REQUIRE(table.lookup("b")->as_string() == "q\"q");
        REQUIRE(table.lookup("c")->is_string());
    }

    SUBCASE("later_values_win") {
        ParseResult result;
        ConfigTable table;
        REQUIRE(cfg_parse_value_tree("[s]\nk = 1\n[s]\nk = 2\n", result, table));
        REQUIRE(table.lookup("s.k")->as_int() == 2);
    }

    SUBCASE("repr") {
        REQUIRE(repr(Value{Value::Int{4}}) == "Integer<4>");
        REQUIRE(repr(Value{true}) == "Boolean<true>");
        REQUIRE(repr(Value{std::string("x")}) == "String<'x'>");
    }
}

TEST_CASE("config_parser_errors") {
    auto parse_error = [](const std::string& input) {
        ParseResult result;
        ConfigTable table;
        REQUIRE_FALSE(cfg_parse_value_tree(input, result, table));
        REQUIRE(result.kind == ParseErrorKind::Parsing);
        return result.error;
    };

    REQUIRE(parse_error("[general\n") == "'expected ']' after section name' at line 1");
    REQUIRE(parse_error("[a b]") == "'invalid section name 'a b'' at line 1");
    REQUIRE(parse_error("\n\njust words") == "'expected 'key = value', found 'just words'' at line 3");
    REQUIRE(parse_error("k =") == "'missing value' at line 1");
    REQUIRE(parse_error("k = 'open") == "'string not terminated' at line 1");
    REQUIRE(parse_error("k = 'a' b") == "'unexpected ' b' after string' at line 1");
    REQUIRE(parse_error("k = a b") == "'invalid value 'a b'' at line 1");
    REQUIRE(parse_error("= 1") == "'invalid key ''' at line 1");
}

TEST_CASE("config_load_file") {
    ParseResult result;
    ConfigTable table;
    REQUIRE_FALSE(cfg_load_file("/nonexistent/gogrep.conf", result, table));
    REQUIRE(result.kind == ParseErrorKind::File);
}
