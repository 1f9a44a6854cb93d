#include "config.hpp"

#include <doctest.h>
#include <fmt/format.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace gogrep;

namespace {

ConfigTable
parse_table(const std::string& input) {
    ParseResult result;
    ConfigTable table;
    REQUIRE_MESSAGE(cfg_parse_value_tree(input, result, table), result.error);
    return table;
}

}  // namespace

TEST_CASE("color_mode") {
    REQUIRE(color_mode_from_string("auto") == ColorMode::kAuto);
    REQUIRE(color_mode_from_string("always") == ColorMode::kAlways);
    REQUIRE(color_mode_from_string("never") == ColorMode::kNever);
    REQUIRE(color_mode_from_string("sometimes") == ColorMode::kInvalid);
    REQUIRE(color_mode_from_string("") == ColorMode::kInvalid);
}

TEST_CASE("config_apply_table") {
    ProgramOptions opts;
    OutputStyle style;
    std::string error;

    SUBCASE("defaults") {
        REQUIRE(config_apply_table(parse_table(""), opts, style, error));
        REQUIRE_FALSE(opts.recursive);
        REQUIRE_FALSE(opts.aggressive);
        REQUIRE(opts.color == ColorMode::kAuto);
        REQUIRE(style.position.fg == TermColor::kMagenta);
    }

    SUBCASE("values") {
        auto table = parse_table(R"(
[general]
recursive = yes
aggressive = true
color = never
unknown = 12

[style]
position = '#00ff00'
position_attr = 'underline'
)");
        REQUIRE(config_apply_table(table, opts, style, error));
        REQUIRE(opts.recursive);
        REQUIRE(opts.aggressive);
        REQUIRE(opts.color == ColorMode::kNever);
        REQUIRE(style.position.fg == TermColor(TermColor::Kind::Color24bit, 0, 255, 0));
        REQUIRE(style.position.attr == TermStyle::Attribute::Underline);
    }

    SUBCASE("invalid_color_mode") {
        REQUIRE_FALSE(config_apply_table(parse_table("[general]\ncolor = rainbow\n"), opts, style, error));
        REQUIRE(error == "'general.color' must be auto, always or never, found 'rainbow'");
    }

    SUBCASE("wrong_types") {
        REQUIRE_FALSE(config_apply_table(parse_table("[general]\nrecursive = 1\n"), opts, style, error));
        REQUIRE(error == "'general.recursive' must be a boolean, found Integer<1>");

        REQUIRE_FALSE(config_apply_table(parse_table("[general]\ncolor = off\n"), opts, style, error));
        REQUIRE(error == "'general.color' must be a string, found Boolean<false>");

        REQUIRE_FALSE(config_apply_table(parse_table("[style]\nposition = 'beige'\n"), opts, style, error));
        REQUIRE(error == "'style.position' is not a color: String<'beige'>");

        REQUIRE_FALSE(config_apply_table(parse_table("[style]\nposition_attr = 'loud'\n"), opts, style, error));
        REQUIRE(error == "'style.position_attr' is not a list of attributes: String<'loud'>");
    }
}

TEST_CASE("config_load") {
    namespace fs = std::filesystem;

    ProgramOptions opts;
    OutputStyle style;
    std::string error;

    SUBCASE("missing_file") {
        REQUIRE(config_load("/nonexistent/gogrep/gogrep.conf", opts, style, error));
        REQUIRE(error.empty());
        REQUIRE_FALSE(opts.recursive);
    }

    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto path = fs::temp_directory_path() / fmt::format("gogrep_config_{}.conf", stamp);

    SUBCASE("file") {
        {
            std::ofstream out(path);
            out << "[general]\nrecursive = on\ncolor = always\n";
        }
        REQUIRE(config_load(path.string(), opts, style, error));
        REQUIRE(opts.recursive);
        REQUIRE(opts.color == ColorMode::kAlways);
    }

    SUBCASE("bad_file_keeps_defaults") {
        {
            std::ofstream out(path);
            out << "[general]\nrecursive = on\ncolor = loud\n";
        }
        REQUIRE_FALSE(config_load(path.string(), opts, style, error));
        REQUIRE_FALSE(opts.recursive);
        REQUIRE(opts.color == ColorMode::kAuto);
    }

    SUBCASE("syntax_error") {
        {
            std::ofstream out(path);
            out << "[general\n";
        }
        REQUIRE_FALSE(config_load(path.string(), opts, style, error));
        REQUIRE(error == "'expected ']' after section name' at line 1");
    }

    std::error_code ec;
    fs::remove(path, ec);
}
