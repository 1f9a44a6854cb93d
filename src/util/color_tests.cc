#include "color.hpp"

#include <doctest.h>

using namespace gogrep;

TEST_CASE("color") {
    SUBCASE("palette_names") {
        REQUIRE(TermColor::parse_string("magenta") == TermColor::kMagenta);
        REQUIRE(TermColor::parse_string("light_blue") == TermColor::kLightBlue);
        REQUIRE_FALSE(TermColor::parse_string("purple"));
        REQUIRE_FALSE(TermColor::parse_string(""));
    }

    SUBCASE("hex") {
        REQUIRE(TermColor::parse_string("#f00") == TermColor(TermColor::Kind::Color24bit, 255, 0, 0));
        REQUIRE(TermColor::parse_string("#102030") == TermColor(TermColor::Kind::Color24bit, 0x10, 0x20, 0x30));
        REQUIRE_FALSE(TermColor::parse_hex("#12"));
        REQUIRE_FALSE(TermColor::parse_hex("#ggg"));
        REQUIRE_FALSE(TermColor::parse_hex("123456"));
    }

    SUBCASE("repr") {
        REQUIRE(repr(TermColor::kRed) == "4:(31,41,0)");
        REQUIRE(repr(*TermColor::parse_hex("#fff")) == "T:(255,255,255)");
    }
}

TEST_CASE("style") {
    SUBCASE("attributes") {
        auto attr = TermStyle::parse_attributes("bold underline");
        REQUIRE(attr);
        REQUIRE(static_cast<int>(*attr) ==
                (static_cast<int>(TermStyle::Attribute::Bold) | static_cast<int>(TermStyle::Attribute::Underline)));
        REQUIRE(TermStyle::parse_attributes("italic,dim"));
        REQUIRE(*TermStyle::parse_attributes("") == TermStyle::Attribute::None);
        REQUIRE_FALSE(TermStyle::parse_attributes("bold shiny"));
    }

    SUBCASE("ansi") {
        TermStyle position{TermColor::kMagenta, TermColor::kNone, TermStyle::Attribute::Bold};
        REQUIRE(position.to_ansi() == "\033[35;1m");

        TermStyle reset{TermColor::kReset, TermColor::kReset};
        REQUIRE(reset.to_ansi() == "\033[0m");

        TermStyle rgb{TermColor(TermColor::Kind::Color24bit, 1, 2, 3), TermColor::kBlue};
        REQUIRE(rgb.to_ansi() == "\033[38;2;1;2;3;44m");

        TermStyle nothing{TermColor::kNone, TermColor::kNone};
        REQUIRE(nothing.to_ansi().empty());
    }

    SUBCASE("apply") {
        TermStyle style{TermColor::kGreen, TermColor::kNone};
        REQUIRE(style.apply("main.go:1:2") == "\033[32mmain.go:1:2\033[0m");
    }
}
