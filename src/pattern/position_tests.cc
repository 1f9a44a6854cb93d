#include "position.hpp"

#include <doctest.h>

#include <vector>

using namespace gogrep;

TEST_CASE("line_col_buffer") {
    LineColBuffer buf;
    REQUIRE(buf.line() == 1);
    REQUIRE(buf.column() == 1);
    REQUIRE(buf.offset() == 0);

    buf.write("ab");
    REQUIRE(buf.column() == 3);

    buf.write("c\nde");
    REQUIRE(buf.str() == "abc\nde");
    REQUIRE(buf.line() == 2);
    REQUIRE(buf.column() == 3);
    REQUIRE(buf.offset() == 6);
}

TEST_CASE("correct_position") {
    // "$x + )" was written out as "_gogrep_0 + )"
    std::vector<PosOffset> offsets = {{1, 10, 9, 7}};

    SUBCASE("after_wildcard") {
        auto pos = correct_position(Pos{12, 1, 13}, offsets);
        REQUIRE(pos.line == 1);
        REQUIRE(pos.column == 6);
        REQUIRE(pos.offset == 5);
    }

    SUBCASE("before_wildcard") {
        auto pos = correct_position(Pos{0, 1, 1}, offsets);
        REQUIRE(pos.column == 1);
        REQUIRE(pos.offset == 0);
    }

    SUBCASE("other_line") {
        // Columns only shift on the wildcard's own line; offsets always do.
        auto pos = correct_position(Pos{20, 2, 3}, offsets);
        REQUIRE(pos.line == 2);
        REQUIRE(pos.column == 3);
        REQUIRE(pos.offset == 13);
    }

    SUBCASE("accumulates") {
        std::vector<PosOffset> two = {{1, 10, 9, 7}, {1, 22, 21, 7}};
        auto pos = correct_position(Pos{24, 1, 25}, two);
        REQUIRE(pos.column == 11);
        REQUIRE(pos.offset == 10);
    }

    SUBCASE("no_offsets") {
        auto pos = correct_position(Pos{3, 1, 4}, {});
        REQUIRE(pos.column == 4);
    }
}
