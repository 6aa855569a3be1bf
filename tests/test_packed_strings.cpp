#include <catch2/catch.hpp>

#include "packed_strings.h"

#include <stdexcept>
#include <string>

TEST_CASE("PackedStrings stores lines back to back", "[packed_strings]")
{
    PackedStrings strings;
    REQUIRE(strings.empty());
    REQUIRE(strings.size() == 0);

    strings.reserve(3, 8);
    strings.push("first");
    strings.push("");
    strings.push("third line");

    REQUIRE_FALSE(strings.empty());
    REQUIRE(strings.size() == 3);
    REQUIRE(strings.at(0) == "first");
    REQUIRE(strings.at(1).empty());
    REQUIRE(strings.at(2) == "third line");
    REQUIRE_THROWS_AS(strings.at(3), std::out_of_range);
}

TEST_CASE("PackedStrings survives growth", "[packed_strings]")
{
    PackedStrings strings;
    for (int i = 0; i < 10000; ++i) {
        strings.push("line " + std::to_string(i));
    }
    strings.shrink_to_fit();

    REQUIRE(strings.size() == 10000);
    REQUIRE(strings.at(0) == "line 0");
    REQUIRE(strings.at(9999) == "line 9999");
}
