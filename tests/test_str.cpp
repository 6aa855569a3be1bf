#include <catch2/catch.hpp>

#include "str.h"

TEST_CASE("decode_utf8 yields one element per code point", "[str]")
{
    REQUIRE(str::decode_utf8("") == U"");
    REQUIRE(str::decode_utf8("abc") == U"abc");
    REQUIRE(str::decode_utf8("caf\xC3\xA9") == U"café");
    REQUIRE(str::decode_utf8("\xE2\x82\xAC") == U"€");
    REQUIRE(str::decode_utf8("\xF0\x9F\x98\x80") == U"\U0001F600");
}

TEST_CASE("decode_utf8 replaces malformed bytes", "[str]")
{
    const char32_t r = str::replacement_character;

    SECTION("lone continuation byte")
    {
        REQUIRE(str::decode_utf8("a\x80" "b") == std::u32string{U'a', r, U'b'});
    }

    SECTION("truncated sequence at the end")
    {
        REQUIRE(str::decode_utf8("a\xC3") == std::u32string{U'a', r});
    }

    SECTION("lead byte followed by ASCII")
    {
        REQUIRE(str::decode_utf8("\xE2" "ab") == std::u32string{r, U'a', U'b'});
    }

    SECTION("overlong encoding")
    {
        REQUIRE(str::decode_utf8("\xC0\xAF") == std::u32string{r, r});
    }
}

TEST_CASE("fold_case lowers ASCII independent of locale", "[str]")
{
    REQUIRE(str::fold_case(U'A') == U'a');
    REQUIRE(str::fold_case(U'Z') == U'z');
    REQUIRE(str::fold_case(U'a') == U'a');
    REQUIRE(str::fold_case(U' ') == U' ');
    REQUIRE(str::fold_case(U'_') == U'_');
    REQUIRE(str::folded("README.md") == U"readme.md");
}
