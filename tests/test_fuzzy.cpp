#include <catch2/catch.hpp>

#include "fuzzy.h"

#include <string>
#include <vector>

using fuzzy::ConsecutiveRule;
using Positions = std::vector<size_t>;

TEST_CASE("Empty pattern matches everything with score zero", "[fuzzy]")
{
    for (const char *candidate : {"", "a", "apple pie", "README"}) {
        const auto r = fuzzy::match("", candidate);
        REQUIRE(r.matched);
        REQUIRE(r.score == 0);
        REQUIRE(r.positions.empty());
    }
}

TEST_CASE("Pattern longer than candidate never matches", "[fuzzy]")
{
    REQUIRE_FALSE(fuzzy::match("x", "").matched);
    REQUIRE_FALSE(fuzzy::match("abcd", "abc").matched);
    REQUIRE_FALSE(fuzzy::match("readme.md", "README").matched);

    const auto r = fuzzy::match("abcd", "abc");
    REQUIRE(r.score == 0);
    REQUIRE(r.positions.empty());
}

TEST_CASE("Exact match collects boundary and consecutive bonuses", "[fuzzy]")
{
    const auto r = fuzzy::match("abc", "abc");
    REQUIRE(r.matched);
    // 32 for the boundary start, 32 for each consecutive character
    REQUIRE(r.score == 96);
    REQUIRE(r.positions == Positions{0, 1, 2});
}

TEST_CASE("Non-positive final score is not a match", "[fuzzy]")
{
    const auto r = fuzzy::match("z", "abc");
    REQUIRE_FALSE(r.matched);
    REQUIRE(r.positions.empty());

    REQUIRE_FALSE(fuzzy::match("zzz", "apple pie").matched);
}

TEST_CASE("A strong boundary start outweighs missing pattern characters", "[fuzzy]")
{
    // 'a' at the boundary earns 32, the missing 'b' and 'n' only cost gaps
    const auto partial = fuzzy::match("ban", "apple pie");
    REQUIRE(partial.matched);
    REQUIRE(partial.score == 21);
    REQUIRE(partial.positions.empty());

    const auto full = fuzzy::match("ban", "banana split");
    REQUIRE(full.matched);
    REQUIRE(full.score == 71);
    REQUIRE(full.positions == Positions{0, 3, 4});

    // Without any matching character the score stays negative
    REQUIRE_FALSE(fuzzy::match("b", "apple pie").matched);
}

TEST_CASE("Matching is case-insensitive", "[fuzzy]")
{
    const auto upper = fuzzy::match("AB", "xaybz");
    const auto lower = fuzzy::match("ab", "xAYbz");

    REQUIRE(upper.matched);
    REQUIRE(lower.matched);
    REQUIRE(upper.score == lower.score);
    REQUIRE(upper.score == 30);
    REQUIRE(upper.positions == Positions{1, 3});
    REQUIRE(lower.positions == Positions{1, 3});
}

TEST_CASE("Word boundary start scores higher than mid-word start", "[fuzzy]")
{
    const auto boundary = fuzzy::match("fo", "foo");
    const auto mid_word = fuzzy::match("fo", "xfoo");

    REQUIRE(boundary.score == 47);
    REQUIRE(mid_word.score == 31);
    REQUIRE(boundary.score > mid_word.score);

    SECTION("a preceding space counts as a boundary")
    {
        REQUIRE(fuzzy::match("b", "a b").score == 32);
        REQUIRE(fuzzy::match("b", "ab").score == 16);
    }
}

TEST_CASE("Whole candidate beats a scattered subsequence", "[fuzzy]")
{
    const auto whole = fuzzy::match("abc", "abc");
    const auto scattered = fuzzy::match("abc", "axxxbxxxc");

    REQUIRE(scattered.matched);
    REQUIRE(scattered.score == 58);
    REQUIRE(scattered.positions == Positions{0, 4, 8});
    REQUIRE(whole.score > scattered.score);
}

TEST_CASE("Positions follow the recorded transitions", "[fuzzy]")
{
    SECTION("trailing match is preferred over the earlier run")
    {
        const auto r = fuzzy::match("fo", "foo");
        REQUIRE(r.positions == Positions{0, 2});
    }

    SECTION("positions can be fewer than pattern characters")
    {
        const auto r = fuzzy::match("abc", "cba");
        REQUIRE(r.matched);
        REQUIRE(r.score == 30);
        REQUIRE(r.positions == Positions{0});
    }

    SECTION("positions carried from the left may be empty")
    {
        const auto r = fuzzy::match("readme", "main.go");
        REQUIRE(r.matched);
        REQUIRE(r.score == 23);
        REQUIRE(r.positions.empty());
    }

    SECTION("positions are ascending and in range")
    {
        for (const char *candidate : {"apple pie", "grape juice", "banana split"}) {
            const std::string text = candidate;
            const auto r = fuzzy::match("apple", text);
            REQUIRE(r.matched);
            for (size_t k = 0; k < r.positions.size(); ++k) {
                REQUIRE(r.positions[k] < text.size());
                if (k > 0) {
                    REQUIRE(r.positions[k - 1] < r.positions[k]);
                }
            }
        }
    }
}

TEST_CASE("Positions index code points of the original candidate", "[fuzzy][utf8]")
{
    const auto r = fuzzy::match("café", "le café");
    REQUIRE(r.matched);
    REQUIRE(r.score == 128);
    REQUIRE(r.positions == Positions{3, 4, 5, 6});

    // "é" is two bytes but one character
    REQUIRE_FALSE(fuzzy::match("abcde", "abcé").matched);
}

TEST_CASE("Consecutive rule variants", "[fuzzy]")
{
    SECTION("rules agree on plain runs")
    {
        for (const char *candidate : {"abc", "abxc", "xabxc"}) {
            REQUIRE(fuzzy::match("abc", candidate, ConsecutiveRule::PreviousCharacters).score ==
                    fuzzy::match("abc", candidate, ConsecutiveRule::AdjacentMatch).score);
        }
    }

    SECTION("previous characters rule rewards equal neighbours off the path")
    {
        const auto literal =
            fuzzy::match("aabaa", "aaabc", ConsecutiveRule::PreviousCharacters);
        const auto adjacent =
            fuzzy::match("aabaa", "aaabc", ConsecutiveRule::AdjacentMatch);

        REQUIRE(literal.score == 88);
        REQUIRE(adjacent.score == 73);
        REQUIRE(literal.positions == Positions{2});
        REQUIRE(adjacent.positions == Positions{2});
    }
}

TEST_CASE("Compiled pattern gives the same result as a query string", "[fuzzy]")
{
    const fuzzy::Pattern pattern("ReadMe");
    REQUIRE(pattern.size() == 6);
    REQUIRE_FALSE(pattern.empty());

    for (const char *candidate : {"README", "Readme.md", "main.go"}) {
        const auto compiled = fuzzy::match(pattern, candidate);
        const auto direct = fuzzy::match("readme", candidate);
        REQUIRE(compiled.matched == direct.matched);
        REQUIRE(compiled.score == direct.score);
        REQUIRE(compiled.positions == direct.positions);
    }
}

TEST_CASE("Reserved penalty is never applied", "[fuzzy]")
{
    STATIC_REQUIRE(fuzzy::penalty_non_contiguous == -5);
    // Gap scoring only uses the start and extension penalties
    REQUIRE(fuzzy::match("ab", "xxxxxxxxab").score == 48);
}
