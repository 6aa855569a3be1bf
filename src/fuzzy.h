#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace fuzzy
{

// Scoring constants
constexpr int bonus_match = 16;
constexpr int bonus_boundary = 16;
constexpr int bonus_consecutive = 16;
constexpr int penalty_gap_start = -3;
constexpr int penalty_gap_extension = -1;
// Reserved for tuning, not applied by any transition
constexpr int penalty_non_contiguous = -5;

enum class ConsecutiveRule {
    // Bonus when the characters preceding the current pattern and
    // candidate characters are equal
    PreviousCharacters,
    // Bonus only when the path chosen for the previous cell ends on the
    // immediately preceding candidate character
    AdjacentMatch,
};

struct MatchResult {
    bool matched = false;
    int score = 0;
    // Code point indices into the original candidate, ascending
    std::vector<size_t> positions;
};

// Query compiled once per rank pass
class Pattern
{
  public:
    explicit Pattern(std::string_view query);

    bool empty() const noexcept { return folded_.empty(); }
    size_t size() const noexcept { return folded_.size(); }
    const std::u32string &folded() const noexcept { return folded_; }

  private:
    std::u32string folded_;
};

MatchResult match(const Pattern &pattern, std::string_view candidate,
                  ConsecutiveRule rule = ConsecutiveRule::PreviousCharacters);

MatchResult match(std::string_view pattern, std::string_view candidate,
                  ConsecutiveRule rule = ConsecutiveRule::PreviousCharacters);

} // namespace fuzzy
