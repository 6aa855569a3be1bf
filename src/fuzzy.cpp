#include "fuzzy.h"
#include "str.h"

#include <algorithm>
#include <cstdint>
#include <utility>

namespace fuzzy
{

namespace
{

// Which neighbour a cell's position list was taken from
enum class Step : uint8_t {
    MatchStart, // diagonal, appends the candidate index
    FromAbove,
    FromLeft,
};

constexpr std::ptrdiff_t no_position = -1;

} // namespace

Pattern::Pattern(std::string_view query) : folded_(str::folded(query)) {}

MatchResult match(const Pattern &pattern, std::string_view candidate,
                  ConsecutiveRule rule)
{
    if (pattern.empty()) {
        return {.matched = true, .score = 0, .positions = {}};
    }

    const std::u32string &p = pattern.folded();
    const std::u32string c = str::folded(candidate);
    const size_t n = p.size();
    const size_t m = c.size();

    if (n > m) {
        return {};
    }

    // Two score rows; row 0 and column 0 are all zero
    std::vector<int> prev(m + 1, 0);
    std::vector<int> cur(m + 1, 0);
    // Last candidate index on the path chosen for each cell
    std::vector<std::ptrdiff_t> prev_last(m + 1, no_position);
    std::vector<std::ptrdiff_t> cur_last(m + 1, no_position);
    // steps[(i - 1) * m + (j - 1)] for cell (i, j)
    std::vector<Step> steps(n * m);

    for (size_t i = 1; i <= n; ++i) {
        cur[0] = 0;
        cur_last[0] = no_position;

        for (size_t j = 1; j <= m; ++j) {
            Step &step = steps[(i - 1) * m + (j - 1)];

            if (p[i - 1] == c[j - 1]) {
                int bonus = bonus_match;

                if (j == 1 || c[j - 2] == U' ') {
                    bonus += bonus_boundary;
                }

                bool consecutive = false;
                if (i > 1 && j > 1) {
                    if (rule == ConsecutiveRule::PreviousCharacters) {
                        consecutive = p[i - 2] == c[j - 2];
                    } else {
                        consecutive =
                            prev_last[j - 1] == static_cast<std::ptrdiff_t>(j - 2);
                    }
                }
                if (consecutive) {
                    bonus += bonus_consecutive;
                }

                const int new_score = prev[j - 1] + bonus;
                if (new_score > prev[j] + penalty_gap_start) {
                    cur[j] = new_score;
                    cur_last[j] = static_cast<std::ptrdiff_t>(j - 1);
                    step = Step::MatchStart;
                } else {
                    cur[j] = prev[j] + penalty_gap_start;
                    cur_last[j] = prev_last[j];
                    step = Step::FromAbove;
                }
            } else {
                // Positions always come from the left here, whichever
                // term wins the score
                cur[j] = std::max(cur[j - 1] + penalty_gap_extension,
                                  prev[j] + penalty_gap_start);
                cur_last[j] = cur_last[j - 1];
                step = Step::FromLeft;
            }
        }

        std::swap(prev, cur);
        std::swap(prev_last, cur_last);
    }

    const int final_score = prev[m];
    if (final_score <= 0) {
        return {};
    }

    MatchResult result{.matched = true, .score = final_score, .positions = {}};

    size_t i = n;
    size_t j = m;
    while (i > 0 && j > 0) {
        switch (steps[(i - 1) * m + (j - 1)]) {
        case Step::MatchStart:
            result.positions.push_back(j - 1);
            --i;
            --j;
            break;
        case Step::FromAbove:
            --i;
            break;
        case Step::FromLeft:
            --j;
            break;
        }
    }
    std::reverse(result.positions.begin(), result.positions.end());

    return result;
}

MatchResult match(std::string_view pattern, std::string_view candidate,
                  ConsecutiveRule rule)
{
    return match(Pattern(pattern), candidate, rule);
}

} // namespace fuzzy
