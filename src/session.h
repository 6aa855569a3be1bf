#pragma once

#include "packed_strings.h"
#include "ranker.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Selection after the list it points into was replaced: an out of range
// (or absent) selection resets to the first row, an empty list has none.
std::optional<size_t> clamp_selection(std::optional<size_t> previous,
                                      size_t list_size);

// Picker state: the full candidate set, the current query and the ranked
// view of it. Each query change replaces the ranked view wholesale.
class Session
{
  public:
    explicit Session(PackedStrings candidates, RankOptions options = {});

    void set_query(std::string query);
    const std::string &query() const noexcept { return query_; }

    // Replaces the ranked view with a pass computed elsewhere (AsyncRanker).
    // Updates not newer than the last applied generation, or for a query
    // other than the current one, are ignored.
    bool apply(RankUpdate &&update);
    uint64_t applied_generation() const noexcept { return applied_generation_; }

    // Arrow keys: moves by offset and stops at either end
    void move_selection(std::ptrdiff_t offset);
    // Mouse: selects a row if it exists
    void select(size_t row);

    // Escape: clears a non-empty query and returns true, otherwise returns
    // false to signal the picker should close
    bool clear_or_cancel();

    std::optional<size_t> selected_index() const noexcept { return selected_; }
    std::optional<std::string_view> selected() const;

    size_t size() const noexcept { return ranked_.size(); }
    bool empty() const noexcept { return ranked_.empty(); }
    std::string_view at(size_t row) const;
    const std::vector<RankedItem> &items() const noexcept { return ranked_; }

    const PackedStrings &candidates() const noexcept { return candidates_; }
    const RankOptions &options() const noexcept { return options_; }

  private:
    PackedStrings candidates_;
    RankOptions options_;
    std::string query_;
    std::vector<RankedItem> ranked_;
    std::optional<size_t> selected_;
    uint64_t applied_generation_ = 0;

    void replace_ranked(std::vector<RankedItem> &&ranked);
};
