#include "session.h"
#include "logger.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

std::optional<size_t> clamp_selection(std::optional<size_t> previous,
                                      size_t list_size)
{
    if (list_size == 0) {
        return std::nullopt;
    }
    if (!previous || *previous >= list_size) {
        return 0;
    }
    return previous;
}

Session::Session(PackedStrings candidates, RankOptions options)
    : candidates_(std::move(candidates)), options_(std::move(options))
{
    // Initial, unranked list
    replace_ranked(rank_items(query_, candidates_, options_));
}

void Session::set_query(std::string query)
{
    query_ = std::move(query);
    replace_ranked(rank_items(query_, candidates_, options_));
    LOG_DEBUG("Query '%s' keeps %zu of %zu candidates", query_.c_str(),
              ranked_.size(), candidates_.size());
}

bool Session::apply(RankUpdate &&update)
{
    if (update.generation <= applied_generation_) {
        LOG_DEBUG("Ignoring rank update %lu, already showing %lu",
                  static_cast<unsigned long>(update.generation),
                  static_cast<unsigned long>(applied_generation_));
        return false;
    }
    if (update.query != query_) {
        return false;
    }
    applied_generation_ = update.generation;
    replace_ranked(std::move(update.items));
    return true;
}

void Session::replace_ranked(std::vector<RankedItem> &&ranked)
{
    ranked_ = std::move(ranked);
    selected_ = clamp_selection(selected_, ranked_.size());
}

void Session::move_selection(std::ptrdiff_t offset)
{
    if (ranked_.empty()) {
        return;
    }

    const auto last = static_cast<std::ptrdiff_t>(ranked_.size()) - 1;
    const auto current = static_cast<std::ptrdiff_t>(selected_.value_or(0));
    selected_ = static_cast<size_t>(std::clamp(current + offset, std::ptrdiff_t{0}, last));
}

void Session::select(size_t row)
{
    if (row < ranked_.size()) {
        selected_ = row;
    }
}

bool Session::clear_or_cancel()
{
    if (query_.empty()) {
        return false;
    }
    set_query({});
    return true;
}

std::optional<std::string_view> Session::selected() const
{
    if (!selected_) {
        return std::nullopt;
    }
    return at(*selected_);
}

std::string_view Session::at(size_t row) const
{
    if (row >= ranked_.size()) {
        throw std::out_of_range("Session::at: row " + std::to_string(row) +
                                " >= " + std::to_string(ranked_.size()));
    }
    return candidates_.at(ranked_[row].index);
}
