#pragma once

#include "fuzzy.h"
#include "parallel.h"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

struct PackedStrings;
template <typename T> class LastWriterWinsSlot;

struct RankOptions {
    fuzzy::ConsecutiveRule consecutive_rule =
        fuzzy::ConsecutiveRule::PreviousCharacters;
    // 0 keeps every match
    size_t max_results = 0;
    // Candidate count from which scoring is spread over threads
    size_t parallel_threshold = 50000;
    size_t n_threads = parallel::default_thread_count();
};

// One kept candidate of a rank pass
struct RankedItem {
    size_t index; // into the candidate list
    int score;
    std::vector<size_t> positions;

    bool operator>(const RankedItem &other) const
    {
        return score > other.score;
    }
};

struct NeverCancelled {
    bool operator()() const noexcept { return false; }
};

namespace detail {

// How many candidates are scored between two cancellation checks
constexpr size_t cancel_check_interval = 256;

template <typename ContainerT, typename CancelFn>
void score_range(const ContainerT &data, const fuzzy::Pattern &pattern,
                 fuzzy::ConsecutiveRule rule, size_t begin, size_t end,
                 std::vector<RankedItem> &out, const CancelFn &cancelled)
{
    for (size_t i = begin; i < end; ++i) {
        if ((i - begin) % cancel_check_interval == 0 && cancelled()) {
            return;
        }

        auto result = fuzzy::match(pattern, data.at(i), rule);
        if (result.matched) {
            out.push_back(RankedItem{.index = i,
                                     .score = result.score,
                                     .positions = std::move(result.positions)});
        }
    }
}

} // namespace detail

// Scores every candidate against the query and returns the matches by
// descending score, ties in candidate order. An empty query keeps every
// candidate, unscored, in its original order.
//
// cancelled() may be polled from several threads; once it returns true
// the pass stops early and the returned items are incomplete.
template <typename ContainerT, typename CancelFn = NeverCancelled>
std::vector<RankedItem> rank_items(std::string_view query,
                                   const ContainerT &data,
                                   const RankOptions &options = {},
                                   const CancelFn &cancelled = {})
{
    std::vector<RankedItem> ranked;

    if (query.empty()) {
        const size_t n = options.max_results == 0
                             ? data.size()
                             : std::min(options.max_results, data.size());
        ranked.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            ranked.push_back(RankedItem{.index = i, .score = 0, .positions = {}});
        }
        return ranked;
    }

    const fuzzy::Pattern pattern(query);

    if (data.size() >= options.parallel_threshold && options.n_threads > 1) {
        std::vector<std::vector<RankedItem>> per_block(
            parallel::block_count(data.size(), options.n_threads));

        parallel::parallel_for_blocks(
            0, data.size(),
            [&](size_t block, size_t begin, size_t end) {
                auto &local = per_block[block];
                local.reserve((end - begin) / 4);
                detail::score_range(data, pattern, options.consecutive_rule,
                                    begin, end, local, cancelled);
            },
            options.n_threads);

        // Blocks are contiguous and in range order
        size_t total = 0;
        for (const auto &local : per_block) {
            total += local.size();
        }
        ranked.reserve(total);
        for (auto &local : per_block) {
            std::move(local.begin(), local.end(), std::back_inserter(ranked));
        }
    } else {
        detail::score_range(data, pattern, options.consecutive_rule, 0,
                            data.size(), ranked, cancelled);
    }

    std::stable_sort(ranked.begin(), ranked.end(), std::greater<>{});

    if (options.max_results != 0 && ranked.size() > options.max_results) {
        ranked.resize(options.max_results);
    }
    return ranked;
}

// Ranked candidate lines for a query
template <typename ContainerT>
std::vector<std::string> rank(std::string_view query, const ContainerT &data,
                              const RankOptions &options = {})
{
    const auto items = rank_items(query, data, options);

    std::vector<std::string> lines;
    lines.reserve(items.size());
    for (const auto &item : items) {
        lines.emplace_back(data.at(item.index));
    }
    return lines;
}

// Result of one complete rank pass
struct RankUpdate {
    uint64_t generation = 0;
    std::string query;
    std::vector<RankedItem> items;
};

// Runs rank passes on a worker thread. Every update_query() starts a new
// generation; a pass that is superseded before it finishes is abandoned and
// never published, so the slot only ever sees complete passes in
// increasing generation order.
class AsyncRanker {
public:
    AsyncRanker(const PackedStrings &candidates,
                LastWriterWinsSlot<RankUpdate> &results,
                RankOptions options = {});
    ~AsyncRanker();

    AsyncRanker(const AsyncRanker &) = delete;
    AsyncRanker &operator=(const AsyncRanker &) = delete;
    AsyncRanker(AsyncRanker &&) = delete;
    AsyncRanker &operator=(AsyncRanker &&) = delete;

    // Returns the generation assigned to this query
    uint64_t update_query(std::string query);
    uint64_t latest_generation() const;

private:
    const PackedStrings &candidates_;
    LastWriterWinsSlot<RankUpdate> &result_updates_;
    const RankOptions options_;

    std::mutex state_mutex_;
    std::condition_variable state_cv_;
    std::string pending_query_;
    // Starts at 1 so the empty query is ranked once at startup
    std::atomic<uint64_t> generation_{1};
    std::atomic_bool should_exit_{false};

    uint64_t processed_generation_ = 0;

    std::thread worker_thread_;

    void run();
    bool superseded(uint64_t generation) const;
};
