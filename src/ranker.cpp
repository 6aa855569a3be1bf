#include "ranker.h"
#include "lastwriterwinsslot.h"
#include "logger.h"
#include "packed_strings.h"

#include <chrono>

AsyncRanker::AsyncRanker(const PackedStrings &candidates,
                         LastWriterWinsSlot<RankUpdate> &results,
                         RankOptions options)
    : candidates_(candidates), result_updates_(results),
      options_(std::move(options)), worker_thread_([this]() { run(); })
{
}

AsyncRanker::~AsyncRanker()
{
    {
        std::lock_guard lock(state_mutex_);
        should_exit_.store(true, std::memory_order_release);
    }
    state_cv_.notify_all();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

uint64_t AsyncRanker::update_query(std::string query)
{
    uint64_t generation = 0;
    {
        std::lock_guard lock(state_mutex_);
        pending_query_ = std::move(query);
        generation = generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
    }
    state_cv_.notify_one();
    return generation;
}

uint64_t AsyncRanker::latest_generation() const
{
    return generation_.load(std::memory_order_acquire);
}

bool AsyncRanker::superseded(uint64_t generation) const
{
    return should_exit_.load(std::memory_order_acquire) ||
           generation_.load(std::memory_order_acquire) != generation;
}

void AsyncRanker::run()
{
    while (true) {
        std::string query;
        uint64_t generation = 0;
        {
            std::unique_lock lock(state_mutex_);
            state_cv_.wait(lock, [this]() {
                return should_exit_.load(std::memory_order_acquire) ||
                       generation_.load(std::memory_order_acquire) !=
                           processed_generation_;
            });

            if (should_exit_.load(std::memory_order_acquire)) {
                break;
            }
            generation = generation_.load(std::memory_order_acquire);
            query = pending_query_;
        }
        processed_generation_ = generation;

        const auto start_time = std::chrono::steady_clock::now();

        auto items = rank_items(query, candidates_, options_, [this, generation]() {
            return superseded(generation);
        });

        if (superseded(generation)) {
            LOG_DEBUG("Dropped rank pass for '%s' (generation %lu superseded)",
                      query.c_str(), static_cast<unsigned long>(generation));
            continue;
        }

        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        LOG_DEBUG("Ranked %zu candidates in %ldms (query: '%s', matches: %zu)",
                  candidates_.size(), static_cast<long>(duration.count()),
                  query.c_str(), items.size());

        RankUpdate update{.generation = generation,
                          .query = std::move(query),
                          .items = std::move(items)};
        if (!result_updates_.write(generation, std::move(update))) {
            LOG_WARNING("Rank result for generation %lu rejected as stale",
                        static_cast<unsigned long>(generation));
        }
    }
}
