#pragma once

#include <algorithm>
#include <cstddef>
#include <thread>
#include <vector>

namespace parallel {

inline size_t default_thread_count()
{
    const size_t n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : n;
}

// Splits [begin, end) into one contiguous block per thread (static
// partitioning) and calls func(block_index, block_begin, block_end) once
// per block. Blocks are numbered in range order, so callers can write
// per-block results and concatenate them to get the sequential order.
// Returns the number of blocks.
template <typename Func>
size_t parallel_for_blocks(size_t begin, size_t end, Func &&func,
                           size_t n_threads = default_thread_count())
{
    if (begin >= end) {
        return 0;
    }

    const size_t total_work = end - begin;
    const size_t actual_threads = std::max<size_t>(1, std::min(n_threads, total_work));

    if (actual_threads == 1) {
        func(size_t{0}, begin, end);
        return 1;
    }

    const size_t block_size = total_work / actual_threads;
    const size_t remainder = total_work % actual_threads;

    std::vector<std::thread> threads;
    threads.reserve(actual_threads);

    for (size_t t = 0; t < actual_threads; ++t) {
        // Distribute remainder across first threads
        const size_t t_begin = begin + t * block_size + std::min(t, remainder);
        const size_t t_end = t_begin + block_size + (t < remainder ? 1 : 0);

        threads.emplace_back([t, t_begin, t_end, &func]() { func(t, t_begin, t_end); });
    }

    for (auto &thread : threads) {
        thread.join();
    }
    return actual_threads;
}

// Number of blocks parallel_for_blocks will use for a range
inline size_t block_count(size_t total_work, size_t n_threads = default_thread_count())
{
    if (total_work == 0) {
        return 0;
    }
    return std::max<size_t>(1, std::min(n_threads, total_work));
}

} // namespace parallel
