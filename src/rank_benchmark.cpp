#include "fuzzy.h"
#include "packed_strings.h"
#include "ranker.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iterator>
#include <random>
#include <string>

namespace
{

// Path-like lines, deterministic for a given seed
PackedStrings generate_candidates(size_t count, unsigned seed)
{
    static constexpr const char *words[] = {
        "src",    "include", "test",   "docs",  "build", "ranker", "fuzzy",
        "config", "main",    "logger", "input", "util",  "README", "notes",
        "apple",  "banana",  "grape",  "pie",   "juice", "split",  "core"};
    static constexpr const char *extensions[] = {".cpp", ".h", ".md", ".txt", ""};

    std::mt19937 rng(seed);
    std::uniform_int_distribution<size_t> word_dist(0, std::size(words) - 1);
    std::uniform_int_distribution<size_t> ext_dist(0, std::size(extensions) - 1);
    std::uniform_int_distribution<int> depth_dist(1, 6);

    PackedStrings candidates;
    candidates.reserve(count, 40);

    std::string line;
    for (size_t i = 0; i < count; ++i) {
        line.clear();
        const int depth = depth_dist(rng);
        for (int d = 0; d < depth; ++d) {
            if (d > 0) {
                line += (d % 3 == 0) ? ' ' : '/';
            }
            line += words[word_dist(rng)];
        }
        line += extensions[ext_dist(rng)];
        candidates.push(line);
    }
    return candidates;
}

} // namespace

int main(int argc, char *argv[])
{
    const size_t count = (argc > 1) ? std::strtoul(argv[1], nullptr, 10) : 200000;
    const char *query = (argc > 2) ? argv[2] : "srcfuz";

    printf("=====================\n\n");
    printf("sift Rank Benchmark\n");

    try {
        printf("  Candidates: %zu\n", count);
        printf("  Query: %s\n", query);
        printf("=================================\n");

        const auto total_start = std::chrono::steady_clock::now();
        const auto candidates = generate_candidates(count, 42);
        const auto generate_end = std::chrono::steady_clock::now();

        RankOptions sequential;
        sequential.n_threads = 1;
        const auto sequential_items = rank_items(query, candidates, sequential);
        const auto sequential_end = std::chrono::steady_clock::now();

        RankOptions threaded;
        threaded.parallel_threshold = 0;
        const auto threaded_items = rank_items(query, candidates, threaded);
        const auto threaded_end = std::chrono::steady_clock::now();

        auto ms = [](auto from, auto to) {
            return static_cast<long>(
                std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count());
        };

        printf("=================================\n");
        printf("Generate time: %ldms Sequential rank: %ldms Parallel rank (%zu threads): %ldms "
               "Total time: %ldms\n",
               ms(total_start, generate_end), ms(generate_end, sequential_end),
               threaded.n_threads, ms(sequential_end, threaded_end),
               ms(total_start, threaded_end));
        printf("Matches: %zu\n", sequential_items.size());

        bool same = sequential_items.size() == threaded_items.size();
        for (size_t i = 0; same && i < sequential_items.size(); ++i) {
            same = sequential_items[i].index == threaded_items[i].index &&
                   sequential_items[i].score == threaded_items[i].score;
        }
        if (!same) {
            fprintf(stderr, "Error: sequential and parallel rankings differ\n");
            return 1;
        }

        for (size_t i = 0; i < std::min<size_t>(5, sequential_items.size()); ++i) {
            const auto line = candidates.at(sequential_items[i].index);
            printf("  %5d  %.*s\n", sequential_items[i].score,
                   static_cast<int>(line.size()), line.data());
        }
    } catch (const std::exception &e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }

    printf("\nBenchmark finished!\n");
    return 0;
}
