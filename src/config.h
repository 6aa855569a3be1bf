// config.h
#pragma once

#include "fuzzy.h"
#include "logger.h"
#include "ranker.h"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

std::optional<fuzzy::ConsecutiveRule> parse_consecutive_rule(std::string_view name);
std::string_view consecutive_rule_name(fuzzy::ConsecutiveRule rule);

struct Config {
    // Matching
    fuzzy::ConsecutiveRule consecutive_rule =
        fuzzy::ConsecutiveRule::PreviousCharacters;
    size_t max_results = 0;             // 0 = keep every match
    size_t parallel_threshold = 50000;  // candidates

    // Logging
    LogLevel log_level = LogLevel::WARNING;
    fs::path log_dir;                   // empty = no log file

    // Paths
    static fs::path default_path();
    fs::path config_path;

    RankOptions rank_options() const;

    static Config load(const fs::path &path);
    void save(const fs::path &path) const;
};
