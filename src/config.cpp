// config.cpp
#include "config.h"
#include "utility.h"

#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

namespace
{

std::string trim(const std::string &s)
{
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::multimap<std::string, std::string> parse_ini(const fs::path &path)
{
    std::multimap<std::string, std::string> result;
    std::ifstream file(path);
    std::string line;

    while (std::getline(file, line)) {
        if (line.empty() || line[0] == '#')
            continue;

        auto pos = line.find('=');
        if (pos != std::string::npos) {
            std::string key = trim(line.substr(0, pos));
            std::string value = trim(line.substr(pos + 1));
            result.emplace(key, value);
        } else if (!trim(line).empty()) {
            LOG_WARNING("Ignoring malformed config line '%s'", line.c_str());
        }
    }
    return result;
}

std::optional<std::string>
get_last(const std::multimap<std::string, std::string> &map,
         const std::string &key)
{
    auto range = map.equal_range(key);
    if (range.first == range.second)
        return std::nullopt;

    auto last = std::prev(range.second);
    return last->second;
}

size_t get_size_or(const std::multimap<std::string, std::string> &map,
                   const std::string &key, size_t default_value)
{
    auto value = get_last(map, key);
    if (!value)
        return default_value;

    // stoul accepts a leading minus sign and wraps
    if (value->empty() || (*value)[0] == '-') {
        LOG_WARNING("Invalid value '%s' for %s, using default", value->c_str(),
                    key.c_str());
        return default_value;
    }

    try {
        size_t consumed = 0;
        const auto parsed = std::stoul(*value, &consumed);
        if (consumed != value->size()) {
            throw std::invalid_argument(key);
        }
        return parsed;
    } catch (const std::logic_error &) {
        LOG_WARNING("Invalid value '%s' for %s, using default", value->c_str(),
                    key.c_str());
        return default_value;
    }
}

fs::path get_path_or(const std::multimap<std::string, std::string> &map,
                     const std::string &key, fs::path default_value)
{
    auto value = get_last(map, key);
    if (!value)
        return default_value;
    return fs::path(*value);
}

template <typename T, typename ParseFn>
T get_enum_or(const std::multimap<std::string, std::string> &map,
              const std::string &key, T default_value, ParseFn parse)
{
    auto value = get_last(map, key);
    if (!value)
        return default_value;

    if (auto parsed = parse(*value)) {
        return *parsed;
    }
    LOG_WARNING("Unknown value '%s' for %s, using default", value->c_str(),
                key.c_str());
    return default_value;
}

} // namespace

std::optional<fuzzy::ConsecutiveRule> parse_consecutive_rule(std::string_view name)
{
    if (name == "previous_chars")
        return fuzzy::ConsecutiveRule::PreviousCharacters;
    if (name == "adjacent_match")
        return fuzzy::ConsecutiveRule::AdjacentMatch;
    return std::nullopt;
}

std::string_view consecutive_rule_name(fuzzy::ConsecutiveRule rule)
{
    switch (rule) {
    case fuzzy::ConsecutiveRule::PreviousCharacters:
        return "previous_chars";
    case fuzzy::ConsecutiveRule::AdjacentMatch:
        return "adjacent_match";
    }
    return "previous_chars";
}

fs::path Config::default_path()
{
    const auto home = platform::get_home_dir();
    if (!home)
        return {};
    return *home / ".sift" / "config.ini";
}

RankOptions Config::rank_options() const
{
    RankOptions options;
    options.consecutive_rule = consecutive_rule;
    options.max_results = max_results;
    options.parallel_threshold = parallel_threshold;
    return options;
}

Config Config::load(const fs::path &path)
{
    Config cfg;
    cfg.config_path = path;

    if (path.empty()) {
        return cfg;
    }

    if (!fs::exists(path)) {
        // First run: leave a commented default file behind
        std::error_code ec;
        if (path.has_parent_path())
            fs::create_directories(path.parent_path(), ec);
        if (ec) {
            LOG_WARNING("Cannot create %s: %s",
                        platform::path_to_string(path.parent_path()).c_str(),
                        ec.message().c_str());
            return cfg;
        }
        cfg.save(path);
        return cfg;
    }

    auto map = parse_ini(path);

    // Matching
    cfg.consecutive_rule = get_enum_or(map, "consecutive_rule",
                                       cfg.consecutive_rule,
                                       parse_consecutive_rule);
    cfg.max_results = get_size_or(map, "max_results", cfg.max_results);
    cfg.parallel_threshold =
        get_size_or(map, "parallel_threshold", cfg.parallel_threshold);

    // Logging
    cfg.log_level = get_enum_or(map, "log_level", cfg.log_level, parse_log_level);
    cfg.log_dir = get_path_or(map, "log_dir", cfg.log_dir);

    return cfg;
}

void Config::save(const fs::path &path) const
{
    std::ofstream file(path);
    if (!file) {
        LOG_WARNING("Cannot write config file %s",
                    platform::path_to_string(path).c_str());
        return;
    }

    file << "# sift configuration\n";
    file << "# This file is auto-generated with defaults on first run.\n";
    file << "\n";

    file << "# Matching\n";
    file << "# previous_chars or adjacent_match\n";
    file << "consecutive_rule=" << consecutive_rule_name(consecutive_rule) << "\n";
    file << "# 0 keeps every match\n";
    file << "max_results=" << max_results << "\n";
    file << "parallel_threshold=" << parallel_threshold << "\n";
    file << "\n";

    file << "# Logging (debug, info, warning, error)\n";
    file << "log_level=" << log_level_name(log_level) << "\n";
    file << "log_dir=" << log_dir.generic_string() << "\n";
}
