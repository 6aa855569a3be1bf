#include <catch2/catch.hpp>

#include "config.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace
{

struct TempDir {
    fs::path path;

    TempDir()
    {
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() / ("sift_config_test_" + std::to_string(stamp));
        fs::create_directories(path);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void write_file(const fs::path &path, const std::string &content)
{
    std::ofstream file(path);
    file << content;
}

} // namespace

TEST_CASE("Missing config file is created with defaults", "[config]")
{
    TempDir dir;
    const auto path = dir.path / "nested" / "config.ini";

    const auto cfg = Config::load(path);
    REQUIRE(fs::exists(path));
    REQUIRE(cfg.config_path == path);
    REQUIRE(cfg.consecutive_rule == fuzzy::ConsecutiveRule::PreviousCharacters);
    REQUIRE(cfg.max_results == 0);
    REQUIRE(cfg.parallel_threshold == 50000);
    REQUIRE(cfg.log_level == LogLevel::WARNING);
    REQUIRE(cfg.log_dir.empty());

    // The generated file loads back to the same values
    const auto reloaded = Config::load(path);
    REQUIRE(reloaded.consecutive_rule == cfg.consecutive_rule);
    REQUIRE(reloaded.max_results == cfg.max_results);
    REQUIRE(reloaded.parallel_threshold == cfg.parallel_threshold);
    REQUIRE(reloaded.log_level == cfg.log_level);
    REQUIRE(reloaded.log_dir.empty());
}

TEST_CASE("Config values are read from the file", "[config]")
{
    TempDir dir;
    const auto path = dir.path / "config.ini";
    write_file(path, "# comment\n"
                     "consecutive_rule = adjacent_match\n"
                     "max_results=25\n"
                     "max_results=50\n"
                     "parallel_threshold=1000\n"
                     "log_level=debug\n"
                     "log_dir=/tmp/sift-logs\n");

    const auto cfg = Config::load(path);
    REQUIRE(cfg.consecutive_rule == fuzzy::ConsecutiveRule::AdjacentMatch);
    // Last occurrence wins
    REQUIRE(cfg.max_results == 50);
    REQUIRE(cfg.parallel_threshold == 1000);
    REQUIRE(cfg.log_level == LogLevel::DEBUG);
    REQUIRE(cfg.log_dir == fs::path("/tmp/sift-logs"));

    const auto options = cfg.rank_options();
    REQUIRE(options.consecutive_rule == fuzzy::ConsecutiveRule::AdjacentMatch);
    REQUIRE(options.max_results == 50);
    REQUIRE(options.parallel_threshold == 1000);
}

TEST_CASE("Invalid config values fall back to defaults", "[config]")
{
    TempDir dir;
    const auto path = dir.path / "config.ini";
    write_file(path, "consecutive_rule=sometimes\n"
                     "max_results=-4\n"
                     "parallel_threshold=lots\n"
                     "log_level=verbose\n"
                     "not a key value line\n");

    const auto cfg = Config::load(path);
    REQUIRE(cfg.consecutive_rule == fuzzy::ConsecutiveRule::PreviousCharacters);
    REQUIRE(cfg.max_results == 0);
    REQUIRE(cfg.parallel_threshold == 50000);
    REQUIRE(cfg.log_level == LogLevel::WARNING);
}

TEST_CASE("Enum names round-trip", "[config]")
{
    for (const auto rule : {fuzzy::ConsecutiveRule::PreviousCharacters,
                            fuzzy::ConsecutiveRule::AdjacentMatch}) {
        REQUIRE(parse_consecutive_rule(consecutive_rule_name(rule)) == rule);
    }
    for (const auto level : {LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARNING, LogLevel::ERR}) {
        REQUIRE(parse_log_level(log_level_name(level)) == level);
    }
    REQUIRE_FALSE(parse_log_level("loud").has_value());
}
