#include "config.h"
#include "input.h"
#include "logger.h"
#include "session.h"
#include "utility.h"

#include <clocale>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace
{

constexpr const char *version = "0.1.0";

struct Arguments {
    enum class Mode { Select, Filter };

    Mode mode = Mode::Select;
    std::string query;
    size_t select = 0;
    bool scores = false;
    std::optional<fs::path> config_path;
    bool help = false;
    bool version = false;
};

void print_usage()
{
    printf("sift - fuzzy picks a line from piped input.\n"
           "\n"
           "USAGE:\n"
           "  sift [options] < input\n"
           "\n"
           "OPTIONS:\n"
           "  -h, --help                Show this help and quit\n"
           "  -v, --version             Show version and quit\n"
           "  -f, --filter <query>      Print every matching line, best first\n"
           "  -q, --query <query>       Query used to pick a line\n"
           "  -s, --select <n>          Row to pick from the ranked list (default 0)\n"
           "      --scores              Prefix filtered lines with their score\n"
           "  -c, --config <path>       Use an alternative config file\n");
}

size_t parse_index(const std::string &value)
{
    if (value.empty() || value[0] == '-') {
        throw std::invalid_argument("Invalid row '" + value + "'");
    }
    size_t consumed = 0;
    const auto parsed = std::stoul(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("Invalid row '" + value + "'");
    }
    return parsed;
}

Arguments parse_arguments(int argc, char *argv[])
{
    Arguments args;

    auto next_value = [&](int &i, std::string_view flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument("Missing value for " + std::string(flag));
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help" || arg == "help") {
            args.help = true;
        } else if (arg == "-v" || arg == "--version" || arg == "version") {
            args.version = true;
        } else if (arg == "-f" || arg == "--filter") {
            args.mode = Arguments::Mode::Filter;
            args.query = next_value(i, arg);
        } else if (arg == "-q" || arg == "--query") {
            args.query = next_value(i, arg);
        } else if (arg == "-s" || arg == "--select") {
            args.select = parse_index(next_value(i, arg));
        } else if (arg == "--scores") {
            args.scores = true;
        } else if (arg == "-c" || arg == "--config") {
            args.config_path = next_value(i, arg);
        } else {
            throw std::invalid_argument("Unknown option '" + std::string(arg) + "'");
        }
    }
    return args;
}

int run_filter(const Session &session, bool scores)
{
    for (size_t row = 0; row < session.size(); ++row) {
        const auto line = session.at(row);
        if (scores) {
            printf("%d\t%.*s\n", session.items()[row].score,
                   static_cast<int>(line.size()), line.data());
        } else {
            printf("%.*s\n", static_cast<int>(line.size()), line.data());
        }
    }
    fflush(stdout);
    return EXIT_SUCCESS;
}

int run_select(Session &session, size_t row)
{
    // Rows past the end fall back to the first one, like a stale selection
    session.select(row);

    const auto selected = session.selected();
    if (!selected) {
        LOG_INFO("No line matches '%s'", session.query().c_str());
        return EXIT_FAILURE;
    }
    printf("%.*s\n", static_cast<int>(selected->size()), selected->data());
    fflush(stdout);
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char *argv[])
{
    // Non-ASCII case folding follows the user's locale
    std::setlocale(LC_CTYPE, "");

    try {
        const Arguments args = parse_arguments(argc, argv);

        if (args.help) {
            print_usage();
            return EXIT_SUCCESS;
        }
        if (args.version) {
            printf("sift %s\n", version);
            return EXIT_SUCCESS;
        }

        const Config config =
            Config::load(args.config_path.value_or(Config::default_path()));

        auto &logger = Logger::getInstance();
        logger.set_level(config.log_level);
        logger.init(config.log_dir);
        LOG_DEBUG("Using config %s",
                  platform::path_to_string(config.config_path).c_str());

        Session session(input::read_candidates(std::cin, platform::is_terminal(stdin)),
                        config.rank_options());
        session.set_query(args.query);

        if (args.mode == Arguments::Mode::Filter) {
            return run_filter(session, args.scores);
        }
        return run_select(session, args.select);
    } catch (const std::exception &e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return EXIT_FAILURE;
    }
}
