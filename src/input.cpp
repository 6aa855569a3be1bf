#include "input.h"
#include "logger.h"

#include <stdexcept>
#include <string>
#include <string_view>

namespace input
{

namespace
{

constexpr const char *no_input_message =
    "No input provided. Please pipe some input into sift.\n"
    "Use 'sift --help' to learn more about how to use the program.";

// Length of the line separator starting at text[i], 0 if there is none.
// '\n' is consumed by getline; CR, VT, FF, NEL, LS and PS remain.
size_t separator_length(std::string_view text, size_t i)
{
    switch (text[i]) {
    case '\r':
    case '\v':
    case '\f':
        return 1;
    case '\xC2':
        // U+0085 NEXT LINE
        return text.substr(i, 2) == "\xC2\x85" ? 2 : 0;
    case '\xE2': {
        // U+2028 LINE SEPARATOR, U+2029 PARAGRAPH SEPARATOR
        const auto seq = text.substr(i, 3);
        return seq == "\xE2\x80\xA8" || seq == "\xE2\x80\xA9" ? 3 : 0;
    }
    default:
        return 0;
    }
}

void push_records(PackedStrings &lines, std::string_view text)
{
    size_t start = 0;
    size_t i = 0;
    while (i < text.size()) {
        const size_t len = separator_length(text, i);
        if (len == 0) {
            ++i;
            continue;
        }
        if (i > start) {
            lines.push(text.substr(start, i - start));
        }
        i += len;
        start = i;
    }
    if (start < text.size()) {
        lines.push(text.substr(start));
    }
}

} // namespace

PackedStrings read_lines(std::istream &in)
{
    PackedStrings lines;
    std::string line;

    while (std::getline(in, line)) {
        push_records(lines, line);
    }
    if (in.bad()) {
        throw std::runtime_error("Failed to read input");
    }

    lines.shrink_to_fit();
    return lines;
}

PackedStrings read_candidates(std::istream &in, bool is_terminal)
{
    if (is_terminal) {
        throw std::runtime_error(no_input_message);
    }

    auto lines = read_lines(in);
    if (lines.empty()) {
        throw std::runtime_error(no_input_message);
    }

    LOG_INFO("Loaded %zu candidates", lines.size());
    return lines;
}

} // namespace input
