#include "packed_strings.h"

#include <stdexcept>
#include <string>

PackedStrings::PackedStrings(std::initializer_list<std::string_view> lines)
{
    size_t total = 0;
    for (const auto line : lines) {
        total += line.size();
    }
    data_.reserve(total);
    offsets_.reserve(lines.size() + 1);

    for (const auto line : lines) {
        push(line);
    }
}

void PackedStrings::reserve(size_t string_count,
                            size_t expected_avg_string_length)
{
    data_.reserve(string_count * expected_avg_string_length);
    offsets_.reserve(string_count + 1);
}

void PackedStrings::push(std::string_view str)
{
    // offsets_ holds the start of every string plus one past the last
    if (offsets_.empty()) {
        offsets_.push_back(0);
    }
    data_.insert(data_.end(), str.begin(), str.end());
    offsets_.push_back(data_.size());
}

std::string_view PackedStrings::at(size_t idx) const
{
    if (idx >= size()) {
        throw std::out_of_range("PackedStrings::at: index " +
                                std::to_string(idx) + " >= size " +
                                std::to_string(size()));
    }

    const size_t start = offsets_[idx];
    const size_t end = offsets_[idx + 1];
    return {data_.data() + start, end - start};
}

void PackedStrings::shrink_to_fit()
{
    data_.shrink_to_fit();
    offsets_.shrink_to_fit();
}

bool PackedStrings::empty() const noexcept { return size() == 0; }

size_t PackedStrings::size() const noexcept
{
    return offsets_.empty() ? 0 : offsets_.size() - 1;
}
