#pragma once

#include <cstddef>
#include <initializer_list>
#include <string_view>
#include <vector>

// Immutable-after-load candidate storage: all lines live in one buffer
struct PackedStrings {

  private:
    std::vector<char> data_;
    std::vector<size_t> offsets_;

  public:
    PackedStrings() = default;
    PackedStrings(std::initializer_list<std::string_view> lines);

    void reserve(size_t string_count, size_t expected_avg_string_length);
    void push(std::string_view str);
    void shrink_to_fit();

    std::string_view at(size_t idx) const;
    bool empty() const noexcept;
    size_t size() const noexcept;
};
