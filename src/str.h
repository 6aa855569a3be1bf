#pragma once

#include <string>
#include <string_view>

namespace str
{

constexpr char32_t replacement_character = 0xFFFD;

// Decodes UTF-8 into code points. Each byte of a malformed sequence
// decodes to U+FFFD, so the result never fails.
std::u32string decode_utf8(std::string_view text);

char32_t fold_case(char32_t c);

// Decoded and case folded in one go
std::u32string folded(std::string_view text);

} // namespace str
