#include "str.h"

#include <cstdint>
#include <cwctype>

namespace str
{

namespace
{

bool is_continuation_byte(unsigned char c) { return (c & 0b11000000) == 0b10000000; }

size_t sequence_length(unsigned char lead)
{
    if (lead < 0x80)
        return 1;
    if ((lead & 0b11100000) == 0b11000000)
        return 2;
    if ((lead & 0b11110000) == 0b11100000)
        return 3;
    if ((lead & 0b11111000) == 0b11110000)
        return 4;
    return 0;
}

} // namespace

std::u32string decode_utf8(std::string_view text)
{
    std::u32string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        const size_t len = sequence_length(lead);

        if (len == 1) {
            result.push_back(lead);
            ++i;
            continue;
        }
        if (len == 0 || i + len > text.size()) {
            result.push_back(replacement_character);
            ++i;
            continue;
        }

        char32_t cp = lead & (0xFF >> (len + 1));
        bool valid = true;
        for (size_t k = 1; k < len; ++k) {
            const auto c = static_cast<unsigned char>(text[i + k]);
            if (!is_continuation_byte(c)) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (c & 0b00111111);
        }

        // Overlong encodings and surrogates are rejected like any other
        // malformed sequence
        static constexpr char32_t min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
        if (!valid || cp < min_for_length[len] || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            result.push_back(replacement_character);
            ++i;
            continue;
        }

        result.push_back(cp);
        i += len;
    }
    return result;
}

char32_t fold_case(char32_t c)
{
    if (c < 0x80) {
        return (c >= U'A' && c <= U'Z') ? c + (U'a' - U'A') : c;
    }
    // Non-ASCII folding follows the LC_CTYPE locale, see main()
    return static_cast<char32_t>(std::towlower(static_cast<std::wint_t>(c)));
}

std::u32string folded(std::string_view text)
{
    std::u32string result = decode_utf8(text);
    for (auto &c : result) {
        c = fold_case(c);
    }
    return result;
}

} // namespace str
