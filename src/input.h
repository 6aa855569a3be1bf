#pragma once

#include "packed_strings.h"

#include <istream>

namespace input
{

// Reads newline-delimited records. CR, VT, FF and the Unicode NEL, LS and
// PS separators end records as well; empty records are dropped.
PackedStrings read_lines(std::istream &in);

// read_lines() for the picker's input. Throws std::runtime_error when the
// input is an interactive terminal or contains no records.
PackedStrings read_candidates(std::istream &in, bool is_terminal);

} // namespace input
