#pragma once

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>

namespace platform
{

std::string path_to_string(const std::filesystem::path &path);

std::optional<std::filesystem::path> get_home_dir();

// True when the stream is attached to an interactive terminal rather
// than a pipe or file
bool is_terminal(std::FILE *stream);

} // namespace platform
