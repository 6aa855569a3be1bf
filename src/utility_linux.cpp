#include "utility.h"

#include <cstdlib>
#include <unistd.h>

namespace platform
{

namespace fs = std::filesystem;

std::string path_to_string(const fs::path &path) { return path.string(); }

std::optional<std::filesystem::path> get_home_dir()
{
    const char *home = std::getenv("HOME");

    if (!home) {
        return std::nullopt;
    }
    const fs::path home_path(home);
    if (!fs::exists(home_path)) {
        return std::nullopt;
    }
    return home_path;
}

bool is_terminal(std::FILE *stream)
{
    const int fd = fileno(stream);
    return fd >= 0 && isatty(fd) != 0;
}

} // namespace platform
