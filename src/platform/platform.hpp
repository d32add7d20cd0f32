#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory ($HOME, falling back to the passwd entry).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Look up an executable on $PATH. Names containing '/' are checked directly.
std::optional<std::filesystem::path> find_in_path(const std::string& program);

// True if stdin is attached to a terminal.
bool stdin_is_tty();

} // namespace platform
