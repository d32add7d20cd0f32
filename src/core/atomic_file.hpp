#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Replace `dest` with `content` in one rename: the data goes to a fresh
// temp file in the same directory, gets `mode`, is flushed, then renamed
// over `dest`. Readers see either the old file or the new one, never a
// partial write. Concurrent writers are not serialized.
Result<void> atomic_write(const fs::path& dest, const std::string& content, unsigned mode);

// Read a whole file as raw bytes.
Result<std::string> read_file(const fs::path& path);
