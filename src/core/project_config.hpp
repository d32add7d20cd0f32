#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Flat key=value project file (claspConfig.txt).
//
// Lines are matched on a "key=" prefix anchored at the start of the line,
// so "account" never matches "accountant=...". Values read back have CRs
// and surrounding whitespace removed. Writes go through atomic_write and
// touch only the line(s) for the written key; everything else, including
// unknown keys and their order, is kept byte-for-byte.
class ProjectConfig {
public:
    explicit ProjectConfig(fs::path path);

    bool exists() const;

    std::optional<std::string> read(const std::string& key) const;

    // Rewrite `key` in place, or append it. Creates the file if absent.
    Result<void> write(const std::string& key, const std::string& value);

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};
