#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// One opaque credential file per identity: <dir>/<name>.json.
// The directory is owner-only (0700), each file 0600. File contents are
// copied around but never parsed.
class CredentialVault {
public:
    explicit CredentialVault(fs::path dir);

    // Create the vault directory (0700) if missing.
    Result<void> ensure_dir();

    // Get the credential blob for `name`. NotFound if there is no file.
    Result<std::string> fetch(const std::string& name) const;

    // Store (or replace) the blob for `name` atomically.
    Result<void> store(const std::string& name, const std::string& blob);

    // Delete `name`. NotFound if there is no file.
    Result<void> remove(const std::string& name);

    bool contains(const std::string& name) const;

    // All identity names, sorted.
    std::vector<std::string> list() const;

    fs::path path_for(const std::string& name) const;
    const fs::path& dir() const { return dir_; }

private:
    fs::path dir_;
};
