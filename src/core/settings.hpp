#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Built-in defaults with "~" already expanded.
Settings default_settings();

// Load ~/.config/claspalt/config.yaml (or $CLASPALT_HOME/config.yaml).
// A missing file yields the defaults; a malformed one is an error.
Result<Settings> load_settings();

// Load from an explicit path. Keys that are absent keep their defaults.
Result<Settings> load_settings(const fs::path& path);

// Directory holding config.yaml
fs::path get_settings_dir();
fs::path get_settings_path();

// Project files resolved against `dir`
fs::path get_project_config_path(const Settings& settings, const fs::path& dir = fs::current_path());
fs::path get_legacy_config_path(const Settings& settings, const fs::path& dir = fs::current_path());
