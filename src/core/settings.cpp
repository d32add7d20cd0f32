#include "settings.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdlib>

Settings default_settings() {
    Settings s;
    s.credentials_dir = (platform::home_dir() / DEFAULT_VAULT_DIR).string();
    s.active_credentials = (platform::home_dir() / DEFAULT_ACTIVE_SLOT).string();
    return s;
}

fs::path get_settings_dir() {
    const char* override_dir = std::getenv(SETTINGS_DIR_ENV);
    if (override_dir && *override_dir) {
        return fs::path(expand_home(override_dir));
    }
    return platform::home_dir() / DEFAULT_VAULT_DIR;
}

fs::path get_settings_path() {
    return get_settings_dir() / SETTINGS_FILE;
}

fs::path get_project_config_path(const Settings& settings, const fs::path& dir) {
    fs::path p = expand_home(settings.project_config);
    return p.is_absolute() ? p : dir / p;
}

fs::path get_legacy_config_path(const Settings& settings, const fs::path& dir) {
    fs::path p = expand_home(settings.legacy_config);
    return p.is_absolute() ? p : dir / p;
}

static void read_string(const YAML::Node& root, const char* key, std::string& out) {
    if (root[key] && root[key].IsScalar()) {
        std::string value = root[key].as<std::string>();
        if (!value.empty()) out = expand_home(value);
    }
}

Result<Settings> load_settings(const fs::path& path) {
    Settings s = default_settings();

    if (!fs::exists(path)) {
        return Result<Settings>::Ok(s);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) {
            return Result<Settings>::Ok(s);
        }
        if (!root.IsMap()) {
            return Result<Settings>::Err(path.string() + ": expected a mapping at top level");
        }

        read_string(root, "tool", s.tool);
        read_string(root, "credentials_dir", s.credentials_dir);
        read_string(root, "active_credentials", s.active_credentials);
        read_string(root, "project_config", s.project_config);
        read_string(root, "legacy_config", s.legacy_config);

        // login_args: a list, or a single string
        if (root["login_args"]) {
            const auto& node = root["login_args"];
            s.login_args.clear();
            if (node.IsSequence()) {
                for (const auto& item : node) {
                    s.login_args.push_back(item.as<std::string>());
                }
            } else if (node.IsScalar()) {
                s.login_args.push_back(node.as<std::string>());
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<Settings>::Err("Failed to parse " + path.string() + ": " + e.what());
    }

    claspalt_logf("settings loaded from {}", path.string());
    return Result<Settings>::Ok(s);
}

Result<Settings> load_settings() {
    return load_settings(get_settings_path());
}
