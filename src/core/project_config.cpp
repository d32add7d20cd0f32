#include "project_config.hpp"
#include "atomic_file.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include "log.hpp"
#include <fstream>
#include <algorithm>
#include <system_error>

ProjectConfig::ProjectConfig(fs::path path) : path_(std::move(path)) {}

bool ProjectConfig::exists() const {
    return fs::exists(path_);
}

static bool line_has_key(const std::string& line, const std::string& prefix) {
    return line.compare(0, prefix.size(), prefix) == 0;
}

std::optional<std::string> ProjectConfig::read(const std::string& key) const {
    std::ifstream f(path_);
    if (!f) return std::nullopt;

    const std::string prefix = key + "=";
    std::string line;
    while (std::getline(f, line)) {
        if (!line_has_key(line, prefix)) continue;

        std::string value = line.substr(prefix.size());
        value.erase(std::remove(value.begin(), value.end(), '\r'), value.end());
        trim(value);
        return value;
    }
    return std::nullopt;
}

Result<void> ProjectConfig::write(const std::string& key, const std::string& value) {
    if (key.empty() || key.find('=') != std::string::npos || key.find('\n') != std::string::npos) {
        return Result<void>::Err("Invalid config key: '" + key + "'", ErrorKind::Validation);
    }
    if (value.find('\n') != std::string::npos) {
        return Result<void>::Err("Config values cannot span lines", ErrorKind::Validation);
    }

    // A rewrite keeps the permissions the file already has.
    std::string existing;
    unsigned mode = CONFIG_FILE_MODE;
    if (exists()) {
        auto r = read_file(path_);
        if (r.is_err()) return Result<void>::Err(r.error, r.kind);
        existing = std::move(r.value);

        std::error_code ec;
        auto perms = fs::status(path_, ec).permissions();
        if (!ec) mode = static_cast<unsigned>(perms) & 0777u;
    }

    const std::string prefix = key + "=";
    const std::string new_line = prefix + value;

    // Walk the file line by line, keeping each line's terminator as-is.
    std::string out;
    out.reserve(existing.size() + new_line.size() + 1);
    bool replaced = false;
    size_t pos = 0;
    while (pos < existing.size()) {
        size_t nl = existing.find('\n', pos);
        size_t end = (nl == std::string::npos) ? existing.size() : nl;
        std::string line = existing.substr(pos, end - pos);

        if (line_has_key(line, prefix)) {
            out += new_line;
            replaced = true;
        } else {
            out += line;
        }
        if (nl != std::string::npos) out += '\n';
        pos = end + 1;
    }

    if (!replaced) {
        if (!out.empty() && out.back() != '\n') out += '\n';
        out += new_line + "\n";
    }

    auto r = atomic_write(path_, out, mode);
    if (r.is_err()) return r;

    claspalt_logf("config {}: {} {}", path_.string(), replaced ? "updated" : "added", key);
    return Result<void>::Ok();
}
