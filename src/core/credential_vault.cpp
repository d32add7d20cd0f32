#include "credential_vault.hpp"
#include "atomic_file.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include "log.hpp"
#include <algorithm>
#include <system_error>
#include <sys/stat.h>

CredentialVault::CredentialVault(fs::path dir) : dir_(std::move(dir)) {}

static Result<void> check_name(const std::string& name) {
    if (!is_valid_account_name(name)) {
        return Result<void>::Err(
            "Invalid account name '" + name + "'. Use only letters, numbers, hyphens and underscores.",
            ErrorKind::Validation);
    }
    return Result<void>::Ok();
}

fs::path CredentialVault::path_for(const std::string& name) const {
    return dir_ / (name + CREDENTIAL_EXT);
}

Result<void> CredentialVault::ensure_dir() {
    if (fs::is_directory(dir_)) return Result<void>::Ok();

    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        return Result<void>::Err("Cannot create " + dir_.string() + ": " + ec.message());
    }
    if (chmod(dir_.c_str(), VAULT_DIR_MODE) != 0) {
        return Result<void>::Err("Cannot set permissions on " + dir_.string());
    }
    claspalt_logf("vault created at {}", dir_.string());
    return Result<void>::Ok();
}

Result<std::string> CredentialVault::fetch(const std::string& name) const {
    auto valid = check_name(name);
    if (valid.is_err()) return Result<std::string>::Err(valid.error, valid.kind);

    fs::path p = path_for(name);
    if (!fs::is_regular_file(p)) {
        return Result<std::string>::Err("Credentials not found for account: " + name,
                                        ErrorKind::NotFound);
    }
    return read_file(p);
}

Result<void> CredentialVault::store(const std::string& name, const std::string& blob) {
    auto valid = check_name(name);
    if (valid.is_err()) return valid;

    auto dir_ok = ensure_dir();
    if (dir_ok.is_err()) return dir_ok;

    auto r = atomic_write(path_for(name), blob, CREDENTIAL_FILE_MODE);
    if (r.is_ok()) claspalt_logf("vault: stored '{}'", name);
    return r;
}

Result<void> CredentialVault::remove(const std::string& name) {
    auto valid = check_name(name);
    if (valid.is_err()) return valid;

    std::error_code ec;
    bool removed = fs::remove(path_for(name), ec);
    if (ec) {
        return Result<void>::Err("Cannot delete " + path_for(name).string() + ": " + ec.message());
    }
    if (!removed) {
        return Result<void>::Err("Credentials not found for account: " + name, ErrorKind::NotFound);
    }
    claspalt_logf("vault: removed '{}'", name);
    return Result<void>::Ok();
}

bool CredentialVault::contains(const std::string& name) const {
    return is_valid_account_name(name) && fs::is_regular_file(path_for(name));
}

std::vector<std::string> CredentialVault::list() const {
    std::vector<std::string> names;

    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) return names;

    for (const auto& entry : fs::directory_iterator(dir_, ec)) {
        if (!entry.is_regular_file()) continue;
        const auto& p = entry.path();
        if (p.extension() != CREDENTIAL_EXT) continue;

        std::string name = p.stem().string();
        if (is_valid_account_name(name)) names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}
