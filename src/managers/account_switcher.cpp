#include "account_switcher.hpp"
#include <core/atomic_file.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>
#include <system_error>

AccountSwitcher::AccountSwitcher(CredentialVault& vault, std::filesystem::path active_slot)
    : vault_(vault), active_slot_(std::move(active_slot)) {}

Result<void> AccountSwitcher::activate(const std::string& name) {
    auto blob = vault_.fetch(name);
    if (blob.is_err()) return Result<void>::Err(blob.error, blob.kind);

    if (active_slot_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(active_slot_.parent_path(), ec);
        if (ec) {
            return Result<void>::Err("Cannot create " + active_slot_.parent_path().string()
                                     + ": " + ec.message());
        }
    }

    auto r = atomic_write(active_slot_, blob.value, CREDENTIAL_FILE_MODE);
    if (r.is_ok()) claspalt_logf("activated '{}' -> {}", name, active_slot_.string());
    return r;
}
