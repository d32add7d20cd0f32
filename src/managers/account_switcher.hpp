#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <core/credential_vault.hpp>

// Copies an identity's blob into the single file the external tool reads.
//
// The active slot is shared by every claspalt invocation on the machine and
// by clasp itself. Writes are atomic (readers never see half a file) but
// two processes activating different accounts at once still race, and the
// last rename wins.
class AccountSwitcher {
public:
    AccountSwitcher(CredentialVault& vault, std::filesystem::path active_slot);

    // NotFound if the identity has no credential file; nothing is touched.
    Result<void> activate(const std::string& name);

    const std::filesystem::path& active_slot() const { return active_slot_; }

private:
    CredentialVault& vault_;
    std::filesystem::path active_slot_;
};
