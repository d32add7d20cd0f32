#pragma once

#include <string>
#include <core/types.hpp>
#include <core/credential_vault.hpp>
#include <cli/prompter.hpp>
#include "login_provider.hpp"

// Creates new identities: validates the name, runs the login flow and
// commits the resulting blob to the vault. Nothing is written to the vault
// unless the login succeeded.
class AccountProvisioner {
public:
    AccountProvisioner(CredentialVault& vault, LoginProvider& login, Prompter& prompter);

    // Allow-list check plus duplicate check against the vault.
    Result<void> validate(const std::string& name) const;

    // Validate `name`, then provision it.
    Result<std::string> create(const std::string& name);

    // Prompt for a name until a valid, unused one is given, then provision
    // it. Returns Environment error if input runs out.
    Result<std::string> create_interactive();

    // Log in and store the blob under `name`. No duplicate check, so it
    // can also recreate an identity whose file went missing.
    Result<std::string> provision(const std::string& name);

private:
    CredentialVault& vault_;
    LoginProvider& login_;
    Prompter& prompter_;
};
