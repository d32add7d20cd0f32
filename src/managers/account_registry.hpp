#pragma once

#include <string>
#include <vector>
#include <iosfwd>
#include <core/types.hpp>
#include <core/credential_vault.hpp>
#include <cli/prompter.hpp>
#include "account_provisioner.hpp"

// Enumerates the identities in the vault and lets the operator pick one.
class AccountRegistry {
public:
    AccountRegistry(CredentialVault& vault, AccountProvisioner& provisioner, Prompter& prompter);

    std::vector<std::string> accounts() const;

    // Numbered menu of existing accounts plus "N) Create new account".
    // Loops until a valid choice is made; Environment error on end of input.
    Result<std::string> prompt_selection();

    // Plain listing for --list; `active` gets an " (active)" suffix.
    void print_list(std::ostream& out, const std::string& active) const;

private:
    CredentialVault& vault_;
    AccountProvisioner& provisioner_;
    Prompter& prompter_;
};
