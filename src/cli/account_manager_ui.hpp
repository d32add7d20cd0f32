#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/credential_vault.hpp>
#include <managers/account_provisioner.hpp>
#include "key_input.hpp"
#include "prompter.hpp"

// Interactive account manager (claspalt --edit)
//
// A full-screen list of the vault's accounts driven by single keystrokes:
// arrows move, Space selects, A adds, D deletes the selection, Q quits.
// The state machine itself is pure (handle_key) so it can be tested
// without a terminal; AccountManagerUI performs the side effects.

enum class UiMode {
    Listing,
    Adding,
    ConfirmingDelete,
    Quit,
};

struct UiState {
    std::vector<std::string> accounts;
    std::vector<bool> selected;         // parallel to accounts
    int cursor = 0;
    std::string message;                // shown for one redraw only
    std::string active_account;         // this project's account= value
};

struct UiTransition {
    UiState state;
    UiMode next;
};

// Replace the account list, clearing the selection and clamping the cursor.
UiState reload_accounts(UiState state, std::vector<std::string> accounts);

// Apply one keystroke. Clears the previous message first.
UiTransition handle_key(UiState state, Key key);

std::vector<std::string> selected_accounts(const UiState& state);
bool selection_includes_active(const UiState& state);

// Full screen: clear, header, list, message, legend.
std::string render(const UiState& state);

class AccountManagerUI {
public:
    AccountManagerUI(CredentialVault& vault, AccountProvisioner& provisioner,
                     Prompter& prompter, KeySource& keys, std::string active_account);

    // Runs until Q or end of input. Environment error without a terminal.
    Result<void> run();

private:
    Result<UiState> add_account(UiState state);
    Result<UiState> confirm_delete(UiState state);

    CredentialVault& vault_;
    AccountProvisioner& provisioner_;
    Prompter& prompter_;
    KeySource& keys_;
    std::string active_account_;
};
