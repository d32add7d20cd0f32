#include "account_manager_ui.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <algorithm>
#include <fmt/format.h>

static const char* CLEAR_SCREEN = "\033[2J\033[H";

// ── State transitions ────────────────────────────────────────────

UiState reload_accounts(UiState state, std::vector<std::string> accounts) {
    state.accounts = std::move(accounts);
    state.selected.assign(state.accounts.size(), false);

    int count = static_cast<int>(state.accounts.size());
    if (count == 0) {
        state.cursor = 0;
    } else {
        state.cursor = std::clamp(state.cursor, 0, count - 1);
    }
    return state;
}

UiTransition handle_key(UiState state, Key key) {
    state.message.clear();
    int count = static_cast<int>(state.accounts.size());

    switch (key) {
        case Key::Up:
            if (count > 0 && state.cursor > 0) state.cursor--;
            break;

        case Key::Down:
            if (count > 0 && state.cursor < count - 1) state.cursor++;
            break;

        case Key::Space:
            if (count > 0) {
                state.selected[state.cursor] = !state.selected[state.cursor];
            }
            break;

        case Key::Add:
            return {std::move(state), UiMode::Adding};

        case Key::Delete:
            if (!selected_accounts(state).empty()) {
                return {std::move(state), UiMode::ConfirmingDelete};
            }
            if (count > 0) state.message = "No accounts selected";
            break;

        case Key::Quit:
        case Key::End:
            return {UiState{}, UiMode::Quit};

        case Key::Other:
            break;
    }
    return {std::move(state), UiMode::Listing};
}

std::vector<std::string> selected_accounts(const UiState& state) {
    std::vector<std::string> names;
    for (size_t i = 0; i < state.accounts.size() && i < state.selected.size(); i++) {
        if (state.selected[i]) names.push_back(state.accounts[i]);
    }
    return names;
}

bool selection_includes_active(const UiState& state) {
    if (state.active_account.empty()) return false;
    auto names = selected_accounts(state);
    return std::find(names.begin(), names.end(), state.active_account) != names.end();
}

// ── Rendering ────────────────────────────────────────────────────

std::string render(const UiState& state) {
    std::string out = CLEAR_SCREEN;

    out += theme::double_rule();
    out += theme::bold("       CLASPALT - Account Management") + "\n";
    out += theme::double_rule();
    out += "\n";

    if (state.accounts.empty()) {
        out += "  (No saved accounts)\n";
    } else {
        for (size_t i = 0; i < state.accounts.size(); i++) {
            bool at_cursor = static_cast<int>(i) == state.cursor;
            bool is_selected = i < state.selected.size() && state.selected[i];

            std::string row = fmt::format("{}{} {}. {}",
                                          at_cursor ? "> " : "  ",
                                          is_selected ? "[x]" : "[ ]",
                                          i + 1, state.accounts[i]);
            out += at_cursor ? theme::bold(row) : row;
            if (state.accounts[i] == state.active_account) {
                out += theme::green(" (active)");
            }
            out += "\n";
        }
    }
    out += "\n";

    if (!state.message.empty()) {
        out += state.message + "\n\n";
    }

    out += theme::rule();
    out += "  [A]dd   [D]elete selected   [Q]uit\n";
    out += "  Space: select/deselect\n";
    out += "  \xe2\x86\x91/\xe2\x86\x93: navigate\n";  // ↑/↓
    out += theme::rule();
    return out;
}

// ── AccountManagerUI ─────────────────────────────────────────────

AccountManagerUI::AccountManagerUI(CredentialVault& vault, AccountProvisioner& provisioner,
                                   Prompter& prompter, KeySource& keys,
                                   std::string active_account)
    : vault_(vault), provisioner_(provisioner), prompter_(prompter),
      keys_(keys), active_account_(std::move(active_account)) {}

Result<void> AccountManagerUI::run() {
    if (!keys_.interactive()) {
        return Result<void>::Err("Edit mode requires an interactive terminal",
                                 ErrorKind::Environment);
    }

    auto dir_ok = vault_.ensure_dir();
    if (dir_ok.is_err()) return dir_ok;

    UiState state;
    state.active_account = active_account_;
    state = reload_accounts(std::move(state), vault_.list());

    auto& out = prompter_.out();
    while (true) {
        out << render(state);
        out.flush();

        auto t = handle_key(std::move(state), keys_.next_key());
        state = std::move(t.state);

        switch (t.next) {
            case UiMode::Listing:
                break;

            case UiMode::Adding: {
                out << CLEAR_SCREEN;
                auto r = add_account(std::move(state));
                if (r.is_err()) return Result<void>::Err(r.error, r.kind);
                state = std::move(r.value);
                break;
            }

            case UiMode::ConfirmingDelete: {
                auto r = confirm_delete(std::move(state));
                if (r.is_err()) return Result<void>::Err(r.error, r.kind);
                state = std::move(r.value);
                break;
            }

            case UiMode::Quit:
                out << CLEAR_SCREEN;
                out.flush();
                return Result<void>::Ok();
        }
    }
}

Result<UiState> AccountManagerUI::add_account(UiState state) {
    auto created = provisioner_.create_interactive();
    if (created.is_err()) {
        // Closing the name prompt just abandons the add.
        if (created.kind == ErrorKind::Environment) {
            state.message = "Add cancelled";
            return Result<UiState>::Ok(std::move(state));
        }
        return Result<UiState>::Err(created.error, created.kind);
    }

    state = reload_accounts(std::move(state), vault_.list());
    state.message = "Account '" + created.value + "' added";
    return Result<UiState>::Ok(std::move(state));
}

Result<UiState> AccountManagerUI::confirm_delete(UiState state) {
    auto names = selected_accounts(state);
    auto& out = prompter_.out();

    if (selection_includes_active(state)) {
        out << "\n"
            << theme::warn("WARNING: You are about to delete the active account in this project.")
            << "  You will need to select another account the next time you use claspalt.\n";
    }

    out << "\n";
    auto answer = prompter_.read_line(
        fmt::format("Are you sure you want to delete {} {}? (y/N): ",
                    names.size(), plural(names.size(), "account")));
    if (!answer || (*answer != "y" && *answer != "Y")) {
        return Result<UiState>::Ok(std::move(state));
    }

    for (const auto& name : names) {
        auto r = vault_.remove(name);
        if (r.is_err() && r.kind != ErrorKind::NotFound) {
            return Result<UiState>::Err(r.error, r.kind);
        }
    }
    claspalt_logf("deleted {} account(s) from the manager", names.size());

    state = reload_accounts(std::move(state), vault_.list());
    state.message = "Accounts deleted";
    return Result<UiState>::Ok(std::move(state));
}
