#include "account_registry.hpp"
#include <core/utils.hpp>
#include <cli/theme.hpp>
#include <ostream>
#include <fmt/format.h>

AccountRegistry::AccountRegistry(CredentialVault& vault, AccountProvisioner& provisioner,
                                 Prompter& prompter)
    : vault_(vault), provisioner_(provisioner), prompter_(prompter) {}

std::vector<std::string> AccountRegistry::accounts() const {
    return vault_.list();
}

Result<std::string> AccountRegistry::prompt_selection() {
    while (true) {
        auto names = accounts();
        auto& out = prompter_.out();

        out << theme::section("Select a Google account:");
        if (names.empty()) {
            out << "  (No saved accounts)\n\n";
        } else {
            for (size_t i = 0; i < names.size(); i++) {
                out << fmt::format("  {}) {}\n", i + 1, names[i]);
            }
            out << "\n";
        }
        out << "  N) Create new account\n\n";

        auto choice = prompter_.read_line("Selection (number or N): ");
        if (!choice) {
            return Result<std::string>::Err("No account selected (input closed)",
                                            ErrorKind::Environment);
        }
        std::string answer = *choice;
        trim(answer);

        if (answer == "N" || answer == "n") {
            return provisioner_.create_interactive();
        }

        bool numeric = !answer.empty() && answer.size() < 10 &&
                       answer.find_first_not_of("0123456789") == std::string::npos;
        if (numeric) {
            size_t n = std::stoul(answer);
            if (n >= 1 && n <= names.size()) {
                return Result<std::string>::Ok(names[n - 1]);
            }
        }
        prompter_.err() << theme::fail("Invalid selection. Try again.");
    }
}

void AccountRegistry::print_list(std::ostream& out, const std::string& active) const {
    auto names = accounts();
    if (names.empty()) {
        out << "No saved accounts.\n";
        out << "Use 'claspalt --edit' to add an account.\n";
        return;
    }
    for (const auto& name : names) {
        out << name;
        if (!active.empty() && name == active) out << " (active)";
        out << "\n";
    }
}
