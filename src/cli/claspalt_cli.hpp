#pragma once

#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include <core/types.hpp>
#include <core/credential_vault.hpp>
#include <core/project_config.hpp>
#include <managers/login_provider.hpp>
#include <managers/account_provisioner.hpp>
#include <managers/account_registry.hpp>
#include <managers/account_switcher.hpp>
#include <managers/migration.hpp>
#include <managers/bootstrap.hpp>
#include "prompter.hpp"
#include "key_input.hpp"

enum class CliAction {
    Activate,   // no flag: activate, then optionally run the tool
    Help,
    List,
    Edit,
    Invalid,
};

struct CliOptions {
    CliAction action = CliAction::Activate;
    std::vector<std::string> passthrough;   // arguments for the external tool
    std::string error;                      // set when action == Invalid
};

// --help/-h, --list/-l and --edit/-e are only recognized as the first
// argument and take no further arguments. Anything else, -v/--version
// included, is handed to the external tool.
CliOptions parse_args(const std::vector<std::string>& args);

void print_usage(std::ostream& out);

class ClaspaltCLI {
public:
    // Terminal-backed: readline prompts, raw keystrokes, real clasp login.
    explicit ClaspaltCLI(Settings settings,
                         std::filesystem::path project_dir = std::filesystem::current_path());

    // Injected collaborators (tests, embedding).
    ClaspaltCLI(Settings settings, std::filesystem::path project_dir,
                Prompter& prompter, KeySource& keys, LoginProvider& login);

    // Returns the process exit code.
    int run(const std::vector<std::string>& args);

    int run_list();
    int run_edit();
    int run_activate(const std::vector<std::string>& tool_args);

private:
    void init_components();
    int report(const std::string& error);

    Settings settings_;
    std::filesystem::path project_dir_;

    std::unique_ptr<Prompter> owned_prompter_;
    std::unique_ptr<KeySource> owned_keys_;
    std::unique_ptr<LoginProvider> owned_login_;

    Prompter* prompter_ = nullptr;
    KeySource* keys_ = nullptr;
    LoginProvider* login_ = nullptr;

    std::unique_ptr<CredentialVault> vault_;
    std::unique_ptr<ProjectConfig> config_;
    std::unique_ptr<AccountProvisioner> provisioner_;
    std::unique_ptr<AccountRegistry> registry_;
    std::unique_ptr<AccountSwitcher> switcher_;
    std::unique_ptr<MigrationEngine> migration_;
    std::unique_ptr<Bootstrap> bootstrap_;
};
