#include "bootstrap.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <cli/theme.hpp>

Bootstrap::Bootstrap(ProjectConfig& config, MigrationEngine& migration, AccountRegistry& registry,
                     AccountProvisioner& provisioner, AccountSwitcher& switcher, Prompter& prompter)
    : config_(config), migration_(migration), registry_(registry),
      provisioner_(provisioner), switcher_(switcher), prompter_(prompter) {}

Result<std::string> Bootstrap::select_and_persist() {
    auto account = registry_.prompt_selection();
    if (account.is_err()) return account;

    auto w = config_.write(KEY_ACCOUNT, account.value);
    if (w.is_err()) return Result<std::string>::Err(w.error, w.kind);
    return account;
}

Result<std::string> Bootstrap::resolve_account() {
    const std::string config_name = config_.path().filename().string();

    if (config_.exists()) {
        auto account = config_.read(KEY_ACCOUNT);
        if (account && !account->empty()) {
            return Result<std::string>::Ok(*account);
        }
        prompter_.out() << "\n"
                        << theme::warn("The file " + config_name + " exists but has no account configured.");
        return select_and_persist();
    }

    if (migration_.needed()) {
        auto migrated = migration_.run();
        if (migrated.is_err()) return migrated;

        auto account = config_.read(KEY_ACCOUNT);
        if (!account || account->empty()) {
            return Result<std::string>::Err("Migration did not record an account in " + config_name);
        }
        return Result<std::string>::Ok(*account);
    }

    prompter_.out() << "\n" << theme::info("No project configuration found.");
    auto account = select_and_persist();
    if (account.is_err()) return account;

    prompter_.out() << "\n" << theme::ok("Configuration saved to " + config_name);
    return account;
}

Result<std::string> Bootstrap::activate(const std::string& name) {
    std::string account = name;

    while (true) {
        auto r = switcher_.activate(account);
        if (r.is_ok()) return Result<std::string>::Ok(account);
        if (r.kind != ErrorKind::NotFound && r.kind != ErrorKind::Validation) {
            return Result<std::string>::Err(r.error, r.kind);
        }

        claspalt_logf("activate '{}': {}", account, r.error);
        auto& out = prompter_.out();
        out << "\n" << theme::warn("Credentials not found for account: " + account) << "\n";

        // An unusable name in claspConfig.txt can only be replaced, not created.
        bool creatable = r.kind == ErrorKind::NotFound;
        std::string choice = "2";
        if (creatable) {
            out << "What would you like to do?\n";
            out << "  1) Create the account '" << account << "' now\n";
            out << "  2) Select another account\n\n";

            auto line = prompter_.read_line("Selection [1/2]: ");
            if (!line) {
                return Result<std::string>::Err("No selection made (input closed)",
                                                ErrorKind::Environment);
            }
            choice = *line;
            trim(choice);
        }

        if (choice == "1") {
            auto created = provisioner_.provision(account);
            if (created.is_err()) return created;
            continue;
        }

        auto replacement = select_and_persist();
        if (replacement.is_err()) return replacement;
        account = replacement.value;
    }
}

Result<std::string> Bootstrap::run() {
    auto account = resolve_account();
    if (account.is_err()) return account;
    return activate(account.value);
}
