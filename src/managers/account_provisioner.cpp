#include "account_provisioner.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <cli/theme.hpp>

AccountProvisioner::AccountProvisioner(CredentialVault& vault, LoginProvider& login,
                                       Prompter& prompter)
    : vault_(vault), login_(login), prompter_(prompter) {}

Result<void> AccountProvisioner::validate(const std::string& name) const {
    if (!is_valid_account_name(name)) {
        return Result<void>::Err(
            "Invalid name. Use only letters, numbers, hyphens and underscores.",
            ErrorKind::Validation);
    }
    if (vault_.contains(name)) {
        return Result<void>::Err("An account with that name already exists.",
                                 ErrorKind::Validation);
    }
    return Result<void>::Ok();
}

Result<std::string> AccountProvisioner::create(const std::string& name) {
    auto valid = validate(name);
    if (valid.is_err()) return Result<std::string>::Err(valid.error, valid.kind);
    return provision(name);
}

Result<std::string> AccountProvisioner::create_interactive() {
    while (true) {
        prompter_.out() << "\n";
        auto name = prompter_.read_line(
            "Name for the new account (letters, numbers, hyphens and underscores only): ");
        if (!name) {
            return Result<std::string>::Err("No account name given (input closed)",
                                            ErrorKind::Environment);
        }

        auto valid = validate(*name);
        if (valid.is_err()) {
            prompter_.err() << theme::fail(valid.error);
            continue;
        }
        return provision(*name);
    }
}

Result<std::string> AccountProvisioner::provision(const std::string& name) {
    auto dir_ok = vault_.ensure_dir();
    if (dir_ok.is_err()) return Result<std::string>::Err(dir_ok.error, dir_ok.kind);

    prompter_.out() << "\n"
                    << theme::warn("IMPORTANT: Make sure the active browser is connected "
                                   "to the correct Google account.")
                    << "\n";
    if (!prompter_.read_line("Press Enter when ready to continue...")) {
        return Result<std::string>::Err("Login cancelled (input closed)", ErrorKind::Environment);
    }

    prompter_.out() << "\n" << theme::info("Logging in...");
    prompter_.out().flush();

    auto blob = login_.login();
    if (blob.is_err()) return blob;

    auto stored = vault_.store(name, blob.value);
    if (stored.is_err()) return Result<std::string>::Err(stored.error, stored.kind);

    claspalt_logf("provisioned account '{}'", name);
    prompter_.out() << "\n" << theme::ok("Credentials saved for account: " + name);
    return Result<std::string>::Ok(name);
}
