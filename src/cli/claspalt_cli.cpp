#include "claspalt_cli.hpp"
#include "account_manager_ui.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/settings.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <iostream>
#include <fmt/format.h>
#include <fmt/ranges.h>

// ── Argument parsing ─────────────────────────────────────────────

CliOptions parse_args(const std::vector<std::string>& args) {
    CliOptions opts;
    if (args.empty()) return opts;

    const std::string& first = args[0];
    CliAction flag = CliAction::Activate;
    if (first == "--help" || first == "-h")         flag = CliAction::Help;
    else if (first == "--list" || first == "-l")    flag = CliAction::List;
    else if (first == "--edit" || first == "-e")    flag = CliAction::Edit;

    if (flag == CliAction::Activate) {
        opts.passthrough = args;
        return opts;
    }

    if (args.size() > 1) {
        opts.action = CliAction::Invalid;
        opts.error = "Option " + first + " does not accept additional arguments";
        return opts;
    }
    opts.action = flag;
    return opts;
}

void print_usage(std::ostream& out) {
    auto row = [&](const std::string& cmd, const std::string& desc) {
        out << theme::color::BLUE << fmt::format("  {:<28}", cmd) << theme::color::RESET
            << theme::color::DIM << desc << theme::color::RESET << "\n";
    };

    out << theme::bold(std::string("claspalt ") + CLASPALT_VERSION_STR)
        << " - Multi-account credential manager for clasp\n";

    out << theme::section("USAGE");
    out << "  claspalt [OPTIONS]\n";
    out << "  claspalt [CLASP_COMMANDS...]\n";

    out << theme::section("OPTIONS");
    row("-h, --help", "Show this help");
    row("-l, --list", "List available accounts");
    row("-e, --edit", "Interactive account management");

    out << theme::section("DESCRIPTION");
    out << "  claspalt allows managing multiple Google accounts for clasp.\n";
    out << "  Credentials are stored in ~/.config/claspalt/{account}.json\n";
    out << "  Project configuration is saved in claspConfig.txt\n";

    out << theme::section("EXAMPLES");
    row("claspalt --list", "List all accounts");
    row("claspalt --edit", "Open interactive account manager");
    row("claspalt push", "Run 'clasp push' with the configured account");
    row("claspalt deploy -d \"v1.0\"", "Run 'clasp deploy' with the configured account");

    out << theme::section("FILES");
    row("~/.config/claspalt/", "Credentials directory");
    row("~/.config/claspalt/config.yaml", "Optional settings");
    row("claspConfig.txt", "Project configuration (account and deploymentId)");
    out << "\n";
}

// ── ClaspaltCLI ──────────────────────────────────────────────────

ClaspaltCLI::ClaspaltCLI(Settings settings, std::filesystem::path project_dir)
    : settings_(std::move(settings)), project_dir_(std::move(project_dir)) {
    owned_prompter_ = std::make_unique<TerminalPrompter>();
    owned_keys_ = std::make_unique<TerminalKeySource>();
    owned_login_ = std::make_unique<ClaspLoginProvider>(settings_);
    prompter_ = owned_prompter_.get();
    keys_ = owned_keys_.get();
    login_ = owned_login_.get();
    init_components();
}

ClaspaltCLI::ClaspaltCLI(Settings settings, std::filesystem::path project_dir,
                         Prompter& prompter, KeySource& keys, LoginProvider& login)
    : settings_(std::move(settings)), project_dir_(std::move(project_dir)),
      prompter_(&prompter), keys_(&keys), login_(&login) {
    init_components();
}

void ClaspaltCLI::init_components() {
    vault_ = std::make_unique<CredentialVault>(settings_.credentials_dir);
    config_ = std::make_unique<ProjectConfig>(get_project_config_path(settings_, project_dir_));
    provisioner_ = std::make_unique<AccountProvisioner>(*vault_, *login_, *prompter_);
    registry_ = std::make_unique<AccountRegistry>(*vault_, *provisioner_, *prompter_);
    switcher_ = std::make_unique<AccountSwitcher>(*vault_, settings_.active_credentials);
    migration_ = std::make_unique<MigrationEngine>(get_legacy_config_path(settings_, project_dir_),
                                                   *config_, *registry_, *prompter_);
    bootstrap_ = std::make_unique<Bootstrap>(*config_, *migration_, *registry_,
                                             *provisioner_, *switcher_, *prompter_);
}

int ClaspaltCLI::report(const std::string& error) {
    claspalt_log("error: " + error);
    prompter_->err() << theme::fail(error);
    return 1;
}

int ClaspaltCLI::run(const std::vector<std::string>& args) {
    auto opts = parse_args(args);

    switch (opts.action) {
        case CliAction::Help:
            print_usage(prompter_->out());
            return 0;
        case CliAction::List:
            return run_list();
        case CliAction::Edit:
            return run_edit();
        case CliAction::Invalid:
            return report(opts.error);
        case CliAction::Activate:
            break;
    }
    return run_activate(opts.passthrough);
}

int ClaspaltCLI::run_list() {
    std::string active = config_->read(KEY_ACCOUNT).value_or("");
    registry_->print_list(prompter_->out(), active);
    return 0;
}

int ClaspaltCLI::run_edit() {
    std::string active = config_->read(KEY_ACCOUNT).value_or("");
    AccountManagerUI ui(*vault_, *provisioner_, *prompter_, *keys_, active);
    auto r = ui.run();
    if (r.is_err()) return report(r.error);
    return 0;
}

int ClaspaltCLI::run_activate(const std::vector<std::string>& tool_args) {
    // Environment checks come before anything touches the filesystem.
    if (!platform::find_in_path(settings_.tool)) {
        return report(settings_.tool + " is not installed. Install it with: npm install -g @google/clasp");
    }

    auto dir_ok = vault_->ensure_dir();
    if (dir_ok.is_err()) return report(dir_ok.error);

    auto account = bootstrap_->run();
    if (account.is_err()) return report(account.error);

    if (tool_args.empty()) {
        prompter_->out() << "\n" << theme::ok("Active account: " + account.value)
                         << theme::step("Use 'claspalt <command>' to run clasp commands");
        return 0;
    }

    prompter_->out().flush();
    claspalt_logf("exec: {} {}", settings_.tool, fmt::join(tool_args, " "));
    int code = platform::run(settings_.tool, tool_args);
    claspalt_logf("exec: exit={}", code);
    if (code < 0) {
        return report("Failed to start " + settings_.tool);
    }
    return code;
}
