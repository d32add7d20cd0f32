#pragma once

#include <string>
#include <core/types.hpp>
#include <core/project_config.hpp>
#include <cli/prompter.hpp>
#include "account_registry.hpp"
#include "account_provisioner.hpp"
#include "account_switcher.hpp"
#include "migration.hpp"

// Decides which account a project uses and makes it active.
//
//   claspConfig.txt present   -> its account= (prompt and persist if empty)
//   deploymentId.txt present  -> migrate, then its account=
//   neither                   -> prompt and write a fresh claspConfig.txt
class Bootstrap {
public:
    Bootstrap(ProjectConfig& config, MigrationEngine& migration, AccountRegistry& registry,
              AccountProvisioner& provisioner, AccountSwitcher& switcher, Prompter& prompter);

    Result<std::string> resolve_account();

    // Activate `name`; if its credentials are missing, offer to create it
    // or pick another one. Returns the account that ended up active.
    Result<std::string> activate(const std::string& name);

    // resolve_account() followed by activate()
    Result<std::string> run();

private:
    Result<std::string> select_and_persist();

    ProjectConfig& config_;
    MigrationEngine& migration_;
    AccountRegistry& registry_;
    AccountProvisioner& provisioner_;
    AccountSwitcher& switcher_;
    Prompter& prompter_;
};
