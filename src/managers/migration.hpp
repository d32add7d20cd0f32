#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>
#include <core/project_config.hpp>
#include <cli/prompter.hpp>
#include "account_registry.hpp"

// One-way conversion of a legacy deploymentId.txt project into
// claspConfig.txt (deploymentId + account). Runs only while the new file
// is absent, so a completed migration is never repeated.
class MigrationEngine {
public:
    MigrationEngine(std::filesystem::path legacy_path, ProjectConfig& config,
                    AccountRegistry& registry, Prompter& prompter);

    bool needed() const;

    // Returns the chosen account.
    Result<std::string> run();

private:
    std::filesystem::path legacy_path_;
    ProjectConfig& config_;
    AccountRegistry& registry_;
    Prompter& prompter_;
};
