#include "migration.hpp"
#include <core/atomic_file.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <core/log.hpp>
#include <cli/theme.hpp>
#include <algorithm>
#include <system_error>

MigrationEngine::MigrationEngine(std::filesystem::path legacy_path, ProjectConfig& config,
                                 AccountRegistry& registry, Prompter& prompter)
    : legacy_path_(std::move(legacy_path)), config_(config),
      registry_(registry), prompter_(prompter) {}

bool MigrationEngine::needed() const {
    return std::filesystem::exists(legacy_path_) && !config_.exists();
}

Result<std::string> MigrationEngine::run() {
    auto legacy_name = legacy_path_.filename().string();
    prompter_.out() << "\n" << theme::info("Old " + legacy_name
                                           + " file detected. Migrating to the new format...");

    auto legacy = read_file(legacy_path_);
    if (legacy.is_err()) return legacy;

    std::string deployment_id = legacy.value;
    deployment_id.erase(std::remove(deployment_id.begin(), deployment_id.end(), '\r'),
                        deployment_id.end());
    trim(deployment_id);

    auto account = registry_.prompt_selection();
    if (account.is_err()) return account;

    auto w1 = config_.write(KEY_DEPLOYMENT_ID, deployment_id);
    if (w1.is_err()) return Result<std::string>::Err(w1.error, w1.kind);
    auto w2 = config_.write(KEY_ACCOUNT, account.value);
    if (w2.is_err()) return Result<std::string>::Err(w2.error, w2.kind);

    std::error_code ec;
    std::filesystem::remove(legacy_path_, ec);
    if (ec) {
        return Result<std::string>::Err("Cannot delete " + legacy_path_.string() + ": " + ec.message());
    }

    claspalt_logf("migrated {} -> {} (account '{}')", legacy_path_.string(),
                  config_.path().string(), account.value);

    prompter_.out() << "\n"
                    << theme::ok("Migration completed. New file: " + config_.path().filename().string())
                    << theme::step("Old file deleted: " + legacy_name);
    return account;
}
