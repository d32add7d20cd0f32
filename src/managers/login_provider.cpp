#include "login_provider.hpp"
#include <core/atomic_file.hpp>
#include <core/log.hpp>
#include <platform/process.hpp>
#include <filesystem>
#include <fmt/format.h>
#include <fmt/ranges.h>

ClaspLoginProvider::ClaspLoginProvider(const Settings& settings) : settings_(settings) {}

Result<std::string> ClaspLoginProvider::login() {
    claspalt_logf("login: running {} {}", settings_.tool, fmt::join(settings_.login_args, " "));

    int code = platform::run(settings_.tool, settings_.login_args);
    claspalt_logf("login: exit={}", code);

    if (code != 0) {
        return Result<std::string>::Err(
            fmt::format("{} login failed (exit {})", settings_.tool, code),
            ErrorKind::ExternalTool);
    }

    std::filesystem::path creds = settings_.active_credentials;
    if (!std::filesystem::is_regular_file(creds)) {
        return Result<std::string>::Err("Credentials not found in " + creds.string(),
                                        ErrorKind::ExternalTool);
    }
    return read_file(creds);
}
