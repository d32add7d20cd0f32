#include "platform.hpp"
#include <cstdlib>
#include <sstream>
#include <unistd.h>
#include <pwd.h>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home);

    struct passwd* pw = getpwuid(getuid());
    if (pw && pw->pw_dir) return fs::path(pw->pw_dir);
    return temp_dir();
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

static bool is_executable_file(const fs::path& p) {
    struct stat st;
    if (stat(p.c_str(), &st) != 0) return false;
    return S_ISREG(st.st_mode) && access(p.c_str(), X_OK) == 0;
}

std::optional<fs::path> find_in_path(const std::string& program) {
    if (program.empty()) return std::nullopt;

    if (program.find('/') != std::string::npos) {
        if (is_executable_file(program)) return fs::path(program);
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env) return std::nullopt;

    std::istringstream iss(path_env);
    std::string dir;
    while (std::getline(iss, dir, ':')) {
        fs::path candidate = (dir.empty() ? fs::path(".") : fs::path(dir)) / program;
        if (is_executable_file(candidate)) return candidate;
    }
    return std::nullopt;
}

bool stdin_is_tty() {
    return isatty(STDIN_FILENO) == 1;
}

} // namespace platform
