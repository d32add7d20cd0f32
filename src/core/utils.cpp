#include "utils.hpp"
#include <platform/platform.hpp>
#include <cctype>

bool is_valid_account_name(const std::string& name) {
    if (name.empty()) return false;
    for (unsigned char c : name) {
        if (!std::isalnum(c) && c != '-' && c != '_') return false;
    }
    return true;
}

std::string expand_home(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

std::string plural(size_t count, const std::string& word) {
    return count == 1 ? word : word + "s";
}
