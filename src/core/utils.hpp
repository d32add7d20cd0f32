#pragma once

#include <string>

// Identity names: letters, digits, hyphen and underscore, at least one char.
bool is_valid_account_name(const std::string& name);

// Expand a leading "~/" (or a bare "~") to the home directory.
std::string expand_home(const std::string& path);

// "account" / "accounts"
std::string plural(size_t count, const std::string& word);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
