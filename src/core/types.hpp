#pragma once

#include <string>
#include <vector>

// Error categories surfaced to the CLI.
enum class ErrorKind {
    None,
    Validation,     // bad identity name or empty input; retried at the prompt
    NotFound,       // no credential file for a named identity
    ExternalTool,   // clasp login / pass-through command failed
    Environment,    // no terminal, tool missing from PATH, input closed
    Io,             // filesystem failure
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err, ErrorKind kind = ErrorKind::Io) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err, ErrorKind kind = ErrorKind::Io) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Per-user settings (~/.config/claspalt/config.yaml)
struct Settings {
    std::string tool = "clasp";
    std::vector<std::string> login_args = {"login"};
    std::string credentials_dir;                  // vault directory
    std::string active_credentials;               // file clasp reads on every run
    std::string project_config = "claspConfig.txt";
    std::string legacy_config = "deploymentId.txt";
};
