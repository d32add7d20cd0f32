#pragma once

#include <string>
#include <core/types.hpp>

// Performs an interactive login against the external service and returns
// the resulting credential blob. Implementations may block indefinitely
// while the operator completes the browser flow.
class LoginProvider {
public:
    virtual ~LoginProvider() = default;
    virtual Result<std::string> login() = 0;
};

// Runs `<tool> <login_args...>` with the terminal attached, then reads the
// credential file the tool wrote (~/.clasprc.json).
class ClaspLoginProvider : public LoginProvider {
public:
    explicit ClaspLoginProvider(const Settings& settings);

    Result<std::string> login() override;

private:
    const Settings& settings_;
};
