#pragma once

#include <string>
#include <optional>
#include <iostream>

// Line-oriented interaction with the operator. Menus and status text go to
// out(), recoverable input errors to err(). read_line() returns nullopt
// once input is exhausted so retry loops can terminate.
class Prompter {
public:
    virtual ~Prompter() = default;

    virtual std::optional<std::string> read_line(const std::string& prompt) = 0;

    virtual std::ostream& out() = 0;
    virtual std::ostream& err() = 0;
};

// stdin/stdout/stderr. Uses GNU readline for line editing when stdin is a
// terminal, plain std::getline otherwise (pipes, scripts).
class TerminalPrompter : public Prompter {
public:
    TerminalPrompter();

    std::optional<std::string> read_line(const std::string& prompt) override;
    std::ostream& out() override { return std::cout; }
    std::ostream& err() override { return std::cerr; }

private:
    bool interactive_;
};

// Arbitrary streams; used by tests and non-terminal callers.
class StreamPrompter : public Prompter {
public:
    StreamPrompter(std::istream& in, std::ostream& out);
    StreamPrompter(std::istream& in, std::ostream& out, std::ostream& err);

    std::optional<std::string> read_line(const std::string& prompt) override;
    std::ostream& out() override { return out_; }
    std::ostream& err() override { return err_; }

private:
    std::istream& in_;
    std::ostream& out_;
    std::ostream& err_;
};
