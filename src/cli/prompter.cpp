#include "prompter.hpp"
#include "theme.hpp"
#include <platform/platform.hpp>
#include <cstdio>
#include <cstdlib>
#include <readline/readline.h>

TerminalPrompter::TerminalPrompter() : interactive_(platform::stdin_is_tty()) {}

std::optional<std::string> TerminalPrompter::read_line(const std::string& prompt) {
    std::cout.flush();

    if (interactive_) {
        // Readline uses \001 and \002 to wrap non-printing chars so it can
        // compute the visible prompt width correctly for cursor positioning.
        std::string rl_prompt = "\001" + theme::color::BROWN + "\002" + prompt
                              + "\001" + theme::color::RESET + "\002";
        char* raw = readline(rl_prompt.c_str());
        if (!raw) {
            std::cout << "\n";
            return std::nullopt;  // EOF / Ctrl-D
        }
        std::string line = raw;
        free(raw);
        return line;
    }

    std::cout << prompt;
    std::cout.flush();
    std::string line;
    if (!std::getline(std::cin, line)) return std::nullopt;
    return line;
}

StreamPrompter::StreamPrompter(std::istream& in, std::ostream& out)
    : in_(in), out_(out), err_(out) {}

StreamPrompter::StreamPrompter(std::istream& in, std::ostream& out, std::ostream& err)
    : in_(in), out_(out), err_(err) {}

std::optional<std::string> StreamPrompter::read_line(const std::string& prompt) {
    out_ << prompt;
    out_.flush();
    std::string line;
    if (!std::getline(in_, line)) return std::nullopt;
    return line;
}
