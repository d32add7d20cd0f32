#include "key_input.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <iostream>

Key decode_key(char c) {
    switch (c) {
        case ' ':           return Key::Space;
        case 'a': case 'A': return Key::Add;
        case 'd': case 'D': return Key::Delete;
        case 'q': case 'Q': return Key::Quit;
        default:            return Key::Other;
    }
}

Key decode_escape(const std::string& seq) {
    if (seq == "[A") return Key::Up;
    if (seq == "[B") return Key::Down;
    return Key::Other;
}

bool TerminalKeySource::interactive() const {
    return platform::stdin_is_tty();
}

Key TerminalKeySource::next_key() {
    std::cout.flush();
    platform::RawModeGuard guard;

    char c;
    if (!platform::read_byte(c)) return Key::End;
    if (c != '\033') return decode_key(c);

    // Arrow keys arrive as ESC [ A. Give the rest of the sequence a short
    // window so a lone Escape keypress does not block.
    std::string seq;
    char next;
    while (seq.size() < 2 && platform::read_byte(next, ESCAPE_SEQ_TIMEOUT_MS)) {
        seq += next;
    }
    return decode_escape(seq);
}
