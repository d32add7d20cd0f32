#pragma once

#include <string>

// Keystrokes understood by the account manager.
enum class Key {
    Up,
    Down,
    Space,
    Add,        // a / A
    Delete,     // d / D
    Quit,       // q / Q
    Other,
    End,        // input closed
};

// Map a single byte (not ESC) to a key.
Key decode_key(char c);

// Map the bytes that followed an ESC. "[A" / "[B" are arrows; anything
// else, including nothing at all (a lone Escape), is Other.
Key decode_escape(const std::string& seq);

class KeySource {
public:
    virtual ~KeySource() = default;

    // False when there is no terminal to read keystrokes from.
    virtual bool interactive() const = 0;

    // Block until the next keystroke.
    virtual Key next_key() = 0;
};

// Reads keystrokes from stdin without waiting for Enter. Raw mode is only
// held while a key is being read, so line prompts in between work normally.
class TerminalKeySource : public KeySource {
public:
    bool interactive() const override;
    Key next_key() override;
};
