// FILE: include/cli/terminal_input.hpp
#pragma once

#ifdef _WIN32
#include <windows.h>
#else
#include <termios.h>
#endif

namespace tb {

// Special key codes returned by GetChar
enum Key {
    // Printable keys are returned as their char value
    UP = 1000,
    DOWN,
    LEFT,
    RIGHT,
    HOME,
    END,
    BACKSPACE,
    ENTER,
    TAB,
    DEL,
    ESC,
    CTRL_C,
    CTRL_D,
    CTRL_L,
    UNKNOWN
};

// Puts stdin in raw mode for the shell's line editor and restores the
// original mode on destruction. Restore()/SetRaw() bracket anything that
// needs a cooked terminal (unit runs, the picker).
class TerminalInput {
public:
    TerminalInput();
    ~TerminalInput();
    TerminalInput(const TerminalInput&) = delete;
    TerminalInput& operator=(const TerminalInput&) = delete;

    int GetChar();

    void Restore();
    void SetRaw();

    // False when stdin is not a terminal (piped input); GetChar still works.
    bool interactive() const { return interactive_; }

private:
    bool interactive_ = false;
#ifdef _WIN32
    HANDLE h_in_;
    DWORD original_mode_;
#else
    struct termios original_termios_;
#endif
};

} // namespace tb
