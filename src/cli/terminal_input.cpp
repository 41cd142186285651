#include "cli/terminal_input.hpp"

#ifdef _WIN32
// Windows implementation
#include <conio.h>

namespace tb {

void TerminalInput::SetRaw() {
    if (!interactive_) return;
    DWORD new_mode = original_mode_;
    new_mode &= ~(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT | ENABLE_PROCESSED_INPUT);
    SetConsoleMode(h_in_, new_mode);
}

void TerminalInput::Restore() {
    if (interactive_) SetConsoleMode(h_in_, original_mode_);
}

TerminalInput::TerminalInput() {
    h_in_ = GetStdHandle(STD_INPUT_HANDLE);
    interactive_ = h_in_ != INVALID_HANDLE_VALUE && GetConsoleMode(h_in_, &original_mode_);
    SetRaw();
}

TerminalInput::~TerminalInput() {
    Restore();
}

int TerminalInput::GetChar() {
    int ch = _getch();
    if (ch == 0 || ch == 224) { // Extended key: second byte is the scan code
        switch (_getch()) {
            case 72: return UP;
            case 80: return DOWN;
            case 75: return LEFT;
            case 77: return RIGHT;
            case 71: return HOME;
            case 79: return END;
            case 83: return DEL;
            default: return UNKNOWN;
        }
    }
    switch (ch) {
        case 3:  return CTRL_C;
        case 4:  return CTRL_D;
        case 12: return CTRL_L;
        case 8:  return BACKSPACE;
        case 9:  return TAB;
        case 13: return ENTER;
        case 27: return ESC;
        default: return ch;
    }
}

} // namespace tb

#else
// POSIX implementation
#include <unistd.h>

namespace tb {

void TerminalInput::SetRaw() {
    if (!interactive_) return;
    struct termios raw = original_termios_;
    raw.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
    raw.c_oflag &= ~(OPOST);
    raw.c_cflag |= (CS8);
    raw.c_lflag &= ~(ECHO | ICANON | IEXTEN | ISIG);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

void TerminalInput::Restore() {
    if (interactive_) tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_termios_);
}

TerminalInput::TerminalInput() {
    interactive_ = isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &original_termios_) != -1;
    SetRaw();
}

TerminalInput::~TerminalInput() {
    Restore();
}

int TerminalInput::GetChar() {
    char c;
    if (read(STDIN_FILENO, &c, 1) != 1) return CTRL_D; // EOF ends the shell

    switch (c) {
        case 1:  return HOME;   // Ctrl+A
        case 3:  return CTRL_C;
        case 4:  return CTRL_D;
        case 5:  return END;    // Ctrl+E
        case 12: return CTRL_L;
        case 8:
        case 127: return BACKSPACE;
        case '\t': return TAB;
        case '\n':
        case '\r': return ENTER;
        default: break;
    }
    if (c != '\x1b') return c;

    // Escape sequences: ESC [ A..D, ESC [ H/F, ESC [ 1~ / 3~ / 4~, ESC O H/F
    char seq[3];
    if (read(STDIN_FILENO, &seq[0], 1) != 1) return ESC;
    if (read(STDIN_FILENO, &seq[1], 1) != 1) return UNKNOWN;
    if (seq[0] == 'O') {
        if (seq[1] == 'H') return HOME;
        if (seq[1] == 'F') return END;
        return UNKNOWN;
    }
    if (seq[0] != '[') return UNKNOWN;
    if (seq[1] >= '0' && seq[1] <= '9') {
        if (read(STDIN_FILENO, &seq[2], 1) != 1 || seq[2] != '~') return UNKNOWN;
        switch (seq[1]) {
            case '1': case '7': return HOME;
            case '4': case '8': return END;
            case '3': return DEL;
            default: return UNKNOWN;
        }
    }
    switch (seq[1]) {
        case 'A': return UP;
        case 'B': return DOWN;
        case 'C': return RIGHT;
        case 'D': return LEFT;
        case 'H': return HOME;
        case 'F': return END;
        default: return UNKNOWN;
    }
}

} // namespace tb

#endif
