// FILE: src/cli/run_repl.cpp
#include <algorithm>
#include <optional>
#include <iostream>
#include <string>
#include <vector>

#include "cli/run_repl.hpp"
#include "cli/terminal_input.hpp"
#include "cli/cli_history.hpp"
#include "cli/cli_autocompleter.hpp"
#include "cli/process_command.hpp"

namespace {
constexpr const char* kPrompt = "tb> ";
constexpr int kPromptWidth = 4;
}

void run_repl(tb::InteractionService& svc, CliConfig& config, const std::string& initial_selection) {
    std::string selection = initial_selection;

    tb::CliHistory history;
    history.SetMaxSize(config.history_size > 0 ? static_cast<size_t>(config.history_size) : 0);
    tb::CliAutocompleter completer(svc);

    // Tab cycling state: options of the last completion and where they start
    struct CompletionState {
        std::vector<std::string> options;
        int current_index = -1;
        size_t token_start = 0;
        void Reset() { options.clear(); current_index = -1; }
        bool IsActive() const { return current_index != -1; }
    } completion_state;

    std::string line_buffer;
    int cursor_pos = 0;
    // Prefix typed before the first Up/Down; kept until the line is edited
    std::optional<std::string> history_prefix;

    auto redraw_line = [&]() {
        std::cout << "\r\x1B[K" << kPrompt;
        if (completion_state.IsActive()) {
            size_t start = std::min(completion_state.token_start, line_buffer.size());
            size_t mid_len = static_cast<size_t>(cursor_pos) > start ? cursor_pos - start : 0;
            std::cout << line_buffer.substr(0, start)
                      << "\x1B[7m"
                      << line_buffer.substr(start, mid_len)
                      << "\x1B[0m"
                      << line_buffer.substr(start + mid_len);
        } else {
            std::cout << line_buffer;
        }
        std::cout << "\r\x1B[" << (kPromptWidth + cursor_pos) << "C" << std::flush;
    };

    auto clear_line = [&]() {
        line_buffer.clear();
        cursor_pos = 0;
        history.ResetNavigation();
        history_prefix.reset();
    };

    std::cout << "Toolbench shell. Type 'help' for commands.\n";
    if (!selection.empty()) std::cout << "Current selection: '" << selection << "'\n";
    std::cout << "History file: " << history.Path().string() << "\n";
    tb::TerminalInput term_input;
    redraw_line();

    while (true) {
        int key = term_input.GetChar();
        if (key != tb::TAB) {
            completion_state.Reset();
        }
        switch (key) {
            case tb::ENTER: {
                term_input.Restore();
                std::cout << "\r\n";
                if (!line_buffer.empty()) {
                    history.Add(line_buffer);
                    history.Save();
                }
                bool continue_repl = process_command(line_buffer, svc, selection, config);
                term_input.SetRaw();
                if (!continue_repl) {
                    return;
                }
                clear_line();
                redraw_line();
                break;
            }
            case tb::CTRL_C: {
                if (line_buffer.empty()) {
                    std::cout << "\r\n(To exit, type 'exit' or press Ctrl+C again on an empty line)\r\n";
                    redraw_line();
                    key = term_input.GetChar();
                    if (key == tb::CTRL_C) {
                        std::cout << "\r\nExiting." << std::endl;
                        return;
                    }
                }
                clear_line();
                redraw_line();
                break;
            }
            case tb::CTRL_D: {
                if (line_buffer.empty()) {
                    std::cout << "\r\n" << std::flush;
                    return;
                }
                break;
            }
            case tb::CTRL_L: {
                std::cout << "\033[2J\033[1;1H";
                redraw_line();
                break;
            }
            case tb::BACKSPACE: {
                if (cursor_pos > 0) {
                    line_buffer.erase(cursor_pos - 1, 1);
                    cursor_pos--;
                    history_prefix.reset();
                    redraw_line();
                }
                break;
            }
            case tb::DEL: {
                if (cursor_pos < (int)line_buffer.length()) {
                    line_buffer.erase(cursor_pos, 1);
                    history_prefix.reset();
                    redraw_line();
                }
                break;
            }
            case tb::UP:
            case tb::DOWN: {
                if (!history_prefix) history_prefix = line_buffer.substr(0, cursor_pos);
                line_buffer = key == tb::UP ? history.GetPrevious(*history_prefix)
                                            : history.GetNext(*history_prefix);
                cursor_pos = (int)line_buffer.length();
                redraw_line();
                break;
            }
            case tb::LEFT: {
                if (cursor_pos > 0) {
                    cursor_pos--;
                    history_prefix.reset();
                    redraw_line();
                }
                break;
            }
            case tb::RIGHT: {
                if (cursor_pos < (int)line_buffer.length()) {
                    cursor_pos++;
                    history_prefix.reset();
                    redraw_line();
                }
                break;
            }
            case tb::HOME: {
                cursor_pos = 0;
                history_prefix.reset();
                redraw_line();
                break;
            }
            case tb::END: {
                cursor_pos = (int)line_buffer.length();
                history_prefix.reset();
                redraw_line();
                break;
            }
            case tb::TAB: {
                if (completion_state.IsActive()) {
                    completion_state.current_index =
                        (completion_state.current_index + 1) % (int)completion_state.options.size();
                    size_t start = completion_state.token_start;
                    line_buffer.erase(start, cursor_pos - start);
                    const std::string& opt = completion_state.options[completion_state.current_index];
                    line_buffer.insert(start, opt);
                    cursor_pos = (int)(start + opt.size());
                    redraw_line();
                } else {
                    auto result = completer.Complete(line_buffer, cursor_pos);
                    if (result.options.empty()) break;
                    line_buffer = result.new_line;
                    cursor_pos = result.new_cursor_pos;
                    if (result.options.size() > 1) {
                        // Several matches: show them, then Tab cycles through them
                        std::cout << "\r\n";
                        for (const auto& opt : result.options) std::cout << opt << "    ";
                        std::cout << "\r\n";
                        completion_state.options = result.options;
                        completion_state.token_start = result.replace_start;
                        completion_state.current_index = (int)result.options.size() - 1;
                    }
                    redraw_line();
                }
                break;
            }
            case tb::UNKNOWN:
            case tb::ESC:
                break;
            default: {
                if (key >= 32 && key <= 126) {
                    line_buffer.insert(cursor_pos, 1, static_cast<char>(key));
                    cursor_pos++;
                    history.ResetNavigation();
                    history_prefix.reset();
                    redraw_line();
                }
                break;
            }
        }
    }
}
