// FILE: include/cli/tui_editor.hpp
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "ftxui/component/screen_interactive.hpp"

// A base class for our interactive screens to share the screen instance.
class TuiEditor {
public:
    explicit TuiEditor(ftxui::ScreenInteractive& screen) : screen_(screen) {}
    virtual ~TuiEditor() = default;
    virtual void Run() = 0; // Each screen implements its own Run loop.

protected:
    ftxui::ScreenInteractive& screen_;
};

namespace tb {

struct PickerEntry {
    std::string name;
    std::string description;
};

// Radio list of units, highlighted unit's description below it.
// Returns the chosen display name, or nullopt if the user cancelled.
std::optional<std::string> run_unit_picker(const std::vector<PickerEntry>& entries,
                                           const std::string& current_selection);

} // namespace tb
