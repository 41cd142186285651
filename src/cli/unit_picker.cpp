// unit_picker.cpp - FTXUI radio list used by `select` without arguments.

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "cli/tui_editor.hpp"
#include "ftxui/component/component.hpp"
#include "ftxui/component/component_options.hpp"
#include "ftxui/component/screen_interactive.hpp"
#include "ftxui/dom/elements.hpp"

using namespace ftxui;

namespace tb {

namespace {

class UnitPicker : public TuiEditor {
public:
    UnitPicker(ScreenInteractive& screen, const std::vector<PickerEntry>& entries, int initial)
        : TuiEditor(screen), entries_(entries), selected_(initial), focused_(initial) {
        for (const auto& e : entries_) names_.push_back(e.name);
    }

    void Run() override {
        RadioboxOption option;
        option.focused_entry = &focused_;
        auto radio = Radiobox(&names_, &selected_, option);

        auto component = Renderer(radio, [&] {
            const auto& desc = entries_[focused_].description;
            return vbox({
                       text("Choose a tool:") | bold,
                       separator(),
                       radio->Render() | vscroll_indicator | frame | size(HEIGHT, LESS_THAN, 16),
                       separator(),
                       desc.empty() ? text("(no description)") | dim : paragraph(desc),
                       separator(),
                       text("Up/Down: move   Enter: select   Esc/q: cancel") | dim,
                   }) |
                   border;
        });
        component |= CatchEvent([&](Event event) {
            if (event == Event::Return) {
                chosen_ = names_[focused_];
                screen_.Exit();
                return true;
            }
            if (event == Event::Escape || event == Event::Character('q')) {
                screen_.Exit();
                return true;
            }
            return false;
        });
        screen_.Loop(component);
    }

    const std::optional<std::string>& chosen() const { return chosen_; }

private:
    const std::vector<PickerEntry>& entries_;
    std::vector<std::string> names_;
    int selected_ = 0;
    int focused_ = 0;
    std::optional<std::string> chosen_;
};

}  // namespace

std::optional<std::string> run_unit_picker(const std::vector<PickerEntry>& entries,
                                           const std::string& current_selection) {
    if (entries.empty()) return std::nullopt;
    auto it = std::find_if(entries.begin(), entries.end(),
                           [&](const PickerEntry& e) { return e.name == current_selection; });
    int initial = it == entries.end() ? 0 : static_cast<int>(it - entries.begin());

    auto screen = ScreenInteractive::TerminalOutput();
    UnitPicker picker(screen, entries, initial);
    picker.Run();
    return picker.chosen();
}

} // namespace tb
