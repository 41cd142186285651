#pragma once
#include <string>
#include <vector>

namespace tb { class InteractionService; }

namespace tb {

struct CompletionResult {
    std::vector<std::string> options;
    std::string new_line;
    int new_cursor_pos = 0;
    // Where the completed text starts in new_line
    int replace_start = 0;
};

class CliAutocompleter {
public:
    // Unit names are read from the registry through `svc` on every call.
    explicit CliAutocompleter(tb::InteractionService& svc);

    CompletionResult Complete(const std::string& line, int cursor_pos);

    const std::vector<std::string>& Commands() const { return commands_; }

private:
    std::vector<std::string> Tokenize(const std::string& line) const;
    std::string FindLongestCommonPrefix(const std::vector<std::string>& options) const;

    // Completion providers
    void CompleteCommand(const std::string& prefix, std::vector<std::string>& options) const;
    // `prefix` may contain spaces: display names are multi-word.
    void CompleteUnitName(const std::string& prefix, std::vector<std::string>& options) const;
    void CompleteConfigArgs(const std::string& prefix, std::vector<std::string>& options) const;

    tb::InteractionService& svc_;
    std::vector<std::string> commands_;
};

} // namespace tb
