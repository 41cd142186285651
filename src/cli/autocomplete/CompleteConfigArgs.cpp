#include "cli/cli_autocompleter.hpp"

namespace tb {

void CliAutocompleter::CompleteConfigArgs(const std::string& prefix, std::vector<std::string>& options) const {
    static const char* const kArgs[] = {"save", "show"};
    for (const char* arg : kArgs) {
        if (std::string(arg).rfind(prefix, 0) == 0) options.emplace_back(arg);
    }
}

} // namespace tb
