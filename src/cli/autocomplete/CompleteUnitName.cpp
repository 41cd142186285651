#include "cli/cli_autocompleter.hpp"
#include "kernel/interaction.hpp"

namespace tb {

// Offers display names in display order. Discovery has already run by the
// time the shell accepts input, so this is a cache read.
void CliAutocompleter::CompleteUnitName(const std::string& prefix, std::vector<std::string>& options) const {
    for (const auto& name : svc_.cmd_unit_names()) {
        if (name.rfind(prefix, 0) == 0) options.push_back(name);
    }
}

} // namespace tb
