// Toolbench kernel: InteractionService helpers that need more than a forward
#include "kernel/interaction.hpp"

#include <cctype>

namespace tb {

std::optional<std::string> InteractionService::cmd_resolve_selection(const std::string& token) {
    const auto& registry = kernel_.registry();
    if (token.empty()) return std::nullopt;
    if (registry.find(token)) return token;

    bool all_digits = true;
    for (char c : token) all_digits = all_digits && std::isdigit(static_cast<unsigned char>(c));
    if (all_digits && token.size() < 9) {
        int pos = std::stoi(token);
        if (pos >= 1 && pos <= static_cast<int>(registry.size())) {
            return registry.units()[pos - 1].name();
        }
    }
    return std::nullopt;
}

} // namespace tb
