// Toolbench kernel: Interaction API between CLI and Kernel
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "kernel/kernel.hpp"
#include "kernel/unit_result.hpp"

namespace tb {

// Minimal interaction facade to decouple frontends from Kernel internals.
class TOOLBENCH_API InteractionService {
public:
    explicit InteractionService(Kernel& kernel) : kernel_(kernel) {}

    // Discovery (runs once; later calls return the cached registry)
    const UnitRegistry& cmd_registry() { return kernel_.registry(); }
    bool cmd_discovered() const { return kernel_.discovered(); }
    const DiscoveryOptions& cmd_discovery_options() const { return kernel_.options(); }

    std::vector<std::string> cmd_unit_names() { return kernel_.registry().names(); }
    const std::vector<UnitLoadError>& cmd_load_errors() { return kernel_.registry().errors(); }

    std::optional<UnitMetadata> cmd_unit_info(const std::string& name) {
        const Unit* unit = kernel_.registry().find(name);
        if (!unit) return std::nullopt;
        return unit->meta;
    }

    // Accepts a display name or a 1-based position in the display list.
    std::optional<std::string> cmd_resolve_selection(const std::string& token);

    // Dispatch
    DispatchReport cmd_dispatch(const std::string& selection) { return kernel_.dispatch(selection); }
    std::string cmd_no_units_guidance() const { return kernel_.dispatcher().no_units_guidance(); }

private:
    Kernel& kernel_;
};

} // namespace tb
