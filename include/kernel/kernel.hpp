// Toolbench kernel: discovery + dispatch facade
#pragma once

#include <memory>
#include <string>

#include "kernel/discovery_options.hpp"
#include "kernel/dispatcher.hpp"
#include "kernel/registry_cache.hpp"
#include "kernel/unit_loader.hpp"
#include "kernel/unit_registry.hpp"

namespace tb {

// Owns the unit registry for the lifetime of the host. Discovery runs on the
// first call to registry() (or dispatch()) and never again; restarting the
// host is the only way to pick up new or changed units.
class TOOLBENCH_API Kernel {
public:
    explicit Kernel(DiscoveryOptions options = {});
    Kernel(DiscoveryOptions options, std::unique_ptr<UnitResolver> resolver);

    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // Throws UnitError(UnitErrc::Io) if the unit directory cannot be listed.
    const UnitRegistry& registry() { return cache_.get(); }
    bool discovered() const { return cache_.ready(); }
    int discovery_count() const { return cache_.build_count(); }

    DispatchReport dispatch(const std::string& selection);

    const DiscoveryOptions& options() const { return options_; }
    const Dispatcher& dispatcher() const { return dispatcher_; }

private:
    DiscoveryOptions options_;
    std::unique_ptr<UnitResolver> resolver_;
    Dispatcher dispatcher_;
    RegistryCache cache_;
};

} // namespace tb
