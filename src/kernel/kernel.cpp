// Toolbench kernel: Kernel implementation
#include "kernel/kernel.hpp"

#include <utility>

namespace tb {

Kernel::Kernel(DiscoveryOptions options)
    : Kernel(std::move(options), std::make_unique<SharedLibraryResolver>()) {}

Kernel::Kernel(DiscoveryOptions options, std::unique_ptr<UnitResolver> resolver)
    : options_(std::move(options)),
      resolver_(std::move(resolver)),
      dispatcher_(options_.prefix, options_.suffix),
      cache_([this] { return discover_units(options_, *resolver_); }) {}

DispatchReport Kernel::dispatch(const std::string& selection) {
    return dispatcher_.dispatch(registry(), selection);
}

} // namespace tb
