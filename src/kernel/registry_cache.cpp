// Toolbench kernel: RegistryCache implementation
#include "kernel/registry_cache.hpp"

namespace tb {

const UnitRegistry& RegistryCache::get() {
    if (ready_.load(std::memory_order_acquire)) return *registry_;

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ready_.load(std::memory_order_relaxed)) {
        builds_.fetch_add(1);
        registry_ = std::make_unique<const UnitRegistry>(builder_());
        ready_.store(true, std::memory_order_release);
    }
    return *registry_;
}

} // namespace tb
