// Toolbench kernel: build-once holder for the unit registry
#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>

#include "kernel/unit_registry.hpp"

namespace tb {

// Runs the discovery pipeline lazily, at most once for the lifetime of the
// cache, and hands out the same registry afterwards. Concurrent first callers
// block until the single build has finished.
//
// A build that throws leaves the cache empty and rethrows to the caller that
// triggered it; the next get() starts a new build.
class TOOLBENCH_API RegistryCache {
public:
    using Builder = std::function<UnitRegistry()>;

    explicit RegistryCache(Builder builder) : builder_(std::move(builder)) {}
    RegistryCache(const RegistryCache&) = delete;
    RegistryCache& operator=(const RegistryCache&) = delete;

    const UnitRegistry& get();

    bool ready() const { return ready_.load(std::memory_order_acquire); }
    // Number of builds started so far (1 after a successful first access).
    int build_count() const { return builds_.load(); }

private:
    Builder builder_;
    std::mutex mutex_;
    std::unique_ptr<const UnitRegistry> registry_;
    std::atomic<bool> ready_{false};
    std::atomic<int> builds_{0};
};

} // namespace tb
