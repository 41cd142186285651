#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "kernel/registry_cache.hpp"

namespace {

tb::UnitRegistry one_unit_registry() {
    tb::UnitRegistry registry;
    tb::Unit unit;
    unit.run = [] {};
    unit.meta.display_name = "Only";
    registry.insert(std::move(unit));
    registry.finalize(tb::OrderingPolicy::NumericId);
    return registry;
}

TEST(RegistryCache, BuildsOnceAcrossRepeatedReads) {
    int builds = 0;
    tb::RegistryCache cache([&] {
        ++builds;
        return one_unit_registry();
    });
    EXPECT_FALSE(cache.ready());

    const tb::UnitRegistry* first = &cache.get();
    for (int i = 0; i < 10; ++i) EXPECT_EQ(&cache.get(), first);
    EXPECT_EQ(builds, 1);
    EXPECT_EQ(cache.build_count(), 1);
    EXPECT_TRUE(cache.ready());
}

TEST(RegistryCache, ConcurrentFirstReadsShareOneBuild) {
    std::atomic<int> builds{0};
    tb::RegistryCache cache([&] {
        builds.fetch_add(1);
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return one_unit_registry();
    });

    std::atomic<bool> go{false};
    std::vector<const tb::UnitRegistry*> seen(8, nullptr);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&, i] {
            while (!go.load()) std::this_thread::yield();
            seen[i] = &cache.get();
        });
    }
    go.store(true);
    for (auto& t : threads) t.join();

    EXPECT_EQ(builds.load(), 1);
    for (const auto* r : seen) EXPECT_EQ(r, seen.front());
    EXPECT_EQ(seen.front()->size(), 1u);
}

TEST(RegistryCache, FailedBuildIsRetriedOnNextRead) {
    int attempts = 0;
    tb::RegistryCache cache([&]() -> tb::UnitRegistry {
        if (++attempts == 1) throw tb::UnitError(tb::UnitErrc::Io, "directory offline");
        return one_unit_registry();
    });

    EXPECT_THROW(cache.get(), tb::UnitError);
    EXPECT_FALSE(cache.ready());
    EXPECT_EQ(cache.get().size(), 1u);
    EXPECT_EQ(attempts, 2);
    EXPECT_EQ(cache.build_count(), 2);
}

} // namespace
