// Loads the fixture units built from tests/units/ through the real dynamic
// loader.
#include <gtest/gtest.h>

#include <algorithm>

#include "kernel/interaction.hpp"
#include "kernel/kernel.hpp"

#ifndef TOOLBENCH_TEST_UNITS_DIR
#define TOOLBENCH_TEST_UNITS_DIR "test_units"
#endif

namespace {

tb::DiscoveryOptions fixture_options() {
    tb::DiscoveryOptions options;
    options.unit_dir = TOOLBENCH_TEST_UNITS_DIR;
    return options;
}

const tb::UnitLoadError* find_error(const tb::UnitRegistry& registry, const std::string& candidate) {
    const auto& errors = registry.errors();
    auto it = std::find_if(errors.begin(), errors.end(),
                           [&](const tb::UnitLoadError& e) { return e.candidate == candidate; });
    return it == errors.end() ? nullptr : &*it;
}

TEST(SharedLibraryUnits, RegistersValidUnitsInNumericOrder) {
    tb::Kernel kernel(fixture_options());
    const auto& registry = kernel.registry();
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"Greeter", "Failing"}));

    const tb::Unit* greeter = registry.find("Greeter");
    ASSERT_NE(greeter, nullptr);
    EXPECT_EQ(greeter->meta.order, 5);
    EXPECT_EQ(greeter->meta.numeric_id, 1);
    EXPECT_EQ(greeter->meta.description, "Fixture unit that prints one line.");
    EXPECT_TRUE(tb::fs::path(greeter->meta.source_path).is_absolute());
}

TEST(SharedLibraryUnits, ReportsEveryBrokenCandidate) {
    tb::Kernel kernel(fixture_options());
    const auto& registry = kernel.registry();
    ASSERT_EQ(registry.errors().size(), 4u);

    const auto* no_run = find_error(registry, "code3_no_run");
    ASSERT_NE(no_run, nullptr);
    EXPECT_EQ(no_run->code, tb::UnitErrc::MissingEntryPoint);

    const auto* null_run = find_error(registry, "code4_null_run");
    ASSERT_NE(null_run, nullptr);
    EXPECT_EQ(null_run->code, tb::UnitErrc::EntryPointNotCallable);

    const auto* init_throws = find_error(registry, "code5_init_throws");
    ASSERT_NE(init_throws, nullptr);
    EXPECT_EQ(init_throws->code, tb::UnitErrc::LoadFailed);
    EXPECT_EQ(init_throws->message, "Failed to load 'code5_init_throws': missing required resource");

    const auto* no_register = find_error(registry, "code6_no_register");
    ASSERT_NE(no_register, nullptr);
    EXPECT_EQ(no_register->code, tb::UnitErrc::LoadFailed);
    EXPECT_NE(no_register->message.find(tb::kUnitRegisterSymbol), std::string::npos);

    EXPECT_EQ(find_error(registry, "helper"), nullptr);
}

TEST(SharedLibraryUnits, FailingUnitDoesNotAffectOthers) {
    tb::Kernel kernel(fixture_options());
    tb::InteractionService svc(kernel);

    auto failed = svc.cmd_dispatch("Failing");
    ASSERT_EQ(failed.status, tb::DispatchStatus::Failed);
    ASSERT_TRUE(failed.failure.has_value());
    EXPECT_EQ(failed.failure->kind, "fixtures::QuotaExceeded");
    EXPECT_EQ(failed.failure->message, "quota of 3 requests exceeded");

    testing::internal::CaptureStdout();
    auto ok = svc.cmd_dispatch("Greeter");
    std::string out = testing::internal::GetCapturedStdout();
    EXPECT_TRUE(ok.ok());
    EXPECT_NE(out.find("greetings from the fixture"), std::string::npos);
    EXPECT_EQ(kernel.discovery_count(), 1);
}

TEST(SharedLibraryUnits, SelectionResolvesByNameOrPosition) {
    tb::Kernel kernel(fixture_options());
    tb::InteractionService svc(kernel);
    EXPECT_EQ(svc.cmd_resolve_selection("2"), std::optional<std::string>("Failing"));
    EXPECT_EQ(svc.cmd_resolve_selection("Greeter"), std::optional<std::string>("Greeter"));
    EXPECT_FALSE(svc.cmd_resolve_selection("3").has_value());
    EXPECT_FALSE(svc.cmd_resolve_selection("0").has_value());
}

} // namespace
