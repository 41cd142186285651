#include <gtest/gtest.h>

#include <fstream>
#include <memory>
#include <sstream>

#include "cli/cli_autocompleter.hpp"
#include "cli/cli_history.hpp"
#include "cli/process_command.hpp"
#include "cli/report_printer.hpp"
#include "fake_resolver.hpp"
#include "kernel/interaction.hpp"

namespace {

using tb::test::FakeResolver;
using tb::test::named;

// A kernel over a temp directory whose candidates resolve in-process.
class ShellTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = tb::fs::temp_directory_path() /
               ("tb_shell_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        tb::fs::remove_all(dir_);
        tb::fs::create_directories(dir_);

        auto resolver = std::make_unique<FakeResolver>();
        add(*resolver, "code1_sys.so", named("System Info", 1));
        add(*resolver, "code2_sync.so", named("Sync Folders", 2));
        add(*resolver, "code3_disk.so", [this](tb::UnitManifest& m) {
            m.name = "Disk Usage";
            m.run = [this] { ++disk_runs_; };
        });
        add(*resolver, "code4_bad.so", [](tb::UnitManifest& m) { m.name = "Bad"; });

        kernel_ = std::make_unique<tb::Kernel>(tb::test::test_options(dir_), std::move(resolver));
        svc_ = std::make_unique<tb::InteractionService>(*kernel_);
    }
    void TearDown() override {
        svc_.reset();
        kernel_.reset();
        tb::fs::remove_all(dir_);
    }

    void add(FakeResolver& resolver, const std::string& file, FakeResolver::Registration reg) {
        std::ofstream(dir_ / file) << "x";
        resolver.add(file, std::move(reg));
    }

    tb::fs::path dir_;
    int disk_runs_ = 0;
    std::unique_ptr<tb::Kernel> kernel_;
    std::unique_ptr<tb::InteractionService> svc_;
};

TEST_F(ShellTest, CompletesCommandsByPrefix) {
    tb::CliAutocompleter completer(*svc_);
    auto result = completer.Complete("sel", 3);
    EXPECT_EQ(result.new_line, "select ");
    EXPECT_EQ(result.new_cursor_pos, 7);

    auto ambiguous = completer.Complete("e", 1);
    EXPECT_EQ(ambiguous.options, (std::vector<std::string>{"errors", "exit"}));
    EXPECT_EQ(ambiguous.new_line, "e");
}

TEST_F(ShellTest, CompletesMultiWordUnitNames) {
    tb::CliAutocompleter completer(*svc_);
    auto result = completer.Complete("run Sy", 6);
    EXPECT_EQ(result.options, (std::vector<std::string>{"System Info", "Sync Folders"}));
    EXPECT_EQ(result.new_line, "run Sy");

    auto unique = completer.Complete("run System I", 12);
    EXPECT_EQ(unique.new_line, "run System Info");
    EXPECT_EQ(unique.new_cursor_pos, 15);
    EXPECT_EQ(unique.replace_start, 4);
}

TEST_F(ShellTest, RunCommandDispatchesAndUpdatesSelection) {
    CliConfig config;
    std::string selection = "System Info";

    testing::internal::CaptureStdout();
    EXPECT_TRUE(process_command("run Disk Usage", *svc_, selection, config));
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(disk_runs_, 1);
    EXPECT_EQ(selection, "Disk Usage");
    EXPECT_NE(out.find("Finished 'Disk Usage'"), std::string::npos);
}

TEST_F(ShellTest, SelectByNumberFollowsDisplayOrder) {
    CliConfig config;
    std::string selection;
    testing::internal::CaptureStdout();
    process_command("select 2", *svc_, selection, config);
    testing::internal::GetCapturedStdout();
    EXPECT_EQ(selection, "Sync Folders");
}

TEST_F(ShellTest, ListMarksSelectionAndErrorsUseLabels) {
    std::ostringstream list;
    print_unit_list(svc_->cmd_registry(), "Sync Folders", list);
    EXPECT_NE(list.str().find("  *  2. Sync Folders"), std::string::npos);

    std::ostringstream errors;
    print_load_errors(svc_->cmd_load_errors(), errors);
    EXPECT_NE(errors.str().find("[missing entry point] Unit 'code4_bad'"), std::string::npos);
}

TEST_F(ShellTest, ExitStopsTheShell) {
    CliConfig config;
    std::string selection;
    EXPECT_FALSE(process_command("quit", *svc_, selection, config));
    EXPECT_TRUE(process_command("", *svc_, selection, config));
}

TEST(CliHistory, PrefixNavigationAndSizeLimit) {
    auto file = tb::fs::temp_directory_path() / "tb_history_test";
    tb::fs::remove(file);
    {
        tb::CliHistory history(file);
        history.SetMaxSize(3);
        history.Add("list");
        history.Add("run Hello");
        history.Add("run Hello");
        history.Add("info 1");
        history.Add("run System Info");
        history.Save();
        EXPECT_EQ(history.Entries(),
                  (std::vector<std::string>{"run Hello", "info 1", "run System Info"}));

        EXPECT_EQ(history.GetPrevious("run"), "run System Info");
        EXPECT_EQ(history.GetPrevious("run"), "run Hello");
        EXPECT_EQ(history.GetNext("run"), "run System Info");
        EXPECT_EQ(history.GetNext("run"), "run");
    }
    tb::CliHistory reloaded(file);
    EXPECT_EQ(reloaded.Entries().size(), 3u);
    tb::fs::remove(file);
}

} // namespace
