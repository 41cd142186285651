#include <gtest/gtest.h>

#include <fstream>

#include "cli_config.hpp"

namespace {

class CliConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = tb::fs::temp_directory_path() / "tb_cli_config";
        tb::fs::remove_all(dir_);
        tb::fs::create_directories(dir_);
    }
    void TearDown() override { tb::fs::remove_all(dir_); }

    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    tb::fs::path dir_;
};

TEST_F(CliConfigTest, SavedConfigLoadsBack) {
    CliConfig written;
    written.unit_dir = "/srv/tools";
    written.unit_prefix = "tool";
    written.unit_suffix = ".plugin";
    written.ordering_policy = "priority";
    written.show_load_errors = true;
    written.unit_path_mode = "absolute_path";
    written.history_size = 25;
    ASSERT_TRUE(write_config_to_file(written, path("saved.yaml")));

    CliConfig loaded;
    load_or_create_config(path("saved.yaml"), loaded);
    EXPECT_EQ(loaded.unit_dir, "/srv/tools");
    EXPECT_EQ(loaded.unit_prefix, "tool");
    EXPECT_EQ(loaded.unit_suffix, ".plugin");
    EXPECT_EQ(loaded.ordering_policy, "priority");
    EXPECT_TRUE(loaded.show_load_errors);
    EXPECT_EQ(loaded.unit_path_mode, "absolute_path");
    EXPECT_EQ(loaded.history_size, 25);
    EXPECT_FALSE(loaded.loaded_config_path.empty());

    auto options = to_discovery_options(loaded);
    EXPECT_EQ(options.unit_dir, tb::fs::path("/srv/tools"));
    EXPECT_EQ(options.prefix, "tool");
    EXPECT_EQ(options.suffix, ".plugin");
    EXPECT_EQ(options.ordering, tb::OrderingPolicy::Priority);
}

TEST_F(CliConfigTest, UnknownOrderingPolicyKeepsDefault) {
    std::ofstream(path("bad_policy.yaml")) << "ordering_policy: alphabetical\nunit_dir: units\n";
    CliConfig config;
    load_or_create_config(path("bad_policy.yaml"), config);
    EXPECT_EQ(config.ordering_policy, "numeric_id");
    EXPECT_EQ(config.unit_dir, "units");
    EXPECT_EQ(to_discovery_options(config).ordering, tb::OrderingPolicy::NumericId);
}

TEST_F(CliConfigTest, UnparsableFileLeavesDefaults) {
    std::ofstream(path("broken.yaml")) << "unit_dir: [unterminated\n";
    CliConfig config;
    load_or_create_config(path("broken.yaml"), config);
    EXPECT_EQ(config.unit_dir, "build/units");
    EXPECT_EQ(config.unit_prefix, tb::kDefaultUnitPrefix);
}

TEST_F(CliConfigTest, MissingCustomFileIsNotCreated) {
    CliConfig config;
    load_or_create_config(path("absent.yaml"), config);
    EXPECT_FALSE(tb::fs::exists(path("absent.yaml")));
    EXPECT_TRUE(config.loaded_config_path.empty());
}

} // namespace
