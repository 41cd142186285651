#include <gtest/gtest.h>

#include "kernel/unit_metadata.hpp"

namespace {

TEST(UnitMetadata, DerivesTitleCaseNameFromStem) {
    EXPECT_EQ(tb::derive_display_name("code_app_5"), "Code App 5");
    EXPECT_EQ(tb::derive_display_name("code1"), "Code1");
    EXPECT_EQ(tb::derive_display_name("code3_directory_listing"), "Code3 Directory Listing");
    EXPECT_EQ(tb::derive_display_name("codeHTTP_client"), "Codehttp Client");
    EXPECT_EQ(tb::derive_display_name("code2x"), "Code2X");
}

TEST(UnitMetadata, StemDropsSuffixOnly) {
    EXPECT_EQ(tb::candidate_stem("code_app_5.so", ".so"), "code_app_5");
    EXPECT_EQ(tb::candidate_stem("code1.tar.so", ".so"), "code1.tar");
}

TEST(UnitMetadata, NumericIdIsFirstDigitRunAfterPrefix) {
    EXPECT_EQ(tb::parse_numeric_id("code10.so", "code"), 10);
    EXPECT_EQ(tb::parse_numeric_id("code_app_5.so", "code"), 5);
    EXPECT_EQ(tb::parse_numeric_id("code2_v3.so", "code"), 2);
    EXPECT_EQ(tb::parse_numeric_id("code_tool.so", "code"), tb::kUnnumberedUnitId);
    EXPECT_EQ(tb::parse_numeric_id("code99999999999999999999999.so", "code"), tb::kUnnumberedUnitId);
}

TEST(UnitMetadata, DefaultsApplyWhenManifestIsSilent) {
    tb::UnitManifest manifest;
    manifest.run = [] {};
    tb::DiscoveryOptions options;
    options.suffix = ".so";

    auto meta = tb::extract_metadata(manifest, "code_app_5.so", "/opt/units/code_app_5.so", options);
    EXPECT_EQ(meta.display_name, "Code App 5");
    EXPECT_EQ(meta.description, "");
    EXPECT_EQ(meta.order, tb::kDefaultUnitOrder);
    EXPECT_EQ(meta.numeric_id, 5);
    EXPECT_EQ(meta.file, "code_app_5.so");
    EXPECT_EQ(meta.source_path, "/opt/units/code_app_5.so");
}

TEST(UnitMetadata, ManifestOverridesDefaults) {
    tb::UnitManifest manifest;
    manifest.name = "Disk Usage";
    manifest.description = "Shows free space";
    manifest.order = 3;
    manifest.run = [] {};
    tb::DiscoveryOptions options;
    options.suffix = ".so";

    auto meta = tb::extract_metadata(manifest, "code7_disk.so", "code7_disk.so", options);
    EXPECT_EQ(meta.display_name, "Disk Usage");
    EXPECT_EQ(meta.description, "Shows free space");
    EXPECT_EQ(meta.order, 3);
    EXPECT_EQ(meta.numeric_id, 7);
}

} // namespace
