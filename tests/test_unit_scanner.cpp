#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>

#include "kernel/unit_scanner.hpp"

namespace {

class UnitScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = tb::fs::temp_directory_path() /
               ("tb_scanner_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        tb::fs::remove_all(dir_);
        tb::fs::create_directories(dir_);
    }
    void TearDown() override { tb::fs::remove_all(dir_); }

    void touch(const std::string& name) { std::ofstream(dir_ / name) << "x"; }

    tb::fs::path dir_;
};

TEST_F(UnitScannerTest, MatchesPrefixAndSuffixOnly) {
    touch("code1.so");
    touch("code_app_5.so");
    touch("helper.so");
    touch("code2.so.bak");
    touch("mycode3.so");
    touch("code4.txt");

    auto names = tb::scan_candidates(dir_, "code", ".so");
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{"code1.so", "code_app_5.so"}));
}

TEST_F(UnitScannerTest, DoesNotEnterSubdirectories) {
    touch("code1.so");
    tb::fs::create_directories(dir_ / "code_nested.so");
    tb::fs::create_directories(dir_ / "sub");
    std::ofstream(dir_ / "sub" / "code9.so") << "x";

    auto names = tb::scan_candidates(dir_, "code", ".so");
    EXPECT_EQ(names, (std::vector<std::string>{"code1.so"}));
}

TEST_F(UnitScannerTest, EmptyDirectoryYieldsNoCandidates) {
    EXPECT_TRUE(tb::scan_candidates(dir_, "code", ".so").empty());
}

TEST_F(UnitScannerTest, MissingDirectoryThrowsIoError) {
    try {
        tb::scan_candidates(dir_ / "does_not_exist", "code", ".so");
        FAIL() << "expected UnitError";
    } catch (const tb::UnitError& e) {
        EXPECT_EQ(e.code(), tb::UnitErrc::Io);
        EXPECT_NE(std::string(e.what()).find("does_not_exist"), std::string::npos);
    }
}

TEST(CandidatePattern, PrefixAndSuffixMayNotOverlap) {
    EXPECT_TRUE(tb::matches_candidate_pattern("code.so", "code", ".so"));
    EXPECT_FALSE(tb::matches_candidate_pattern("code", "code", ".so"));
    EXPECT_FALSE(tb::matches_candidate_pattern("cod.so", "code", "e.so"));
    EXPECT_TRUE(tb::matches_candidate_pattern("anything.dll", "", ".dll"));
}

} // namespace
