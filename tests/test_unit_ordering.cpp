#include <gtest/gtest.h>

#include "kernel/unit_ordering.hpp"

namespace {

tb::Unit make_unit(const std::string& name, int order, long long numeric_id = tb::kUnnumberedUnitId) {
    tb::Unit unit;
    unit.meta.display_name = name;
    unit.meta.order = order;
    unit.meta.numeric_id = numeric_id;
    unit.run = [] {};
    return unit;
}

std::vector<std::pair<std::string, int>> name_order(const std::vector<tb::Unit>& units) {
    std::vector<std::pair<std::string, int>> out;
    for (const auto& u : units) out.emplace_back(u.meta.display_name, u.meta.order);
    return out;
}

TEST(UnitOrdering, PriorityPolicySortsByOrderThenName) {
    std::vector<tb::Unit> units = {make_unit("B", 5, 1), make_unit("A", 1, 2), make_unit("A", 5, 3)};
    tb::order_units(units, tb::OrderingPolicy::Priority);
    EXPECT_EQ(name_order(units),
              (std::vector<std::pair<std::string, int>>{{"A", 1}, {"A", 5}, {"B", 5}}));
}

TEST(UnitOrdering, NumericIdDominatesDeclaredOrder) {
    // code2 declares nothing, code10 declares order 1
    std::vector<tb::Unit> units = {make_unit("Code10", 1, 10), make_unit("Code2", tb::kDefaultUnitOrder, 2)};
    tb::order_units(units, tb::OrderingPolicy::NumericId);
    EXPECT_EQ(units[0].meta.display_name, "Code2");
    EXPECT_EQ(units[1].meta.display_name, "Code10");

    tb::order_units(units, tb::OrderingPolicy::Priority);
    EXPECT_EQ(units[0].meta.display_name, "Code10");
}

TEST(UnitOrdering, UnnumberedUnitsSortLastUnderNumericId) {
    std::vector<tb::Unit> units = {make_unit("Tool", 1), make_unit("Code7", 50, 7)};
    tb::order_units(units, tb::OrderingPolicy::NumericId);
    EXPECT_EQ(units[0].meta.display_name, "Code7");
}

TEST(UnitOrdering, NumericIdTiesFallBackToOrderThenName) {
    std::vector<tb::Unit> units = {make_unit("Zeta", 2, 4), make_unit("Beta", 3, 4), make_unit("Alpha", 2, 4)};
    tb::order_units(units, tb::OrderingPolicy::NumericId);
    EXPECT_EQ(name_order(units),
              (std::vector<std::pair<std::string, int>>{{"Alpha", 2}, {"Zeta", 2}, {"Beta", 3}}));
}

TEST(UnitOrdering, ParsesPolicyNames) {
    EXPECT_EQ(tb::parse_ordering_policy("priority"), tb::OrderingPolicy::Priority);
    EXPECT_EQ(tb::parse_ordering_policy("numeric_id"), tb::OrderingPolicy::NumericId);
    EXPECT_FALSE(tb::parse_ordering_policy("alphabetical").has_value());
    EXPECT_STREQ(tb::to_string(tb::OrderingPolicy::Priority), "priority");
}

} // namespace
