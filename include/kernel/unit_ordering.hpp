// Toolbench kernel: display ordering of loaded units
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "kernel/unit.hpp"

namespace tb {

enum class OrderingPolicy {
    // (order, display_name)
    Priority,
    // (numeric_id, order, display_name); the id taken from the file name
    // dominates the declared order.
    NumericId,
};

TOOLBENCH_API const char* to_string(OrderingPolicy policy);
// Accepts "priority" and "numeric_id".
TOOLBENCH_API std::optional<OrderingPolicy> parse_ordering_policy(const std::string& text);

// Strict weak ordering used by order_units(). Display names are unique in a
// registry, so the result is a total order there.
TOOLBENCH_API bool unit_precedes(const UnitMetadata& a, const UnitMetadata& b, OrderingPolicy policy);

TOOLBENCH_API void order_units(std::vector<Unit>& units, OrderingPolicy policy);

} // namespace tb
