// Toolbench kernel: ordering policies
#include "kernel/unit_ordering.hpp"

#include <algorithm>
#include <tuple>

namespace tb {

const char* to_string(OrderingPolicy policy) {
    switch (policy) {
        case OrderingPolicy::Priority:  return "priority";
        case OrderingPolicy::NumericId: return "numeric_id";
    }
    return "numeric_id";
}

std::optional<OrderingPolicy> parse_ordering_policy(const std::string& text) {
    if (text == "priority") return OrderingPolicy::Priority;
    if (text == "numeric_id") return OrderingPolicy::NumericId;
    return std::nullopt;
}

bool unit_precedes(const UnitMetadata& a, const UnitMetadata& b, OrderingPolicy policy) {
    if (policy == OrderingPolicy::NumericId) {
        return std::tie(a.numeric_id, a.order, a.display_name) <
               std::tie(b.numeric_id, b.order, b.display_name);
    }
    return std::tie(a.order, a.display_name) < std::tie(b.order, b.display_name);
}

void order_units(std::vector<Unit>& units, OrderingPolicy policy) {
    std::sort(units.begin(), units.end(), [policy](const Unit& a, const Unit& b) {
        return unit_precedes(a.meta, b.meta, policy);
    });
}

} // namespace tb
