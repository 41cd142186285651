// Toolbench kernel: discovery settings shared by scanner, loader and registry
#pragma once

#include <string>

#include "kernel/unit_ordering.hpp"
#include "tb_types.hpp"

namespace tb {

struct DiscoveryOptions {
    fs::path unit_dir = "build/units";
    std::string prefix = kDefaultUnitPrefix;
    std::string suffix = default_unit_suffix();
    OrderingPolicy ordering = OrderingPolicy::NumericId;
};

} // namespace tb
