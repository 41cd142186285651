// Toolbench kernel: loaded unit and its display metadata
#pragma once

#include <memory>
#include <string>

#include "tb_types.hpp"
#include "unit_api.hpp"

namespace tb {

struct UnitMetadata {
    std::string display_name;
    std::string description;
    int order = kDefaultUnitOrder;
    long long numeric_id = kUnnumberedUnitId;
    std::string file;         // candidate file name, e.g. "code10_orders.so"
    std::string source_path;  // absolute path of the candidate
};

// A validated unit. `library` is declared before `run` so that the entry
// point (whose code may live in the library) is destroyed first.
struct Unit {
    std::shared_ptr<void> library;
    RunFunc run;
    UnitMetadata meta;

    const std::string& name() const { return meta.display_name; }
};

} // namespace tb
