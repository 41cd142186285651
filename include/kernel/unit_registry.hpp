// Toolbench kernel: ordered registry of loaded units
#pragma once

#include <map>
#include <string>
#include <vector>

#include "kernel/discovery_options.hpp"
#include "kernel/unit.hpp"
#include "kernel/unit_result.hpp"

namespace tb {

class UnitResolver;

// Display name -> Unit, in display order, plus every load error seen while
// building it. Built once per host lifetime and only read afterwards.
class TOOLBENCH_API UnitRegistry {
public:
    // Inserts `unit` under its display name. A unit already registered under
    // the same name is replaced (last write wins). Returns true on replace.
    bool insert(Unit unit);
    void add_error(UnitLoadError error);
    // Sorts the units with `policy`. Call once after all inserts.
    void finalize(OrderingPolicy policy);

    const std::vector<Unit>& units() const { return units_; }
    const std::vector<UnitLoadError>& errors() const { return errors_; }
    const Unit* find(const std::string& display_name) const;
    // Position of `display_name` in display order, or -1.
    int index_of(const std::string& display_name) const;
    std::vector<std::string> names() const;

    bool empty() const { return units_.empty(); }
    size_t size() const { return units_.size(); }
    OrderingPolicy ordering() const { return ordering_; }

private:
    void reindex();

    std::vector<Unit> units_;
    std::map<std::string, size_t> index_;
    std::vector<UnitLoadError> errors_;
    OrderingPolicy ordering_ = OrderingPolicy::NumericId;
};

// Moves the loader's output into a finalized registry.
TOOLBENCH_API UnitRegistry build_registry(UnitLoadResult result, OrderingPolicy policy);

// The whole pipeline: scan options.unit_dir, load, extract, order.
// Throws UnitError(UnitErrc::Io) when the directory cannot be listed.
TOOLBENCH_API UnitRegistry discover_units(const DiscoveryOptions& options, UnitResolver& resolver);

} // namespace tb
