// Toolbench kernel: UnitRegistry implementation
#include "kernel/unit_registry.hpp"

#include <utility>

#include "kernel/unit_loader.hpp"
#include "kernel/unit_scanner.hpp"

namespace tb {

bool UnitRegistry::insert(Unit unit) {
    auto it = index_.find(unit.name());
    if (it == index_.end()) {
        index_.emplace(unit.name(), units_.size());
        units_.push_back(std::move(unit));
        return false;
    }
    // Move the old unit out before overwriting so that it is destroyed as a
    // whole (entry point first, then its library).
    Unit replaced = std::exchange(units_[it->second], std::move(unit));
    return true;
}

void UnitRegistry::add_error(UnitLoadError error) {
    errors_.push_back(std::move(error));
}

void UnitRegistry::finalize(OrderingPolicy policy) {
    ordering_ = policy;
    order_units(units_, policy);
    reindex();
}

void UnitRegistry::reindex() {
    index_.clear();
    for (size_t i = 0; i < units_.size(); ++i) index_[units_[i].name()] = i;
}

const Unit* UnitRegistry::find(const std::string& display_name) const {
    auto it = index_.find(display_name);
    if (it == index_.end()) return nullptr;
    return &units_[it->second];
}

int UnitRegistry::index_of(const std::string& display_name) const {
    auto it = index_.find(display_name);
    return it == index_.end() ? -1 : static_cast<int>(it->second);
}

std::vector<std::string> UnitRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(units_.size());
    for (const auto& u : units_) out.push_back(u.name());
    return out;
}

UnitRegistry build_registry(UnitLoadResult result, OrderingPolicy policy) {
    UnitRegistry registry;
    for (auto& unit : result.units) registry.insert(std::move(unit));
    for (auto& error : result.errors) registry.add_error(std::move(error));
    registry.finalize(policy);
    return registry;
}

UnitRegistry discover_units(const DiscoveryOptions& options, UnitResolver& resolver) {
    auto candidates = scan_candidates(options.unit_dir, options.prefix, options.suffix);
    return build_registry(load_units(candidates, resolver, options), options.ordering);
}

} // namespace tb
