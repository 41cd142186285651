// Unit loading utilities for Toolbench
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "kernel/discovery_options.hpp"
#include "kernel/unit_result.hpp"
#include "unit_api.hpp"

namespace tb {

// A candidate after resolution, before validation. `library` keeps the code
// behind the manifest's functions mapped; it may be null for units that live
// in the host image.
struct ResolvedUnit {
    std::shared_ptr<void> library;
    UnitManifest manifest;
};

// Turns a candidate file into a manifest. Implementations throw on any
// failure (unreadable library, missing registration symbol, exception in
// the unit's registration code); the loader converts that into a UnitLoadError.
class UnitResolver {
public:
    virtual ~UnitResolver() = default;
    virtual ResolvedUnit resolve(const fs::path& candidate_path) = 0;
};

// Resolves shared libraries with dlopen/LoadLibrary and calls their
// register_toolbench_unit export.
class TOOLBENCH_API SharedLibraryResolver : public UnitResolver {
public:
    ResolvedUnit resolve(const fs::path& candidate_path) override;
};

// Loads every candidate of `candidates` (names relative to options.unit_dir)
// in lexicographic order. One failing candidate never stops the others: it is
// recorded in the result's error list and skipped.
TOOLBENCH_API UnitLoadResult load_units(const std::vector<std::string>& candidates,
                                        UnitResolver& resolver,
                                        const DiscoveryOptions& options);

} // namespace tb
