// Toolbench kernel: metadata extraction from a unit manifest
#pragma once

#include <string>

#include "kernel/discovery_options.hpp"
#include "kernel/unit.hpp"
#include "unit_api.hpp"

namespace tb {

// "code_app_5.so" -> "code_app_5" when `suffix` is ".so".
TOOLBENCH_API std::string candidate_stem(const std::string& candidate, const std::string& suffix);

// Display name used when a unit declares none: underscores become spaces and
// every alphabetic run is capitalized ("code_app_5" -> "Code App 5").
TOOLBENCH_API std::string derive_display_name(const std::string& stem);

// First run of digits after `prefix` in `candidate` ("code10.so" -> 10,
// "code_app_5.so" -> 5). Returns kUnnumberedUnitId when there is none or it
// does not fit.
TOOLBENCH_API long long parse_numeric_id(const std::string& candidate, const std::string& prefix);

// Applies the manifest overrides on top of the defaults. `source_path` is
// recorded as-is.
TOOLBENCH_API UnitMetadata extract_metadata(const UnitManifest& manifest,
                                            const std::string& candidate,
                                            const std::string& source_path,
                                            const DiscoveryOptions& options);

} // namespace tb
