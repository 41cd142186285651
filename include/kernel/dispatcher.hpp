// Toolbench kernel: invoking the selected unit
#pragma once

#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "kernel/unit_registry.hpp"

namespace tb {

enum class DispatchStatus { Ok, NoUnits, UnknownSelection, Failed };

TOOLBENCH_API const char* to_string(DispatchStatus status);

struct DispatchFailure {
    std::string kind;                // type of the exception, "unknown" if not a std::exception
    std::string message;
    std::vector<std::string> trace;  // nested exceptions outermost first, then unit context
};

struct DispatchReport {
    DispatchStatus status = DispatchStatus::Ok;
    std::string unit;                // display name of the invoked unit
    std::optional<DispatchFailure> failure;
    std::string guidance;            // NoUnits / UnknownSelection / remediation hint on failure
    double elapsed_ms = 0.0;

    bool ok() const { return status == DispatchStatus::Ok; }
};

// Invokes exactly one unit per call. Whatever the unit throws stays inside
// dispatch(); the registry is never modified, so a failing unit can be
// dispatched again on the next cycle.
class TOOLBENCH_API Dispatcher {
public:
    Dispatcher() = default;
    Dispatcher(std::string prefix, std::string suffix)
        : prefix_(std::move(prefix)), suffix_(std::move(suffix)) {}

    DispatchReport dispatch(const UnitRegistry& registry, const std::string& selection) const;

    // How to add units; shown when nothing was discovered.
    std::string no_units_guidance() const;
    static const char* remediation_hint();

private:
    std::string prefix_ = kDefaultUnitPrefix;
    std::string suffix_ = default_unit_suffix();
};

// Demangled dynamic type of `e`.
TOOLBENCH_API std::string exception_kind(const std::exception& e);

} // namespace tb
