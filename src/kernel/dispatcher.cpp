// Toolbench kernel: Dispatcher implementation
#include "kernel/dispatcher.hpp"

#include <chrono>
#include <sstream>
#include <typeinfo>

#if defined(__GNUG__)
  #include <cxxabi.h>
  #include <cstdlib>
#endif

namespace tb {

namespace {

std::string demangle(const char* name) {
#if defined(__GNUG__)
    int status = 0;
    char* demangled = abi::__cxa_demangle(name, nullptr, nullptr, &status);
    if (status == 0 && demangled) {
        std::string out(demangled);
        std::free(demangled);
        return out;
    }
    std::free(demangled);
#endif
    return name;
}

// One frame per level of a std::nested_exception chain, outermost first.
void collect_nested(const std::exception& e, std::vector<std::string>& trace) {
    trace.push_back(exception_kind(e) + ": " + e.what());
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception& inner) {
        collect_nested(inner, trace);
    } catch (...) {
        trace.push_back("unknown: non-standard nested exception");
    }
}

}  // namespace

const char* to_string(DispatchStatus status) {
    switch (status) {
        case DispatchStatus::Ok:               return "ok";
        case DispatchStatus::NoUnits:          return "no-units";
        case DispatchStatus::UnknownSelection: return "unknown-selection";
        case DispatchStatus::Failed:           return "failed";
    }
    return "failed";
}

std::string exception_kind(const std::exception& e) {
    return demangle(typeid(e).name());
}

const char* Dispatcher::remediation_hint() {
    return "Tip: check the unit's code or contact the unit developer.";
}

std::string Dispatcher::no_units_guidance() const {
    std::ostringstream os;
    os << "No tool units found.\n\n"
       << "To add tools:\n"
       << "  1. Build a shared library named '" << prefix_ << "<name>" << suffix_ << "' (e.g. '"
       << prefix_ << "_my_tool" << suffix_ << "') into the unit directory.\n"
       << "  2. Export 'extern \"C\" void " << kUnitRegisterSymbol << "(tb::UnitManifest&)' from it\n"
       << "     and set manifest.run to the tool's entry point.\n"
       << "  3. Optionally set metadata on the manifest:\n"
       << "       name        - custom display name\n"
       << "       description - brief description\n"
       << "       order       - sort priority (lower = higher in list, default " << kDefaultUnitOrder << ")\n\n"
       << "Example:\n"
       << "  #include \"unit_api.hpp\"\n"
       << "  extern \"C\" UNIT_API void " << kUnitRegisterSymbol << "(tb::UnitManifest& m) {\n"
       << "      m.name = \"Example Tool\";\n"
       << "      m.description = \"A sample tool\";\n"
       << "      m.order = 1;\n"
       << "      m.run = [] { std::cout << \"Hello from Example Tool!\\n\"; };\n"
       << "  }\n";
    return os.str();
}

DispatchReport Dispatcher::dispatch(const UnitRegistry& registry, const std::string& selection) const {
    DispatchReport report;
    report.unit = selection;

    if (registry.empty()) {
        report.status = DispatchStatus::NoUnits;
        report.guidance = no_units_guidance();
        return report;
    }

    const Unit* unit = registry.find(selection);
    if (!unit) {
        report.status = DispatchStatus::UnknownSelection;
        report.guidance = "No unit named '" + selection + "'. Use 'list' to see the available units.";
        return report;
    }

    auto context = [&] {
        return "in unit '" + unit->name() + "' (" + unit->meta.source_path + ")";
    };

    const auto start = std::chrono::steady_clock::now();
    try {
        unit->run();
        report.status = DispatchStatus::Ok;
    } catch (const std::exception& e) {
        DispatchFailure failure;
        failure.kind = exception_kind(e);
        failure.message = e.what();
        collect_nested(e, failure.trace);
        failure.trace.push_back(context());
        report.status = DispatchStatus::Failed;
        report.failure = std::move(failure);
        report.guidance = remediation_hint();
    } catch (...) {
        DispatchFailure failure;
        failure.kind = "unknown";
        failure.message = "non-standard exception";
        failure.trace.push_back("unknown: non-standard exception");
        failure.trace.push_back(context());
        report.status = DispatchStatus::Failed;
        report.failure = std::move(failure);
        report.guidance = remediation_hint();
    }
    report.elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    return report;
}

} // namespace tb
