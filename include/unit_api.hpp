// FILE: include/unit_api.hpp
#pragma once

#include <functional>
#include <optional>
#include <string>

namespace tb {

using RunFunc = std::function<void()>;

/**
 * @brief What a unit declares about itself at load time.
 *
 * Every field is optional. The host applies the documented defaults:
 *  - name:        derived from the file name ("code_app_5" -> "Code App 5")
 *  - description: empty
 *  - order:       999
 *
 * `run` is the one required field. Leaving it unset is reported as a missing
 * entry point; setting it to an empty function is reported as an entry point
 * that is not callable. Either way the unit is not registered.
 */
struct UnitManifest {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<int> order;
    std::optional<RunFunc> run;
};

} // namespace tb

/**
 * @brief The function signature that every Toolbench unit must implement and
 * export.
 *
 * When the host loads a unit (a .so, .dylib or .dll file whose name follows
 * the discovery convention), it looks up a function named
 * "register_toolbench_unit" and calls it once with an empty manifest for the
 * unit to fill in. An exception thrown from here is reported as a load
 * failure for this unit only.
 *
 * Use extern "C" to prevent C++ name mangling, which ensures that the host
 * can find the function by its exact name.
 */
#ifdef _WIN32
#define UNIT_API __declspec(dllexport)
#else
#define UNIT_API __attribute__((visibility("default")))
#endif

extern "C" UNIT_API void register_toolbench_unit(tb::UnitManifest& manifest);
