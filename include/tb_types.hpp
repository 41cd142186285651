#pragma once
#include <string>
#include <filesystem>
#include <stdexcept>

namespace tb {
namespace fs = std::filesystem;

#if defined(_WIN32)
    #if defined(TOOLBENCH_LIB_BUILD)
        #define TOOLBENCH_API __declspec(dllexport)
    #else
        #define TOOLBENCH_API __declspec(dllimport)
    #endif
#else // Non-Windows platforms
    #if defined(TOOLBENCH_LIB_BUILD)
        #define TOOLBENCH_API __attribute__((visibility("default")))
    #else
        #define TOOLBENCH_API
    #endif
#endif

// Sort priority of a unit that does not declare one. Undeclared units sort
// after declared ones.
constexpr int kDefaultUnitOrder = 999;
// Numeric id of a unit whose file name carries no digits after the prefix.
constexpr long long kUnnumberedUnitId = 999999;

constexpr const char* kDefaultUnitPrefix = "code";
constexpr const char* kUnitRegisterSymbol = "register_toolbench_unit";

// Shared-library extension of the host platform; the default discovery suffix.
inline std::string default_unit_suffix() {
#if defined(_WIN32)
    return ".dll";
#elif defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

enum class UnitErrc {
    Unknown = 1, NotFound, Io, LoadFailed,
    MissingEntryPoint, EntryPointNotCallable, InvalidConfig,
};

struct TOOLBENCH_API UnitError : public std::runtime_error {
    explicit UnitError(const std::string& what)
        : std::runtime_error(what), code_(UnitErrc::Unknown) {}
    UnitError(UnitErrc code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    UnitErrc code() const noexcept { return code_; }
private:
    UnitErrc code_;
};

TOOLBENCH_API const char* to_string(UnitErrc code);

} // namespace tb
