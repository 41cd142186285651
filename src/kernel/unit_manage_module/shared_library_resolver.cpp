// Resolution of unit candidates from shared libraries
#include "kernel/unit_loader.hpp"

#include <string>

#ifdef _WIN32
  #include <windows.h>
#else
  #include <dlfcn.h>
#endif

namespace tb {

using RegisterFunc = void (*)(UnitManifest&);

ResolvedUnit SharedLibraryResolver::resolve(const fs::path& candidate_path) {
    #ifdef _WIN32
    HMODULE handle = LoadLibraryW(candidate_path.wstring().c_str());
    if (!handle) {
        throw UnitError(UnitErrc::LoadFailed, "LoadLibrary failed. Code: " + std::to_string(GetLastError()));
    }
    std::shared_ptr<void> library(handle, [](void* h) { FreeLibrary(static_cast<HMODULE>(h)); });
    RegisterFunc register_func = reinterpret_cast<RegisterFunc>(GetProcAddress(handle, kUnitRegisterSymbol));
    if (!register_func) {
        throw UnitError(UnitErrc::LoadFailed, std::string("Cannot find '") + kUnitRegisterSymbol + "' export");
    }
    #else
    // RTLD_NOW so that unresolved symbols in the unit's own dependencies fail
    // here instead of in the middle of run().
    void* handle = dlopen(candidate_path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        const char* e = dlerror();
        throw UnitError(UnitErrc::LoadFailed, e ? e : "dlopen failed");
    }
    std::shared_ptr<void> library(handle, [](void* h) { dlclose(h); });
    dlerror();
    RegisterFunc register_func;
    *(void**)(&register_func) = dlsym(handle, kUnitRegisterSymbol);
    const char* dlsym_error = dlerror();
    if (dlsym_error || !register_func) {
        throw UnitError(UnitErrc::LoadFailed, std::string("Cannot find '") + kUnitRegisterSymbol + "' export: " +
                                                  (dlsym_error ? dlsym_error : "null symbol"));
    }
    #endif

    ResolvedUnit resolved;
    resolved.library = library;
    // Exceptions thrown by the unit are rethrown as UnitError while the library
    // is still mapped: their type may be defined inside it.
    try {
        register_func(resolved.manifest);
    } catch (const std::exception& e) {
        throw UnitError(UnitErrc::LoadFailed, e.what());
    } catch (...) {
        throw UnitError(UnitErrc::LoadFailed, "non-standard exception thrown during registration");
    }
    return resolved;
}

} // namespace tb
