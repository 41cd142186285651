// Minimal unit: only the required entry point, everything else defaulted.
#include <iostream>

#include "unit_api.hpp"

extern "C" UNIT_API void register_toolbench_unit(tb::UnitManifest& manifest) {
    manifest.name = "Hello";
    manifest.description = "Prints a greeting.";
    manifest.order = 1;
    manifest.run = [] { std::cout << "Hello from a Toolbench unit!" << std::endl; };
}
