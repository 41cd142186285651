// Built next to the fixture units; its name does not match the discovery pattern.
#include "unit_api.hpp"

extern "C" UNIT_API void register_toolbench_unit(tb::UnitManifest& manifest) {
    manifest.name = "Helper";
    manifest.run = [] {};
}
