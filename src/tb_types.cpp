#include "tb_types.hpp"
#include "kernel/unit_result.hpp"

namespace tb {

const char* to_string(UnitErrc code) {
    switch (code) {
        case UnitErrc::NotFound:              return "NotFound";
        case UnitErrc::Io:                    return "Io";
        case UnitErrc::LoadFailed:            return "LoadFailed";
        case UnitErrc::MissingEntryPoint:     return "MissingEntryPoint";
        case UnitErrc::EntryPointNotCallable: return "EntryPointNotCallable";
        case UnitErrc::InvalidConfig:         return "InvalidConfig";
        case UnitErrc::Unknown:               break;
    }
    return "Unknown";
}

const char* load_error_label(UnitErrc code) {
    switch (code) {
        case UnitErrc::MissingEntryPoint:     return "missing entry point";
        case UnitErrc::EntryPointNotCallable: return "not callable";
        default:                              return "load failed";
    }
}

} // namespace tb
