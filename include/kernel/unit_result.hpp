// Kernel unit loader result and error reporting structures
#pragma once

#include <string>
#include <vector>

#include "kernel/unit.hpp"
#include "tb_types.hpp"

namespace tb {

// A candidate that could not be turned into a Unit. Never discarded: the
// frontend shows every entry in its error list.
struct UnitLoadError {
  std::string candidate;  // candidate name without the suffix
  UnitErrc code = UnitErrc::Unknown;
  std::string message;
};

struct UnitLoadResult {
  int attempted = 0;
  int loaded = 0;
  std::vector<Unit> units;  // scan order
  std::vector<UnitLoadError> errors;
};

// Short label for the error list ("missing entry point", "not callable",
// "load failed").
TOOLBENCH_API const char* load_error_label(UnitErrc code);

}  // namespace tb
