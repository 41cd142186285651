// Candidate scanning for Toolbench units
#pragma once

#include <string>
#include <vector>

#include "tb_types.hpp"

namespace tb {

// Lists the regular files directly inside `base_dir` whose name starts with
// `prefix` and ends with `suffix`. Subdirectories are not entered and the
// returned order is whatever the directory listing produced.
//
// Throws UnitError(UnitErrc::Io) when `base_dir` is missing, is not a
// directory, or cannot be listed.
TOOLBENCH_API std::vector<std::string> scan_candidates(const fs::path& base_dir,
                                                       const std::string& prefix,
                                                       const std::string& suffix);

// True when `name` follows the `<prefix>...<suffix>` convention.
TOOLBENCH_API bool matches_candidate_pattern(const std::string& name,
                                             const std::string& prefix,
                                             const std::string& suffix);

} // namespace tb
