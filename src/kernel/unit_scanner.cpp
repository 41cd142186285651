// Toolbench kernel: candidate scanning
#include "kernel/unit_scanner.hpp"

#include <system_error>

namespace tb {

bool matches_candidate_pattern(const std::string& name,
                               const std::string& prefix,
                               const std::string& suffix) {
    if (name.size() < prefix.size() + suffix.size()) return false;
    if (name.compare(0, prefix.size(), prefix) != 0) return false;
    return name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> scan_candidates(const fs::path& base_dir,
                                         const std::string& prefix,
                                         const std::string& suffix) {
    std::error_code ec;
    if (!fs::is_directory(base_dir, ec)) {
        throw UnitError(UnitErrc::Io, "Unit directory not found: '" + base_dir.string() + "'");
    }

    std::vector<std::string> names;
    fs::directory_iterator it(base_dir, ec);
    if (ec) {
        throw UnitError(UnitErrc::Io, "Cannot list unit directory '" + base_dir.string() + "': " + ec.message());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) break;
        std::error_code type_ec;
        if (!it->is_regular_file(type_ec)) continue; // no recursion, no sockets/fifos
        std::string name = it->path().filename().string();
        if (matches_candidate_pattern(name, prefix, suffix)) names.push_back(std::move(name));
    }
    if (ec) {
        throw UnitError(UnitErrc::Io, "Error while listing unit directory '" + base_dir.string() + "': " + ec.message());
    }
    return names;
}

} // namespace tb
