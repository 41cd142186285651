// Toolbench kernel: unit loading and validation
#include "kernel/unit_loader.hpp"

#include <algorithm>
#include <system_error>

#include "kernel/unit_metadata.hpp"

namespace tb {

namespace {

std::string absolute_or_raw(const fs::path& path) {
    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    return ec ? path.string() : abs.lexically_normal().string();
}

}  // namespace

UnitLoadResult load_units(const std::vector<std::string>& candidates,
                          UnitResolver& resolver,
                          const DiscoveryOptions& options) {
    UnitLoadResult result;

    // Directory listings come back in no particular order; sorting here is what
    // makes "later in scan order" well defined for duplicate display names.
    std::vector<std::string> ordered = candidates;
    std::sort(ordered.begin(), ordered.end());

    for (const auto& candidate : ordered) {
        ++result.attempted;
        const std::string stem = candidate_stem(candidate, options.suffix);
        const fs::path path = options.unit_dir / candidate;

        ResolvedUnit resolved;
        try {
            resolved = resolver.resolve(path);
        } catch (const std::exception& e) {
            result.errors.push_back({stem, UnitErrc::LoadFailed,
                                     "Failed to load '" + stem + "': " + e.what()});
            continue;
        } catch (...) {
            result.errors.push_back({stem, UnitErrc::LoadFailed,
                                     "Failed to load '" + stem + "': unknown exception"});
            continue;
        }

        if (!resolved.manifest.run) {
            result.errors.push_back({stem, UnitErrc::MissingEntryPoint,
                                     "Unit '" + stem + "' missing required 'run' entry point"});
            continue;
        }
        if (!*resolved.manifest.run) {
            result.errors.push_back({stem, UnitErrc::EntryPointNotCallable,
                                     "Unit '" + stem + "' has 'run' but it is not callable"});
            continue;
        }

        Unit unit;
        unit.library = std::move(resolved.library);
        unit.run = std::move(*resolved.manifest.run);
        unit.meta = extract_metadata(resolved.manifest, candidate, absolute_or_raw(path), options);
        result.units.push_back(std::move(unit));
        ++result.loaded;
    }
    return result;
}

} // namespace tb
