// Toolbench kernel: metadata extraction
#include "kernel/unit_metadata.hpp"

#include <cctype>
#include <charconv>

namespace tb {

std::string candidate_stem(const std::string& candidate, const std::string& suffix) {
    if (!suffix.empty() && candidate.size() >= suffix.size() &&
        candidate.compare(candidate.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return candidate.substr(0, candidate.size() - suffix.size());
    }
    return candidate;
}

std::string derive_display_name(const std::string& stem) {
    std::string out;
    out.reserve(stem.size());
    bool word_start = true;
    for (char c : stem) {
        if (c == '_') c = ' ';
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalpha(uc)) {
            out.push_back(static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc)));
            word_start = false;
        } else {
            out.push_back(c);
            word_start = true;
        }
    }
    return out;
}

long long parse_numeric_id(const std::string& candidate, const std::string& prefix) {
    size_t pos = candidate.compare(0, prefix.size(), prefix) == 0 ? prefix.size() : 0;
    while (pos < candidate.size() && !std::isdigit(static_cast<unsigned char>(candidate[pos]))) ++pos;
    if (pos == candidate.size()) return kUnnumberedUnitId;

    size_t end = pos;
    while (end < candidate.size() && std::isdigit(static_cast<unsigned char>(candidate[end]))) ++end;

    long long value = 0;
    auto [ptr, ec] = std::from_chars(candidate.data() + pos, candidate.data() + end, value);
    if (ec != std::errc() || ptr != candidate.data() + end) return kUnnumberedUnitId;
    return value;
}

UnitMetadata extract_metadata(const UnitManifest& manifest,
                              const std::string& candidate,
                              const std::string& source_path,
                              const DiscoveryOptions& options) {
    UnitMetadata meta;
    if (manifest.name && !manifest.name->empty()) {
        meta.display_name = *manifest.name;
    } else {
        meta.display_name = derive_display_name(candidate_stem(candidate, options.suffix));
    }
    meta.description = manifest.description.value_or("");
    meta.order = manifest.order.value_or(kDefaultUnitOrder);
    meta.numeric_id = parse_numeric_id(candidate, options.prefix);
    meta.file = candidate;
    meta.source_path = source_path;
    return meta;
}

} // namespace tb
