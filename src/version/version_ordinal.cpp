#include "patchguard/version_ordinal.hpp"

#include <cctype>
#include <vector>

namespace patchguard {

namespace {

// Split string by delimiter, preserving empty parts
std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    size_t pos;
    while ((pos = s.find(delim, start)) != std::string::npos) {
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(s.substr(start));
    return parts;
}

} // namespace

uint16_t VersionOrdinal::segment(int index) const {
    if (index < 0 || index >= VERSION_SEGMENT_COUNT) return 0;
    int shift = 16 * (VERSION_SEGMENT_COUNT - 1 - index);
    return static_cast<uint16_t>((packed_ >> shift) & 0xFFFF);
}

std::string VersionOrdinal::to_string() const {
    return std::to_string(segment(0)) + "." + std::to_string(segment(1)) + "." +
           std::to_string(segment(2)) + "." + std::to_string(segment(3));
}

VersionParseResult encode_version(const std::string& version) {
    VersionParseResult result;

    if (version.empty()) {
        result.ok = true;
        return result;
    }

    auto segments = split(version, '.');
    if (segments.size() > static_cast<size_t>(VERSION_SEGMENT_COUNT)) {
        result.error = "Version " + version + " has " + std::to_string(segments.size()) +
                       " segments; at most 4 are allowed.";
        return result;
    }

    uint64_t packed = 0;
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& segment = segments[i];
        if (segment.empty()) {
            result.error = "Segment index " + std::to_string(i) + " of version " + version +
                           " is empty.";
            return result;
        }

        uint64_t value = 0;
        for (char c : segment) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                result.error = "Segment index " + std::to_string(i) + " of version " + version +
                               " is not a number.";
                return result;
            }
            value = value * 10 + static_cast<uint64_t>(c - '0');
            // Stop accumulating before overflow; anything this large is out of range
            if (value > MAX_VERSION_SEGMENT) break;
        }

        if (value > MAX_VERSION_SEGMENT) {
            result.error = "Segment index " + std::to_string(i) + " of version " + version +
                           " is more than 65535.";
            return result;
        }

        int shift = 16 * (VERSION_SEGMENT_COUNT - 1 - static_cast<int>(i));
        packed |= value << shift;
    }

    result.ok = true;
    result.ordinal = VersionOrdinal(packed);
    return result;
}

Ordering compare(const VersionOrdinal& a, const VersionOrdinal& b) {
    if (a.packed() < b.packed()) return Ordering::Less;
    if (a.packed() > b.packed()) return Ordering::Greater;
    return Ordering::Equal;
}

VersionOrdinal truncate3(const VersionOrdinal& ordinal) {
    return VersionOrdinal(ordinal.packed() & ~static_cast<uint64_t>(0xFFFF));
}

} // namespace patchguard
