#pragma once

/**
 * @file version_ordinal.hpp
 * @brief Four-segment file versions as used by the patch engine
 *
 * Windows Installer compares file versions as four 16-bit segments
 * (MAJOR.MINOR.BUILD.PRIVATE) packed into 64 bits. This header provides:
 * - Encoding of dotted version strings into an ordinal
 * - Total ordering of ordinals
 * - The 3-segment projection used when the installer ignores the 4th segment
 *
 * @example
 * ```cpp
 * #include <patchguard/version_ordinal.hpp>
 *
 * auto current = patchguard::encode_version("1.2.3.9");
 * auto released = patchguard::encode_version("1.2.3.4");
 *
 * if (current.ok && released.ok &&
 *     patchguard::truncate3(current.ordinal) == patchguard::truncate3(released.ordinal)) {
 *     // Only the ignored segment changed
 * }
 * ```
 */

#include <cstdint>
#include <string>

namespace patchguard {

/// Largest value a single version segment may hold
constexpr uint64_t MAX_VERSION_SEGMENT = 65535;

/// Number of segments an ordinal can represent
constexpr int VERSION_SEGMENT_COUNT = 4;

/// Result of comparing two ordinals
enum class Ordering {
    Less,
    Equal,
    Greater
};

inline const char* ordering_to_string(Ordering o) {
    switch (o) {
        case Ordering::Less: return "less";
        case Ordering::Equal: return "equal";
        case Ordering::Greater: return "greater";
        default: return "equal";
    }
}

/**
 * @brief Packed version number, first segment most significant
 *
 * "1.2.3.4" packs to 0x0001'0002'0003'0004. Missing trailing segments are
 * zero, so "1.2" and "1.2.0.0" are the same ordinal.
 */
class VersionOrdinal {
public:
    VersionOrdinal() = default;
    explicit VersionOrdinal(uint64_t packed) : packed_(packed) {}

    uint64_t packed() const { return packed_; }

    /// Segment 0..3, where 0 is MAJOR
    uint16_t segment(int index) const;

    bool is_zero() const { return packed_ == 0; }

    /// Render as "a.b.c.d"
    std::string to_string() const;

    bool operator==(const VersionOrdinal& other) const { return packed_ == other.packed_; }
    bool operator!=(const VersionOrdinal& other) const { return packed_ != other.packed_; }
    bool operator<(const VersionOrdinal& other) const { return packed_ < other.packed_; }
    bool operator>(const VersionOrdinal& other) const { return packed_ > other.packed_; }
    bool operator<=(const VersionOrdinal& other) const { return packed_ <= other.packed_; }
    bool operator>=(const VersionOrdinal& other) const { return packed_ >= other.packed_; }

private:
    uint64_t packed_ = 0;
};

struct VersionParseResult {
    bool ok = false;
    std::string error;
    VersionOrdinal ordinal;
};

/**
 * @brief Encode a dotted version string
 * @param version Up to four dot-separated decimal segments, each <= 65535
 * @return Encoded ordinal, or an error naming the offending segment
 *
 * The empty string encodes to the zero ordinal.
 */
VersionParseResult encode_version(const std::string& version);

/// Total order over ordinals
Ordering compare(const VersionOrdinal& a, const VersionOrdinal& b);

/// Drop the 4th (PRIVATE) segment, which the installer ignores
VersionOrdinal truncate3(const VersionOrdinal& ordinal);

} // namespace patchguard
