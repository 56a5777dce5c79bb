#include <doctest/doctest.h>
#include <patchguard/version_ordinal.hpp>

using patchguard::Ordering;
using patchguard::VersionOrdinal;
using patchguard::compare;
using patchguard::encode_version;
using patchguard::truncate3;

namespace {

VersionOrdinal ordinal(const char* version) {
    auto result = encode_version(version);
    REQUIRE(result.ok);
    return result.ordinal;
}

} // namespace

// ============================================================================
// Encoding Tests
// ============================================================================

TEST_CASE("encode_version packs the first segment most significant") {
    auto v = ordinal("1.2.3.4");
    CHECK(v.packed() == 0x0001000200030004ULL);
    CHECK(v.segment(0) == 1);
    CHECK(v.segment(1) == 2);
    CHECK(v.segment(2) == 3);
    CHECK(v.segment(3) == 4);
    CHECK(v.to_string() == "1.2.3.4");
}

TEST_CASE("encode_version pads missing segments with zero") {
    CHECK(ordinal("1.2") == ordinal("1.2.0.0"));
    CHECK(ordinal("7").to_string() == "7.0.0.0");
}

TEST_CASE("encode_version maps the empty string to the zero ordinal") {
    auto empty = ordinal("");
    CHECK(empty.is_zero());
    CHECK(compare(empty, ordinal("0.0.0.0")) == Ordering::Equal);
    CHECK(compare(empty, ordinal("0.0.0.1")) == Ordering::Less);
}

TEST_CASE("encode_version accepts the segment maximum") {
    auto v = ordinal("65535.65535.65535.65535");
    CHECK(v.packed() == 0xFFFFFFFFFFFFFFFFULL);
}

TEST_CASE("encode_version rejects a segment above 65535") {
    auto result = encode_version("1.65536");
    CHECK_FALSE(result.ok);
    CHECK(result.error == "Segment index 1 of version 1.65536 is more than 65535.");
}

TEST_CASE("encode_version rejects huge segments without overflowing") {
    auto result = encode_version("99999999999999999999999.1");
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("Segment index 0") != std::string::npos);
}

TEST_CASE("encode_version rejects non-numeric segments") {
    auto result = encode_version("1.2.beta.4");
    CHECK_FALSE(result.ok);
    CHECK(result.error == "Segment index 2 of version 1.2.beta.4 is not a number.");

    CHECK_FALSE(encode_version("1.-2").ok);
    CHECK_FALSE(encode_version(" 1.2").ok);
}

TEST_CASE("encode_version rejects empty segments") {
    CHECK_FALSE(encode_version("1..3").ok);
    CHECK_FALSE(encode_version("1.2.").ok);
    CHECK_FALSE(encode_version(".").ok);
}

TEST_CASE("encode_version rejects more than four segments") {
    auto result = encode_version("1.2.3.4.5");
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("5 segments") != std::string::npos);
}

// ============================================================================
// Ordering Tests
// ============================================================================

TEST_CASE("compare agrees with segment-wise numeric comparison") {
    CHECK(compare(ordinal("1.2.3.4"), ordinal("1.2.3.5")) == Ordering::Less);
    CHECK(compare(ordinal("1.10.0.0"), ordinal("1.9.65535.65535")) == Ordering::Greater);
    CHECK(compare(ordinal("2.0"), ordinal("1.65535.65535.65535")) == Ordering::Greater);
    CHECK(compare(ordinal("3.1.4.1"), ordinal("3.1.4.1")) == Ordering::Equal);
    CHECK(compare(ordinal("0.0.1.0"), ordinal("0.0.0.65535")) == Ordering::Greater);
}

TEST_CASE("compare is antisymmetric") {
    const char* versions[] = {"", "0.0.0.1", "1", "1.2", "1.2.3.4", "1.2.3.9", "2.0.0.0", "65535"};
    for (const char* a : versions) {
        for (const char* b : versions) {
            auto ab = compare(ordinal(a), ordinal(b));
            auto ba = compare(ordinal(b), ordinal(a));
            if (ab == Ordering::Less) CHECK(ba == Ordering::Greater);
            if (ab == Ordering::Greater) CHECK(ba == Ordering::Less);
            if (ab == Ordering::Equal) CHECK(ba == Ordering::Equal);
        }
    }
}

TEST_CASE("truncate3 drops only the 4th segment") {
    CHECK(truncate3(ordinal("1.2.3.4")) == ordinal("1.2.3.0"));
    CHECK(truncate3(ordinal("1.2.3.4")) == truncate3(ordinal("1.2.3.9")));
    CHECK(truncate3(ordinal("1.2.3.4")) != truncate3(ordinal("1.2.4.4")));
    CHECK(truncate3(ordinal("1.2")) == ordinal("1.2"));
}

TEST_CASE("ordering_to_string names each ordering") {
    CHECK(std::string(patchguard::ordering_to_string(Ordering::Less)) == "less");
    CHECK(std::string(patchguard::ordering_to_string(Ordering::Equal)) == "equal");
    CHECK(std::string(patchguard::ordering_to_string(Ordering::Greater)) == "greater");
}
