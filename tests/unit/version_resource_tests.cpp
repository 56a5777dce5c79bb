#include <doctest/doctest.h>
#include <patchguard/platform.hpp>

#include <cstring>
#include <vector>

using namespace patchguard;

namespace {

void put16(std::vector<uint8_t>& buf, size_t offset, uint16_t value) {
    buf[offset] = static_cast<uint8_t>(value & 0xFF);
    buf[offset + 1] = static_cast<uint8_t>(value >> 8);
}

void put32(std::vector<uint8_t>& buf, size_t offset, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        buf[offset + i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

// Minimal image: one .rsrc section holding RT_VERSION -> 1 -> 0x409 -> VS_FIXEDFILEINFO
std::vector<uint8_t> make_pe(uint32_t version_ms, uint32_t version_ls, uint32_t resource_type = 16) {
    std::vector<uint8_t> buf(0x400, 0);

    buf[0] = 'M';
    buf[1] = 'Z';
    put32(buf, 0x3C, 0x40);
    std::memcpy(&buf[0x40], "PE\0\0", 4);
    put16(buf, 0x46, 1);     // NumberOfSections
    put16(buf, 0x54, 0);     // SizeOfOptionalHeader

    // Section table
    std::memcpy(&buf[0x58], ".rsrc", 5);
    put32(buf, 0x58 + 8, 0x200);    // VirtualSize
    put32(buf, 0x58 + 12, 0x1000);  // VirtualAddress
    put32(buf, 0x58 + 16, 0x200);   // SizeOfRawData
    put32(buf, 0x58 + 20, 0x200);   // PointerToRawData

    // Type directory
    put16(buf, 0x200 + 14, 1);
    put32(buf, 0x210, resource_type);
    put32(buf, 0x214, 0x80000018);

    // Name directory
    put16(buf, 0x218 + 14, 1);
    put32(buf, 0x228, 1);
    put32(buf, 0x22C, 0x80000030);

    // Language directory
    put16(buf, 0x230 + 14, 1);
    put32(buf, 0x240, 0x409);
    put32(buf, 0x244, 0x48);

    // Data entry
    put32(buf, 0x248, 0x1060);
    put32(buf, 0x24C, 0x60);

    // VS_FIXEDFILEINFO after the VS_VERSIONINFO header
    put32(buf, 0x288, 0xFEEF04BD);
    put32(buf, 0x288 + 8, version_ms);
    put32(buf, 0x288 + 12, version_ls);
    return buf;
}

} // namespace

TEST_CASE("version resource is read from a PE image") {
    auto result = read_version_resource(make_pe(0x00010002, 0x00030004));
    REQUIRE(result.ok);
    CHECK(result.version == "1.2.3.4");
}

TEST_CASE("version resource segments use the full 16 bits") {
    auto result = read_version_resource(make_pe(0xFFFF0000, 0x00070001));
    REQUIRE(result.ok);
    CHECK(result.version == "65535.0.7.1");
}

TEST_CASE("image without a version resource") {
    auto result = read_version_resource(make_pe(0x00010002, 0x00030004, 3));
    CHECK_FALSE(result.ok);
    CHECK(result.error == "no version resource");
}

TEST_CASE("version resource without the fixed info signature") {
    auto image = make_pe(0x00010002, 0x00030004);
    put32(image, 0x288, 0);
    auto result = read_version_resource(image);
    CHECK_FALSE(result.ok);
    CHECK(result.error == "version resource has no fixed file info");
}

TEST_CASE("non-PE data has no version") {
    std::vector<uint8_t> text(200, 'a');
    auto result = read_version_resource(text);
    CHECK_FALSE(result.ok);
    CHECK(result.error == "not a PE file");

    CHECK_FALSE(read_version_resource(std::vector<uint8_t>{}).ok);
}

TEST_CASE("truncated PE headers are rejected") {
    auto image = make_pe(0x00010002, 0x00030004);
    image.resize(0x50);
    CHECK_FALSE(read_version_resource(image).ok);
}

TEST_CASE("missing file has no version") {
    auto result = read_version_resource(std::string("/nonexistent/core.dll"));
    CHECK_FALSE(result.ok);
}
