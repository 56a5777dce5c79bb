#include "patchguard/platform.hpp"

#include <cstring>

namespace patchguard {

namespace {

// ============================================================================
// PE/COFF Layout
// ============================================================================

constexpr uint32_t DOS_LFANEW_OFFSET = 0x3C;
constexpr uint32_t COFF_HEADER_SIZE = 20;
constexpr uint32_t SECTION_HEADER_SIZE = 40;
constexpr uint16_t PE32_MAGIC = 0x10B;
constexpr uint16_t PE32_PLUS_MAGIC = 0x20B;
constexpr uint32_t RESOURCE_DATA_DIRECTORY = 2;
constexpr uint32_t RT_VERSION = 16;
constexpr uint32_t SUBDIRECTORY_FLAG = 0x80000000u;
constexpr uint32_t NAMED_ENTRY_FLAG = 0x80000000u;
constexpr uint32_t FIXED_FILE_INFO_SIGNATURE = 0xFEEF04BDu;
constexpr size_t FIXED_FILE_INFO_SIZE = 52;

uint32_t read_le32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

uint16_t read_le16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0]) | static_cast<uint16_t>(static_cast<uint16_t>(p[1]) << 8);
}

struct Section {
    char name[9];
    uint32_t virtual_size;
    uint32_t virtual_address;
    uint32_t raw_size;
    uint32_t raw_offset;
};

class PeImage {
public:
    explicit PeImage(const std::vector<uint8_t>& data) : data_(data) {}

    bool in_bounds(uint64_t offset, uint64_t size) const {
        return offset <= data_.size() && size <= data_.size() - offset;
    }

    const uint8_t* at(uint64_t offset) const { return data_.data() + offset; }

    std::string parse_headers() {
        if (!in_bounds(0, DOS_LFANEW_OFFSET + 4) || data_[0] != 'M' || data_[1] != 'Z') {
            return "not a PE file";
        }

        uint32_t pe_offset = read_le32(at(DOS_LFANEW_OFFSET));
        if (!in_bounds(pe_offset, 4 + COFF_HEADER_SIZE) ||
            std::memcmp(at(pe_offset), "PE\0\0", 4) != 0) {
            return "missing PE signature";
        }

        const uint8_t* coff = at(pe_offset + 4);
        uint16_t section_count = read_le16(coff + 2);
        uint16_t optional_size = read_le16(coff + 16);

        uint64_t optional_offset = static_cast<uint64_t>(pe_offset) + 4 + COFF_HEADER_SIZE;
        if (!in_bounds(optional_offset, optional_size)) {
            return "optional header out of bounds";
        }
        read_resource_directory_rva(optional_offset, optional_size);

        uint64_t table_offset = optional_offset + optional_size;
        if (!in_bounds(table_offset, static_cast<uint64_t>(section_count) * SECTION_HEADER_SIZE)) {
            return "section table out of bounds";
        }

        for (uint16_t i = 0; i < section_count; ++i) {
            const uint8_t* hdr = at(table_offset + static_cast<uint64_t>(i) * SECTION_HEADER_SIZE);
            Section s{};
            std::memcpy(s.name, hdr, 8);
            s.name[8] = '\0';
            s.virtual_size = read_le32(hdr + 8);
            s.virtual_address = read_le32(hdr + 12);
            s.raw_size = read_le32(hdr + 16);
            s.raw_offset = read_le32(hdr + 20);
            sections_.push_back(s);
        }

        return "";
    }

    // File offset of the resource tree root, from the data directory or the .rsrc section
    bool find_resource_root(uint64_t& offset) const {
        if (resource_rva_ != 0) {
            return rva_to_offset(resource_rva_, offset);
        }
        for (const auto& s : sections_) {
            if (std::strcmp(s.name, ".rsrc") == 0) {
                offset = s.raw_offset;
                return true;
            }
        }
        return false;
    }

    bool rva_to_offset(uint32_t rva, uint64_t& offset) const {
        for (const auto& s : sections_) {
            uint32_t span = s.virtual_size > s.raw_size ? s.virtual_size : s.raw_size;
            if (rva >= s.virtual_address && rva - s.virtual_address < span) {
                offset = static_cast<uint64_t>(s.raw_offset) + (rva - s.virtual_address);
                return true;
            }
        }
        return false;
    }

private:
    void read_resource_directory_rva(uint64_t optional_offset, uint16_t optional_size) {
        if (optional_size < 2) return;

        uint16_t magic = read_le16(at(optional_offset));
        uint64_t count_offset = 0;
        if (magic == PE32_MAGIC) {
            count_offset = 92;
        } else if (magic == PE32_PLUS_MAGIC) {
            count_offset = 108;
        } else {
            return;
        }

        if (count_offset + 4 > optional_size) return;
        uint32_t directory_count = read_le32(at(optional_offset + count_offset));
        if (directory_count <= RESOURCE_DATA_DIRECTORY) return;

        uint64_t entry_offset = count_offset + 4 + RESOURCE_DATA_DIRECTORY * 8;
        if (entry_offset + 8 > optional_size) return;
        resource_rva_ = read_le32(at(optional_offset + entry_offset));
    }

    const std::vector<uint8_t>& data_;
    std::vector<Section> sections_;
    uint32_t resource_rva_ = 0;
};

// Find an entry in a resource directory. id < 0 selects the first entry.
bool find_directory_entry(const PeImage& image, uint64_t directory, int64_t id,
                          uint32_t& entry_value) {
    if (!image.in_bounds(directory, 16)) return false;

    const uint8_t* dir = image.at(directory);
    uint32_t entries = static_cast<uint32_t>(read_le16(dir + 12)) + read_le16(dir + 14);
    if (!image.in_bounds(directory + 16, static_cast<uint64_t>(entries) * 8)) return false;

    for (uint32_t i = 0; i < entries; ++i) {
        const uint8_t* entry = image.at(directory + 16 + static_cast<uint64_t>(i) * 8);
        uint32_t name = read_le32(entry);
        if (id >= 0 && ((name & NAMED_ENTRY_FLAG) != 0 || name != static_cast<uint32_t>(id))) {
            continue;
        }
        entry_value = read_le32(entry + 4);
        return true;
    }
    return false;
}

} // namespace

VersionResourceResult read_version_resource(const std::string& binary_path) {
    auto data = read_binary_file(binary_path);
    if (data.empty()) {
        VersionResourceResult result;
        result.error = "failed to read file";
        return result;
    }
    return read_version_resource(data);
}

VersionResourceResult read_version_resource(const std::vector<uint8_t>& binary_data) {
    VersionResourceResult result;

    PeImage image(binary_data);
    std::string header_error = image.parse_headers();
    if (!header_error.empty()) {
        result.error = header_error;
        return result;
    }

    uint64_t root = 0;
    if (!image.find_resource_root(root)) {
        result.error = "no resource section";
        return result;
    }

    // type (RT_VERSION) -> name (first) -> language (first) -> data entry
    uint32_t value = 0;
    if (!find_directory_entry(image, root, RT_VERSION, value) ||
        (value & SUBDIRECTORY_FLAG) == 0) {
        result.error = "no version resource";
        return result;
    }

    uint64_t name_dir = root + (value & ~SUBDIRECTORY_FLAG);
    if (!find_directory_entry(image, name_dir, -1, value) ||
        (value & SUBDIRECTORY_FLAG) == 0) {
        result.error = "malformed version resource directory";
        return result;
    }

    uint64_t language_dir = root + (value & ~SUBDIRECTORY_FLAG);
    if (!find_directory_entry(image, language_dir, -1, value) ||
        (value & SUBDIRECTORY_FLAG) != 0) {
        result.error = "malformed version resource directory";
        return result;
    }

    uint64_t data_entry = root + value;
    if (!image.in_bounds(data_entry, 16)) {
        result.error = "version resource entry out of bounds";
        return result;
    }

    uint32_t data_rva = read_le32(image.at(data_entry));
    uint32_t data_size = read_le32(image.at(data_entry + 4));
    uint64_t data_offset = 0;
    if (!image.rva_to_offset(data_rva, data_offset) || !image.in_bounds(data_offset, data_size)) {
        result.error = "version resource data out of bounds";
        return result;
    }

    // VS_VERSIONINFO header and key precede the DWORD-aligned VS_FIXEDFILEINFO
    for (uint64_t pos = 0; pos + FIXED_FILE_INFO_SIZE <= data_size; pos += 4) {
        const uint8_t* info = image.at(data_offset + pos);
        if (read_le32(info) != FIXED_FILE_INFO_SIGNATURE) continue;

        uint32_t ms = read_le32(info + 8);
        uint32_t ls = read_le32(info + 12);
        result.version = std::to_string(ms >> 16) + "." + std::to_string(ms & 0xFFFF) + "." +
                         std::to_string(ls >> 16) + "." + std::to_string(ls & 0xFFFF);
        result.ok = true;
        return result;
    }

    result.error = "version resource has no fixed file info";
    return result;
}

} // namespace patchguard
