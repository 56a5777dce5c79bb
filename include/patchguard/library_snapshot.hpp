#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace patchguard {

// ============================================================================
// Library Records (attributes as of the last release)
// ============================================================================

struct FileLibraryEntry {
    std::string path;                          // build-relative, may contain ${config}
    std::string released_date;                 // as recorded
    std::optional<std::time_t> released_time;  // parsed; nullopt when unparseable
    std::string released_version;              // may be empty
    std::string released_md5;
    std::vector<std::string> feature_list;     // declaration order, duplicates removed
    std::string component_guid;
    std::string component_id;
    std::string directory_id;
    std::string long_name;
    std::string short_name;
};

struct RegistryLibraryEntry {
    std::string guid;
    std::string root;
    std::string key_header;
    std::string directory_id;
    std::string id;
    std::vector<std::string> feature_list;
};

// Split a comma-separated FeatureList attribute, trimming blanks and
// dropping empty and repeated names
std::vector<std::string> split_feature_list(const std::string& feature_list);

/**
 * Typed view over FileLibrary.xml and RegLibrary.xml.
 *
 * A document that does not exist is normal before the first release and
 * leaves the corresponding list empty (has_files / has_registry false).
 * Entries that cannot be fully checked are described in load_issues.
 */
struct LibrarySnapshot {
    bool has_files = false;
    bool has_registry = false;
    std::vector<FileLibraryEntry> files;
    std::vector<RegistryLibraryEntry> registry;
    std::vector<std::string> load_issues;
};

struct LibraryLoadResult {
    bool ok = false;
    std::string error;
    LibrarySnapshot snapshot;
};

// Load both documents; either path may name a file that does not exist
LibraryLoadResult load_library_snapshot(const std::string& file_library_path,
                                        const std::string& registry_library_path);

// Parse documents held in memory. Empty text means the document is absent.
LibraryLoadResult parse_library_snapshot(const std::string& file_library_xml,
                                         const std::string& registry_library_xml);

} // namespace patchguard
