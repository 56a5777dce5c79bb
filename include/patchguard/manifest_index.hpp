#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace patchguard {

// ============================================================================
// Manifest Records
// ============================================================================

struct ComponentRecord {
    std::string guid;                    // as declared
    std::string id;
    std::string directory_id;
    std::set<std::string> feature_ids;   // filled from every source once the index is built
    std::string source_name;             // manifest source that declared it
};

// Canonical form of a component GUID: braces stripped, upper case
std::string normalize_guid(const std::string& guid);

/**
 * Index over one WiX manifest document.
 *
 * Built once at load time; the document itself is not retained.
 */
struct ManifestSource {
    std::string name;

    // normalized GUID -> component (first declaration wins)
    std::unordered_map<std::string, ComponentRecord> components;

    // component id -> ids of Feature/FeatureRef elements that reference it
    std::unordered_map<std::string, std::set<std::string>> component_features;

    // (file name, directory id) -> Source attribute (first declaration wins).
    // Both the long and the short name of a file are keys.
    std::map<std::pair<std::string, std::string>, std::string> files;
};

struct ManifestLoadResult {
    bool ok = false;
    std::string error;
    ManifestSource source;
};

// Load and index a .wxs file
ManifestLoadResult load_manifest_source(const std::string& path);

// Index a .wxs document held in memory; name is used in messages
ManifestLoadResult parse_manifest_source(const std::string& xml, const std::string& name);

// ============================================================================
// Manifest Index
// ============================================================================

/**
 * Read-only view over an ordered list of manifest sources.
 *
 * Lookups scan sources in list order and return the first match, so a
 * corrections overlay placed after the primary sources never shadows them.
 */
class ManifestIndex {
public:
    ManifestIndex() = default;

    // project_root is stripped from file Source paths returned by find_file_elsewhere
    explicit ManifestIndex(std::vector<ManifestSource> sources, std::string project_root = "");

    bool has_component(const std::string& guid) const;

    std::optional<ComponentRecord> find_component(const std::string& guid) const;

    // Union over all sources
    std::set<std::string> features_referencing(const std::string& component_id) const;

    // Source path of a file with this long or short name declared in directory_id
    std::optional<std::string> find_file_elsewhere(const std::string& long_name,
                                                   const std::string& directory_id) const;

private:
    std::vector<ManifestSource> sources_;
    std::string project_root_;
};

} // namespace patchguard
