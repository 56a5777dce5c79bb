#pragma once

#include "patchguard/library_snapshot.hpp"
#include "patchguard/manifest_index.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace patchguard {

// ============================================================================
// Deterministic Identifiers
// ============================================================================

/// WiX identifiers are limited to 72 characters
constexpr size_t MAX_IDENTIFIER_LENGTH = 72;

/// Replace characters outside [A-Za-z0-9_.] with '_' and prefix '_' when the
/// result would not start with a letter or underscore
std::string sanitize_identifier(const std::string& name);

struct IdentifierResult {
    bool ok = false;
    std::string error;
    std::string id;
};

/**
 * @brief Build an installer identifier from a readable name and unique data
 *
 * The result is sanitize(name), truncated so the whole identifier fits in
 * 72 characters, then "." and the upper-case MD5 of unique_seed. Identical
 * inputs always give the identical identifier.
 */
IdentifierResult make_id(const std::string& name, const std::string& unique_seed);

// ============================================================================
// Corrective Fragments
// ============================================================================

enum class OrphanKind {
    File,
    Registry
};

// New component whose only job is to delete what the orphan left behind
struct RemovalComponent {
    std::string id;
    std::string guid;
    // OrphanKind::File
    std::string short_name;
    std::string long_name;
    // OrphanKind::Registry
    std::string registry_root;
    std::string registry_key;
};

struct CorrectiveFragment {
    OrphanKind kind = OrphanKind::File;
    std::string subject;                          // library path, or Root\KeyHeader
    std::string orphan_guid;
    std::string directory_id;                     // empty: no snippet can be suggested
    std::string component_id;                     // "[unknown]" when not recorded
    std::optional<std::string> relocated_source;  // same file now sourced elsewhere
    std::optional<RemovalComponent> removal;
    std::vector<std::string> feature_ids;
    std::string error;                            // identifier could not be derived
};

using GuidGenerator = std::function<std::string()>;

/// Fragment retiring a file component that vanished from the manifest
CorrectiveFragment synthesize_file_fragment(const FileLibraryEntry& entry,
                                            const ManifestIndex& index,
                                            const GuidGenerator& new_guid);

/// Fragment retiring a registry component that vanished from the manifest
CorrectiveFragment synthesize_registry_fragment(const RegistryLibraryEntry& entry,
                                                const GuidGenerator& new_guid);

/// Manifest text for the report: explanatory comments, the DirectoryRef
/// scope and the FeatureRef wiring
std::string render_fragment(const CorrectiveFragment& fragment);

} // namespace patchguard
