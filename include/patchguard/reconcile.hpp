#pragma once

#include "patchguard/diagnostics.hpp"
#include "patchguard/file_probe.hpp"
#include "patchguard/fragment.hpp"
#include "patchguard/library_snapshot.hpp"
#include "patchguard/manifest_index.hpp"
#include "patchguard/source_control.hpp"

#include <ctime>
#include <set>
#include <string>
#include <vector>

namespace patchguard {

// The patch engine tolerates this much clock skew between releases
constexpr std::time_t DATE_TOLERANCE_SECONDS = 24 * 60 * 60;

constexpr const char* ZERO_VERSION = "0.0.0.0";

// Upper bound on worker threads for one run
constexpr unsigned MAX_JOBS = 64;

// jobs clamped to [1, MAX_JOBS]
unsigned effective_jobs(unsigned jobs);

// ============================================================================
// Feature Membership
// ============================================================================

struct FeatureDiff {
    std::vector<std::string> added;    // in the manifest, not in the library
    std::vector<std::string> removed;  // in the library, not in the manifest
};

FeatureDiff diff_features(const std::set<std::string>& library_features,
                          const std::set<std::string>& manifest_features);

// ============================================================================
// Reconciliation Engine
// ============================================================================

struct ReconcileOptions {
    std::string project_root;
    std::string build_flavor;                       // substituted for ${config}
    std::vector<std::string> ignore_version_zero;   // partial paths allowed to be 0.0.0.0
    unsigned jobs = 1;
    GuidGenerator new_guid;                         // defaults to generate_uuid
};

/**
 * Compares the last release's library against the current manifest and the
 * built files.
 *
 * The index, probe and entries are only read, so entries may be checked
 * concurrently. Each check returns its diagnostics instead of appending to a
 * shared log; run() merges them in library order.
 */
class Reconciler {
public:
    Reconciler(const ManifestIndex& index, const FileProbe& probe, ReconcileOptions options);

    // Presence, feature membership, then details, in that order
    std::vector<Diagnostic> check_file_entry(const FileLibraryEntry& entry) const;

    std::vector<Diagnostic> check_registry_entry(const RegistryLibraryEntry& entry) const;

    std::vector<Diagnostic> check_file_presence(const FileLibraryEntry& entry) const;
    std::vector<Diagnostic> check_feature_membership(const FileLibraryEntry& entry) const;
    std::vector<Diagnostic> check_file_details(const FileLibraryEntry& entry) const;

    // Full pass: the load-issue note, every file entry, every registry entry
    DiagnosticLog run(const LibrarySnapshot& snapshot) const;

private:
    const ManifestIndex& index_;
    const FileProbe& probe_;
    ReconcileOptions options_;
};

// Convenience wrapper around Reconciler::run
DiagnosticLog reconcile(const ManifestIndex& index, const LibrarySnapshot& snapshot,
                        const FileProbe& probe, ReconcileOptions options);

// ============================================================================
// Untracked Files
// ============================================================================

/**
 * Warning 4 when the query failed, otherwise Warning 2 listing untracked
 * files that match neither the allowed patterns nor the omissions.
 */
std::vector<Diagnostic> check_untracked_files(const UntrackedQueryResult& query,
                                              const std::vector<std::string>& ignore_untracked,
                                              const std::vector<std::string>& omissions,
                                              const std::string& build_flavor);

} // namespace patchguard
