#include "patchguard/reconcile.hpp"
#include "patchguard/digest.hpp"
#include "patchguard/platform.hpp"
#include "patchguard/version_ordinal.hpp"

#include <algorithm>
#include <atomic>
#include <iterator>
#include <system_error>
#include <thread>

#include <spdlog/spdlog.h>

namespace patchguard {

unsigned effective_jobs(unsigned jobs) {
    return std::min(std::max(jobs, 1u), MAX_JOBS);
}

namespace {

std::string join(const std::vector<std::string>& items, const std::string& separator) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += separator;
        result += items[i];
    }
    return result;
}

// Check every entry on up to `jobs` threads; results keep the entry order
template <typename Entry, typename Check>
std::vector<std::vector<Diagnostic>> check_all(const std::vector<Entry>& entries, unsigned jobs,
                                               Check check) {
    std::vector<std::vector<Diagnostic>> results(entries.size());
    std::atomic<size_t> next{0};

    auto worker = [&]() {
        for (size_t i = next++; i < entries.size(); i = next++) {
            results[i] = check(entries[i]);
        }
    };

    size_t thread_count = std::min<size_t>(effective_jobs(jobs), entries.size());
    if (thread_count <= 1) {
        worker();
        return results;
    }

    // The calling thread is the last worker
    std::vector<std::thread> threads;
    threads.reserve(thread_count - 1);
    try {
        for (size_t t = 1; t < thread_count; ++t) {
            threads.emplace_back(worker);
        }
    } catch (const std::system_error& e) {
        spdlog::warn("Started {} of {} worker threads: {}", threads.size() + 1, thread_count, e.what());
    }

    worker();
    for (auto& th : threads) {
        th.join();
    }
    return results;
}

Diagnostic file_error(ErrorCode code, const FileLibraryEntry& entry, const std::string& text) {
    return make_error(code, entry.path, "File " + entry.path + " " + text);
}

} // namespace

FeatureDiff diff_features(const std::set<std::string>& library_features,
                          const std::set<std::string>& manifest_features) {
    FeatureDiff diff;
    std::set_difference(manifest_features.begin(), manifest_features.end(),
                        library_features.begin(), library_features.end(),
                        std::back_inserter(diff.added));
    std::set_difference(library_features.begin(), library_features.end(),
                        manifest_features.begin(), manifest_features.end(),
                        std::back_inserter(diff.removed));
    return diff;
}

// ============================================================================
// Reconciler
// ============================================================================

Reconciler::Reconciler(const ManifestIndex& index, const FileProbe& probe, ReconcileOptions options)
    : index_(index), probe_(probe), options_(std::move(options)) {
    if (!options_.new_guid) {
        options_.new_guid = generate_uuid;
    }
}

std::vector<Diagnostic> Reconciler::check_file_presence(const FileLibraryEntry& entry) const {
    std::vector<Diagnostic> out;

    // Unresolvable; already described by the load-issue note
    if (entry.component_guid.empty()) return out;
    if (index_.has_component(entry.component_guid)) return out;

    spdlog::debug("File component {} [{}] is no longer in the manifest", entry.component_guid, entry.path);
    auto fragment = synthesize_file_fragment(entry, index_, options_.new_guid);
    out.push_back(make_note(entry.path, render_fragment(fragment)));
    return out;
}

std::vector<Diagnostic> Reconciler::check_feature_membership(const FileLibraryEntry& entry) const {
    std::vector<Diagnostic> out;

    if (entry.feature_list.empty()) {
        out.push_back(make_error(ErrorCode::MissingFeatureList, entry.path,
                                 "Library contains file " + entry.path + " with no FeatureList attribute."));
        return out;
    }

    // Vanished components are handled by the presence check
    if (entry.component_guid.empty()) return out;
    auto component = index_.find_component(entry.component_guid);
    if (!component) return out;

    std::set<std::string> library_features(entry.feature_list.begin(), entry.feature_list.end());
    auto diff = diff_features(library_features, index_.features_referencing(component->id));

    if (!diff.added.empty()) {
        out.push_back(file_error(ErrorCode::FeatureAdded, entry,
                                 "has been added to the following features since the last release: " +
                                     join(diff.added, ", ") + ". Patching will fail."));
    }
    if (!diff.removed.empty()) {
        out.push_back(file_error(ErrorCode::FeatureRemoved, entry,
                                 "has been removed from the following features since the last release: " +
                                     join(diff.removed, ", ") + ". Patching will fail."));
    }
    return out;
}

std::vector<Diagnostic> Reconciler::check_file_details(const FileLibraryEntry& entry) const {
    std::vector<Diagnostic> out;

    std::string full_path =
        join_path(options_.project_root, expand_config_placeholder(entry.path, options_.build_flavor));

    auto probe = probe_.probe(full_path);
    if (!probe.exists) return out;  // expected to be retired by PatchCorrections.wxs
    if (!probe.ok) {
        spdlog::warn("Cannot examine {}: {}", full_path, probe.error);
        return out;
    }

    const auto& current = probe.facts;
    const auto& released_version = entry.released_version;

    // A changed file needs a version bump the installer can see
    if (!digests_equal(current.md5, entry.released_md5) && !released_version.empty() &&
        !current.version.empty()) {
        if (current.version == released_version) {
            out.push_back(file_error(ErrorCode::ModifiedWithoutVersionBump, entry,
                                     "has been modified since the last release, but its version remains at " +
                                         current.version + ". Patching will fail."));
        } else {
            auto current_ordinal = encode_version(current.version);
            auto released_ordinal = encode_version(released_version);
            if (current_ordinal.ok && released_ordinal.ok &&
                truncate3(current_ordinal.ordinal) == truncate3(released_ordinal.ordinal)) {
                out.push_back(file_error(ErrorCode::FourthSegmentOnly, entry,
                                         "has a version number (" + current.version +
                                             ") that has only changed in the 4th segment since the last release (" +
                                             released_version +
                                             "). The 4th version segment is ignored by the installer. "
                                             "Patching will fail."));
            }
        }
    }

    if (entry.released_time && current.last_write < *entry.released_time - DATE_TOLERANCE_SECONDS) {
        out.push_back(file_error(ErrorCode::DateRegression, entry,
                                 "has a date/time stamp (" + format_local_time(current.last_write) +
                                     ") that is earlier than a previously released version (" +
                                     entry.released_date + "). Patching may fail."));
    }

    if (current.version == ZERO_VERSION &&
        !path_matches_any(full_path, options_.ignore_version_zero, options_.build_flavor)) {
        out.push_back(make_warning(WarningCode::ZeroVersion, entry.path,
                                   "File " + entry.path + " has a version number of 0.0.0.0. "
                                   "That is very silly, and I don't like it. You'll only regret it later."));
    }

    if (!released_version.empty() && current.version.empty()) {
        out.push_back(file_error(ErrorCode::VersionInfoRemoved, entry,
                                 "had a version of " + released_version +
                                     " in the last release. The version information has since been removed. "
                                     "Patching will fail."));
        return out;
    }

    auto current_ordinal = encode_version(current.version);
    auto released_ordinal = encode_version(released_version);
    if (!current_ordinal.ok || !released_ordinal.ok) {
        const auto& reason = current_ordinal.ok ? released_ordinal.error : current_ordinal.error;
        out.push_back(file_error(ErrorCode::InvalidVersion, entry,
                                 "has invalid version number (possibly in FileLibrary.xml): " + reason));
        return out;
    }

    if (compare(current_ordinal.ordinal, released_ordinal.ordinal) == Ordering::Less) {
        out.push_back(file_error(ErrorCode::VersionLowered, entry,
                                 "had a version of " + released_version +
                                     " in the last release. The version has since been lowered to " +
                                     current.version + ". Patching will fail."));
    }
    return out;
}

std::vector<Diagnostic> Reconciler::check_file_entry(const FileLibraryEntry& entry) const {
    auto out = check_file_presence(entry);

    auto features = check_feature_membership(entry);
    out.insert(out.end(), features.begin(), features.end());

    auto details = check_file_details(entry);
    out.insert(out.end(), details.begin(), details.end());
    return out;
}

std::vector<Diagnostic> Reconciler::check_registry_entry(const RegistryLibraryEntry& entry) const {
    std::vector<Diagnostic> out;

    if (entry.guid.empty()) return out;
    if (index_.has_component(entry.guid)) return out;

    auto fragment = synthesize_registry_fragment(entry, options_.new_guid);
    out.push_back(make_note(fragment.subject, render_fragment(fragment)));
    return out;
}

DiagnosticLog Reconciler::run(const LibrarySnapshot& snapshot) const {
    DiagnosticLog log;

    if (!snapshot.load_issues.empty()) {
        std::string text = "<!-- The following library entries cannot be fully checked:";
        for (const auto& issue : snapshot.load_issues) {
            text += "\n    " + issue;
        }
        text += "\n-->";
        log.append(make_note("library", text));
    }

    spdlog::info("Checking {} library files and {} registry components with {} job(s)",
                 snapshot.files.size(), snapshot.registry.size(), effective_jobs(options_.jobs));

    auto file_results = check_all(snapshot.files, options_.jobs,
                                  [this](const FileLibraryEntry& e) { return check_file_entry(e); });
    for (auto& diagnostics : file_results) {
        log.append(std::move(diagnostics));
    }

    auto registry_results = check_all(snapshot.registry, options_.jobs,
                                      [this](const RegistryLibraryEntry& e) { return check_registry_entry(e); });
    for (auto& diagnostics : registry_results) {
        log.append(std::move(diagnostics));
    }

    return log;
}

DiagnosticLog reconcile(const ManifestIndex& index, const LibrarySnapshot& snapshot,
                        const FileProbe& probe, ReconcileOptions options) {
    Reconciler reconciler(index, probe, std::move(options));
    return reconciler.run(snapshot);
}

// ============================================================================
// Untracked Files
// ============================================================================

std::vector<Diagnostic> check_untracked_files(const UntrackedQueryResult& query,
                                              const std::vector<std::string>& ignore_untracked,
                                              const std::vector<std::string>& omissions,
                                              const std::string& build_flavor) {
    std::vector<Diagnostic> out;

    if (!query.ok) {
        out.push_back(make_warning(WarningCode::SourceControlQueryFailed, "DistFiles",
                                   "Could not determine if DistFiles folder is consistent with source control:\n" +
                                       join(query.errors, "\n")));
        return out;
    }

    std::vector<std::string> unexpected;
    for (const auto& file : query.files) {
        if (path_matches_any(file, ignore_untracked, build_flavor)) continue;
        if (path_matches_any(file, omissions, build_flavor)) continue;
        unexpected.push_back(file);
    }

    if (!unexpected.empty()) {
        out.push_back(make_warning(WarningCode::UntrackedFiles, "DistFiles",
                                   "The following files are present in DistFiles but not checked into "
                                   "source control: \n    " + join(unexpected, "\n    ")));
    }
    return out;
}

} // namespace patchguard
