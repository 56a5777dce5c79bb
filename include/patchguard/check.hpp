#pragma once

#include "patchguard/config.hpp"
#include "patchguard/diagnostics.hpp"
#include "patchguard/file_probe.hpp"
#include "patchguard/source_control.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace patchguard {

constexpr const char* DEFAULT_CONFIG_FILE = "patchguard.json";

// ============================================================================
// Check Run
// ============================================================================

struct CheckSettings {
    std::string installer_dir = ".";    // holds the manifests and libraries
    std::string project_root;           // empty: derived from installer_dir
    std::string build_flavor;           // substituted for ${config}
    std::string config_path;            // empty: optional patchguard.json in installer_dir
    std::vector<std::string> manifests; // empty: Files.wxs, AutoFiles.wxs, PatchCorrections.wxs
    std::string report_path;            // empty: InstallerIntegrity.log in installer_dir
    unsigned jobs = 0;                  // 0: hardware concurrency
};

struct CheckResult {
    bool ok = false;                    // false: environment failure, no report
    std::string error;

    std::string installer_dir;
    std::string project_root;
    std::string report_path;
    IntegrityConfig config;

    DiagnosticLog log;
    std::string build_header;
    std::string report_text;            // empty when nothing was found
    bool report_written = false;
    bool mailed = false;
};

using UntrackedQuery = std::function<UntrackedQueryResult(const std::string& dist_dir)>;

/**
 * Full integrity check of one installer.
 *
 * Removes the previous report, loads the configuration, manifests and
 * libraries, reconciles them and writes a new report only when something was
 * found. On an emailing machine the report is also mailed. Any environment
 * failure stops the run before a report is written.
 */
CheckResult run_check(const CheckSettings& settings);

// Same, with the file system probe and the source control query supplied
CheckResult run_check(const CheckSettings& settings, const FileProbe& probe,
                      const UntrackedQuery& untracked_query);

// Absolute, normalized form of dir without a trailing separator
std::string normalize_directory(const std::string& dir);

// Explicit root if given, else the parent of an "...installer" directory,
// else the installer directory itself
std::string resolve_project_root(const std::string& installer_dir,
                                 const std::optional<std::string>& override_root);

} // namespace patchguard
