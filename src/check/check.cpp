#include "patchguard/check.hpp"
#include "patchguard/library_snapshot.hpp"
#include "patchguard/manifest_index.hpp"
#include "patchguard/platform.hpp"
#include "patchguard/reconcile.hpp"
#include "patchguard/report.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <thread>

#include <spdlog/spdlog.h>

namespace patchguard {

namespace {

// Explicit config is mandatory; the default one is optional
bool load_configuration(const CheckSettings& settings, const std::string& installer_dir,
                        IntegrityConfig& config, std::string& error) {
    std::string path = settings.config_path;
    if (path.empty()) {
        path = join_path(installer_dir, DEFAULT_CONFIG_FILE);
        if (!is_regular_file(path)) {
            spdlog::debug("No {}; using the built-in empty configuration", path);
            config = get_builtin_empty_config();
            return true;
        }
    }

    auto result = load_config(path);
    if (!result.ok) {
        error = "invalid configuration " + path + ": " + result.error;
        return false;
    }
    for (const auto& warning : result.warnings) {
        spdlog::warn("{}: {}", path, warning);
    }
    config = std::move(result.config);
    return true;
}

bool load_manifests(const CheckSettings& settings, const std::string& installer_dir,
                    std::vector<ManifestSource>& sources, std::string& error) {
    struct Wanted {
        std::string path;
        bool mandatory;
    };

    std::vector<Wanted> wanted;
    if (!settings.manifests.empty()) {
        for (const auto& m : settings.manifests) {
            wanted.push_back({m, true});
        }
    } else {
        wanted.push_back({join_path(installer_dir, "Files.wxs"), true});
        wanted.push_back({join_path(installer_dir, "AutoFiles.wxs"), true});
        wanted.push_back({join_path(installer_dir, "PatchCorrections.wxs"), false});
    }

    for (const auto& w : wanted) {
        if (!w.mandatory && !is_regular_file(w.path)) {
            spdlog::debug("Optional manifest {} not present", w.path);
            continue;
        }
        auto loaded = load_manifest_source(w.path);
        if (!loaded.ok) {
            error = loaded.error;
            return false;
        }
        sources.push_back(std::move(loaded.source));
    }
    return true;
}

CheckResult fail(CheckResult result, const std::string& error) {
    result.ok = false;
    result.error = error;
    return result;
}

} // namespace

std::string normalize_directory(const std::string& dir) {
    std::error_code ec;
    auto p = std::filesystem::absolute(dir, ec);
    if (ec) p = std::filesystem::path(dir);
    p = p.lexically_normal();
    if (p.filename().empty() && p.has_parent_path()) {
        p = p.parent_path();
    }
    return p.string();
}

std::string resolve_project_root(const std::string& installer_dir,
                                 const std::optional<std::string>& override_root) {
    if (override_root && !override_root->empty()) {
        return *override_root;
    }

    std::string name = get_filename(installer_dir);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const std::string suffix = "installer";
    if (name.size() >= suffix.size() &&
        name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return get_parent_directory(installer_dir);
    }
    return installer_dir;
}

CheckResult run_check(const CheckSettings& settings) {
    DiskFileProbe probe;
    return run_check(settings, probe, query_untracked_files);
}

CheckResult run_check(const CheckSettings& settings, const FileProbe& probe,
                      const UntrackedQuery& untracked_query) {
    CheckResult result;

    result.installer_dir = normalize_directory(settings.installer_dir);
    if (!is_directory(result.installer_dir)) {
        return fail(std::move(result), "Installer directory not found: " + result.installer_dir);
    }

    result.project_root = normalize_directory(resolve_project_root(
        result.installer_dir,
        settings.project_root.empty() ? std::nullopt : std::make_optional(settings.project_root)));
    if (!is_directory(result.project_root)) {
        return fail(std::move(result), "Project root not found: " + result.project_root);
    }
    spdlog::debug("Installer directory: {}", result.installer_dir);
    spdlog::debug("Project root: {}", result.project_root);

    result.report_path = settings.report_path.empty()
                             ? join_path(result.installer_dir, DEFAULT_REPORT_FILE)
                             : settings.report_path;
    auto stale = remove_stale_report(result.report_path);
    if (!stale.ok) {
        return fail(std::move(result), stale.error);
    }

    std::string error;
    if (!load_configuration(settings, result.installer_dir, result.config, error)) {
        return fail(std::move(result), error);
    }

    std::vector<ManifestSource> sources;
    if (!load_manifests(settings, result.installer_dir, sources, error)) {
        return fail(std::move(result), error);
    }
    ManifestIndex index(std::move(sources), result.project_root);

    auto library = load_library_snapshot(join_path(result.installer_dir, "FileLibrary.xml"),
                                         join_path(result.installer_dir, "RegLibrary.xml"));
    if (!library.ok) {
        return fail(std::move(result), library.error);
    }

    ReconcileOptions options;
    options.project_root = result.project_root;
    options.build_flavor = settings.build_flavor;
    options.ignore_version_zero = result.config.integrity_checks.ignore_version_zero;
    options.jobs = settings.jobs > 0 ? settings.jobs : std::max(1u, std::thread::hardware_concurrency());

    result.log = reconcile(index, library.snapshot, probe, options);

    auto untracked = untracked_query(join_path(result.project_root, "DistFiles"));
    result.log.append(check_untracked_files(untracked, result.config.integrity_checks.ignore_untracked,
                                            result.config.omissions, settings.build_flavor));

    result.ok = true;
    if (result.log.empty()) {
        spdlog::info("No integrity problems found");
        return result;
    }

    result.build_header = build_header(result.project_root);
    result.report_text = render_report(result.log, result.build_header);

    auto written = write_report(result.report_path, result.report_text);
    if (!written.ok) {
        return fail(std::move(result), "Failed to write report: " + written.error);
    }
    result.report_written = true;

    if (is_emailing_machine(result.config, get_host_name())) {
        auto mailed = send_report_mail(result.config, result.report_text);
        if (!mailed.ok) {
            return fail(std::move(result), mailed.error);
        }
        result.mailed = true;
    }

    spdlog::info("{} error(s), {} warning(s)", result.log.count(Severity::Error),
                 result.log.count(Severity::Warning));
    return result;
}

} // namespace patchguard
