/**
 * patchguard CLI - check command
 *
 * Reconcile the last release's libraries with the current manifest and
 * build output, then write, print or mail the report.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <vector>

namespace patchguard::cli::commands {

namespace {

struct CheckOptions {
    CheckSettings settings;
    bool silent = false;
    bool strict = false;
};

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    configure_logging(opts);

    auto result = run_check(check_opts.settings);
    if (!result.ok) {
        print_error(result.error, opts.json);
        return 1;
    }

    // Silent success: no report at all
    if (result.log.empty()) {
        if (opts.json) {
            output_json(report_to_json(result.log));
        }
        return 0;
    }

    if (!result.mailed) {
        if (opts.json) {
            output_json(report_to_json(result.log, result.build_header));
        } else if (!check_opts.silent) {
            std::cout << result.report_text;
        }
    }

    if (check_opts.strict && result.log.has_errors()) {
        return 2;
    }
    return 0;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;
    auto& s = check_opts.settings;

    app->add_option("--installer-dir", s.installer_dir, "Directory holding the manifests and libraries")
        ->capture_default_str();
    app->add_option("--root", s.project_root, "Project root (default: derived from the installer directory)");
    app->add_option("--build-type", s.build_flavor, "Build flavor substituted for ${config}")
        ->required();
    app->add_option("--config", s.config_path, "Configuration file (default: patchguard.json)");
    app->add_option("--manifest", s.manifests,
                    "Manifest source, in lookup order (repeatable; default: Files.wxs, AutoFiles.wxs, PatchCorrections.wxs)");
    app->add_option("--report", s.report_path, "Report file (default: InstallerIntegrity.log)");
    app->add_flag("--silent", check_opts.silent, "Do not print the report");
    app->add_flag("--strict", check_opts.strict, "Exit with status 2 when errors were reported");
    app->add_option("-j,--jobs", s.jobs, "Worker threads (default: hardware concurrency)")
        ->check(CLI::Range(0u, MAX_JOBS));

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace patchguard::cli::commands
