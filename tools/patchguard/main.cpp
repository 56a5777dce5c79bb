/**
 * patchguard CLI - Entry Point
 *
 * Checks that an installer build can still be patched from the last release.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace patchguard::cli::commands {
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_make_id(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace patchguard::cli;

    CLI::App app{"patchguard - installer patch integrity checker"};
    app.set_version_flag("-V,--version", PATCHGUARD_VERSION);
    app.require_subcommand(0, 1);
    app.fallthrough();

    GlobalOptions opts;

    // Global options
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    // Commands
    auto* check_cmd = app.add_subcommand("check", "Compare the installer against the last release");
    commands::setup_check(check_cmd, opts);

    auto* make_id_cmd = app.add_subcommand("make-id", "Print a deterministic installer identifier");
    commands::setup_make_id(make_id_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
