/**
 * patchguard CLI - make-id command
 *
 * Print the identifier the corrective fragments would use for a name.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace patchguard::cli::commands {

namespace {

struct MakeIdOptions {
    std::string name;
    std::string seed;
};

int cmd_make_id(const GlobalOptions& opts, const MakeIdOptions& id_opts) {
    configure_logging(opts);

    auto result = make_id(id_opts.name, id_opts.seed);
    if (!result.ok) {
        print_error(result.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["name"] = id_opts.name;
        j["seed"] = id_opts.seed;
        j["id"] = result.id;
        output_json(j);
    } else {
        print_success(result.id, opts.json);
    }
    return 0;
}

} // anonymous namespace

void setup_make_id(CLI::App* app, GlobalOptions& opts) {
    static MakeIdOptions id_opts;

    app->add_option("name", id_opts.name, "Readable part of the identifier")->required();
    app->add_option("seed", id_opts.seed, "Unique data hashed into the identifier")->required();

    app->callback([&opts]() {
        std::exit(cmd_make_id(opts, id_opts));
    });
}

} // namespace patchguard::cli::commands
