/**
 * exampack CLI - verify command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace exampack::cli::commands {

namespace {

struct VerifyOptions {
    std::string pack_id;
};

int cmd_verify(const GlobalOptions& opts, const VerifyOptions& verify_opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto session = open_session(opts);
    if (!session) return 1;

    auto result = session->manager.verify_installed(verify_opts.pack_id);
    if (!result.is_valid) {
        print_error(verify_opts.pack_id + " failed verification", opts.json, result.errors);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["pack"]["id"] = verify_opts.pack_id;
        output_json(j);
    } else {
        std::cout << verify_opts.pack_id << ": OK" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_verify(CLI::App* app, GlobalOptions& opts) {
    static VerifyOptions verify_opts;

    app->add_option("id", verify_opts.pack_id, "Pack id")->required();

    app->callback([&opts]() {
        std::exit(cmd_verify(opts, verify_opts));
    });
}

} // namespace exampack::cli::commands
