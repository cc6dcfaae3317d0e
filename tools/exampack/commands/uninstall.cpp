/**
 * exampack CLI - uninstall command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace exampack::cli::commands {

namespace {

struct UninstallOptions {
    std::string pack_id;
};

int cmd_uninstall(const GlobalOptions& opts, const UninstallOptions& uninstall_opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto session = open_session(opts);
    if (!session) return 1;

    auto previous = session->manager.get_installed_version(uninstall_opts.pack_id);
    if (!session->manager.uninstall_pack(uninstall_opts.pack_id)) {
        print_error("Failed to uninstall " + uninstall_opts.pack_id, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["pack"]["id"] = uninstall_opts.pack_id;
        j["pack"]["version"] = previous ? nlohmann::json(*previous) : nlohmann::json(nullptr);
        output_json(j);
    } else if (previous) {
        std::cout << "Uninstalled " << uninstall_opts.pack_id << "@" << *previous << std::endl;
    } else {
        std::cout << uninstall_opts.pack_id << " was not installed" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_uninstall(CLI::App* app, GlobalOptions& opts) {
    static UninstallOptions uninstall_opts;

    app->add_option("id", uninstall_opts.pack_id, "Pack id")->required();

    app->callback([&opts]() {
        std::exit(cmd_uninstall(opts, uninstall_opts));
    });
}

} // namespace exampack::cli::commands
