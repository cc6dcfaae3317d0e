/**
 * exampack CLI - usage command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace exampack::cli::commands {

namespace {

int cmd_usage(const GlobalOptions& opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto session = open_session(opts);
    if (!session) return 1;

    auto usage = session->manager.get_storage_usage();

    if (opts.json) {
        nlohmann::json j;
        j["total_size"] = usage.total_size;
        j["packs_size"] = usage.packs_size;
        j["temp_size"] = usage.temp_size;
        j["packs"] = nlohmann::json::array();
        for (const auto& p : usage.packs) {
            j["packs"].push_back({{"id", p.id}, {"size", p.size}, {"version", p.version}});
        }
        output_json(j);
        return 0;
    }

    std::cout << "Packs: " << usage.packs_size << " bytes" << std::endl;
    for (const auto& p : usage.packs) {
        std::cout << "  " << p.id << "@" << p.version << "  " << p.size << " bytes" << std::endl;
    }
    std::cout << "Temp:  " << usage.temp_size << " bytes" << std::endl;
    std::cout << "Total: " << usage.total_size << " bytes" << std::endl;
    return 0;
}

} // anonymous namespace

void setup_usage(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_usage(opts));
    });
}

} // namespace exampack::cli::commands
