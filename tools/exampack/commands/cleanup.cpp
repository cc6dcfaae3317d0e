/**
 * exampack CLI - cleanup command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace exampack::cli::commands {

namespace {

int cmd_cleanup(const GlobalOptions& opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto session = open_session(opts);
    if (!session) return 1;

    size_t removed = session->manager.cleanup_temp_files();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["removed"] = removed;
        output_json(j);
    } else {
        std::cout << "Removed " << removed << " stale file(s)" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_cleanup(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_cleanup(opts));
    });
}

} // namespace exampack::cli::commands
