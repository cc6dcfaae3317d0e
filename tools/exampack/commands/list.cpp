/**
 * exampack CLI - list command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace exampack::cli::commands {

namespace {

int cmd_list(const GlobalOptions& opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto session = open_session(opts);
    if (!session) return 1;

    auto packs = session->manager.list_installed();

    if (opts.json) {
        nlohmann::json j;
        j["packs"] = nlohmann::json::array();
        for (const auto& p : packs) {
            nlohmann::json entry;
            entry["id"] = p.id;
            entry["version"] = p.version;
            entry["record"] = p.record ? metadata_record_to_json(*p.record) : nlohmann::json(nullptr);
            j["packs"].push_back(entry);
        }
        output_json(j);
        return 0;
    }

    if (packs.empty()) {
        std::cout << "No packs installed" << std::endl;
        return 0;
    }
    for (const auto& p : packs) {
        std::cout << p.id << "@" << p.version;
        if (!p.record) {
            std::cout << "  (no metadata record)";
        } else if (!p.record->verified) {
            std::cout << "  (unverified)";
        }
        std::cout << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_list(opts));
    });
}

} // namespace exampack::cli::commands
