/**
 * exampack CLI - Common utilities and types
 */

#pragma once

#include <exampack/config.hpp>
#include <exampack/metadata_store.hpp>
#include <exampack/pack_manager.hpp>
#include <exampack/platform.hpp>
#include <exampack/verifier.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace exampack::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route diagnostics to stderr so --json output stays parseable.
 * Default level is warn; -v lowers it to debug, -q raises it to error.
 */
inline void configure_logging(const GlobalOptions& opts) {
    auto logger = spdlog::get("exampack");
    if (!logger) {
        logger = spdlog::stderr_color_mt("exampack");
        spdlog::set_default_logger(logger);
    }
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode,
                        const std::vector<std::string>& details = {}) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (!details.empty()) {
            j["details"] = details;
        }
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
        for (const auto& d : details) {
            std::cerr << "  " << d << std::endl;
        }
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    // Include any collected warnings in the output
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Everything a command needs to talk to the pack manager.
 * Members are declared in construction order.
 */
struct Session {
    PackManagerConfig config;
    PackVerifier verifier;
    FileMetadataStore store;
    PackManager manager;

    explicit Session(PackManagerConfig cfg)
        : config(std::move(cfg)),
          verifier(config.trusted_keys, config.max_pack_age_days),
          store(config.registry_dir),
          manager(config, verifier, store) {}
};

/**
 * Resolve root and load config (--config, else <root>/config.json).
 * Prints the error and returns nullptr on failure.
 */
inline std::unique_ptr<Session> open_session(const GlobalOptions& opts) {
    std::string root = resolve_root(
        opts.root.empty() ? std::nullopt : std::make_optional(opts.root));
    std::string config_path = opts.config.empty() ? join_path(root, CONFIG_FILE) : opts.config;

    auto loaded = load_config(config_path, root);
    if (!loaded.ok) {
        print_error("Invalid config " + config_path + ": " + loaded.error, opts.json);
        return nullptr;
    }
    for (const auto& w : loaded.warnings) {
        spdlog::warn("{}: {}", config_path, w);
    }
    spdlog::debug("root {} packs {} temp {}", root, loaded.config.packs_dir, loaded.config.temp_dir);

    return std::make_unique<Session>(std::move(loaded.config));
}

} // namespace exampack::cli
