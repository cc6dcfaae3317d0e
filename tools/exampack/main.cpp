/**
 * exampack CLI - Entry Point
 *
 * Install, inspect and author signed exam content packs.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace exampack::cli::commands {
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_uninstall(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_verify(CLI::App* app, GlobalOptions& opts);
    void setup_usage(CLI::App* app, GlobalOptions& opts);
    void setup_cleanup(CLI::App* app, GlobalOptions& opts);
    void setup_validate(CLI::App* app, GlobalOptions& opts);
    void setup_keygen(CLI::App* app, GlobalOptions& opts);
    void setup_pack(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace exampack::cli;

    CLI::App app{"exampack - exam content pack manager"};
    app.set_version_flag("-V,--version", EXAMPACK_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "exampack root directory");
    app.add_option("--config", opts.config, "Config file (default <root>/config.json)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* install_cmd = app.add_subcommand("install", "Download, verify and install a pack");
    commands::setup_install(install_cmd, opts);

    auto* uninstall_cmd = app.add_subcommand("uninstall", "Remove an installed pack");
    commands::setup_uninstall(uninstall_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List installed packs");
    commands::setup_list(list_cmd, opts);

    auto* verify_cmd = app.add_subcommand("verify", "Check an installed pack against its metadata record");
    commands::setup_verify(verify_cmd, opts);

    auto* usage_cmd = app.add_subcommand("usage", "Show storage usage");
    commands::setup_usage(usage_cmd, opts);

    auto* cleanup_cmd = app.add_subcommand("cleanup", "Delete stale temporary files");
    commands::setup_cleanup(cleanup_cmd, opts);

    auto* validate_cmd = app.add_subcommand("validate", "Validate an unpacked pack directory");
    commands::setup_validate(validate_cmd, opts);

    auto* keygen_cmd = app.add_subcommand("keygen", "Generate an Ed25519 signing key");
    commands::setup_keygen(keygen_cmd, opts);

    auto* pack_cmd = app.add_subcommand("pack", "Build and sign a pack archive");
    commands::setup_pack(pack_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
