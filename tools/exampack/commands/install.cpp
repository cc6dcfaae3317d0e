/**
 * exampack CLI - install command
 *
 * Compatibility check, download, verify and install one pack.
 */

#include "../common.hpp"
#include <exampack/manifest.hpp>
#include <CLI/CLI.hpp>
#include <filesystem>

namespace exampack::cli::commands {

namespace {

struct InstallOptions {
    std::string source;
    std::string manifest;
    std::string app_version;
};

std::string to_url(const std::string& source) {
    if (source.rfind("https://", 0) == 0 || source.rfind("http://", 0) == 0 ||
        source.rfind("file://", 0) == 0) {
        return source;
    }
    std::error_code ec;
    auto absolute = std::filesystem::absolute(source, ec);
    return "file://" + to_portable_path(ec ? source : absolute.string());
}

int cmd_install(const GlobalOptions& opts, const InstallOptions& install_opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto session = open_session(opts);
    if (!session) return 1;
    auto& manager = session->manager;

    auto parsed = read_manifest_file(install_opts.manifest);
    if (!parsed.ok) {
        print_error("Invalid manifest: " + parsed.error, opts.json);
        return 1;
    }
    const auto& manifest = parsed.manifest;

    auto compat = install_opts.app_version.empty()
        ? manager.check_compatibility(manifest)
        : manager.check_compatibility(manifest, install_opts.app_version);
    if (!compat.compatible) {
        print_error(compat.reason.value_or("Pack is not compatible with this app version"), opts.json);
        return 1;
    }

    ProgressCallback on_progress;
    if (!opts.json && !opts.quiet) {
        auto last = std::make_shared<std::pair<DownloadStatus, int>>(DownloadStatus::Error, -1);
        on_progress = [last](const DownloadProgress& p) {
            // One line per phase, plus every 10% while downloading
            int bucket = p.status == DownloadStatus::Downloading ? p.percentage / 10 : 0;
            if (last->first == p.status && last->second == bucket) return;
            *last = {p.status, bucket};
            std::cerr << download_status_to_string(p.status);
            if (p.status == DownloadStatus::Downloading) {
                std::cerr << " " << p.percentage << "% (" << p.downloaded << "/" << p.total << ")";
            }
            if (p.error) {
                std::cerr << ": " << *p.error;
            }
            std::cerr << std::endl;
        };
    }

    auto download = manager.download_pack(manifest.id, to_url(install_opts.source), on_progress).get();
    if (!download.ok) {
        print_error(std::string(pack_error_to_string(download.kind)) + ": " + download.error, opts.json);
        return 1;
    }

    auto result = manager.install_pack(manifest.id, download.temp_path, manifest, on_progress);
    for (const auto& w : result.warnings) {
        print_warning(w);
    }

    if (!result.success) {
        print_error(std::string(pack_error_to_string(result.kind)) + ": install of " +
                    manifest.id + " failed", opts.json, result.errors);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["pack"]["id"] = result.pack_id;
        j["pack"]["version"] = result.version;
        j["pack"]["path"] = manager.pack_directory(result.pack_id);
        output_json(j);
    } else {
        std::cout << "Installed " << result.pack_id << "@" << result.version << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallOptions install_opts;

    app->add_option("source", install_opts.source, "Pack archive URL or local path")->required();
    app->add_option("-m,--manifest", install_opts.manifest, "Signed manifest for the archive")
        ->required()->check(CLI::ExistingFile);
    app->add_option("--app-version", install_opts.app_version, "Override the configured app version");

    app->callback([&opts]() {
        std::exit(cmd_install(opts, install_opts));
    });
}

} // namespace exampack::cli::commands
