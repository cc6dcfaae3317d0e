/**
 * exampack CLI - pack command
 *
 * Validate a content directory, build its archive and write a signed
 * manifest next to it.
 */

#include "../common.hpp"
#include <exampack/archive.hpp>
#include <exampack/content.hpp>
#include <exampack/manifest.hpp>
#include <exampack/validator.hpp>
#include <CLI/CLI.hpp>

#include <algorithm>

namespace exampack::cli::commands {

namespace {

struct PackOptions {
    std::string dir;
    std::string manifest_template;
    std::string key;
    std::string key_file;
    std::string output;
    std::string manifest_output;
};

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

int cmd_pack(const GlobalOptions& opts, const PackOptions& pack_opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    std::string private_key = pack_opts.key;
    if (!pack_opts.key_file.empty()) {
        auto text = read_text_file(pack_opts.key_file);
        if (!text) {
            print_error("Failed to read key file: " + pack_opts.key_file, opts.json);
            return 1;
        }
        private_key = trim(*text);
    }
    if (private_key.empty()) {
        print_error("A signing key is required (--key or --key-file)", opts.json);
        return 1;
    }

    // Template supplies identity and files; checksum, signature and
    // createdAt are filled in here
    auto template_text = read_text_file(pack_opts.manifest_template);
    if (!template_text) {
        print_error("Failed to read manifest template: " + pack_opts.manifest_template, opts.json);
        return 1;
    }
    auto manifest_json = nlohmann::json::parse(*template_text, nullptr, false);
    if (manifest_json.is_discarded() || !manifest_json.is_object()) {
        print_error("Manifest template is not a JSON object", opts.json);
        return 1;
    }
    manifest_json["checksum"] = std::string(64, '0');
    manifest_json["signature"] = "";
    if (!manifest_json.contains("createdAt") || !manifest_json["createdAt"].is_number() ||
        manifest_json["createdAt"].get<double>() <= 0) {
        manifest_json["createdAt"] = current_time_ms();
    }

    auto parsed = parse_manifest(manifest_json);
    if (!parsed.ok) {
        print_error("Invalid manifest template: " + parsed.error, opts.json);
        return 1;
    }
    auto manifest = parsed.manifest;

    auto content = load_pack_content(pack_opts.dir, manifest);
    auto report = validate_entire_pack(manifest, content.content.questions,
                                       content.content.exam_templates, content.content.tips);
    auto media = validate_media_references(manifest, pack_opts.dir);
    for (const auto& w : report.warnings) print_warning(format_issue(w));
    for (const auto& w : media.warnings) print_warning(format_issue(w));

    if (!content.ok || !report.is_valid || !media.is_valid) {
        std::vector<std::string> details;
        for (const auto& e : content.errors) details.push_back(format_issue(e));
        for (const auto& e : report.errors) details.push_back(format_issue(e));
        for (const auto& e : media.errors) details.push_back(format_issue(e));
        print_error("Pack content is invalid", opts.json, details);
        return 1;
    }

    auto collected = collect_directory_entries(pack_opts.dir);
    if (!collected.ok) {
        print_error("Failed to read " + pack_opts.dir + ": " + collected.error, opts.json);
        return 1;
    }
    // The manifest travels beside the archive, never inside it
    auto& entries = collected.entries;
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [](const ArchiveEntry& e) { return e.path == MANIFEST_FILE; }),
                  entries.end());

    auto archive = create_pack_archive(entries);
    if (!archive.ok) {
        print_error("Failed to build archive: " + archive.error, opts.json);
        return 1;
    }

    auto hash = compute_sha256(archive.archive_data);
    if (!hash.ok) {
        print_error("Failed to hash archive: " + hash.error, opts.json);
        return 1;
    }
    manifest.checksum = hash.hex_digest;

    auto signature = sign_manifest(manifest, private_key);
    if (!signature.ok) {
        print_error("Failed to sign manifest: " + signature.error, opts.json);
        return 1;
    }
    manifest.signature = signature.signature_hex;

    std::string output = pack_opts.output.empty() ? manifest.id + "-" + manifest.version + ".pack"
                                                  : pack_opts.output;
    std::string manifest_output = pack_opts.manifest_output.empty() ? output + ".manifest.json"
                                                                    : pack_opts.manifest_output;

    auto written = atomic_write_file(output, archive.archive_data);
    if (!written.ok) {
        print_error("Failed to write " + output + ": " + written.error, opts.json);
        return 1;
    }
    written = atomic_write_file(manifest_output, serialize_manifest(manifest));
    if (!written.ok) {
        print_error("Failed to write " + manifest_output + ": " + written.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["archive"] = output;
        j["manifest"] = manifest_output;
        j["checksum"] = manifest.checksum;
        j["size"] = archive.archive_data.size();
        output_json(j);
    } else {
        std::cout << "Created " << output << " (" << archive.archive_data.size() << " bytes)" << std::endl;
        std::cout << "Manifest " << manifest_output << std::endl;
        std::cout << "SHA-256 " << manifest.checksum << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_pack(CLI::App* app, GlobalOptions& opts) {
    static PackOptions pack_opts;

    app->add_option("dir", pack_opts.dir, "Directory with the pack's content files")
        ->required()->check(CLI::ExistingDirectory);
    app->add_option("-m,--manifest", pack_opts.manifest_template, "Manifest template (JSON)")
        ->required()->check(CLI::ExistingFile);
    auto* key = app->add_option("-k,--key", pack_opts.key, "Ed25519 private key (hex)");
    auto* key_file = app->add_option("--key-file", pack_opts.key_file, "File holding the private key");
    key->excludes(key_file);
    app->add_option("-o,--out", pack_opts.output, "Archive output path (default <id>-<version>.pack)");
    app->add_option("--manifest-out", pack_opts.manifest_output,
                    "Signed manifest output path (default <out>.manifest.json)");

    app->callback([&opts]() {
        std::exit(cmd_pack(opts, pack_opts));
    });
}

} // namespace exampack::cli::commands
