/**
 * exampack CLI - keygen command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace exampack::cli::commands {

namespace {

struct KeygenOptions {
    std::string out;
};

int cmd_keygen(const GlobalOptions& opts, const KeygenOptions& keygen_opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto key = generate_signing_key();
    if (!key.ok) {
        print_error("Key generation failed: " + key.error, opts.json);
        return 1;
    }

    // The private key goes to a file when asked, never both places
    if (!keygen_opts.out.empty()) {
        auto written = atomic_write_file(keygen_opts.out, key.private_key_hex + "\n");
        if (!written.ok) {
            print_error("Failed to write " + keygen_opts.out + ": " + written.error, opts.json);
            return 1;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["public_key"] = key.public_key_hex;
        if (keygen_opts.out.empty()) {
            j["private_key"] = key.private_key_hex;
        } else {
            j["private_key_file"] = keygen_opts.out;
        }
        output_json(j);
    } else {
        std::cout << "public key:  " << key.public_key_hex << std::endl;
        if (keygen_opts.out.empty()) {
            std::cout << "private key: " << key.private_key_hex << std::endl;
        } else {
            std::cout << "private key written to " << keygen_opts.out << std::endl;
        }
    }
    return 0;
}

} // anonymous namespace

void setup_keygen(CLI::App* app, GlobalOptions& opts) {
    static KeygenOptions keygen_opts;

    app->add_option("-o,--out", keygen_opts.out, "Write the private key to this file");

    app->callback([&opts]() {
        std::exit(cmd_keygen(opts, keygen_opts));
    });
}

} // namespace exampack::cli::commands
