#include <doctest/doctest.h>
#include <exampack/config.hpp>
#include <exampack/manifest.hpp>
#include <exampack/platform.hpp>

#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdio>
#include <string>

#include <sys/wait.h>

using namespace exampack;
using namespace exampack::test;

namespace {

struct CliResult {
    int exit_code = -1;
    std::string out;  // stdout only; diagnostics go to stderr
};

// Run the built exampack binary with a fixed root
CliResult run_cli(const std::string& root, const std::string& args) {
    std::string command = std::string("'") + EXAMPACK_CLI_PATH + "' --root '" + root + "' " +
                          args + " 2>/dev/null";

    CliResult result;
    FILE* pipe = popen(command.c_str(), "r");
    REQUIRE(pipe != nullptr);

    std::array<char, 4096> buffer;
    size_t n;
    while ((n = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        result.out.append(buffer.data(), n);
    }

    int status = pclose(pipe);
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

nlohmann::json run_json(const std::string& root, const std::string& args, int expected_exit = 0) {
    auto result = run_cli(root, "--json " + args);
    INFO("exampack " << args << "\n" << result.out);
    CHECK(result.exit_code == expected_exit);

    auto j = nlohmann::json::parse(result.out, nullptr, false);
    REQUIRE_FALSE(j.is_discarded());
    REQUIRE(j.is_object());
    return j;
}

// Root with a config trusting public_key, plus an authoring directory
struct CliFixture {
    TempDir dir;
    std::string root = dir.file("root");
    std::string content_dir = dir.file("content");
    std::string template_path = dir.file("manifest.template.json");

    void write_config(const std::string& public_key) {
        nlohmann::json config = {
            {"$schema", CONFIG_SCHEMA},
            {"app_version", "1.5.0"},
            {"trusted_keys", {public_key}},
        };
        write_text(join_path(root, CONFIG_FILE), config.dump(2));
    }

    void write_content(const std::string& id, const std::string& version) {
        for (const auto& entry : pack_entries(sample_questions(3))) {
            write_text(join_path(content_dir, entry.path),
                       std::string(entry.data.begin(), entry.data.end()));
        }

        auto manifest = sample_manifest(id, version);
        PackMetadata metadata;
        metadata.total_questions = 3;
        metadata.total_tips = 1;
        metadata.total_templates = 1;
        metadata.topics = {"networking"};
        metadata.supported_languages = {"en"};
        manifest.metadata = metadata;
        write_text(template_path, manifest_to_json(manifest).dump(2));
    }
};

} // namespace

// ============================================================================
// Authoring
// ============================================================================

TEST_CASE("keygen prints a key pair as JSON") {
    CliFixture f;
    auto j = run_json(f.root, "keygen");

    CHECK(j["ok"] == true);
    REQUIRE(j["public_key"].is_string());
    REQUIRE(j["private_key"].is_string());
    CHECK(j["public_key"].get<std::string>().size() == 64);
    CHECK(j["private_key"].get<std::string>().size() == 64);
}

TEST_CASE("keygen -o keeps the private key out of stdout") {
    CliFixture f;
    std::string key_file = f.dir.file("signing.key");
    auto j = run_json(f.root, "keygen -o '" + key_file + "'");

    CHECK(j["private_key_file"] == key_file);
    CHECK_FALSE(j.contains("private_key"));
    auto text = read_text_file(key_file);
    REQUIRE(text.has_value());
    CHECK(text->size() == 65);
}

TEST_CASE("pack without a key fails with a JSON error") {
    CliFixture f;
    f.write_content("networking-basics", "1.0.0");

    auto j = run_json(f.root, "pack '" + f.content_dir + "' -m '" + f.template_path + "'", 1);
    CHECK(j["ok"] == false);
    CHECK(j["error"] == "A signing key is required (--key or --key-file)");
}

TEST_CASE("validate reports invalid content with exit code 1") {
    CliFixture f;
    f.write_content("networking-basics", "1.0.0");
    write_text(join_path(f.content_dir, "questions.jsonl"), "{not json}\n");
    auto manifest = manifest_to_json(sample_manifest());
    write_text(join_path(f.content_dir, MANIFEST_FILE), manifest.dump(2));

    CHECK(run_cli(f.root, "validate '" + f.content_dir + "'").exit_code == 1);

    auto j = run_json(f.root, "validate '" + f.content_dir + "'", 1);
    CHECK(j["ok"] == false);
    REQUIRE(j["errors"].is_array());
    REQUIRE_FALSE(j["errors"].empty());
    bool found = false;
    for (const auto& e : j["errors"]) {
        found = found || (e["file"] == "questions.jsonl" && e.value("line", 0) == 1);
    }
    CHECK(found);
    CHECK(j["warnings"].is_array());
}

// ============================================================================
// Install Workflow
// ============================================================================

TEST_CASE("keygen, pack, install, list, verify, uninstall") {
    CliFixture f;
    std::string key_file = f.dir.file("signing.key");
    auto key = run_json(f.root, "keygen -o '" + key_file + "'");
    f.write_config(key["public_key"].get<std::string>());
    f.write_content("networking-basics", "1.0.0");

    std::string archive = f.dir.file("networking-basics-1.0.0.pack");
    std::string manifest = archive + ".manifest.json";
    auto packed = run_json(f.root, "pack '" + f.content_dir + "' -m '" + f.template_path +
                                       "' --key-file '" + key_file + "' -o '" + archive + "'");
    CHECK(packed["ok"] == true);
    CHECK(packed["archive"] == archive);
    CHECK(packed["manifest"] == manifest);
    CHECK(packed["checksum"].get<std::string>().size() == 64);
    CHECK(packed["size"].get<uint64_t>() > 0);

    auto signed_manifest = read_manifest_file(manifest);
    REQUIRE(signed_manifest.ok);
    CHECK(signed_manifest.manifest.checksum == packed["checksum"].get<std::string>());

    auto installed = run_json(f.root, "install '" + archive + "' -m '" + manifest + "'");
    CHECK(installed["ok"] == true);
    CHECK(installed["pack"]["id"] == "networking-basics");
    CHECK(installed["pack"]["version"] == "1.0.0");
    CHECK(is_regular_file(join_path(installed["pack"]["path"].get<std::string>(), MANIFEST_FILE)));

    auto listed = run_json(f.root, "list");
    REQUIRE(listed["packs"].is_array());
    REQUIRE(listed["packs"].size() == 1);
    CHECK(listed["packs"][0]["id"] == "networking-basics");
    CHECK(listed["packs"][0]["version"] == "1.0.0");
    CHECK(listed["packs"][0]["record"].is_object());

    CHECK(run_cli(f.root, "verify networking-basics").exit_code == 0);

    auto removed = run_json(f.root, "uninstall networking-basics");
    CHECK(removed["ok"] == true);
    CHECK(removed["pack"]["id"] == "networking-basics");
    CHECK(removed["pack"]["version"] == "1.0.0");

    auto empty = run_json(f.root, "list");
    CHECK(empty["packs"].empty());

    // Uninstalling again still succeeds
    auto again = run_json(f.root, "uninstall networking-basics");
    CHECK(again["ok"] == true);
    CHECK(again["pack"]["version"].is_null());
}

TEST_CASE("install rejects a pack signed by an untrusted key") {
    CliFixture f;
    auto trusted = run_json(f.root, "keygen");
    auto untrusted = run_json(f.root, "keygen");
    f.write_config(trusted["public_key"].get<std::string>());
    f.write_content("networking-basics", "1.0.0");

    std::string archive = f.dir.file("pack.pack");
    std::string manifest = archive + ".manifest.json";
    run_json(f.root, "pack '" + f.content_dir + "' -m '" + f.template_path + "' --key " +
                         untrusted["private_key"].get<std::string>() + " -o '" + archive + "'");

    auto j = run_json(f.root, "install '" + archive + "' -m '" + manifest + "'", 1);
    CHECK(j["ok"] == false);
    REQUIRE(j["details"].is_array());
    CHECK_FALSE(j["details"].empty());

    auto listed = run_json(f.root, "list");
    CHECK(listed["packs"].empty());
}

TEST_CASE("install refuses a pack that needs a newer app") {
    CliFixture f;
    std::string key_file = f.dir.file("signing.key");
    auto key = run_json(f.root, "keygen -o '" + key_file + "'");
    f.write_config(key["public_key"].get<std::string>());
    f.write_content("networking-basics", "1.0.0");

    auto template_json = nlohmann::json::parse(*read_text_file(f.template_path));
    template_json["minAppVersion"] = "2.0.0";
    write_text(f.template_path, template_json.dump(2));

    std::string archive = f.dir.file("pack.pack");
    run_json(f.root, "pack '" + f.content_dir + "' -m '" + f.template_path +
                         "' --key-file '" + key_file + "' -o '" + archive + "'");

    auto j = run_json(f.root, "install '" + archive + "' -m '" + archive + ".manifest.json'", 1);
    CHECK(j["ok"] == false);
    CHECK(j["error"].get<std::string>().find("2.0.0") != std::string::npos);

    // Same pack installs once the configured version is overridden
    auto ok = run_json(f.root, "install '" + archive + "' -m '" + archive +
                                   ".manifest.json' --app-version 2.1.0");
    CHECK(ok["ok"] == true);
}

// ============================================================================
// Storage
// ============================================================================

TEST_CASE("usage and cleanup on an empty root") {
    CliFixture f;
    f.write_config(std::string(64, 'a'));

    auto usage = run_json(f.root, "usage");
    CHECK(usage["packs"].is_array());
    CHECK(usage["packs"].empty());

    auto cleaned = run_json(f.root, "cleanup");
    CHECK(cleaned["ok"] == true);
    CHECK(cleaned["removed"] == 0);
}
