#include <doctest/doctest.h>
#include <exampack/config.hpp>
#include <exampack/platform.hpp>

#include "test_helpers.hpp"

using namespace exampack;
using namespace exampack::test;

TEST_CASE("default config lays out directories under root") {
    auto config = default_config("/data/exampack");
    CHECK(config.root == "/data/exampack");
    CHECK(config.packs_dir == join_path("/data/exampack", "packs"));
    CHECK(config.temp_dir == join_path("/data/exampack", "tmp"));
    CHECK(config.registry_dir == join_path("/data/exampack", "registry"));
    CHECK(config.app_version == "1.0.0");
    CHECK(config.download_timeout_seconds == 300);
    CHECK(config.temp_max_age_hours == 24);
    CHECK_FALSE(config.allow_insecure_http);
}

TEST_CASE("parse_config reads all fields") {
    auto result = parse_config(R"({
        "$schema": "exampack.config.v1",
        "app_version": " 2.1.0 ",
        "packs_dir": "content",
        "temp_dir": "/var/tmp/exampack",
        "trusted_keys": ["aa", "bb"],
        "download_timeout_seconds": 60,
        "connect_timeout_seconds": 5,
        "temp_max_age_hours": 2,
        "max_pack_age_days": 30,
        "allow_insecure_http": true
    })", "/root");

    REQUIRE(result.ok);
    CHECK(result.warnings.empty());
    const auto& config = result.config;
    CHECK(config.app_version == "2.1.0");
    CHECK(config.packs_dir == join_path("/root", "content"));
    CHECK(config.temp_dir == "/var/tmp/exampack");
    CHECK(config.registry_dir == join_path("/root", "registry"));
    CHECK(config.trusted_keys == std::vector<std::string>{"aa", "bb"});
    CHECK(config.download_timeout_seconds == 60);
    CHECK(config.connect_timeout_seconds == 5);
    CHECK(config.temp_max_age_hours == 2);
    CHECK(config.max_pack_age_days == 30);
    CHECK(config.allow_insecure_http);
}

TEST_CASE("parse_config requires the schema tag") {
    auto missing = parse_config(R"({"app_version": "1.0.0"})", "/root");
    CHECK_FALSE(missing.ok);
    CHECK(missing.error == "$schema missing");

    auto wrong = parse_config(R"({"$schema": "other.v2"})", "/root");
    CHECK_FALSE(wrong.ok);
    CHECK(wrong.error == "$schema mismatch: expected exampack.config.v1");
}

TEST_CASE("parse_config rejects malformed input") {
    CHECK_FALSE(parse_config("{not json", "/root").ok);
    CHECK_FALSE(parse_config("[]", "/root").ok);
    CHECK_FALSE(parse_config(R"({"$schema": "exampack.config.v1", "trusted_keys": "aa"})", "/root").ok);
    CHECK_FALSE(parse_config(R"({"$schema": "exampack.config.v1", "download_timeout_seconds": 0})", "/root").ok);
}

TEST_CASE("parse_config warns about unknown keys and missing trust anchors") {
    auto result = parse_config(R"({"$schema": "exampack.config.v1", "colour": "blue"})", "/root");
    REQUIRE(result.ok);
    REQUIRE(result.warnings.size() == 2);
    CHECK(result.warnings[0] == "unknown config key: colour");
    CHECK(result.warnings[1].find("no trusted_keys") == 0);
}

TEST_CASE("load_config falls back to defaults when the file is absent") {
    TempDir dir;
    auto result = load_config(dir.file("config.json"), dir.path());
    REQUIRE(result.ok);
    CHECK(result.config.packs_dir == join_path(dir.path(), "packs"));
}

TEST_CASE("load_config reads a file") {
    TempDir dir;
    write_text(dir.file("config.json"),
               R"({"$schema": "exampack.config.v1", "app_version": "3.0.0", "trusted_keys": ["aa"]})");
    auto result = load_config(dir.file("config.json"), dir.path());
    REQUIRE(result.ok);
    CHECK(result.config.app_version == "3.0.0");
}

TEST_CASE("resolve_root prefers an explicit override") {
    CHECK(resolve_root(std::string("/explicit/root")) == "/explicit/root");
    CHECK_FALSE(resolve_root(std::nullopt).empty());
}
