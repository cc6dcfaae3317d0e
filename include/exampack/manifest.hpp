#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace exampack {

// ============================================================================
// Pack Manifest (manifest.json)
// ============================================================================

struct PackFiles {
    std::string questions;        // e.g. "questions.jsonl"
    std::string exam_templates;   // e.g. "examTemplates.json"
    std::string tips;             // e.g. "tips.json"
    std::vector<std::string> media;
};

struct PackMetadata {
    int64_t total_questions = 0;
    int64_t total_tips = 0;
    int64_t total_templates = 0;
    std::vector<std::string> topics;
    std::vector<std::string> supported_languages;
};

struct PackManifest {
    std::string id;
    std::string version;
    std::string name;
    std::string description;
    std::string author;
    std::string min_app_version;
    std::optional<std::string> max_app_version;
    std::string checksum;    // SHA-256 of the pack archive, 64 hex chars
    std::string signature;   // Ed25519 signature, hex
    int64_t created_at = 0;  // epoch milliseconds
    PackFiles files;
    std::optional<PackMetadata> metadata;
};

// JSON keys follow the wire format (camelCase)
nlohmann::json manifest_to_json(const PackManifest& manifest);

struct ManifestParseResult {
    bool ok = false;
    std::string error;
    PackManifest manifest;
};

// Tolerant conversion: missing or mistyped fields are reported, never thrown.
// Schema-level checks belong to validate_manifest().
ManifestParseResult parse_manifest(const nlohmann::json& j);
ManifestParseResult parse_manifest(const std::string& json_str);

// Read <dir>/manifest.json
ManifestParseResult read_manifest_file(const std::string& path);

// Pretty-printed (2-space indent) serialization as stored on disk
std::string serialize_manifest(const PackManifest& manifest);

// Pack ids name directories and registry files: [a-zA-Z0-9_-]+
bool is_valid_pack_id(const std::string& id);

} // namespace exampack
