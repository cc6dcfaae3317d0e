#pragma once

#include <exampack/archive.hpp>
#include <exampack/manifest.hpp>
#include <exampack/platform.hpp>
#include <exampack/verifier.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace exampack::test {

namespace fs = std::filesystem;

// Helper to create temporary directory
class TempDir {
public:
    TempDir() {
        path_ = fs::temp_directory_path() / ("exampack_test_" + generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }
    std::string file(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

inline void write_text(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::vector<uint8_t> to_bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// ============================================================================
// Sample Content
// ============================================================================

inline nlohmann::json sample_question(const std::string& id, const std::string& type = "single") {
    nlohmann::json q = {
        {"id", id},
        {"type", type},
        {"stem", "Which port does HTTPS use by default?"},
        {"topicIds", {"networking"}},
        {"difficulty", "easy"},
    };
    if (type == "order") {
        q["correctOrder"] = {"a", "b", "c"};
    } else {
        q["choices"] = {{{"id", "a"}, {"text", "443"}}, {{"id", "b"}, {"text", "80"}}};
        q["correct"] = {"a"};
    }
    return q;
}

inline nlohmann::json sample_template(const std::string& id) {
    return {
        {"id", id},
        {"name", "Full practice exam"},
        {"durationMinutes", 90},
        {"sections", {{{"topicIds", {"networking"}},
                       {"count", 10},
                       {"difficultyMix", {{"easy", 0.5}, {"med", 0.3}, {"hard", 0.2}}}}}},
    };
}

inline nlohmann::json sample_tip(const std::string& id) {
    return {
        {"id", id},
        {"topicIds", {"networking"}},
        {"title", "Remember the well-known ports"},
        {"body", "Ports below 1024 are reserved for well-known services."},
    };
}

inline std::vector<nlohmann::json> sample_questions(size_t count) {
    std::vector<nlohmann::json> out;
    for (size_t i = 0; i < count; ++i) {
        out.push_back(sample_question("q" + std::to_string(i + 1)));
    }
    return out;
}

inline std::string to_jsonl(const std::vector<nlohmann::json>& items) {
    std::string out;
    for (const auto& item : items) {
        out += item.dump() + "\n";
    }
    return out;
}

// Unsigned manifest with valid identity fields and a zero checksum
inline PackManifest sample_manifest(const std::string& id = "networking-basics",
                                    const std::string& version = "1.0.0") {
    PackManifest m;
    m.id = id;
    m.version = version;
    m.name = "Networking Basics";
    m.description = "Introductory networking questions";
    m.author = "Exam Team";
    m.min_app_version = "1.0.0";
    m.checksum = std::string(64, '0');
    m.signature = std::string(128, '0');
    m.created_at = current_time_ms();
    m.files.questions = "questions.jsonl";
    m.files.exam_templates = "examTemplates.json";
    m.files.tips = "tips.json";
    return m;
}

// ============================================================================
// Signed Packs
// ============================================================================

struct BuiltPack {
    PackManifest manifest;
    std::vector<uint8_t> archive;
};

inline std::vector<ArchiveEntry> pack_entries(const std::vector<nlohmann::json>& questions) {
    std::vector<ArchiveEntry> entries;
    entries.push_back({"questions.jsonl", ArchiveEntryType::RegularFile, to_bytes(to_jsonl(questions))});
    entries.push_back({"examTemplates.json", ArchiveEntryType::RegularFile,
                       to_bytes(nlohmann::json::array({sample_template("exam1")}).dump(2))});
    entries.push_back({"tips.json", ArchiveEntryType::RegularFile,
                       to_bytes(nlohmann::json::array({sample_tip("t1")}).dump(2))});
    return entries;
}

// Archive the entries, then fill in checksum and signature
inline BuiltPack sign_pack(PackManifest manifest, const std::vector<ArchiveEntry>& entries,
                           const SigningKey& key) {
    BuiltPack pack;
    auto archive = create_pack_archive(entries);
    pack.archive = archive.archive_data;

    manifest.checksum = compute_sha256(pack.archive).hex_digest;
    manifest.signature = sign_manifest(manifest, key.private_key_hex).signature_hex;
    pack.manifest = manifest;
    return pack;
}

inline BuiltPack build_signed_pack(const std::string& id, const std::string& version,
                                   const SigningKey& key, size_t question_count = 3) {
    auto manifest = sample_manifest(id, version);
    PackMetadata metadata;
    metadata.total_questions = static_cast<int64_t>(question_count);
    metadata.total_tips = 1;
    metadata.total_templates = 1;
    metadata.topics = {"networking"};
    metadata.supported_languages = {"en"};
    manifest.metadata = metadata;
    return sign_pack(manifest, pack_entries(sample_questions(question_count)), key);
}

inline std::string write_archive(const TempDir& dir, const std::string& name,
                                 const std::vector<uint8_t>& data) {
    std::string path = dir.file(name);
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return path;
}

} // namespace exampack::test
