#include "exampack/manifest.hpp"
#include "exampack/platform.hpp"

namespace exampack {

namespace {

// Collects the first conversion error while walking a JSON object
class FieldReader {
public:
    FieldReader(const nlohmann::json& j, std::string prefix)
        : j_(j), prefix_(std::move(prefix)) {}

    std::string required_string(const std::string& key) {
        if (!j_.contains(key)) {
            fail(key, "missing");
            return "";
        }
        if (!j_[key].is_string()) {
            fail(key, "must be a string");
            return "";
        }
        return j_[key].get<std::string>();
    }

    std::optional<std::string> optional_string(const std::string& key) {
        if (!j_.contains(key) || j_[key].is_null()) return std::nullopt;
        if (!j_[key].is_string()) {
            fail(key, "must be a string");
            return std::nullopt;
        }
        return j_[key].get<std::string>();
    }

    int64_t number(const std::string& key, bool required) {
        if (!j_.contains(key)) {
            if (required) fail(key, "missing");
            return 0;
        }
        if (!j_[key].is_number()) {
            fail(key, "must be a number");
            return 0;
        }
        return static_cast<int64_t>(j_[key].get<double>());
    }

    std::vector<std::string> string_array(const std::string& key) {
        std::vector<std::string> out;
        if (!j_.contains(key)) return out;
        if (!j_[key].is_array()) {
            fail(key, "must be an array");
            return out;
        }
        for (const auto& elem : j_[key]) {
            if (!elem.is_string()) {
                fail(key, "must contain only strings");
                return {};
            }
            out.push_back(elem.get<std::string>());
        }
        return out;
    }

    void fail(const std::string& key, const std::string& what) {
        if (error_.empty()) {
            error_ = prefix_ + key + " " + what;
        }
    }

    const std::string& error() const { return error_; }

private:
    const nlohmann::json& j_;
    std::string prefix_;
    std::string error_;
};

} // namespace

nlohmann::json manifest_to_json(const PackManifest& manifest) {
    nlohmann::json j;
    j["id"] = manifest.id;
    j["version"] = manifest.version;
    j["name"] = manifest.name;
    j["description"] = manifest.description;
    j["author"] = manifest.author;
    j["minAppVersion"] = manifest.min_app_version;
    if (manifest.max_app_version) {
        j["maxAppVersion"] = *manifest.max_app_version;
    }
    j["checksum"] = manifest.checksum;
    j["signature"] = manifest.signature;
    j["createdAt"] = manifest.created_at;

    nlohmann::json files;
    files["questions"] = manifest.files.questions;
    files["examTemplates"] = manifest.files.exam_templates;
    files["tips"] = manifest.files.tips;
    if (!manifest.files.media.empty()) {
        files["media"] = manifest.files.media;
    }
    j["files"] = files;

    if (manifest.metadata) {
        const auto& m = *manifest.metadata;
        j["metadata"] = {
            {"totalQuestions", m.total_questions},
            {"totalTips", m.total_tips},
            {"totalTemplates", m.total_templates},
            {"topics", m.topics},
            {"supportedLanguages", m.supported_languages},
        };
    }

    return j;
}

ManifestParseResult parse_manifest(const nlohmann::json& j) {
    ManifestParseResult result;

    if (!j.is_object()) {
        result.error = "manifest must be a JSON object";
        return result;
    }

    FieldReader reader(j, "");
    auto& m = result.manifest;
    m.id = reader.required_string("id");
    m.version = reader.required_string("version");
    m.name = reader.required_string("name");
    m.description = reader.required_string("description");
    m.author = reader.required_string("author");
    m.min_app_version = reader.required_string("minAppVersion");
    m.max_app_version = reader.optional_string("maxAppVersion");
    m.checksum = reader.required_string("checksum");
    m.signature = reader.required_string("signature");
    m.created_at = reader.number("createdAt", true);

    if (!reader.error().empty()) {
        result.error = reader.error();
        return result;
    }

    if (!j.contains("files") || !j["files"].is_object()) {
        result.error = "files missing or not an object";
        return result;
    }

    FieldReader files(j["files"], "files.");
    m.files.questions = files.required_string("questions");
    m.files.exam_templates = files.required_string("examTemplates");
    m.files.tips = files.required_string("tips");
    m.files.media = files.string_array("media");
    if (!files.error().empty()) {
        result.error = files.error();
        return result;
    }

    if (j.contains("metadata") && !j["metadata"].is_null()) {
        if (!j["metadata"].is_object()) {
            result.error = "metadata must be an object";
            return result;
        }
        FieldReader meta(j["metadata"], "metadata.");
        PackMetadata md;
        md.total_questions = meta.number("totalQuestions", false);
        md.total_tips = meta.number("totalTips", false);
        md.total_templates = meta.number("totalTemplates", false);
        md.topics = meta.string_array("topics");
        md.supported_languages = meta.string_array("supportedLanguages");
        if (!meta.error().empty()) {
            result.error = meta.error();
            return result;
        }
        m.metadata = md;
    }

    result.ok = true;
    return result;
}

ManifestParseResult parse_manifest(const std::string& json_str) {
    auto j = nlohmann::json::parse(json_str, nullptr, false);
    if (j.is_discarded()) {
        ManifestParseResult result;
        result.error = "manifest is not valid JSON";
        return result;
    }
    return parse_manifest(j);
}

ManifestParseResult read_manifest_file(const std::string& path) {
    auto content = read_text_file(path);
    if (!content) {
        ManifestParseResult result;
        result.error = "failed to read " + path;
        return result;
    }
    return parse_manifest(*content);
}

std::string serialize_manifest(const PackManifest& manifest) {
    return manifest_to_json(manifest).dump(2) + "\n";
}

bool is_valid_pack_id(const std::string& id) {
    if (id.empty()) return false;
    for (char c : id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

} // namespace exampack
