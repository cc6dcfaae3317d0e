#include "exampack/validator.hpp"
#include "exampack/archive.hpp"
#include "exampack/content.hpp"
#include "exampack/platform.hpp"
#include "exampack/schema.hpp"

#include <cmath>
#include <regex>
#include <unordered_map>

namespace exampack {

namespace {

constexpr double DIFFICULTY_MIX_TOLERANCE = 0.001;

void append_schema_issues(std::vector<ValidationIssue>& errors,
                          const std::vector<FieldIssue>& issues,
                          const std::string& file,
                          std::optional<size_t> line) {
    for (const auto& issue : issues) {
        errors.push_back({file, line, issue.field, issue.message});
    }
}

void append(std::vector<ValidationIssue>& to, const std::vector<ValidationIssue>& from) {
    to.insert(to.end(), from.begin(), from.end());
}

// Tracks first occurrence of each id within one content list
class DuplicateTracker {
public:
    explicit DuplicateTracker(std::string label) : label_(std::move(label)) {}

    void check(const nlohmann::json& item, const std::string& file, size_t line,
               std::vector<ValidationIssue>& errors) {
        if (!item.is_object()) return;
        auto it = item.find("id");
        if (it == item.end() || !it->is_string()) return;

        const auto& id = it->get_ref<const std::string&>();
        auto [pos, inserted] = first_seen_.emplace(id, line);
        if (!inserted) {
            errors.push_back({file, line, "id",
                              "Duplicate " + label_ + " ID: " + id +
                              " (first defined at line " + std::to_string(pos->second) + ")"});
        }
    }

private:
    std::string label_;
    std::unordered_map<std::string, size_t> first_seen_;
};

size_t array_size(const nlohmann::json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end() || !it->is_array()) return 0;
    return it->size();
}

bool has_array(const nlohmann::json& item, const char* key) {
    auto it = item.find(key);
    return it != item.end() && it->is_array();
}

double number_or_zero(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return 0.0;
    return it->get<double>();
}

std::optional<double> metadata_number(const nlohmann::json& manifest, const char* key) {
    if (!manifest.is_object()) return std::nullopt;
    auto meta = manifest.find("metadata");
    if (meta == manifest.end() || !meta->is_object()) return std::nullopt;
    auto it = meta->find(key);
    if (it == meta->end() || !it->is_number()) return std::nullopt;
    return it->get<double>();
}

bool is_image_file(const std::string& name) {
    static const std::regex image_ext(R"(\.(png|jpg|jpeg|gif|svg)$)",
                                      std::regex::ECMAScript | std::regex::icase);
    return std::regex_search(name, image_ext);
}

void check_question_rules(const nlohmann::json& q, const std::string& file, size_t line,
                          PackValidationResult& result) {
    auto type_it = q.find("type");
    if (type_it == q.end() || !type_it->is_string()) return;
    const auto& type = type_it->get_ref<const std::string&>();

    if (type == "single" || type == "multi" || type == "scenario") {
        if (array_size(q, "choices") < 2) {
            result.errors.push_back({file, line, "choices",
                                     "Choice questions must have at least 2 choices"});
        }

        size_t correct = array_size(q, "correct");
        if (correct == 0) {
            result.errors.push_back({file, line, "correct",
                                     "Choice questions must have correct answers specified"});
        }

        if (type == "single" && correct > 1) {
            result.warnings.push_back({file, line, "correct",
                                       "Single choice questions should have only one correct answer"});
        }
    }

    if (type == "order" && array_size(q, "correctOrder") < 2) {
        result.errors.push_back({file, line, "correctOrder",
                                 "Ordering questions must have at least 2 items in correct order"});
    }

    if (has_array(q, "exhibits")) {
        for (const auto& exhibit : q["exhibits"]) {
            if (exhibit.is_string() && !is_image_file(exhibit.get_ref<const std::string&>())) {
                result.warnings.push_back({file, line, "exhibits",
                                           "Exhibit file should be an image: " +
                                           exhibit.get<std::string>()});
            }
        }
    }
}

void check_difficulty_mix(const nlohmann::json& tmpl, const std::string& file, size_t line,
                          PackValidationResult& result) {
    if (!has_array(tmpl, "sections")) return;

    const auto& sections = tmpl["sections"];
    for (size_t i = 0; i < sections.size(); ++i) {
        const auto& section = sections[i];
        if (!section.is_object()) continue;
        auto mix = section.find("difficultyMix");
        if (mix == section.end() || !mix->is_object()) continue;

        double total = number_or_zero(*mix, "easy") +
                       number_or_zero(*mix, "med") +
                       number_or_zero(*mix, "hard");
        if (std::fabs(total - 1.0) > DIFFICULTY_MIX_TOLERANCE) {
            result.warnings.push_back({file, line,
                                       "sections[" + std::to_string(i) + "].difficultyMix",
                                       "Difficulty mix should sum to 1.0"});
        }
    }
}

std::string file_or_default(const nlohmann::json& manifest, const char* key, const char* fallback) {
    if (manifest.is_object()) {
        auto files = manifest.find("files");
        if (files != manifest.end() && files->is_object()) {
            auto it = files->find(key);
            if (it != files->end() && it->is_string() && !it->get_ref<const std::string&>().empty()) {
                return it->get<std::string>();
            }
        }
    }
    return fallback;
}

} // namespace

std::string format_issue(const ValidationIssue& issue) {
    std::string out = issue.file;
    if (issue.line) {
        out += ":" + std::to_string(*issue.line);
    }
    if (!issue.field.empty()) {
        out += " " + issue.field;
    }
    out += ": " + issue.message;
    return out;
}

PackValidationResult validate_manifest(const nlohmann::json& manifest) {
    PackValidationResult result;

    append_schema_issues(result.errors, validate_schema(manifest_schema(), manifest),
                         MANIFEST_FILE, std::nullopt);

    auto total_questions = metadata_number(manifest, "totalQuestions");
    if (total_questions && *total_questions <= 0) {
        result.warnings.push_back({MANIFEST_FILE, std::nullopt, "metadata.totalQuestions",
                                   "Pack should contain at least one question"});
    }

    result.is_valid = result.errors.empty();
    return result;
}

PackValidationResult validate_manifest(const PackManifest& manifest) {
    return validate_manifest(manifest_to_json(manifest));
}

PackValidationResult validate_questions(const std::vector<nlohmann::json>& questions,
                                        const std::string& file) {
    PackValidationResult result;
    DuplicateTracker ids("question");

    for (size_t i = 0; i < questions.size(); ++i) {
        const auto& q = questions[i];
        size_t line = i + 1;

        append_schema_issues(result.errors, validate_schema(question_schema(), q), file, line);
        if (!q.is_object()) continue;

        ids.check(q, file, line, result.errors);
        check_question_rules(q, file, line, result);
    }

    result.is_valid = result.errors.empty();
    return result;
}

PackValidationResult validate_exam_templates(const std::vector<nlohmann::json>& templates,
                                             const std::string& file) {
    PackValidationResult result;
    DuplicateTracker ids("template");

    for (size_t i = 0; i < templates.size(); ++i) {
        const auto& t = templates[i];
        size_t line = i + 1;

        append_schema_issues(result.errors, validate_schema(exam_template_schema(), t), file, line);
        if (!t.is_object()) continue;

        ids.check(t, file, line, result.errors);
        check_difficulty_mix(t, file, line, result);
    }

    result.is_valid = result.errors.empty();
    return result;
}

PackValidationResult validate_tips(const std::vector<nlohmann::json>& tips,
                                   const std::string& file) {
    PackValidationResult result;
    DuplicateTracker ids("tip");

    for (size_t i = 0; i < tips.size(); ++i) {
        const auto& tip = tips[i];
        size_t line = i + 1;

        append_schema_issues(result.errors, validate_schema(tip_schema(), tip), file, line);
        if (!tip.is_object()) continue;

        ids.check(tip, file, line, result.errors);
    }

    result.is_valid = result.errors.empty();
    return result;
}

PackValidationResult validate_entire_pack(const nlohmann::json& manifest,
                                          const std::vector<nlohmann::json>& questions,
                                          const std::vector<nlohmann::json>& templates,
                                          const std::vector<nlohmann::json>& tips) {
    auto manifest_result = validate_manifest(manifest);
    auto questions_result = validate_questions(
        questions, file_or_default(manifest, "questions", QUESTIONS_FILE));
    auto templates_result = validate_exam_templates(
        templates, file_or_default(manifest, "examTemplates", EXAM_TEMPLATES_FILE));
    auto tips_result = validate_tips(
        tips, file_or_default(manifest, "tips", TIPS_FILE));

    std::vector<ValidationIssue> cross_errors;
    std::vector<ValidationIssue> cross_warnings;

    auto total_questions = metadata_number(manifest, "totalQuestions");
    if (total_questions && *total_questions != static_cast<double>(questions.size())) {
        cross_warnings.push_back({MANIFEST_FILE, std::nullopt, "metadata.totalQuestions",
                                  "Metadata count (" + std::to_string(static_cast<long long>(*total_questions)) +
                                  ") doesn't match actual questions (" +
                                  std::to_string(questions.size()) + ")"});
    }

    PackValidationResult result;
    result.is_valid = manifest_result.is_valid && questions_result.is_valid &&
                      templates_result.is_valid && tips_result.is_valid &&
                      cross_errors.empty();

    append(result.errors, manifest_result.errors);
    append(result.errors, questions_result.errors);
    append(result.errors, templates_result.errors);
    append(result.errors, tips_result.errors);
    append(result.errors, cross_errors);

    append(result.warnings, manifest_result.warnings);
    append(result.warnings, questions_result.warnings);
    append(result.warnings, templates_result.warnings);
    append(result.warnings, tips_result.warnings);
    append(result.warnings, cross_warnings);

    return result;
}

PackValidationResult validate_entire_pack(const PackManifest& manifest,
                                          const std::vector<nlohmann::json>& questions,
                                          const std::vector<nlohmann::json>& templates,
                                          const std::vector<nlohmann::json>& tips) {
    return validate_entire_pack(manifest_to_json(manifest), questions, templates, tips);
}

PackValidationResult validate_media_references(const PackManifest& manifest,
                                               const std::string& pack_dir) {
    PackValidationResult result;

    for (size_t i = 0; i < manifest.files.media.size(); ++i) {
        const auto& media = manifest.files.media[i];
        std::string field = "files.media[" + std::to_string(i) + "]";

        auto safe = validate_extraction_path(media, pack_dir);
        if (!safe.safe) {
            result.errors.push_back({MANIFEST_FILE, std::nullopt, field, safe.error});
            continue;
        }
        if (!is_regular_file(join_path(pack_dir, safe.normalized_path))) {
            result.warnings.push_back({MANIFEST_FILE, std::nullopt, field,
                                       "Media file not found in pack: " + media});
        }
    }

    result.is_valid = result.errors.empty();
    return result;
}

PackValidationResult validate_pack_directory(const std::string& pack_dir) {
    PackValidationResult result;

    auto text = read_text_file(join_path(pack_dir, MANIFEST_FILE));
    if (!text) {
        result.errors.push_back({MANIFEST_FILE, std::nullopt, "", "manifest.json not found"});
        result.is_valid = false;
        return result;
    }

    auto manifest_json = nlohmann::json::parse(*text, nullptr, false);
    if (manifest_json.is_discarded()) {
        result.errors.push_back({MANIFEST_FILE, std::nullopt, "", "File is not valid JSON"});
        result.is_valid = false;
        return result;
    }

    auto parsed = parse_manifest(manifest_json);
    if (!parsed.ok) {
        // Structural report is still useful even when files cannot be located
        return validate_manifest(manifest_json);
    }

    auto loaded = load_pack_content(pack_dir, parsed.manifest);
    result = validate_entire_pack(manifest_json,
                                  loaded.content.questions,
                                  loaded.content.exam_templates,
                                  loaded.content.tips);
    append(result.errors, loaded.errors);

    auto media = validate_media_references(parsed.manifest, pack_dir);
    append(result.errors, media.errors);
    append(result.warnings, media.warnings);

    result.is_valid = result.is_valid && loaded.ok && media.is_valid;
    return result;
}

} // namespace exampack
