#include "exampack/schema.hpp"

namespace exampack {

namespace {

const char* const ID_PATTERN = "^[a-zA-Z0-9_-]+$";
const char* const SEMVER_PATTERN = "^\\d+\\.\\d+\\.\\d+$";
const char* const SHA256_PATTERN = "^[a-fA-F0-9]{64}$";
const char* const LANGUAGE_PATTERN = "^[a-z]{2}(-[A-Z]{2})?$";

SchemaPtr any_string() {
    return string_schema();
}

SchemaPtr string_array(std::optional<size_t> min_items = std::nullopt) {
    return array_schema(any_string(), min_items);
}

SchemaPtr pattern_string(const char* pattern) {
    StringSchema s;
    s.pattern = pattern;
    return string_schema(std::move(s));
}

SchemaPtr bounded_string(std::optional<size_t> min_length, std::optional<size_t> max_length) {
    StringSchema s;
    s.min_length = min_length;
    s.max_length = max_length;
    return string_schema(std::move(s));
}

SchemaPtr enum_string(std::vector<std::string> values) {
    StringSchema s;
    s.enum_values = std::move(values);
    return string_schema(std::move(s));
}

SchemaPtr build_manifest_schema() {
    auto files = object_schema(
        {"questions", "examTemplates", "tips"},
        {
            {"questions", any_string()},
            {"examTemplates", any_string()},
            {"tips", any_string()},
            {"media", string_array()},
        });

    auto metadata = object_schema(
        {},
        {
            {"totalQuestions", number_schema(0.0)},
            {"totalTips", number_schema(0.0)},
            {"totalTemplates", number_schema(0.0)},
            {"topics", string_array()},
            {"supportedLanguages", array_schema(pattern_string(LANGUAGE_PATTERN))},
        });

    return object_schema(
        {"id", "version", "name", "description", "author", "minAppVersion",
         "checksum", "signature", "createdAt", "files"},
        {
            {"id", pattern_string(ID_PATTERN)},
            {"version", pattern_string(SEMVER_PATTERN)},
            {"name", bounded_string(1, 100)},
            {"description", bounded_string(1, 500)},
            {"author", bounded_string(1, 100)},
            {"minAppVersion", pattern_string(SEMVER_PATTERN)},
            {"maxAppVersion", pattern_string(SEMVER_PATTERN)},
            {"checksum", pattern_string(SHA256_PATTERN)},
            {"signature", any_string()},
            {"createdAt", number_schema(0.0)},
            {"files", files},
            {"metadata", metadata},
        });
}

SchemaPtr build_question_schema() {
    auto choice = object_schema(
        {"id", "text"},
        {
            {"id", any_string()},
            {"text", bounded_string(1, std::nullopt)},
        });

    return object_schema(
        {"id", "type", "stem", "topicIds", "difficulty"},
        {
            {"id", pattern_string(ID_PATTERN)},
            {"type", enum_string({"single", "multi", "scenario", "order"})},
            {"stem", bounded_string(10, std::nullopt)},
            {"topicIds", string_array(1)},
            {"choices", array_schema(choice)},
            {"correct", string_array()},
            {"correctOrder", string_array()},
            {"exhibits", string_array()},
            {"difficulty", enum_string({"easy", "med", "hard"})},
            {"explanation", any_string()},
        });
}

SchemaPtr build_exam_template_schema() {
    auto difficulty_mix = object_schema(
        {},
        {
            {"easy", number_schema(0.0, 1.0)},
            {"med", number_schema(0.0, 1.0)},
            {"hard", number_schema(0.0, 1.0)},
        });

    auto section = object_schema(
        {"topicIds", "count"},
        {
            {"topicIds", string_array(1)},
            {"count", number_schema(1.0)},
            {"difficultyMix", difficulty_mix},
        });

    return object_schema(
        {"id", "name", "durationMinutes", "sections"},
        {
            {"id", pattern_string(ID_PATTERN)},
            {"name", bounded_string(1, 100)},
            {"durationMinutes", number_schema(1.0, 600.0)},
            {"sections", array_schema(section, 1)},
            {"calculatorRules", object_schema({})},
        });
}

SchemaPtr build_tip_schema() {
    return object_schema(
        {"id", "topicIds", "title", "body"},
        {
            {"id", pattern_string(ID_PATTERN)},
            {"topicIds", string_array(1)},
            {"title", bounded_string(1, 200)},
            {"body", bounded_string(10, std::nullopt)},
            {"tags", string_array()},
            {"relatedQuestionIds", string_array()},
        });
}

} // namespace

const SchemaNode& manifest_schema() {
    static const SchemaPtr schema = build_manifest_schema();
    return *schema;
}

const SchemaNode& question_schema() {
    static const SchemaPtr schema = build_question_schema();
    return *schema;
}

const SchemaNode& exam_template_schema() {
    static const SchemaPtr schema = build_exam_template_schema();
    return *schema;
}

const SchemaNode& tip_schema() {
    static const SchemaPtr schema = build_tip_schema();
    return *schema;
}

} // namespace exampack
