#pragma once

#include "exampack/manifest.hpp"
#include "exampack/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace exampack {

// ============================================================================
// Content Items
// ============================================================================

struct Choice {
    std::string id;
    std::string text;
};

struct QuestionPackItem {
    std::string id;
    std::string type;        // single | multi | scenario | order
    std::string stem;
    std::vector<std::string> topic_ids;
    std::vector<Choice> choices;
    std::vector<std::string> correct;
    std::vector<std::string> correct_order;
    std::vector<std::string> exhibits;
    std::string difficulty;  // easy | med | hard
    std::optional<std::string> explanation;
};

struct DifficultyMix {
    double easy = 0.0;
    double med = 0.0;
    double hard = 0.0;
};

struct ExamSection {
    std::vector<std::string> topic_ids;
    int count = 0;
    std::optional<DifficultyMix> difficulty_mix;
};

struct ExamTemplatePackItem {
    std::string id;
    std::string name;
    int duration_minutes = 0;
    std::vector<ExamSection> sections;
    nlohmann::json calculator_rules;  // null when absent
};

struct TipPackItem {
    std::string id;
    std::vector<std::string> topic_ids;
    std::string title;
    std::string body;
    std::vector<std::string> tags;
    std::vector<std::string> related_question_ids;
};

// Typed views of records that already passed validation. Return nullopt
// instead of throwing when a record does not have the expected shape.
std::optional<QuestionPackItem> to_question(const nlohmann::json& j);
std::optional<ExamTemplatePackItem> to_exam_template(const nlohmann::json& j);
std::optional<TipPackItem> to_tip(const nlohmann::json& j);

// ============================================================================
// Content Files
// ============================================================================
//
// A ".jsonl" file holds one JSON record per non-empty line; any other file
// holds a JSON array of records.

struct ContentFileResult {
    bool ok = false;
    std::vector<ValidationIssue> errors;
    std::vector<nlohmann::json> items;
};

ContentFileResult parse_content_file(const std::string& text, const std::string& file_name);

struct PackContent {
    std::vector<nlohmann::json> questions;
    std::vector<nlohmann::json> exam_templates;
    std::vector<nlohmann::json> tips;
};

struct PackContentLoadResult {
    bool ok = false;
    std::vector<ValidationIssue> errors;
    PackContent content;
};

// Load the three content files named by manifest.files from pack_dir.
// Paths escaping pack_dir are rejected.
PackContentLoadResult load_pack_content(const std::string& pack_dir,
                                        const PackManifest& manifest);

} // namespace exampack
