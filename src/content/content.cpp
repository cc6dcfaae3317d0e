#include "exampack/content.hpp"
#include "exampack/archive.hpp"
#include "exampack/platform.hpp"

#include <sstream>

namespace exampack {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> string_list(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it != j.end() && it->is_array()) {
        for (const auto& elem : *it) {
            out.push_back(elem.get<std::string>());
        }
    }
    return out;
}

} // namespace

std::optional<QuestionPackItem> to_question(const nlohmann::json& j) {
    try {
        QuestionPackItem q;
        q.id = j.at("id").get<std::string>();
        q.type = j.at("type").get<std::string>();
        q.stem = j.at("stem").get<std::string>();
        q.topic_ids = string_list(j, "topicIds");
        if (auto it = j.find("choices"); it != j.end() && it->is_array()) {
            for (const auto& c : *it) {
                q.choices.push_back({c.at("id").get<std::string>(), c.at("text").get<std::string>()});
            }
        }
        q.correct = string_list(j, "correct");
        q.correct_order = string_list(j, "correctOrder");
        q.exhibits = string_list(j, "exhibits");
        q.difficulty = j.at("difficulty").get<std::string>();
        if (auto it = j.find("explanation"); it != j.end() && it->is_string()) {
            q.explanation = it->get<std::string>();
        }
        return q;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<ExamTemplatePackItem> to_exam_template(const nlohmann::json& j) {
    try {
        ExamTemplatePackItem t;
        t.id = j.at("id").get<std::string>();
        t.name = j.at("name").get<std::string>();
        t.duration_minutes = static_cast<int>(j.at("durationMinutes").get<double>());
        for (const auto& s : j.at("sections")) {
            ExamSection section;
            section.topic_ids = string_list(s, "topicIds");
            section.count = static_cast<int>(s.at("count").get<double>());
            if (auto it = s.find("difficultyMix"); it != s.end() && it->is_object()) {
                DifficultyMix mix;
                mix.easy = it->value("easy", 0.0);
                mix.med = it->value("med", 0.0);
                mix.hard = it->value("hard", 0.0);
                section.difficulty_mix = mix;
            }
            t.sections.push_back(std::move(section));
        }
        if (auto it = j.find("calculatorRules"); it != j.end()) {
            t.calculator_rules = *it;
        }
        return t;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<TipPackItem> to_tip(const nlohmann::json& j) {
    try {
        TipPackItem tip;
        tip.id = j.at("id").get<std::string>();
        tip.topic_ids = string_list(j, "topicIds");
        tip.title = j.at("title").get<std::string>();
        tip.body = j.at("body").get<std::string>();
        tip.tags = string_list(j, "tags");
        tip.related_question_ids = string_list(j, "relatedQuestionIds");
        return tip;
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

ContentFileResult parse_content_file(const std::string& text, const std::string& file_name) {
    ContentFileResult result;

    if (ends_with(file_name, ".jsonl")) {
        std::istringstream stream(text);
        std::string line;
        size_t line_no = 0;
        while (std::getline(stream, line)) {
            ++line_no;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (line.find_first_not_of(" \t") == std::string::npos) continue;

            auto j = nlohmann::json::parse(line, nullptr, false);
            if (j.is_discarded()) {
                result.errors.push_back({file_name, line_no, "", "Line is not valid JSON"});
                continue;
            }
            result.items.push_back(std::move(j));
        }
    } else {
        auto j = nlohmann::json::parse(text, nullptr, false);
        if (j.is_discarded()) {
            result.errors.push_back({file_name, std::nullopt, "", "File is not valid JSON"});
        } else if (!j.is_array()) {
            result.errors.push_back({file_name, std::nullopt, "",
                                     std::string("Expected array, got ") + j.type_name()});
        } else {
            for (auto& item : j) {
                result.items.push_back(std::move(item));
            }
        }
    }

    result.ok = result.errors.empty();
    return result;
}

PackContentLoadResult load_pack_content(const std::string& pack_dir,
                                        const PackManifest& manifest) {
    PackContentLoadResult result;

    auto load = [&](const std::string& rel, const char* field,
                    std::vector<nlohmann::json>& out) {
        auto safe = validate_extraction_path(rel, pack_dir);
        if (!safe.safe) {
            result.errors.push_back({"manifest.json", std::nullopt, field, safe.error});
            return;
        }
        auto text = read_text_file(join_path(pack_dir, safe.normalized_path));
        if (!text) {
            result.errors.push_back({rel, std::nullopt, "", "Content file not found in pack"});
            return;
        }
        auto parsed = parse_content_file(*text, rel);
        result.errors.insert(result.errors.end(), parsed.errors.begin(), parsed.errors.end());
        out = std::move(parsed.items);
    };

    load(manifest.files.questions, "files.questions", result.content.questions);
    load(manifest.files.exam_templates, "files.examTemplates", result.content.exam_templates);
    load(manifest.files.tips, "files.tips", result.content.tips);

    result.ok = result.errors.empty();
    return result;
}

} // namespace exampack
