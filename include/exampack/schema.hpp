#pragma once

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <variant>
#include <vector>

namespace exampack {

// ============================================================================
// Schema Description
// ============================================================================
//
// A schema is a tree of SchemaNode values. Each node is exactly one of four
// kinds and carries only the constraints that apply to that kind. Absent
// constraints are std::nullopt / empty.

struct SchemaNode;
using SchemaPtr = std::shared_ptr<const SchemaNode>;

struct SchemaProperty {
    std::string name;
    SchemaPtr schema;
};

struct ObjectSchema {
    std::vector<std::string> required;
    std::vector<SchemaProperty> properties;  // unknown keys are accepted
};

struct ArraySchema {
    SchemaPtr items;  // may be null: elements unchecked
    std::optional<size_t> min_items;
};

struct StringSchema {
    std::optional<size_t> min_length;
    std::optional<size_t> max_length;
    std::optional<std::string> pattern;  // ECMAScript regex, searched
    std::vector<std::string> enum_values;

    // Filled by string_schema(); compiled on demand when absent
    std::shared_ptr<const std::regex> compiled;
};

struct NumberSchema {
    std::optional<double> minimum;
    std::optional<double> maximum;
};

struct SchemaNode {
    std::variant<ObjectSchema, ArraySchema, StringSchema, NumberSchema> kind;
};

// Builders
SchemaPtr object_schema(std::vector<std::string> required,
                        std::vector<SchemaProperty> properties = {});
SchemaPtr array_schema(SchemaPtr items, std::optional<size_t> min_items = std::nullopt);
SchemaPtr string_schema(StringSchema constraints = {});
SchemaPtr number_schema(std::optional<double> minimum = std::nullopt,
                        std::optional<double> maximum = std::nullopt);

// ============================================================================
// Schema Walker
// ============================================================================

struct FieldIssue {
    std::string field;    // ".files.questions", ".sections[0].count"
    std::string message;
};

// Validate value against schema. Never throws; a type mismatch stops descent
// into that value.
std::vector<FieldIssue> validate_schema(const SchemaNode& schema,
                                        const nlohmann::json& value,
                                        const std::string& path = "");

// ============================================================================
// Built-in Pack Schemas
// ============================================================================

const SchemaNode& manifest_schema();
const SchemaNode& question_schema();
const SchemaNode& exam_template_schema();
const SchemaNode& tip_schema();

} // namespace exampack
