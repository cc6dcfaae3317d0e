#include "exampack/schema.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <type_traits>

namespace exampack {

namespace {

// Number of code points in a UTF-8 string (continuation bytes not counted)
size_t utf8_length(const std::string& s) {
    size_t count = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++count;
    }
    return count;
}

std::string format_number(double value) {
    if (std::floor(value) == value && std::fabs(value) < 1e15) {
        return std::to_string(static_cast<long long>(value));
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string join(const std::vector<std::string>& values, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out += sep;
        out += values[i];
    }
    return out;
}

void check_object(const ObjectSchema& schema, const nlohmann::json& value,
                  const std::string& path, std::vector<FieldIssue>& issues) {
    if (!value.is_object()) {
        issues.push_back({path, std::string("Expected object, got ") + value.type_name()});
        return;
    }

    for (const auto& key : schema.required) {
        if (!value.contains(key)) {
            issues.push_back({path + "." + key, "Missing required field"});
        }
    }

    for (const auto& property : schema.properties) {
        auto it = value.find(property.name);
        if (it == value.end() || !property.schema) continue;
        auto nested = validate_schema(*property.schema, *it, path + "." + property.name);
        issues.insert(issues.end(), nested.begin(), nested.end());
    }
}

void check_array(const ArraySchema& schema, const nlohmann::json& value,
                 const std::string& path, std::vector<FieldIssue>& issues) {
    if (!value.is_array()) {
        issues.push_back({path, std::string("Expected array, got ") + value.type_name()});
        return;
    }

    if (schema.min_items && value.size() < *schema.min_items) {
        issues.push_back({path, "Array must have at least " +
                                std::to_string(*schema.min_items) + " items"});
    }

    if (schema.items) {
        for (size_t i = 0; i < value.size(); ++i) {
            auto nested = validate_schema(*schema.items, value[i],
                                          path + "[" + std::to_string(i) + "]");
            issues.insert(issues.end(), nested.begin(), nested.end());
        }
    }
}

void check_string(const StringSchema& schema, const nlohmann::json& value,
                  const std::string& path, std::vector<FieldIssue>& issues) {
    if (!value.is_string()) {
        issues.push_back({path, std::string("Expected string, got ") + value.type_name()});
        return;
    }

    const auto& s = value.get_ref<const std::string&>();
    size_t length = utf8_length(s);

    if (schema.min_length && length < *schema.min_length) {
        issues.push_back({path, "String must be at least " +
                                std::to_string(*schema.min_length) + " characters"});
    }

    if (schema.max_length && length > *schema.max_length) {
        issues.push_back({path, "String must be at most " +
                                std::to_string(*schema.max_length) + " characters"});
    }

    if (schema.pattern) {
        std::shared_ptr<const std::regex> re = schema.compiled;
        if (!re) {
            try {
                re = std::make_shared<const std::regex>(*schema.pattern, std::regex::ECMAScript);
            } catch (const std::regex_error&) {
                issues.push_back({path, "Schema pattern is not a valid regular expression"});
                re.reset();
            }
        }
        if (re && !std::regex_search(s, *re)) {
            issues.push_back({path, "String does not match required pattern"});
        }
    }

    if (!schema.enum_values.empty() &&
        std::find(schema.enum_values.begin(), schema.enum_values.end(), s) == schema.enum_values.end()) {
        issues.push_back({path, "Value must be one of: " + join(schema.enum_values, ", ")});
    }
}

void check_number(const NumberSchema& schema, const nlohmann::json& value,
                  const std::string& path, std::vector<FieldIssue>& issues) {
    if (!value.is_number()) {
        issues.push_back({path, std::string("Expected number, got ") + value.type_name()});
        return;
    }

    double n = value.get<double>();

    if (schema.minimum && n < *schema.minimum) {
        issues.push_back({path, "Number must be at least " + format_number(*schema.minimum)});
    }

    if (schema.maximum && n > *schema.maximum) {
        issues.push_back({path, "Number must be at most " + format_number(*schema.maximum)});
    }
}

} // namespace

SchemaPtr object_schema(std::vector<std::string> required,
                        std::vector<SchemaProperty> properties) {
    ObjectSchema schema;
    schema.required = std::move(required);
    schema.properties = std::move(properties);
    return std::make_shared<const SchemaNode>(SchemaNode{std::move(schema)});
}

SchemaPtr array_schema(SchemaPtr items, std::optional<size_t> min_items) {
    ArraySchema schema;
    schema.items = std::move(items);
    schema.min_items = min_items;
    return std::make_shared<const SchemaNode>(SchemaNode{std::move(schema)});
}

SchemaPtr string_schema(StringSchema constraints) {
    if (constraints.pattern && !constraints.compiled) {
        constraints.compiled = std::make_shared<const std::regex>(
            *constraints.pattern, std::regex::ECMAScript);
    }
    return std::make_shared<const SchemaNode>(SchemaNode{std::move(constraints)});
}

SchemaPtr number_schema(std::optional<double> minimum, std::optional<double> maximum) {
    NumberSchema schema;
    schema.minimum = minimum;
    schema.maximum = maximum;
    return std::make_shared<const SchemaNode>(SchemaNode{schema});
}

std::vector<FieldIssue> validate_schema(const SchemaNode& schema,
                                        const nlohmann::json& value,
                                        const std::string& path) {
    std::vector<FieldIssue> issues;

    std::visit([&](const auto& node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, ObjectSchema>) {
            check_object(node, value, path, issues);
        } else if constexpr (std::is_same_v<T, ArraySchema>) {
            check_array(node, value, path, issues);
        } else if constexpr (std::is_same_v<T, StringSchema>) {
            check_string(node, value, path, issues);
        } else {
            check_number(node, value, path, issues);
        }
    }, schema.kind);

    return issues;
}

} // namespace exampack
