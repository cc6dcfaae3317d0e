#include "exampack/config.hpp"
#include "exampack/platform.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <set>

namespace exampack {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

bool is_absolute(const std::string& path) {
    if (path.empty()) return false;
    if (path[0] == '/' || path[0] == '\\') return true;
    return path.size() > 1 && path[1] == ':';
}

std::string resolve_dir(const std::string& root, const std::string& dir) {
    return is_absolute(dir) ? dir : join_path(root, dir);
}

const std::set<std::string>& known_keys() {
    static const std::set<std::string> keys = {
        "$schema", "packs_dir", "temp_dir", "registry_dir", "app_version",
        "trusted_keys", "download_timeout_seconds", "connect_timeout_seconds",
        "temp_max_age_hours", "max_pack_age_days", "allow_insecure_http",
    };
    return keys;
}

} // namespace

PackManagerConfig default_config(const std::string& root) {
    PackManagerConfig config;
    config.root = root;
    config.packs_dir = join_path(root, "packs");
    config.temp_dir = join_path(root, "tmp");
    config.registry_dir = join_path(root, "registry");
    return config;
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& root) {
    ConfigParseResult result;
    result.config = default_config(root);
    auto& config = result.config;

    auto j = nlohmann::json::parse(json_str, nullptr, false);
    if (j.is_discarded()) {
        result.error = "config is not valid JSON";
        return result;
    }
    if (!j.is_object()) {
        result.error = "config must be a JSON object";
        return result;
    }

    try {
        if (!j.contains("$schema") || !j["$schema"].is_string()) {
            result.error = "$schema missing";
            return result;
        }
        if (trim(j["$schema"].get<std::string>()) != CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
            return result;
        }

        for (const auto& [key, value] : j.items()) {
            if (known_keys().count(key) == 0) {
                result.warnings.push_back("unknown config key: " + key);
            }
        }

        if (j.contains("packs_dir")) {
            config.packs_dir = resolve_dir(root, j["packs_dir"].get<std::string>());
        }
        if (j.contains("temp_dir")) {
            config.temp_dir = resolve_dir(root, j["temp_dir"].get<std::string>());
        }
        if (j.contains("registry_dir")) {
            config.registry_dir = resolve_dir(root, j["registry_dir"].get<std::string>());
        }
        if (j.contains("app_version")) {
            config.app_version = trim(j["app_version"].get<std::string>());
        }
        if (j.contains("trusted_keys")) {
            config.trusted_keys = j["trusted_keys"].get<std::vector<std::string>>();
        }
        if (j.contains("download_timeout_seconds")) {
            config.download_timeout_seconds = j["download_timeout_seconds"].get<long>();
        }
        if (j.contains("connect_timeout_seconds")) {
            config.connect_timeout_seconds = j["connect_timeout_seconds"].get<long>();
        }
        if (j.contains("temp_max_age_hours")) {
            config.temp_max_age_hours = j["temp_max_age_hours"].get<int64_t>();
        }
        if (j.contains("max_pack_age_days")) {
            config.max_pack_age_days = j["max_pack_age_days"].get<int64_t>();
        }
        if (j.contains("allow_insecure_http")) {
            config.allow_insecure_http = j["allow_insecure_http"].get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("invalid config value: ") + e.what();
        return result;
    }

    if (config.download_timeout_seconds <= 0) {
        result.error = "download_timeout_seconds must be positive";
        return result;
    }
    if (config.connect_timeout_seconds <= 0) {
        result.error = "connect_timeout_seconds must be positive";
        return result;
    }
    if (config.temp_max_age_hours < 0) {
        result.error = "temp_max_age_hours must not be negative";
        return result;
    }
    if (config.trusted_keys.empty()) {
        result.warnings.push_back("no trusted_keys configured; every pack will fail verification");
    }

    result.ok = true;
    return result;
}

ConfigParseResult load_config(const std::string& path, const std::string& root) {
    auto text = read_text_file(path);
    if (!text) {
        ConfigParseResult result;
        result.config = default_config(root);
        if (path_exists(path)) {
            result.error = "failed to read config: " + path;
            return result;
        }
        result.ok = true;
        return result;
    }
    return parse_config(*text, root);
}

std::string resolve_root(const std::optional<std::string>& override_root) {
    // 1. Explicit override
    if (override_root && !override_root->empty()) {
        return *override_root;
    }

    // 2. Environment variable
    auto env_root = get_env("EXAMPACK_ROOT");
    if (env_root && !env_root->empty()) {
        return *env_root;
    }

    // 3. Default: ~/.exampack
    auto home = get_env("HOME");
    if (home && !home->empty()) {
        return *home + "/.exampack";
    }

    // Fallback for Windows
    auto userprofile = get_env("USERPROFILE");
    if (userprofile && !userprofile->empty()) {
        return *userprofile + "/.exampack";
    }

    return ".exampack";
}

} // namespace exampack
