#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace exampack {

// ============================================================================
// Pack Manager Configuration (config.json)
// ============================================================================
//
// {
//   "$schema": "exampack.config.v1",
//   "app_version": "2.1.0",
//   "packs_dir": "packs",
//   "trusted_keys": ["<64 hex chars>"],
//   "download_timeout_seconds": 300
// }
//
// Relative directories resolve against the root directory.

inline constexpr const char* CONFIG_SCHEMA = "exampack.config.v1";
inline constexpr const char* CONFIG_FILE = "config.json";

struct PackManagerConfig {
    std::string root;
    std::string packs_dir;
    std::string temp_dir;
    std::string registry_dir;
    std::string app_version = "1.0.0";
    std::vector<std::string> trusted_keys;
    long download_timeout_seconds = 300;
    long connect_timeout_seconds = 30;
    int64_t temp_max_age_hours = 24;
    int64_t max_pack_age_days = 365;
    bool allow_insecure_http = false;
};

// Defaults: <root>/packs, <root>/tmp, <root>/registry
PackManagerConfig default_config(const std::string& root);

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> warnings;
    PackManagerConfig config;
};

ConfigParseResult parse_config(const std::string& json_str, const std::string& root);

// A missing file yields default_config(root)
ConfigParseResult load_config(const std::string& path, const std::string& root);

/**
 * Resolve the root directory.
 * Priority: explicit override > EXAMPACK_ROOT env > $HOME/.exampack > .exampack
 */
std::string resolve_root(const std::optional<std::string>& override_root);

} // namespace exampack
