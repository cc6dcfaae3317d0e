#include "exampack/version.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>

namespace exampack {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

// Split on '.', preserving empty parts
std::vector<long long> numeric_parts(const std::string& s) {
    std::vector<long long> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find('.', start);
        std::string part = s.substr(start, pos == std::string::npos ? std::string::npos : pos - start);

        char* end = nullptr;
        long long value = std::strtoll(part.c_str(), &end, 10);
        bool numeric = !part.empty() && end && *end == '\0';
        parts.push_back(numeric ? value : 0);

        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return parts;
}

} // namespace

int compare_app_versions(const std::string& a, const std::string& b) {
    auto pa = numeric_parts(trim(a));
    auto pb = numeric_parts(trim(b));

    size_t n = std::max(pa.size(), pb.size());
    for (size_t i = 0; i < n; ++i) {
        long long x = i < pa.size() ? pa[i] : 0;
        long long y = i < pb.size() ? pb[i] : 0;
        if (x < y) return -1;
        if (x > y) return 1;
    }
    return 0;
}

CompatibilityResult check_compatibility(const PackManifest& manifest,
                                        const std::string& app_version) {
    CompatibilityResult result;

    if (compare_app_versions(app_version, manifest.min_app_version) < 0) {
        result.reason = "App version " + app_version + " is below minimum required " +
                        manifest.min_app_version;
        return result;
    }

    if (manifest.max_app_version && !manifest.max_app_version->empty() &&
        compare_app_versions(app_version, *manifest.max_app_version) > 0) {
        result.reason = "App version " + app_version + " is above maximum supported " +
                        *manifest.max_app_version;
        return result;
    }

    result.compatible = true;
    return result;
}

std::optional<Version> parse_version(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    try {
        return semver::version::parse(s);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

bool is_downgrade(const std::string& installed, const std::string& incoming) {
    auto old_version = parse_version(installed);
    auto new_version = parse_version(incoming);
    if (!old_version || !new_version) return false;
    return *new_version < *old_version;
}

} // namespace exampack
