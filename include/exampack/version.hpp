#pragma once

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>

#include "exampack/manifest.hpp"
#include "exampack/types.hpp"

#include <optional>
#include <string>

namespace exampack {

// ============================================================================
// App Compatibility
// ============================================================================

/**
 * @brief Compare dotted numeric version strings part by part
 *
 * Missing trailing parts count as 0 ("2.0" == "2.0.0"). A part that is not
 * a number also counts as 0.
 *
 * @return negative, zero or positive like strcmp
 */
int compare_app_versions(const std::string& a, const std::string& b);

/**
 * @brief Check an app version against the pack's [minAppVersion, maxAppVersion] window
 *
 * Both bounds are inclusive. Run this before downloading to avoid a wasted transfer.
 */
CompatibilityResult check_compatibility(const PackManifest& manifest,
                                        const std::string& app_version);

// ============================================================================
// Pack Versions (SemVer 2.0.0)
// ============================================================================

using Version = semver::version;

/// Parse a SemVer 2.0.0 version string; nullopt on failure
std::optional<Version> parse_version(const std::string& str);

/// True when both versions parse and incoming sorts before installed
bool is_downgrade(const std::string& installed, const std::string& incoming);

} // namespace exampack
