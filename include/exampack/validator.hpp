#pragma once

#include "exampack/manifest.hpp"
#include "exampack/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace exampack {

// ============================================================================
// Pack Validation
// ============================================================================
//
// Structural (schema) and business-rule checks over a pack's manifest and
// content items. All functions are pure and total: malformed input yields
// errors in the returned report, never an exception.
//
// Errors block installation; warnings are advisory only.

// Default file names used in reports when the manifest does not name one
inline constexpr const char* MANIFEST_FILE = "manifest.json";
inline constexpr const char* QUESTIONS_FILE = "questions.jsonl";
inline constexpr const char* EXAM_TEMPLATES_FILE = "examTemplates.json";
inline constexpr const char* TIPS_FILE = "tips.json";

PackValidationResult validate_manifest(const nlohmann::json& manifest);
PackValidationResult validate_manifest(const PackManifest& manifest);

// Items are raw records as parsed from the pack's content files
PackValidationResult validate_questions(const std::vector<nlohmann::json>& questions,
                                        const std::string& file = QUESTIONS_FILE);

PackValidationResult validate_exam_templates(const std::vector<nlohmann::json>& templates,
                                             const std::string& file = EXAM_TEMPLATES_FILE);

PackValidationResult validate_tips(const std::vector<nlohmann::json>& tips,
                                   const std::string& file = TIPS_FILE);

// Union of the four reports plus cross-reference checks. Count mismatches
// between manifest metadata and content are warnings only.
PackValidationResult validate_entire_pack(const nlohmann::json& manifest,
                                          const std::vector<nlohmann::json>& questions,
                                          const std::vector<nlohmann::json>& templates,
                                          const std::vector<nlohmann::json>& tips);

PackValidationResult validate_entire_pack(const PackManifest& manifest,
                                          const std::vector<nlohmann::json>& questions,
                                          const std::vector<nlohmann::json>& templates,
                                          const std::vector<nlohmann::json>& tips);

// Checks files.media entries against an unpacked pack directory: escaping
// paths are errors, missing files are warnings.
PackValidationResult validate_media_references(const PackManifest& manifest,
                                               const std::string& pack_dir);

// Reads <dir>/manifest.json and the content files it names, then runs
// validate_entire_pack and validate_media_references. Unreadable files are
// reported as errors.
PackValidationResult validate_pack_directory(const std::string& pack_dir);

} // namespace exampack
