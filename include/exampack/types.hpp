#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace exampack {

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class PackError {
    None,
    Schema,         // structural mismatch against a declared schema
    BusinessRule,   // duplicate ids, content rules, identity mismatch
    Integrity,      // checksum or signature mismatch
    Compatibility,  // app version outside the pack's window
    Network,
    Timeout,
    Canceled,
    Filesystem,
};

inline const char* pack_error_to_string(PackError e) {
    switch (e) {
        case PackError::None: return "none";
        case PackError::Schema: return "schema";
        case PackError::BusinessRule: return "business_rule";
        case PackError::Integrity: return "integrity";
        case PackError::Compatibility: return "compatibility";
        case PackError::Network: return "network";
        case PackError::Timeout: return "timeout";
        case PackError::Canceled: return "canceled";
        case PackError::Filesystem: return "filesystem";
        default: return "unknown";
    }
}

// ============================================================================
// Validation Report
// ============================================================================

struct ValidationIssue {
    std::string file;
    std::optional<size_t> line;   // 1-based item index within the file
    std::string field;
    std::string message;
};

struct PackValidationResult {
    bool is_valid = true;
    std::vector<ValidationIssue> errors;
    std::vector<ValidationIssue> warnings;
};

// Render an issue as "file:line field: message"
std::string format_issue(const ValidationIssue& issue);

// ============================================================================
// Progress Reporting
// ============================================================================

enum class DownloadStatus {
    Downloading,
    Verifying,
    Installing,
    Complete,
    Error
};

inline const char* download_status_to_string(DownloadStatus s) {
    switch (s) {
        case DownloadStatus::Downloading: return "downloading";
        case DownloadStatus::Verifying: return "verifying";
        case DownloadStatus::Installing: return "installing";
        case DownloadStatus::Complete: return "complete";
        case DownloadStatus::Error: return "error";
        default: return "error";
    }
}

struct DownloadProgress {
    std::string pack_id;
    uint64_t downloaded = 0;
    uint64_t total = 0;
    int percentage = 0;
    DownloadStatus status = DownloadStatus::Downloading;
    std::optional<std::string> error;
};

// Receives immutable progress snapshots; may be invoked from a download thread
using ProgressCallback = std::function<void(const DownloadProgress&)>;

// ============================================================================
// Operation Results
// ============================================================================

struct PackInstallationResult {
    bool success = false;
    PackError kind = PackError::None;
    std::string pack_id;
    std::string version;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

struct CompatibilityResult {
    bool compatible = false;
    std::optional<std::string> reason;
};

struct DownloadResult {
    bool ok = false;
    PackError kind = PackError::None;
    std::string error;
    std::string temp_path;
    uint64_t bytes = 0;
    long http_status = 0;
};

struct InstalledPackUsage {
    std::string id;
    uint64_t size = 0;
    std::string version;  // "unknown" when manifest.json is unreadable
};

struct StorageUsage {
    uint64_t total_size = 0;
    uint64_t packs_size = 0;
    uint64_t temp_size = 0;
    std::vector<InstalledPackUsage> packs;
};

} // namespace exampack
