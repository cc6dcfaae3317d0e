#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace exampack {

// ============================================================================
// Pack Archive Format
// ============================================================================
//
// A pack archive is a gzip-compressed POSIX ustar stream. Archives produced
// here are deterministic: entries sorted by path, uid/gid/mtime zeroed,
// dirs 0755, files 0644, gzip header with mtime=0 and OS=255. Only regular
// files and directories are permitted.

enum class ArchiveEntryType {
    RegularFile,
    Directory,
    Symlink,    // rejected
    Hardlink,   // rejected
    Other       // rejected
};

struct ArchiveEntry {
    std::string path;           // Relative path within archive
    ArchiveEntryType type = ArchiveEntryType::RegularFile;
    std::vector<uint8_t> data;  // File content (empty for directories)
};

struct ArchiveResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> archive_data;
};

struct ExtractResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> entries;  // Paths of extracted files and dirs
};

ArchiveResult create_pack_archive(const std::vector<ArchiveEntry>& entries);

struct CollectResult {
    bool ok = false;
    std::string error;
    std::vector<ArchiveEntry> entries;
};

// Collect every file and directory below dir_path; symlinks are an error
CollectResult collect_directory_entries(const std::string& dir_path);

// Convenience: collect + create
ArchiveResult pack_directory(const std::string& dir_path);

// ============================================================================
// Safe Extraction
// ============================================================================

struct PathValidation {
    bool safe = false;
    std::string error;
    std::string normalized_path;
};

// Rejects absolute paths and any path that escapes extraction_root
PathValidation validate_extraction_path(const std::string& entry_path,
                                        const std::string& extraction_root);

// Extract into staging_dir. On failure staging_dir is removed.
ExtractResult extract_pack_archive(const std::vector<uint8_t>& archive_data,
                                   const std::string& staging_dir);

} // namespace exampack
