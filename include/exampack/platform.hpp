#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace exampack {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);
AtomicWriteResult atomic_write_file(const std::string& path, const std::vector<uint8_t>& content);

// Rename a file or directory within one filesystem, then fsync the parent(s).
// Fails if the destination already exists.
AtomicWriteResult atomic_rename(const std::string& from, const std::string& to);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// List directory entries (names only); empty if the directory is missing
std::vector<std::string> list_directory(const std::string& path);

// Create parent directories recursively
bool create_directories(const std::string& path);

// Remove a directory recursively
bool remove_directory(const std::string& path);

// Remove a file
bool remove_file(const std::string& path);

// ============================================================================
// File Contents
// ============================================================================

struct ReadResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
};

ReadResult read_file_bytes(const std::string& path);

std::optional<std::string> read_text_file(const std::string& path);

// Sum of regular-file sizes below path; 0 if missing. Entries that vanish
// during the walk are skipped.
uint64_t directory_size(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Milliseconds since the Unix epoch
int64_t current_time_ms();

// Generate a UUID string
std::string generate_uuid();

} // namespace exampack
