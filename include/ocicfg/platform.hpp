#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace ocicfg {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// On failure the destination is left untouched and the temp file removed.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// File Reading
// ============================================================================

struct ReadFileResult {
    bool ok = false;
    bool not_found = false;
    std::string error;
    std::string content;
};

// Read a whole file in binary mode. A missing file sets not_found.
ReadFileResult read_file(const std::string& path);

// ============================================================================
// File Ownership
// ============================================================================

struct FileOwnership {
    uint32_t uid = 0;
    uint32_t gid = 0;
    uint32_t mode = 0;  // permission bits only
    bool is_directory = false;
    bool is_symlink = false;
};

// lstat(2) a path without following a final symlink
std::optional<FileOwnership> lstat_ownership(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Check if a path is a directory
bool is_directory(const std::string& path);

// True if the directory can be opened for listing
bool is_readable_directory(const std::string& path);

} // namespace ocicfg
