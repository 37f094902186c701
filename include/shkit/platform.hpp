#pragma once

#include "shkit/export.hpp"

#include <optional>
#include <string>

namespace shkit {

// ============================================================================
// File Operations
// ============================================================================

struct WriteResult {
    bool ok = false;
    std::string error;
};

// Write content via temp file + fsync + rename. mode is applied to the
// temp file before the rename, so the final path never exists with
// different permissions.
SHKIT_API WriteResult write_file(const std::string& path,
                                 const std::string& content,
                                 unsigned mode = 0644);

SHKIT_API std::optional<std::string> read_file(const std::string& path);

SHKIT_API bool path_exists(const std::string& path);

SHKIT_API bool is_directory(const std::string& path);

// Regular file with an execute bit for the current user
SHKIT_API bool is_executable(const std::string& path);

SHKIT_API bool create_directories(const std::string& path);

// Remove a directory tree. Missing paths count as removed.
SHKIT_API bool remove_directory(const std::string& path);

SHKIT_API bool remove_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

SHKIT_API std::optional<std::string> get_env(const std::string& name);

SHKIT_API bool set_env(const std::string& name, const std::string& value);

SHKIT_API bool unset_env(const std::string& name);

// Separator between PATH entries
SHKIT_API char get_path_separator();

// Random 16 hex digit identifier for unique file names
SHKIT_API std::string generate_id();

} // namespace shkit
