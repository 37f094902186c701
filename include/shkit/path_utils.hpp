#pragma once

#include "shkit/export.hpp"

#include <string>

namespace shkit {

enum class PathError {
    None,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

struct PathResult {
    bool ok = false;
    std::string path;  // normalized absolute path when ok
    PathError error = PathError::None;
};

// Resolve relative_path under root without touching the filesystem.
// - Rejects NUL bytes
// - Rejects an absolute relative_path unless allow_absolute, in which case
//   it is re-rooted under root
// - Collapses ".", ".." and repeated separators
// - Fails if the result would leave root
SHKIT_API PathResult normalize_under_root(const std::string& root,
                                          const std::string& relative_path,
                                          bool allow_absolute = false);

SHKIT_API const char* path_error_to_string(PathError error);

} // namespace shkit
