#include "shkit/path_utils.hpp"

#include <filesystem>
#include <vector>

namespace shkit {

namespace fs = std::filesystem;

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

// Split on separators, dropping empty and "." segments.
std::vector<std::string> segments(const std::string& s) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (is_separator(c)) {
            if (!current.empty() && current != ".") parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty() && current != ".") parts.push_back(current);
    return parts;
}

} // namespace

PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute) {
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    if (!relative_path.empty() && is_separator(relative_path.front()) && !allow_absolute) {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }

    std::vector<std::string> kept;
    for (const auto& part : segments(relative_path)) {
        if (part != "..") {
            kept.push_back(part);
            continue;
        }
        if (kept.empty()) {
            return {false, {}, PathError::EscapesRoot};
        }
        kept.pop_back();
    }

    fs::path out = fs::path(root).lexically_normal();
    for (const auto& part : kept) {
        out /= part;
    }
    std::string result = out.lexically_normal().generic_string();
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return {true, result, PathError::None};
}

const char* path_error_to_string(PathError error) {
    switch (error) {
        case PathError::None: return "none";
        case PathError::ContainsNul: return "path contains NUL byte";
        case PathError::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathError::EscapesRoot: return "path escapes root";
    }
    return "unknown path error";
}

} // namespace shkit
