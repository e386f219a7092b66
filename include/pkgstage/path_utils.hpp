#pragma once

#include <string>

namespace pkgstage {

enum class PathError {
    None,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

inline const char* path_error_to_string(PathError e) {
    switch (e) {
        case PathError::None: return "none";
        case PathError::ContainsNul: return "NUL byte in path";
        case PathError::AbsoluteNotAllowed: return "absolute path where a relative one is required";
        case PathError::EscapesRoot: return "path climbs above the staging root";
        default: return "invalid path";
    }
}

struct PathResult {
    bool ok;
    std::string path;  // "<root>/<collapsed relative_path>" when ok
    PathError error;
};

// Place relative_path below root using string operations only.
// An absolute relative_path is accepted only with allow_absolute, and is then
// re-rooted ("/usr" under "/stage" is "/stage/usr"). A ".." that would leave
// root fails with EscapesRoot.
PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute = false);

} // namespace pkgstage
