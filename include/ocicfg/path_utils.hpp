#pragma once

#include <string>

namespace ocicfg {

enum class PathError {
    None,
    ContainsNul,
    TooManySymlinks,
    LstatFailed,
};

struct PathResult {
    bool ok;
    std::string path;  // host path under root when ok
    PathError error;
};

// Resolve an in-image path against a root directory the way a process
// chrooted into root would see it.
// - Rejects NUL bytes
// - Resolves symlinks component by component with lstat/readlink
// - Absolute symlink targets restart at root, ".." stops at root
// - Components that do not exist are appended as-is
// The returned path never leaves root, although a final component that is
// a symlink is resolved too.
PathResult resolve_in_root(const std::string& root, const std::string& unsafe_path);

const char* path_error_to_string(PathError error);

} // namespace ocicfg
