#pragma once

#include <string>

namespace safeproc {

enum class PathError {
    None,
    ContainsNul,
    EmptyRoot,
    CanonicalizeFailed,
    EscapesRoot,
};

struct PathResult {
    bool ok;
    std::string path;  // canonical absolute path when ok
    std::string root;  // canonical absolute root
    PathError error;
};

// Resolve a user path against a root and prove it stays inside.
// - Rejects NUL bytes
// - Relative paths are joined to root; absolute paths are taken as given
// - Both sides are canonicalized: symlinks in the existing prefix are
//   followed, the non-existent remainder is normalized lexically
// - Fails if the result is not root itself or a descendant of it
PathResult resolve_under_root(const std::string& root, const std::string& user_path);

// Component-wise descendant test on already-normalized absolute paths.
// "/app" contains "/app" and "/app/x" but not "/application".
bool is_within_root(const std::string& root, const std::string& candidate);

} // namespace safeproc
