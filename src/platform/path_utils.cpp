#include "safeproc/path_utils.hpp"

#include <filesystem>
#include <string>
#include <system_error>

namespace safeproc {

namespace fs = std::filesystem;

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

// "/a/b/" -> "/a/b", "/" stays "/"
std::string strip_trailing_separators(std::string s) {
    while (s.size() > 1 && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

bool canonicalize(const fs::path& p, std::string& out) {
    std::error_code ec;
    auto abs = fs::absolute(p, ec);
    if (ec) return false;
    auto canon = fs::weakly_canonical(abs, ec);
    if (ec) return false;
    out = strip_trailing_separators(canon.lexically_normal().string());
    return true;
}

} // namespace

bool is_within_root(const std::string& root, const std::string& candidate) {
    fs::path lex_root = fs::path(strip_trailing_separators(root)).lexically_normal();
    fs::path lex_out = fs::path(strip_trailing_separators(candidate)).lexically_normal();

    auto root_it = lex_root.begin();
    auto out_it = lex_out.begin();
    for (; root_it != lex_root.end() && out_it != lex_out.end(); ++root_it, ++out_it) {
        if (*root_it != *out_it) {
            return false;
        }
    }
    return root_it == lex_root.end();
}

PathResult resolve_under_root(const std::string& root, const std::string& user_path) {
    if (contains_nul(root) || contains_nul(user_path)) {
        return {false, {}, {}, PathError::ContainsNul};
    }
    if (root.empty()) {
        return {false, {}, {}, PathError::EmptyRoot};
    }

    std::string canon_root;
    if (!canonicalize(fs::path(root), canon_root)) {
        return {false, {}, {}, PathError::CanonicalizeFailed};
    }

    fs::path target(user_path);
    if (!target.is_absolute()) {
        target = fs::path(canon_root) / target;
    }

    std::string canon_target;
    if (!canonicalize(target, canon_target)) {
        return {false, {}, canon_root, PathError::CanonicalizeFailed};
    }

    if (!is_within_root(canon_root, canon_target)) {
        return {false, canon_target, canon_root, PathError::EscapesRoot};
    }

    return {true, canon_target, canon_root, PathError::None};
}

} // namespace safeproc
