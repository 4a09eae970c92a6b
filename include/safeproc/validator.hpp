#pragma once

#include "safeproc/result.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace safeproc {

// ============================================================================
// Denied Token Tables
// ============================================================================
//
// These are blocklists and therefore incomplete. Argument-vector execution
// and the disabled shell-escape of the typesetting tool are what make
// command construction safe; these tables only narrow what reaches them.

// Characters rejected in every identifier, branch name and model name.
constexpr const char* kShellMetacharacters = ";&|`$(){}[]<>*?'\"\\";

struct DeniedLatexCommand {
    const char* control_word;   // lowercase, including the leading backslash
    const char* description;
    bool requires_pipe;         // only denied when followed by an optional '{' and '|'
};

// Document-level code execution and raw file access directives.
const std::vector<DeniedLatexCommand>& denied_latex_commands();

constexpr std::size_t kDefaultIdentifierMaxLength = 50;
constexpr std::size_t kMaxBranchNameLength = 255;
constexpr std::size_t kMaxModelNameLength = 200;
constexpr std::size_t kMaxReportedValueLength = 50;
constexpr int kMinPort = 1024;
constexpr int kMaxPort = 65535;

// ============================================================================
// Validated Values
// ============================================================================
//
// Only Validator can construct these, so holding one is proof the string
// passed the corresponding checks.

class ValidatedIdentifier {
public:
    const std::string& value() const { return value_; }

private:
    explicit ValidatedIdentifier(std::string value) : value_(std::move(value)) {}
    friend class Validator;

    std::string value_;
};

class ValidatedBranchName {
public:
    const std::string& value() const { return value_; }

private:
    explicit ValidatedBranchName(std::string value) : value_(std::move(value)) {}
    friend class Validator;

    std::string value_;
};

class ValidatedUrl {
public:
    const std::string& value() const { return value_; }
    const std::string& scheme() const { return scheme_; }

private:
    ValidatedUrl(std::string value, std::string scheme)
        : value_(std::move(value)), scheme_(std::move(scheme)) {}
    friend class Validator;

    std::string value_;
    std::string scheme_;
};

class ValidatedPath {
public:
    // Absolute, canonical, inside base_dir()
    const std::string& value() const { return path_; }
    const std::string& base_dir() const { return base_; }
    bool verified_exists() const { return verified_exists_; }

private:
    ValidatedPath(std::string path, std::string base, bool verified_exists)
        : path_(std::move(path)), base_(std::move(base)), verified_exists_(verified_exists) {}
    friend class Validator;

    std::string path_;
    std::string base_;
    bool verified_exists_;
};

/**
 * @brief Character set and length rules for validate_identifier
 */
struct IdentifierRules {
    std::string name = "identifier";   // field name used in messages
    std::size_t max_length = kDefaultIdentifierMaxLength;
    bool allow_dash = true;
    bool allow_underscore = true;
    bool allow_slash = false;
};

// ============================================================================
// Validator
// ============================================================================

/**
 * @brief Pure functions turning untrusted strings into validated values
 *
 * No I/O except validate_path, which consults the filesystem to
 * canonicalize. No shared state; safe to call from any thread.
 * Every failure is ErrorCode::VALIDATION_ERROR with the offending value
 * (truncated) in Error::detail().value.
 */
class Validator {
public:
    /// Alphanumeric plus the characters enabled in @p rules. Surrounding
    /// whitespace is trimmed and the trimmed value is returned.
    static Result<ValidatedIdentifier> validate_identifier(const std::string& value,
                                                           const IdentifierRules& rules = {});

    /**
     * @brief Resolve @p user_path under @p base_dir and prove containment
     *
     * Relative paths are joined to base_dir; both are canonicalized
     * (symlinks of existing prefixes resolved) before the descendant check.
     */
    static Result<ValidatedPath> validate_path(const std::string& user_path,
                                               const std::string& base_dir,
                                               bool must_exist = false,
                                               const std::string& name = "path");

    /// Git ref rules: [A-Za-z0-9/_-], at most 255 chars, no leading '.',
    /// '/' or '-', no trailing ".lock", no "..".
    static Result<ValidatedBranchName> validate_branch_name(const std::string& branch);

    /// scheme://host[/path] with scheme in @p allowed_schemes; local hosts rejected.
    static Result<ValidatedUrl> validate_url(const std::string& url,
                                             const std::vector<std::string>& allowed_schemes = {"https"});

    /// [A-Za-z0-9/_.-], at most 200 chars.
    static Result<ValidatedIdentifier> validate_model_name(const std::string& model);

    /// Returns @p content unchanged unless it uses a denied_latex_commands() entry.
    static Result<std::string> sanitize_latex_content(const std::string& content);

    static Result<int> validate_port(int port, const std::string& name = "port");
};

// Shorten a value for inclusion in error messages.
std::string truncate_for_message(const std::string& value,
                                 std::size_t max_length = kMaxReportedValueLength);

} // namespace safeproc
