#include "safeproc/validator.hpp"
#include "safeproc/path_utils.hpp"
#include "safeproc/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace safeproc {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// ASCII only; std::isalnum is locale dependent
bool is_ascii_alnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool is_shell_metacharacter(char c) {
    return c != '\0' && std::strchr(kShellMetacharacters, c) != nullptr;
}

Error validation_error(const std::string& message, const std::string& value) {
    ErrorDetail detail;
    detail.value = truncate_for_message(value);
    return Error(ErrorCode::VALIDATION_ERROR, message, std::move(detail));
}

// Blocked metacharacters present in value, quoted for messages: "';', '&'"
std::string describe_metacharacters(const std::string& value) {
    std::string found;
    std::string seen;
    for (char c : value) {
        if (is_shell_metacharacter(c) && seen.find(c) == std::string::npos) {
            seen.push_back(c);
            if (!found.empty()) found += ", ";
            found += '\'';
            found += c;
            found += '\'';
        }
    }
    return found;
}

bool matches_charset(const std::string& value, const std::string& extra) {
    return std::all_of(value.begin(), value.end(), [&extra](char c) {
        return is_ascii_alnum(c) || extra.find(c) != std::string::npos;
    });
}

const char* const kBlockedHosts[] = {"localhost", "127.0.0.1"};

// Characters the URL path grammar accepts after the host
bool is_url_path_char(char c) {
    static const char* const extra = "._~:/?#[]@!$&'()*+,;=-";
    return is_ascii_alnum(c) || (c != '\0' && std::strchr(extra, c) != nullptr);
}

bool is_url_host_char(char c) {
    return is_ascii_alnum(c) || c == '.' || c == '-';
}

} // namespace

const std::vector<DeniedLatexCommand>& denied_latex_commands() {
    static const std::vector<DeniedLatexCommand> table = {
        {"\\write18", "write18 (shell escape)", false},
        {"\\input", "input with pipe", true},
        {"\\immediate", "immediate", false},
        {"\\openout", "openout (file write)", false},
        {"\\openin", "openin (file read)", false},
        {"\\special", "special", false},
        {"\\pdfliteral", "pdfliteral", false},
        {"\\directlua", "directlua (Lua code execution)", false},
    };
    return table;
}

std::string truncate_for_message(const std::string& value, std::size_t max_length) {
    if (value.size() <= max_length) return value;
    return value.substr(0, max_length) + "...";
}

// ============================================================================
// Identifiers
// ============================================================================

Result<ValidatedIdentifier> Validator::validate_identifier(const std::string& raw,
                                                           const IdentifierRules& rules) {
    using R = Result<ValidatedIdentifier>;

    if (raw.empty()) {
        return R::err(validation_error(rules.name + " must be a non-empty string", raw));
    }

    std::string value = trim(raw);
    if (value.empty()) {
        return R::err(validation_error(rules.name + " cannot be empty or whitespace only", raw));
    }

    if (value.size() > rules.max_length) {
        return R::err(validation_error(
            rules.name + " too long (" + std::to_string(value.size()) + " characters > " +
                std::to_string(rules.max_length) + " max)",
            value));
    }

    if (value.find('\0') != std::string::npos) {
        return R::err(validation_error("Null byte detected in " + rules.name, value));
    }

    // Independent of the charset below: a flag may one day admit a character
    // that is also in the metacharacter table.
    std::string meta = describe_metacharacters(value);
    if (!meta.empty()) {
        return R::err(validation_error(
            "Shell metacharacters not allowed in " + rules.name + " (found: " + meta + ")", value));
    }

    if (value.find("..") != std::string::npos) {
        return R::err(validation_error(
            "Path traversal detected in " + rules.name + ": '..' is not allowed", value));
    }

    std::string extra;
    std::string allowed = "alphanumeric";
    if (rules.allow_dash) {
        extra += '-';
        allowed += " + dash";
    }
    if (rules.allow_underscore) {
        extra += '_';
        allowed += " + underscore";
    }
    if (rules.allow_slash) {
        extra += '/';
        allowed += " + slash";
    }

    if (!matches_charset(value, extra)) {
        return R::err(validation_error(
            rules.name + " contains invalid characters (allowed: " + allowed + ")", value));
    }

    return R::ok(ValidatedIdentifier(std::move(value)));
}

Result<ValidatedIdentifier> Validator::validate_model_name(const std::string& raw) {
    using R = Result<ValidatedIdentifier>;

    std::string model = trim(raw);
    if (model.empty()) {
        return R::err(validation_error("Model name cannot be empty", raw));
    }

    if (model.size() > kMaxModelNameLength) {
        return R::err(validation_error(
            "Model name too long (" + std::to_string(model.size()) + " > " +
                std::to_string(kMaxModelNameLength) + ")",
            model));
    }

    if (!matches_charset(model, "/_.-")) {
        return R::err(validation_error(
            "Invalid model name (allowed: alphanumeric, dash, underscore, slash, dot)", model));
    }

    if (model.find("..") != std::string::npos) {
        return R::err(validation_error("Model name cannot contain '..'", model));
    }

    return R::ok(ValidatedIdentifier(std::move(model)));
}

// ============================================================================
// Paths
// ============================================================================

Result<ValidatedPath> Validator::validate_path(const std::string& user_path,
                                               const std::string& base_dir,
                                               bool must_exist,
                                               const std::string& name) {
    using R = Result<ValidatedPath>;

    auto resolved = resolve_under_root(base_dir, user_path);
    if (!resolved.ok) {
        switch (resolved.error) {
            case PathError::ContainsNul:
                return R::err(validation_error("Null byte detected in " + name, user_path));
            case PathError::EmptyRoot:
                return R::err(validation_error("Base directory for " + name + " is empty", user_path));
            case PathError::CanonicalizeFailed:
                return R::err(validation_error("Cannot resolve " + name, user_path));
            case PathError::EscapesRoot:
            default:
                return R::err(validation_error(
                    name + " is outside base directory (attempted: " + resolved.path +
                        ", base dir: " + resolved.root + ")",
                    user_path));
        }
    }

    if (must_exist && !path_exists(resolved.path)) {
        return R::err(validation_error(name + " does not exist: " + resolved.path, user_path));
    }

    return R::ok(ValidatedPath(resolved.path, resolved.root, must_exist));
}

// ============================================================================
// Git Branch Names
// ============================================================================

Result<ValidatedBranchName> Validator::validate_branch_name(const std::string& raw) {
    using R = Result<ValidatedBranchName>;

    std::string branch = trim(raw);
    if (branch.empty()) {
        return R::err(validation_error("Branch name cannot be empty", raw));
    }

    if (branch.size() > kMaxBranchNameLength) {
        return R::err(validation_error(
            "Branch name too long (" + std::to_string(branch.size()) + " > " +
                std::to_string(kMaxBranchNameLength) + ")",
            branch));
    }

    if (!describe_metacharacters(branch).empty() || !matches_charset(branch, "/_-")) {
        return R::err(validation_error(
            "Invalid branch name (allowed: alphanumeric, dash, underscore, slash)", branch));
    }

    if (branch.front() == '.' || branch.front() == '/') {
        return R::err(validation_error("Branch name cannot start with '.' or '/'", branch));
    }

    // Would be parsed as an option by git checkout
    if (branch.front() == '-') {
        return R::err(validation_error("Branch name cannot start with '-'", branch));
    }

    const std::string lock_suffix = ".lock";
    if (branch.size() >= lock_suffix.size() &&
        branch.compare(branch.size() - lock_suffix.size(), lock_suffix.size(), lock_suffix) == 0) {
        return R::err(validation_error("Branch name cannot end with '.lock'", branch));
    }

    if (branch.find("..") != std::string::npos) {
        return R::err(validation_error("Branch name cannot contain '..'", branch));
    }

    return R::ok(ValidatedBranchName(std::move(branch)));
}

// ============================================================================
// URLs
// ============================================================================

Result<ValidatedUrl> Validator::validate_url(const std::string& raw,
                                             const std::vector<std::string>& allowed_schemes) {
    using R = Result<ValidatedUrl>;

    std::string url = trim(raw);
    if (url.empty()) {
        return R::err(validation_error("URL cannot be empty", raw));
    }

    // Grammar: (http|https|git)://host[/path]
    auto sep = url.find("://");
    if (sep == std::string::npos) {
        return R::err(validation_error("Invalid URL format", url));
    }

    std::string scheme = url.substr(0, sep);
    if (scheme != "http" && scheme != "https" && scheme != "git") {
        return R::err(validation_error("Invalid URL format", url));
    }

    size_t host_begin = sep + 3;
    size_t host_end = url.find('/', host_begin);
    if (host_end == std::string::npos) host_end = url.size();

    if (host_end == host_begin ||
        !std::all_of(url.begin() + static_cast<std::ptrdiff_t>(host_begin),
                     url.begin() + static_cast<std::ptrdiff_t>(host_end), is_url_host_char)) {
        return R::err(validation_error("Invalid URL format", url));
    }

    if (!std::all_of(url.begin() + static_cast<std::ptrdiff_t>(host_end), url.end(), is_url_path_char)) {
        return R::err(validation_error("Invalid URL format", url));
    }

    bool scheme_allowed = std::any_of(allowed_schemes.begin(), allowed_schemes.end(),
                                      [&scheme](const std::string& s) { return to_lower(s) == scheme; });
    if (!scheme_allowed) {
        std::string allowed;
        for (const auto& s : allowed_schemes) {
            if (!allowed.empty()) allowed += ", ";
            allowed += s;
        }
        return R::err(validation_error(
            "URL scheme '" + scheme + "' not allowed (allowed schemes: " + allowed + ")", url));
    }

    std::string lowered = to_lower(url);
    for (const char* host : kBlockedHosts) {
        if (lowered.find(host) != std::string::npos) {
            return R::err(validation_error("Local URLs not allowed", url));
        }
    }

    return R::ok(ValidatedUrl(std::move(url), std::move(scheme)));
}

// ============================================================================
// LaTeX Content
// ============================================================================

Result<std::string> Validator::sanitize_latex_content(const std::string& content) {
    std::string lowered = to_lower(content);

    for (const auto& denied : denied_latex_commands()) {
        const size_t word_len = std::strlen(denied.control_word);
        size_t pos = lowered.find(denied.control_word);

        while (pos != std::string::npos) {
            size_t end = pos + word_len;
            bool hit = true;

            if (denied.requires_pipe) {
                // \input|"cmd" and \input{|"cmd"}, spaces allowed as TeX skips them
                size_t i = end;
                while (i < lowered.size() && std::isspace(static_cast<unsigned char>(lowered[i]))) ++i;
                if (i < lowered.size() && lowered[i] == '{') ++i;
                while (i < lowered.size() && std::isspace(static_cast<unsigned char>(lowered[i]))) ++i;
                hit = i < lowered.size() && lowered[i] == '|';
                end = i + 1;
            }

            if (hit) {
                return Result<std::string>::err(validation_error(
                    std::string("Dangerous LaTeX command detected: ") + denied.description +
                        " (this command could execute arbitrary code)",
                    content.substr(pos, std::min(end, content.size()) - pos)));
            }

            pos = lowered.find(denied.control_word, pos + 1);
        }
    }

    return Result<std::string>::ok(content);
}

// ============================================================================
// Ports
// ============================================================================

Result<int> Validator::validate_port(int port, const std::string& name) {
    if (port < kMinPort || port > kMaxPort) {
        return Result<int>::err(validation_error(
            name + " must be between " + std::to_string(kMinPort) + " and " +
                std::to_string(kMaxPort) + " (got " + std::to_string(port) + ")",
            std::to_string(port)));
    }
    return Result<int>::ok(port);
}

} // namespace safeproc
