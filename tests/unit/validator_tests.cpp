#include <doctest/doctest.h>
#include <safeproc/validator.hpp>

#include "../support/test_support.hpp"

#include <string>

using namespace safeproc;

namespace {

bool message_contains(const Error& e, const std::string& needle) {
    return e.message().find(needle) != std::string::npos;
}

} // namespace

// ============================================================================
// Identifiers
// ============================================================================

TEST_CASE("identifier accepts default charset") {
    auto r = Validator::validate_identifier("my-project_01");
    REQUIRE(r.isOk());
    CHECK(r.value().value() == "my-project_01");
}

TEST_CASE("identifier is trimmed") {
    auto r = Validator::validate_identifier("  paper  ");
    REQUIRE(r.isOk());
    CHECK(r.value().value() == "paper");
}

TEST_CASE("identifier rejects empty and whitespace only") {
    CHECK(Validator::validate_identifier("").isErr());
    auto r = Validator::validate_identifier("   \t ");
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::VALIDATION_ERROR);
}

TEST_CASE("identifier length limit") {
    CHECK(Validator::validate_identifier(std::string(50, 'a')).isOk());
    CHECK(Validator::validate_identifier(std::string(51, 'a')).isErr());

    IdentifierRules rules;
    rules.max_length = 5;
    CHECK(Validator::validate_identifier("abcde", rules).isOk());
    CHECK(Validator::validate_identifier("abcdef", rules).isErr());
}

TEST_CASE("identifier rejects every shell metacharacter regardless of flags") {
    IdentifierRules permissive;
    permissive.allow_slash = true;

    for (const char* p = kShellMetacharacters; *p; ++p) {
        std::string value = std::string("ab") + *p + "cd";
        CAPTURE(value);
        CHECK(Validator::validate_identifier(value).isErr());
        CHECK(Validator::validate_identifier(value, permissive).isErr());
    }
}

TEST_CASE("identifier metacharacter message lists what was found") {
    auto r = Validator::validate_identifier("a;b&c;");
    REQUIRE(r.isErr());
    CHECK(message_contains(r.error(), "Shell metacharacters"));
    CHECK(message_contains(r.error(), "';', '&'"));
}

TEST_CASE("identifier rejects traversal and NUL") {
    auto dots = Validator::validate_identifier("a..b");
    REQUIRE(dots.isErr());
    CHECK(message_contains(dots.error(), "Path traversal"));

    auto nul = Validator::validate_identifier(std::string("ab\0cd", 5));
    REQUIRE(nul.isErr());
    CHECK(message_contains(nul.error(), "Null byte"));
}

TEST_CASE("identifier charset follows the flags") {
    CHECK(Validator::validate_identifier("a/b").isErr());
    CHECK(Validator::validate_identifier("a b").isErr());
    CHECK(Validator::validate_identifier("a.b").isErr());

    IdentifierRules rules;
    rules.allow_slash = true;
    CHECK(Validator::validate_identifier("a/b", rules).isOk());

    rules.allow_dash = false;
    CHECK(Validator::validate_identifier("a-b", rules).isErr());

    rules.allow_underscore = false;
    CHECK(Validator::validate_identifier("a_b", rules).isErr());
}

TEST_CASE("identifier message uses the field name") {
    IdentifierRules rules;
    rules.name = "project_name";
    auto r = Validator::validate_identifier("bad name", rules);
    REQUIRE(r.isErr());
    CHECK(message_contains(r.error(), "project_name"));
}

TEST_CASE("offending value is truncated in the error detail") {
    std::string long_value = std::string(59, 'a') + ";";
    auto r = Validator::validate_identifier(long_value);
    REQUIRE(r.isErr());
    CHECK(r.error().detail().value == std::string(50, 'a') + "...");
    CHECK(truncate_for_message("short") == "short");
}

// ============================================================================
// Model names
// ============================================================================

TEST_CASE("model name charset includes slash and dot") {
    auto r = Validator::validate_model_name("meta-llama/Llama-3.1-8B_instruct");
    REQUIRE(r.isOk());
    CHECK(r.value().value() == "meta-llama/Llama-3.1-8B_instruct");
}

TEST_CASE("model name rejections") {
    CHECK(Validator::validate_model_name("").isErr());
    CHECK(Validator::validate_model_name("gpt 4").isErr());
    CHECK(Validator::validate_model_name("gpt;4").isErr());
    CHECK(Validator::validate_model_name("../model").isErr());
    CHECK(Validator::validate_model_name(std::string(200, 'm')).isOk());
    CHECK(Validator::validate_model_name(std::string(201, 'm')).isErr());
}

// ============================================================================
// Branch names
// ============================================================================

TEST_CASE("branch names accepted") {
    CHECK(Validator::validate_branch_name("main").isOk());
    CHECK(Validator::validate_branch_name("feature/login-form_v2").isOk());

    auto r = Validator::validate_branch_name(" develop ");
    REQUIRE(r.isOk());
    CHECK(r.value().value() == "develop");
}

TEST_CASE("branch names rejected") {
    CHECK(Validator::validate_branch_name("").isErr());
    CHECK(Validator::validate_branch_name("test; rm -rf /").isErr());
    CHECK(Validator::validate_branch_name(".hidden").isErr());
    CHECK(Validator::validate_branch_name("/rooted").isErr());
    CHECK(Validator::validate_branch_name("x.lock").isErr());
    CHECK(Validator::validate_branch_name("a..b").isErr());
    CHECK(Validator::validate_branch_name("-f").isErr());
    CHECK(Validator::validate_branch_name("--orphan").isErr());
    CHECK(Validator::validate_branch_name("$(id)").isErr());
    CHECK(Validator::validate_branch_name(std::string(256, 'b')).isErr());
    CHECK(Validator::validate_branch_name(std::string(255, 'b')).isOk());
}

// ============================================================================
// URLs
// ============================================================================

TEST_CASE("https url accepted by default") {
    auto r = Validator::validate_url("https://github.com/a/b");
    REQUIRE(r.isOk());
    CHECK(r.value().value() == "https://github.com/a/b");
    CHECK(r.value().scheme() == "https");
}

TEST_CASE("url scheme allow-list") {
    CHECK(Validator::validate_url("git://github.com/a/b.git").isErr());
    CHECK(Validator::validate_url("git://github.com/a/b.git", {"https", "git"}).isOk());
    CHECK(Validator::validate_url("http://example.com/").isErr());

    auto file = Validator::validate_url("file:///etc/passwd", {"https", "git"});
    CHECK(file.isErr());
}

TEST_CASE("url scheme list compares case-insensitively") {
    CHECK(Validator::validate_url("https://example.com/x", {"HTTPS"}).isOk());
}

TEST_CASE("local hosts blocked") {
    auto r = Validator::validate_url("https://127.0.0.1/x");
    REQUIRE(r.isErr());
    CHECK(message_contains(r.error(), "Local URLs"));
    CHECK(Validator::validate_url("https://LOCALHOST/repo").isErr());
    CHECK(Validator::validate_url("https://example.com/localhost").isErr());
}

TEST_CASE("url grammar") {
    CHECK(Validator::validate_url("").isErr());
    CHECK(Validator::validate_url("github.com/a/b").isErr());
    CHECK(Validator::validate_url("https://").isErr());
    CHECK(Validator::validate_url("https://exa mple.com/").isErr());
    CHECK(Validator::validate_url("https://example.com/a b").isErr());
    CHECK(Validator::validate_url("https://user@example.com/").isErr());
    CHECK(Validator::validate_url("https://example.com/path?q=1&x=y#frag").isOk());
}

// ============================================================================
// Paths
// ============================================================================

TEST_CASE("path resolves relative to base") {
    safeproc::testing::TempDir tmp;
    auto r = Validator::validate_path("papers/vq", tmp.path());
    REQUIRE(r.isOk());
    CHECK(r.value().value() == tmp.path() + "/papers/vq");
    CHECK(r.value().base_dir() == tmp.path());
    CHECK_FALSE(r.value().verified_exists());
}

TEST_CASE("path outside base rejected") {
    safeproc::testing::TempDir tmp;
    auto r = Validator::validate_path("../../../etc/passwd", tmp.path());
    REQUIRE(r.isErr());
    CHECK(message_contains(r.error(), "outside base directory"));

    CHECK(Validator::validate_path("/etc/passwd", tmp.path()).isErr());
}

TEST_CASE("path must exist") {
    safeproc::testing::TempDir tmp;
    safeproc::testing::write_file(tmp.file("main.tex"), "x");

    auto missing = Validator::validate_path("nope.tex", tmp.path(), true);
    REQUIRE(missing.isErr());
    CHECK(message_contains(missing.error(), "does not exist"));

    auto present = Validator::validate_path("main.tex", tmp.path(), true);
    REQUIRE(present.isOk());
    CHECK(present.value().verified_exists());
}

TEST_CASE("path symlink escaping base rejected") {
    safeproc::testing::TempDir base;
    safeproc::testing::TempDir outside;
    std::filesystem::create_directory_symlink(outside.path(), base.file("link"));

    auto r = Validator::validate_path("link/secret", base.path());
    CHECK(r.isErr());
}

// ============================================================================
// LaTeX content
// ============================================================================

TEST_CASE("clean latex passes through unchanged") {
    std::string doc = "\\documentclass{article}\n\\begin{document}\n\\input{intro}\nHello\n\\end{document}\n";
    auto r = Validator::sanitize_latex_content(doc);
    REQUIRE(r.isOk());
    CHECK(r.value() == doc);
}

TEST_CASE("denied latex commands rejected") {
    const char* cases[] = {
        "\\write18{rm -rf /}",
        "\\input|\"cat /etc/passwd\"",
        "\\input |ls",
        "\\input{|ls}",
        "\\immediate\\write\\out{x}",
        "\\openout\\f=out.txt",
        "\\openin\\f=/etc/passwd",
        "\\special{ps: x}",
        "\\pdfliteral{0 0 m}",
        "\\directlua{os.execute('id')}",
        "\\WRITE18{id}",
    };
    for (const char* c : cases) {
        CAPTURE(c);
        auto r = Validator::sanitize_latex_content(std::string("before ") + c + " after");
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::VALIDATION_ERROR);
        CHECK(message_contains(r.error(), "Dangerous LaTeX command detected"));
    }
}

TEST_CASE("denied command table is non-empty and pipe rule is scoped to input") {
    const auto& table = denied_latex_commands();
    REQUIRE(table.size() >= 7);
    int pipe_rules = 0;
    for (const auto& entry : table) {
        if (entry.requires_pipe) {
            ++pipe_rules;
            CHECK(std::string(entry.control_word) == "\\input");
        }
    }
    CHECK(pipe_rules == 1);
}

// ============================================================================
// Ports
// ============================================================================

TEST_CASE("port bounds") {
    CHECK(Validator::validate_port(1024).isOk());
    CHECK(Validator::validate_port(65535).isOk());
    CHECK(Validator::validate_port(8080).value() == 8080);
    CHECK(Validator::validate_port(1023).isErr());
    CHECK(Validator::validate_port(65536).isErr());
    CHECK(Validator::validate_port(-1).isErr());
}
