#include "runner_orchestrator.h"
#include "runner_selector.h"
#include "support.h"

#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

using namespace matrixrun;
using namespace matrixrun::runner;
using matrixrun::testing::exit_with;
using matrixrun::testing::ok;
using matrixrun::testing::ScriptedExecutor;

namespace {

struct Fixture {
    std::filesystem::path root;
    std::string           workspace;

    Fixture() {
        root = std::filesystem::temp_directory_path() / ("matrixrun_orchestrator_" + std::to_string(::getpid()));
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root);
        workspace = (root / "ws").string();
    }
    ~Fixture() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    CliOptions options() const {
        CliOptions opt;
        opt.color_output = false;
        opt.workspace    = workspace.c_str();
        opt.source_dir   = nullptr;
        opt.axes         = {{"python-version", {"3.8", "3.9"}}};
        opt.steps        = {{.name = "Install dependencies", .command = "pip${{ matrix.python-version }} install tox"}, {.name = "Run tests", .command = "tox"}};
        return opt;
    }
};

ScriptedExecutor green() {
    return ScriptedExecutor([](std::string_view, const CellEnvironment &) { return ok(); });
}

} // namespace

int main() {
    matrixrun::testing::Run t;
    Fixture                 fx;
    CancellationToken       never;

    // Job assembly
    {
        CliOptions opt;
        opt.preset = "python-package";
        opt.axes   = {{"python-version", {"3.10"}}, {"os", {"ubuntu", "debian"}}};
        const auto job = build_job(opt);
        t.expect(job.name == "test", "preset provides the job name");
        t.expect(job.axes.size() == 2, "CLI axis replaces the preset axis and new ones are appended");
        t.expect(job.axes[0].name == "python-version" && job.axes[0].values == std::vector<std::string>{"3.10"}, "preset axis is replaced in place");
        t.expect(job.axes[1].name == "os", "new axis is appended");
        t.expect(job.steps.size() == 3, "preset steps are kept without --step");

        opt.steps = {{.name = "only", .command = "true"}};
        t.expect(build_job(opt).steps.size() == 1, "--step replaces the preset steps");
    }
    {
        CliOptions opt;
        opt.preset = "no-such-preset";
        try {
            (void)build_job(opt);
            t.expect(false, "unknown preset must throw");
        } catch (const config_error &e) {
            t.expect(std::string(e.what()).find("python-package") != std::string::npos, "error lists the available presets");
        }
    }
    {
        CliOptions opt;
        try {
            (void)build_job(opt);
            t.expect(false, "job without steps must throw");
        } catch (const config_error &) {
            t.expect(true, "job without steps is a config error");
        }
    }

    // Exit status mapping
    {
        auto exec = green();
        t.expect(run_from_options(fx.options(), exec, never) == kExitOk, "green run exits 0");
        t.expect(exec.calls().size() == 4, "every step of every cell runs");
    }
    {
        ScriptedExecutor exec([](std::string_view cmd, const CellEnvironment &) { return cmd == "pip3.8 install tox" ? exit_with(1, "boom\n") : ok(); });
        t.expect(run_from_options(fx.options(), exec, never) == kExitRunFailed, "failing cell exits 1");
        t.expect(exec.calls().size() == 3, "failing cell skips its remaining steps while its sibling runs");
    }
    {
        auto opt = fx.options();
        opt.axes = {{"python-version", {}}};
        auto exec = green();
        t.expect(run_from_options(opt, exec, never) == kExitConfigError, "empty axis exits 2");
        t.expect(exec.calls().empty(), "nothing runs on a configuration error");
    }
    {
        auto opt  = fx.options();
        opt.steps = {{.name = "t", .command = "tox -e ${{ matrix.toxenv }}"}};
        auto exec = green();
        t.expect(run_from_options(opt, exec, never) == kExitConfigError, "unknown axis reference exits 2");
        t.expect(exec.calls().empty(), "nothing runs for an unknown axis reference");
    }
    {
        CancellationToken cancelled;
        cancelled.request_cancel();
        auto exec = green();
        t.expect(run_from_options(fx.options(), exec, cancelled) == kExitCancelled, "cancelled run exits 130");
        t.expect(exec.calls().empty(), "nothing starts after cancellation");
    }

    // Selection and triggers
    {
        auto opt       = fx.options();
        opt.filter_pat = "3.9";
        auto exec      = green();
        t.expect(run_from_options(opt, exec, never) == kExitOk, "filtered run succeeds");
        const auto calls = exec.calls();
        t.expect(calls.size() == 2, "only the selected cell runs");
        t.expect(!calls.empty() && calls[0].command == "pip3.9 install tox", "selected cell is python 3.9");
        t.expect(!calls.empty() && calls[0].env.work_dir.filename() == "1-python-version-3.9", "filtered cell keeps its index");
    }
    {
        auto opt       = fx.options();
        opt.filter_pat = "3.7";
        auto exec      = green();
        t.expect(run_from_options(opt, exec, never) == kExitConfigError, "filter matching nothing exits 2");
        t.expect(exec.calls().empty(), "nothing runs when the filter matches nothing");
    }
    {
        auto opt     = fx.options();
        opt.event    = TriggerEvent::PullRequest;
        opt.triggers = TriggerSet{.push = true, .pull_request = false};
        auto exec    = green();
        t.expect(run_from_options(opt, exec, never) == kExitOk, "non-triggering event exits 0");
        t.expect(exec.calls().empty(), "non-triggering event runs nothing");

        opt.event = TriggerEvent::Push;
        t.expect(run_from_options(opt, exec, never) == kExitOk, "triggering event runs");
        t.expect(exec.calls().size() == 4, "triggering event runs the full matrix");
    }

    // Listing modes never execute.
    {
        auto exec = green();
        auto opt  = fx.options();
        opt.mode  = Mode::ListCells;
        t.expect(run_from_options(opt, exec, never) == kExitOk, "--list-cells exits 0");
        opt.mode = Mode::ListSteps;
        t.expect(run_from_options(opt, exec, never) == kExitOk, "--list-steps exits 0");
        opt.mode = Mode::Help;
        t.expect(run_from_options(opt, exec, never) == kExitOk, "--help exits 0");
        t.expect(exec.calls().empty(), "listing modes run nothing");
    }

    // The real shell end to end.
    {
        auto opt  = fx.options();
        opt.axes  = {{"greeting", {"hello", "bye"}}};
        opt.steps = {{.name = "say", .command = "echo ${{ matrix.greeting }} > \"$MATRIXRUN_CELL_DIR/out.txt\""},
                     {.name = "check", .command = "test \"$MATRIX_GREETING\" = ${{ matrix.greeting }}"}};
        const std::string junit = (fx.root / "junit.xml").string();
        opt.junit_path          = junit.c_str();
        t.expect(run_from_options(opt, never) == kExitOk, "shell run exits 0");
        t.expect(std::filesystem::exists(fx.root / "ws" / "0-greeting-hello" / "out.txt"), "first cell wrote into its directory");
        t.expect(std::filesystem::exists(fx.root / "ws" / "1-greeting-bye" / "out.txt"), "second cell wrote into its directory");
        t.expect(std::filesystem::exists(junit), "JUnit report is written");

        opt.steps      = {{.name = "fail", .command = "exit 7"}};
        opt.junit_path = nullptr;
        t.expect(run_from_options(opt, never) == kExitRunFailed, "failing shell step exits 1");
    }

    // Cell selection
    {
        t.expect(wildcard_match("3.8", "3.*"), "star matches a suffix");
        t.expect(wildcard_match("3.8, ubuntu", "*ubuntu"), "star matches a prefix");
        t.expect(wildcard_match("3.9", "3.?"), "question mark matches one character");
        t.expect(!wildcard_match("3.10", "3.?"), "question mark matches exactly one character");
        t.expect(!wildcard_match("3.8", "3.9"), "literal mismatch");

        const auto cells = expand_matrix(std::vector<Axis>{{"python-version", {"3.8", "3.9"}}, {"os", {"ubuntu", "macos"}}});
        const auto all   = select_cells(cells, nullptr);
        t.expect(all.status == SelectionStatus::Ok && all.cells.size() == 4 && all.filtered_out == 0, "null pattern selects everything");

        const auto mac = select_cells(cells, "*macos");
        t.expect(mac.cells.size() == 2 && mac.filtered_out == 2, "label pattern selects matching cells");
        t.expect(mac.cells.size() == 2 && mac.cells[0].index == 1 && mac.cells[1].index == 3, "selected cells keep their indices");

        const auto by_slug = select_cells(cells, "python-version-3.9-os-ubuntu");
        t.expect(by_slug.cells.size() == 1 && by_slug.cells[0].index == 2, "slug pattern selects a single cell");

        const auto none = select_cells(cells, "3.7*");
        t.expect(none.status == SelectionStatus::ZeroSelected && none.cells.empty(), "no match reports zero selected");
    }

    return t.finish();
}
