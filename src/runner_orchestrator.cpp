#include "runner_orchestrator.h"

#include "log.h"
#include "matrixrun/presets.h"
#include "runner_reporting.h"
#include "runner_selector.h"

#include <filesystem>
#include <fmt/format.h>
#include <mutex>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace matrixrun::runner {
namespace {

constexpr const char *kDefaultWorkspace = ".matrixrun";

void print_help() {
#ifdef MATRIXRUN_VERSION_STR
    fmt::print("matrixrun v{}\n", MATRIXRUN_VERSION_STR);
#else
    fmt::print("matrixrun v{}\n", "0.0.0");
#endif
    fmt::print("Usage: matrixrun [options]\n");
    fmt::print("  --help                Show this help\n");
    fmt::print("  --list-cells          List matrix cells (one per line)\n");
    fmt::print("  --list-steps          List steps with their command templates\n");
    fmt::print("  --preset=<name>       Start from a built-in job (python-package)\n");
    fmt::print("  --axis=<name>=<v,..>  Declare or replace a matrix axis\n");
    fmt::print("  --step=<name>=<cmd>   Append a step; replaces the preset's steps\n");
    fmt::print("  --env=<key>=<value>   Extra environment variable for every step\n");
    fmt::print("  --filter=<pattern>    Run cells whose label or slug matches (*, ?)\n");
    fmt::print("  --jobs=<N>            Cells run in parallel (default 1, 0 = all cores)\n");
    fmt::print("  --timeout-s=<sec>     Per-step timeout (default 21600, 0 = none)\n");
    fmt::print("  --workspace=<dir>     Root of the per-cell workspaces (default {})\n", kDefaultWorkspace);
    fmt::print("  --source-dir=<dir>    Project directory exported as MATRIXRUN_SOURCE_DIR\n");
    fmt::print("  --shell=<path>        Shell used to run commands (default /bin/sh)\n");
    fmt::print("  --event=<name>        Incoming event: push|pull_request (or GITHUB_EVENT_NAME)\n");
    fmt::print("  --on=<list>           Events that trigger the job (default push,pull_request)\n");
    fmt::print("  --output-tail=<N>     Output lines shown per failed cell (default 20)\n");
    fmt::print("  --no-color            Disable colorized output (or set NO_COLOR/MATRIXRUN_NO_COLOR)\n");
    fmt::print("  --github-annotations  Emit GitHub Actions annotations (::error ...) on failures\n");
    fmt::print("  --junit=<file>        Write JUnit XML report to file\n");
    fmt::print("  --allure-dir=<dir>    Write Allure result JSON files into directory\n");
    fmt::print("\nExit status: 0 success, 1 failed cells, 2 configuration error, 130 cancelled.\n");
}

std::string preset_list() {
    std::string out;
    for (auto name : preset_names()) {
        if (!out.empty())
            out.append(", ");
        out.append(name);
    }
    return out;
}

std::filesystem::path absolute_or_empty(const char *path) {
    std::error_code ec;
    if (path == nullptr) {
        auto cwd = std::filesystem::current_path(ec);
        return ec ? std::filesystem::path{} : cwd;
    }
    auto abs = std::filesystem::absolute(path, ec);
    return ec ? std::filesystem::path(path) : abs;
}

} // namespace

JobDefinition build_job(const CliOptions &opt) {
    JobDefinition job;
    job.name = "job";
    if (opt.preset) {
        auto preset = find_preset(opt.preset);
        if (!preset)
            throw config_error(fmt::format("unknown preset '{}' (available: {})", opt.preset, preset_list()));
        job = std::move(*preset);
    }

    for (const auto &axis : opt.axes) {
        bool replaced = false;
        for (auto &existing : job.axes) {
            if (existing.name == axis.name) {
                existing = axis;
                replaced = true;
                break;
            }
        }
        if (!replaced)
            job.axes.push_back(axis);
    }

    if (!opt.steps.empty())
        job.steps = opt.steps;
    if (job.steps.empty())
        throw config_error("no steps to run; pass --step=<name>=<command> or --preset=<name>");
    return job;
}

int run_from_options(const CliOptions &opt, CommandExecutor &executor, const CancellationToken &cancel) {
    if (opt.mode == Mode::Help) {
        print_help();
        return kExitOk;
    }

    JobDefinition     job;
    std::vector<Cell> cells;
    try {
        job   = build_job(opt);
        cells = expand_matrix(job.axes);
        validate_steps(job.steps, job.axes);
    } catch (const config_error &e) {
        detail::log_err("error: {}\n", e.what());
        return kExitConfigError;
    }

    switch (opt.mode) {
    case Mode::ListCells:
        for (const auto &cell : cells)
            fmt::print("{}\n", cell.label());
        return kExitOk;
    case Mode::ListSteps:
        for (const auto &step : job.steps)
            fmt::print("{}: {}\n", step.name, step.command);
        return kExitOk;
    case Mode::Help:
    case Mode::Execute: break;
    }

    if (opt.event && !opt.triggers.accepts(*opt.event)) {
        fmt::print("Event '{}' does not trigger job '{}'; nothing to run.\n", to_string(*opt.event), job.name);
        return kExitOk;
    }

    auto selection = select_cells(cells, opt.filter_pat);
    if (selection.status == SelectionStatus::ZeroSelected) {
        detail::log_err("error: cell filter matched 0 of {} cell(s): {}\n", cells.size(), opt.filter_pat ? opt.filter_pat : "");
        detail::log_err("hint: use --list-cells to see available cells\n");
        return kExitConfigError;
    }
    if (selection.filtered_out > 0)
        fmt::print("Note: filter excluded {} cell(s).\n", selection.filtered_out);

    RunnerOptions ropt;
    ropt.jobs           = opt.jobs;
    ropt.step_timeout   = opt.step_timeout;
    ropt.workspace_root = opt.workspace ? opt.workspace : kDefaultWorkspace;
    ropt.source_dir     = absolute_or_empty(opt.source_dir);
    ropt.env            = opt.env;
    ropt.cancel         = &cancel;

    const bool color       = opt.color_output;
    ropt.on_step_started  = [color](const Cell &cell, const Step &step) { print_step_started(color, cell, step); };
    ropt.on_step_finished = [color](const Cell &cell, const StepResult &step) { print_step_result(color, cell, step); };

    const std::string trigger = opt.event ? fmt::format(" on {}", to_string(*opt.event)) : std::string();
    fmt::print("Running job '{}'{}: {} cell(s) x {} step(s)\n", job.name, trigger, selection.cells.size(), job.steps.size());

    JobRunner runner(executor, std::move(ropt));
    const RunResult result = runner.run(selection.cells, job.steps);

    {
        const std::string summary = format_summary(result, job.name, opt.output_tail);
        std::lock_guard<std::mutex> lock(detail::console_mutex());
        fmt::print("{}", summary);
    }

    write_reports(result, ReportConfig{
                              .job_name   = job.name,
                              .junit_path = opt.junit_path,
                              .allure_dir = opt.allure_dir,
                          });

    if (opt.github_annotations)
        emit_github_annotations(result, job.name, opt.output_tail);

    return exit_code(result);
}

int run_from_options(const CliOptions &opt, const CancellationToken &cancel) {
    ShellExecutor executor(opt.shell ? opt.shell : "/bin/sh");
    return run_from_options(opt, executor, cancel);
}

} // namespace matrixrun::runner
