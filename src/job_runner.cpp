#include "matrixrun/job.h"

#include "parallel_for.h"

#include <chrono>
#include <exception>
#include <fmt/format.h>
#include <system_error>
#include <utility>

namespace matrixrun {

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

std::string format_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() % 1000 == 0)
        return fmt::format("{} s", timeout.count() / 1000);
    return fmt::format("{} ms", timeout.count());
}

void classify(StepResult &sr, CommandResult &res, std::chrono::milliseconds timeout) {
    sr.exit_status = res.exit_status;
    sr.time_s      = res.time_s;
    sr.output      = std::move(res.output);

    if (!res.launched) {
        sr.outcome = Outcome::Failure;
        sr.reason  = FailureReason::EnvironmentError;
        sr.message = res.error.empty() ? std::string("command could not be started") : std::move(res.error);
    } else if (res.timed_out) {
        sr.outcome = Outcome::Failure;
        sr.reason  = FailureReason::Timeout;
        sr.message = fmt::format("timed out after {}", format_timeout(timeout));
    } else if (!res.error.empty()) {
        sr.outcome = Outcome::Failure;
        sr.reason  = FailureReason::EnvironmentError;
        sr.message = std::move(res.error);
    } else if (res.exit_status != 0) {
        sr.outcome = Outcome::Failure;
        sr.reason  = FailureReason::ExitStatus;
        sr.message = fmt::format("exit status {}", res.exit_status);
    } else {
        sr.outcome = Outcome::Success;
        sr.reason  = FailureReason::None;
    }
}

} // namespace

const StepResult *CellResult::first_failure() const {
    for (const auto &s : steps) {
        if (s.outcome == Outcome::Failure)
            return &s;
    }
    return nullptr;
}

std::vector<const CellResult *> RunResult::failed_cells() const {
    std::vector<const CellResult *> out;
    for (const auto &c : cells) {
        if (c.outcome == Outcome::Failure)
            out.push_back(&c);
    }
    return out;
}

std::string_view to_string(Outcome outcome) {
    switch (outcome) {
    case Outcome::Success: return "success";
    case Outcome::Failure: return "failure";
    case Outcome::Skipped: return "skipped";
    }
    return "unknown";
}

std::string_view to_string(FailureReason reason) {
    switch (reason) {
    case FailureReason::None: return "none";
    case FailureReason::ExitStatus: return "exit-status";
    case FailureReason::Timeout: return "timeout";
    case FailureReason::EnvironmentError: return "environment-error";
    case FailureReason::Cancelled: return "cancelled";
    }
    return "unknown";
}

JobRunner::JobRunner(CommandExecutor &executor, RunnerOptions options) : executor_(executor), options_(std::move(options)) {}

void JobRunner::notify(const std::function<void()> &fn) const {
    std::lock_guard<std::mutex> lock(notify_mutex_);
    fn();
}

CellEnvironment JobRunner::prepare_environment(const Cell &cell, std::string &error) const {
    CellEnvironment env;
    env.vars = options_.env;

    std::error_code ec;
    if (!options_.workspace_root.empty()) {
        const auto root = std::filesystem::absolute(options_.workspace_root, ec);
        if (ec) {
            error = fmt::format("cannot resolve workspace '{}': {}", options_.workspace_root.string(), ec.message());
            return env;
        }
        env.work_dir = root / fmt::format("{}-{}", cell.index, cell.slug());
        std::filesystem::create_directories(env.work_dir, ec);
        if (ec) {
            error = fmt::format("cannot create workspace '{}': {}", env.work_dir.string(), ec.message());
            return env;
        }
    }

    std::filesystem::path cell_dir = env.work_dir;
    if (cell_dir.empty()) {
        cell_dir = std::filesystem::current_path(ec);
        ec.clear();
    }

    env.vars.push_back({"MATRIXRUN_CELL", cell.label()});
    env.vars.push_back({"MATRIXRUN_CELL_INDEX", std::to_string(cell.index)});
    env.vars.push_back({"MATRIXRUN_CELL_DIR", cell_dir.string()});
    if (!options_.source_dir.empty())
        env.vars.push_back({"MATRIXRUN_SOURCE_DIR", options_.source_dir.string()});
    for (const auto &b : cell.bindings)
        env.vars.push_back({axis_env_name(b.axis), b.value});
    return env;
}

CellResult JobRunner::run_cell(const Cell &cell, std::span<const Step> steps) const {
    CellResult cr;
    cr.cell = cell;
    cr.steps.reserve(steps.size());
    const auto start = std::chrono::steady_clock::now();

    CellEnvironment env;
    std::string     env_error;
    bool            env_ready = false;
    bool            failed    = false;
    bool            cancelled = false;

    for (const auto &step : steps) {
        StepResult sr;
        sr.name    = step.name;
        sr.command = substitute_command(step.command, cell);

        if (failed) {
            sr.message = "skipped after an earlier failure";
        } else if (options_.cancel && options_.cancel->cancelled()) {
            cancelled  = true;
            sr.reason  = FailureReason::Cancelled;
            sr.message = "run cancelled";
        } else {
            if (!env_ready) {
                env       = prepare_environment(cell, env_error);
                env_ready = true;
            }
            if (options_.on_step_started)
                notify([&] { options_.on_step_started(cell, step); });

            const auto timeout = step.timeout.count() > 0 ? step.timeout : options_.step_timeout;
            if (!env_error.empty()) {
                sr.outcome = Outcome::Failure;
                sr.reason  = FailureReason::EnvironmentError;
                sr.message = env_error;
            } else {
                try {
                    auto res = executor_.execute(sr.command, env, timeout);
                    classify(sr, res, timeout);
                } catch (const std::exception &e) {
                    sr.outcome = Outcome::Failure;
                    sr.reason  = FailureReason::EnvironmentError;
                    sr.message = fmt::format("executor error: {}", e.what());
                }
            }
            failed = sr.outcome == Outcome::Failure;
        }

        if (options_.on_step_finished)
            notify([&] { options_.on_step_finished(cell, sr); });
        cr.steps.push_back(std::move(sr));
    }

    if (failed)
        cr.outcome = Outcome::Failure;
    else if (cancelled)
        cr.outcome = Outcome::Skipped;
    else
        cr.outcome = Outcome::Success;
    cr.time_s = seconds_since(start);

    if (options_.on_cell_finished)
        notify([&] { options_.on_cell_finished(cr); });
    return cr;
}

RunResult JobRunner::run(std::span<const Cell> cells, std::span<const Step> steps) const {
    RunResult  rr;
    const auto start = std::chrono::steady_clock::now();
    rr.cells.resize(cells.size());

    const std::size_t jobs = options_.jobs == 0 ? detail::default_concurrency(cells.size()) : options_.jobs;
    detail::parallel_for(cells.size(), jobs, [&](std::size_t i) { rr.cells[i] = run_cell(cells[i], steps); });

    rr.cancelled = options_.cancel && options_.cancel->cancelled();
    rr.outcome   = rr.cancelled ? Outcome::Failure : Outcome::Success;
    for (const auto &c : rr.cells) {
        if (c.outcome == Outcome::Failure)
            rr.outcome = Outcome::Failure;
    }
    rr.time_s = seconds_since(start);
    return rr;
}

RunResult run_job(const JobDefinition &job, CommandExecutor &executor, const RunnerOptions &options) {
    const auto cells = expand_matrix(job.axes);
    validate_steps(job.steps, job.axes);
    JobRunner runner(executor, options);
    return runner.run(cells, job.steps);
}

int exit_code(const RunResult &result) {
    if (result.outcome == Outcome::Success)
        return 0;
    return result.cancelled ? 130 : 1;
}

} // namespace matrixrun
