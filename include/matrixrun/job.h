#pragma once

#include "matrixrun/executor.h"
#include "matrixrun/matrix.h"
#include "matrixrun/process.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace matrixrun {

// Matches the job-level limit of hosted CI runners.
inline constexpr std::chrono::milliseconds kDefaultStepTimeout = std::chrono::minutes(360);

struct Step {
    std::string               name;
    std::string               command; // may reference ${{ matrix.<axis> }}
    std::chrono::milliseconds timeout{0}; // 0 = use the runner default
};

struct JobDefinition {
    std::string       name;
    std::vector<Axis> axes;
    std::vector<Step> steps;
};

enum class Outcome {
    Success,
    Failure,
    Skipped,
};

enum class FailureReason {
    None,
    ExitStatus,
    Timeout,
    EnvironmentError,
    Cancelled, // only on Skipped steps that were never issued
};

struct StepResult {
    std::string   name;
    std::string   command; // after substitution
    Outcome       outcome     = Outcome::Skipped;
    FailureReason reason      = FailureReason::None;
    int           exit_status = -1;
    double        time_s      = 0.0;
    std::string   output;
    std::string   message;
};

struct CellResult {
    Cell                    cell;
    Outcome                 outcome = Outcome::Success;
    double                  time_s  = 0.0;
    std::vector<StepResult> steps;

    [[nodiscard]] const StepResult *first_failure() const;
};

struct RunResult {
    Outcome                 outcome   = Outcome::Success;
    bool                    cancelled = false;
    double                  time_s    = 0.0;
    std::vector<CellResult> cells; // in expansion order

    [[nodiscard]] std::vector<const CellResult *> failed_cells() const;
};

class CancellationToken {
  public:
    void request_cancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool cancelled() const noexcept { return cancelled_.load(std::memory_order_relaxed); }

  private:
    std::atomic<bool> cancelled_{false};
};

struct RunnerOptions {
    std::size_t                  jobs         = 1;
    std::chrono::milliseconds    step_timeout = kDefaultStepTimeout; // 0 = no limit
    std::filesystem::path        workspace_root;                     // empty: run in the current directory
    std::filesystem::path        source_dir;                         // exported as MATRIXRUN_SOURCE_DIR
    std::vector<process::EnvVar> env;
    const CancellationToken     *cancel = nullptr;

    // Progress hooks. Invoked from worker threads, one call at a time.
    std::function<void(const Cell &, const Step &)>       on_step_started;
    std::function<void(const Cell &, const StepResult &)> on_step_finished;
    std::function<void(const CellResult &)>               on_cell_finished;
};

// Throws config_error when the plan cannot run: no steps, unnamed or
// duplicate steps, blank commands, or placeholders naming unknown axes.
void validate_steps(std::span<const Step> steps, std::span<const Axis> axes);

// Replaces every ${{ matrix.NAME }} with the cell's value for NAME.
std::string substitute_command(std::string_view command, const Cell &cell);

// "MATRIX_PYTHON_VERSION" for axis "python-version".
std::string axis_env_name(std::string_view axis);

std::string_view to_string(Outcome outcome);
std::string_view to_string(FailureReason reason);

class JobRunner {
  public:
    JobRunner(CommandExecutor &executor, RunnerOptions options);

    // Runs every cell; a failing cell never stops its siblings.
    [[nodiscard]] RunResult run(std::span<const Cell> cells, std::span<const Step> steps) const;

    // Steps run in order; the first failure marks the rest Skipped.
    [[nodiscard]] CellResult run_cell(const Cell &cell, std::span<const Step> steps) const;

    [[nodiscard]] const RunnerOptions &options() const noexcept { return options_; }

  private:
    CellEnvironment prepare_environment(const Cell &cell, std::string &error) const;
    void            notify(const std::function<void()> &fn) const;

    CommandExecutor   &executor_;
    RunnerOptions      options_;
    mutable std::mutex notify_mutex_;
};

// Expands, validates and runs. config_error escapes before any step starts.
RunResult run_job(const JobDefinition &job, CommandExecutor &executor, const RunnerOptions &options);

// 0 on Success, 130 when cancelled, 1 otherwise.
int exit_code(const RunResult &result);

} // namespace matrixrun
