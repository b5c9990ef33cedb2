#pragma once

#include "matrixrun/executor.h"
#include "matrixrun/job.h"
#include "runner_cli.h"

namespace matrixrun::runner {

inline constexpr int kExitOk          = 0;
inline constexpr int kExitRunFailed   = 1;
inline constexpr int kExitConfigError = 2;
inline constexpr int kExitCancelled   = 130;

// Builds the job from a preset and/or --axis/--step flags. Throws config_error.
JobDefinition build_job(const CliOptions &opt);

// Runs the selected mode with the given executor; returns the process exit code.
int run_from_options(const CliOptions &opt, CommandExecutor &executor, const CancellationToken &cancel);

// Same, with a ShellExecutor built from --shell.
int run_from_options(const CliOptions &opt, const CancellationToken &cancel);

} // namespace matrixrun::runner
