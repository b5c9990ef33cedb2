#pragma once

#include "matrixrun/job.h"
#include "matrixrun/matrix.h"
#include "matrixrun/process.h"
#include "matrixrun/trigger.h"

#include <chrono>
#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace matrixrun::runner {

enum class Mode {
    Execute,
    Help,
    ListCells,
    ListSteps,
};

struct CliOptions {
    Mode mode = Mode::Execute;

    bool color_output       = true;
    bool github_annotations = false;

    std::vector<Axis>            axes;  // --axis, in command line order
    std::vector<Step>            steps; // --step, in command line order
    std::vector<process::EnvVar> env;   // --env

    const char *preset     = nullptr;
    const char *filter_pat = nullptr;
    const char *junit_path = nullptr;
    const char *allure_dir = nullptr;
    const char *workspace  = nullptr;
    const char *source_dir = nullptr;
    const char *shell      = nullptr;

    std::size_t               jobs         = 1; // 0 = one per hardware thread
    std::chrono::milliseconds step_timeout = kDefaultStepTimeout;
    std::size_t               output_tail  = 20;

    std::optional<TriggerEvent> event; // --event or GITHUB_EVENT_NAME
    TriggerSet                  triggers{};
};

// Prints a diagnostic to stderr and returns false on malformed input.
bool parse_cli(std::span<const char *> args, CliOptions &out_opt);

} // namespace matrixrun::runner
