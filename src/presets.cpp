#include "matrixrun/presets.h"

#include <array>

namespace matrixrun {

namespace {
constexpr std::array<std::string_view, 1> kPresetNames{"python-package"};
} // namespace

JobDefinition python_package_job() {
    JobDefinition job;
    job.name = "test";
    job.axes = {Axis{"python-version", {"3.8", "3.9"}}};

    job.steps.push_back(Step{
        .name    = "Install system dependencies",
        .command = "flock /tmp/matrixrun-apt.lock sh -c"
                   " 'sudo apt-get update && sudo apt-get install -y libgtk-3-dev libgl1-mesa-glx libglu1-mesa'",
    });
    job.steps.push_back(Step{
        .name    = "Install dependencies",
        .command = "python${{ matrix.python-version }} -m venv \"$MATRIXRUN_CELL_DIR/.venv\""
                   " && \"$MATRIXRUN_CELL_DIR/.venv/bin/python\" -m pip install --upgrade pip"
                   " && \"$MATRIXRUN_CELL_DIR/.venv/bin/python\" -m pip install -r \"$MATRIXRUN_SOURCE_DIR/requirements.txt\""
                   " && \"$MATRIXRUN_CELL_DIR/.venv/bin/python\" -m pip install tox",
    });
    job.steps.push_back(Step{
        .name    = "Run tests",
        .command = "cd \"$MATRIXRUN_SOURCE_DIR\" && \"$MATRIXRUN_CELL_DIR/.venv/bin/tox\" --workdir \"$MATRIXRUN_CELL_DIR/.tox\"",
    });
    return job;
}

std::span<const std::string_view> preset_names() { return kPresetNames; }

std::optional<JobDefinition> find_preset(std::string_view name) {
    if (name == "python-package")
        return python_package_job();
    return std::nullopt;
}

} // namespace matrixrun
