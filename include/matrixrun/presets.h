#pragma once

#include "matrixrun/job.h"

#include <optional>
#include <span>
#include <string_view>

namespace matrixrun {

// Python package job: provision GUI/GL system libraries, install the project
// requirements and tox into a per-cell virtualenv, then run tox, for every
// python-version in [3.8, 3.9]. The system packages are host-wide, so that
// step holds /tmp/matrixrun-apt.lock and runs one cell at a time.
JobDefinition python_package_job();

std::span<const std::string_view> preset_names();
std::optional<JobDefinition>      find_preset(std::string_view name);

} // namespace matrixrun
