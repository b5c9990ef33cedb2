#pragma once

#include "matrixrun/job.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace matrixrun::runner {

struct ReportConfig {
    std::string job_name   = "job";
    const char *junit_path = nullptr;
    const char *allure_dir = nullptr;
};

// Last `max_lines` lines of `output`, without trailing newlines.
std::string output_tail(std::string_view output, std::size_t max_lines);

// "test (3.8)"
std::string cell_display_name(std::string_view job_name, const Cell &cell);

void print_step_started(bool color, const Cell &cell, const Step &step);
void print_step_result(bool color, const Cell &cell, const StepResult &step);

// Per-cell outcome lines plus, for each failed cell, the first failing step and
// the tail of its output.
std::string format_summary(const RunResult &result, std::string_view job_name, std::size_t tail_lines);

std::string format_github_annotations(const RunResult &result, std::string_view job_name, std::size_t tail_lines);
void        emit_github_annotations(const RunResult &result, std::string_view job_name, std::size_t tail_lines);

// Report write failures are logged; they never change the run outcome.
void write_reports(const RunResult &result, const ReportConfig &cfg);

} // namespace matrixrun::runner
