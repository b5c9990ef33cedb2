#pragma once

#include "matrixrun/process.h"

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace matrixrun {

// Per-cell execution environment. Each cell gets its own working directory and
// variable set, so concurrent cells never share installation state.
struct CellEnvironment {
    std::filesystem::path        work_dir;
    std::vector<process::EnvVar> vars;
};

struct CommandResult {
    int         exit_status = -1;
    bool        launched    = false; // false: the executor itself could not run the command
    bool        timed_out   = false;
    double      time_s      = 0.0;
    std::string output;
    std::string error;
};

class CommandExecutor {
  public:
    virtual ~CommandExecutor() = default;

    // timeout of zero means no limit. Must be safe to call from several
    // threads at once for different cells.
    virtual CommandResult execute(std::string_view command, const CellEnvironment &env, std::chrono::milliseconds timeout) = 0;
};

// Runs each command as `<shell> -c <command>` with stdout and stderr merged.
class ShellExecutor final : public CommandExecutor {
  public:
    explicit ShellExecutor(std::string shell = "/bin/sh");

    CommandResult execute(std::string_view command, const CellEnvironment &env, std::chrono::milliseconds timeout) override;

    [[nodiscard]] const std::string &shell() const noexcept { return shell_; }

  private:
    std::string shell_;
};

} // namespace matrixrun
