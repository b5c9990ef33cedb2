#include "matrixrun/executor.h"

#include <utility>

namespace matrixrun {

ShellExecutor::ShellExecutor(std::string shell) : shell_(std::move(shell)) {}

CommandResult ShellExecutor::execute(std::string_view command, const CellEnvironment &env, std::chrono::milliseconds timeout) {
    process::SubprocessOptions opts;
    opts.argv         = {shell_, "-c", std::string(command)};
    opts.env          = env.vars;
    opts.timeout      = timeout;
    opts.merge_stderr = true;
    if (!env.work_dir.empty())
        opts.working_dir = env.work_dir.string();

    auto sub = process::run_subprocess(opts);

    CommandResult result;
    result.launched    = sub.started;
    result.timed_out   = sub.timed_out;
    result.exit_status = sub.exit_code;
    result.time_s      = sub.elapsed_s;
    result.output      = std::move(sub.stdout_text);
    result.error       = std::move(sub.error);
    return result;
}

} // namespace matrixrun
