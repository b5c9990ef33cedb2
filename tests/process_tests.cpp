#include "matrixrun/executor.h"
#include "matrixrun/process.h"
#include "support.h"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <string>
#include <unistd.h>

using matrixrun::process::run_subprocess;
using matrixrun::process::SubprocessOptions;

namespace {

SubprocessOptions sh(std::string script) {
    SubprocessOptions opts;
    opts.argv = {"/bin/sh", "-c", std::move(script)};
    return opts;
}

} // namespace

int main() {
    matrixrun::testing::Run t;

    {
        auto res = run_subprocess(sh("echo out; echo err 1>&2; exit 3"));
        t.expect(res.started, "shell starts");
        t.expect(res.exit_code == 3, "exit code is reported");
        t.expect(!res.timed_out && !res.signaled, "normal exit is neither timed out nor signaled");
        t.expect(res.stdout_text == "out\n", "stdout is captured separately");
        t.expect(res.stderr_text == "err\n", "stderr is captured separately");
        t.expect(res.error.empty(), "no error for a normal exit");
    }

    {
        auto opts         = sh("echo out; echo err 1>&2");
        opts.merge_stderr = true;
        auto res          = run_subprocess(opts);
        t.expect(res.exit_code == 0, "merged run succeeds");
        t.expect(res.stdout_text.find("out\n") != std::string::npos && res.stdout_text.find("err\n") != std::string::npos,
                 "merged output contains both streams");
        t.expect(res.stderr_text.empty(), "stderr text stays empty when merged");
    }

    {
        auto opts = sh("printf %s \"$MATRIXRUN_PROBE\"");
        opts.env.push_back({"MATRIXRUN_PROBE", "probe-value"});
        auto res = run_subprocess(opts);
        t.expect(res.stdout_text == "probe-value", "environment variables reach the child");
    }

    {
        const auto dir = std::filesystem::temp_directory_path() / ("matrixrun_process_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir);
        auto opts        = sh("pwd -P");
        opts.working_dir = dir.string();
        auto res         = run_subprocess(opts);
        t.expect(res.stdout_text == std::filesystem::canonical(dir).string() + "\n", "child runs in the working directory");
        std::filesystem::remove_all(dir);
    }

    {
        auto opts        = sh("true");
        opts.working_dir = "/nonexistent/matrixrun/dir";
        auto res         = run_subprocess(opts);
        t.expect(!res.started, "bad working directory prevents start");
        t.expect(res.error.find("working directory") != std::string::npos, "error names the working directory");
    }

    {
        SubprocessOptions opts;
        opts.argv = {"/nonexistent/matrixrun-shell", "-c", "true"};
        auto res  = run_subprocess(opts);
        t.expect(!res.started, "missing executable prevents start");
        t.expect(res.error.find("cannot execute") != std::string::npos, "error says the executable could not run");
    }

    {
        t.expect(!run_subprocess(SubprocessOptions{}).started, "empty argv is rejected");
    }

    {
        auto opts    = sh("echo begin; sleep 10");
        opts.timeout = std::chrono::milliseconds(200);
        auto res     = run_subprocess(opts);
        t.expect(res.started, "slow child starts");
        t.expect(res.timed_out, "slow child times out");
        t.expect(res.elapsed_s < 5.0, "timed out child is terminated promptly");
        t.expect(res.stdout_text == "begin\n", "output before the timeout is kept");
    }

    {
        auto opts       = sh("trap '' TERM; sleep 10");
        opts.timeout    = std::chrono::milliseconds(200);
        opts.kill_grace = std::chrono::milliseconds(200);
        auto res        = run_subprocess(opts);
        t.expect(res.timed_out, "child ignoring SIGTERM times out");
        t.expect(res.signaled && res.signal == SIGKILL, "child ignoring SIGTERM is killed");
        t.expect(res.elapsed_s < 5.0, "kill grace is honoured");
    }

    {
        auto res = run_subprocess(sh("sleep 30 & echo done"));
        t.expect(res.exit_code == 0, "shell with a background job exits cleanly");
        t.expect(res.stdout_text == "done\n", "output of the shell is captured");
        t.expect(res.elapsed_s < 10.0, "background job does not hold the run open");
    }

    {
        matrixrun::ShellExecutor   exec;
        matrixrun::CellEnvironment env;
        env.vars.push_back({"MATRIX_OS", "linux"});

        auto res = exec.execute("echo \"os=$MATRIX_OS\" 1>&2; exit 4", env, std::chrono::milliseconds(0));
        t.expect(res.launched, "shell executor launches");
        t.expect(res.exit_status == 4, "shell executor reports the exit status");
        t.expect(res.output == "os=linux\n", "shell executor merges stderr into the output");

        auto missing = exec.execute("matrixrun_no_such_command_xyz", env, std::chrono::milliseconds(0));
        t.expect(missing.launched, "unknown command still launches the shell");
        t.expect(missing.exit_status == 127, "shell reports 127 for an unknown command");

        auto slow = exec.execute("sleep 10", env, std::chrono::milliseconds(150));
        t.expect(slow.timed_out, "shell executor enforces the timeout");
    }

    {
        matrixrun::ShellExecutor exec("/nonexistent/matrixrun-sh");
        auto                     res = exec.execute("true", matrixrun::CellEnvironment{}, std::chrono::milliseconds(0));
        t.expect(!res.launched, "missing shell is not launched");
        t.expect(!res.error.empty(), "missing shell carries an error");
    }

    return t.finish();
}
