#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace matrixrun::process {

struct EnvVar {
    std::string key;
    std::string value;
};

struct SubprocessOptions {
    std::vector<std::string>   argv;
    std::vector<EnvVar>        env;
    std::chrono::milliseconds  timeout{0}; // 0 = wait forever
    std::chrono::milliseconds  kill_grace{2000};
    std::optional<std::string> working_dir;
    bool                       merge_stderr = false;
};

// `started` is false when the child never reached exec (pipe/fork failure,
// bad working directory, missing executable); `error` then says why.
struct SubprocessResult {
    int         exit_code = -1;
    bool        started   = false;
    bool        timed_out = false;
    bool        signaled  = false;
    int         signal    = 0;
    double      elapsed_s = 0.0;
    std::string stdout_text;
    std::string stderr_text;
    std::string error;
};

// The child runs in its own process group; on timeout the whole group gets
// SIGTERM, then SIGKILL once kill_grace has elapsed. Processes still left in
// the group after the child exits are killed.
auto run_subprocess(const SubprocessOptions &options) -> SubprocessResult;

} // namespace matrixrun::process
