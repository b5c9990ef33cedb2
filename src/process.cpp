#include "matrixrun/process.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <functional>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace matrixrun::process {
namespace {

enum class ChildStage : int {
    Chdir = 1,
    Exec  = 2,
};

struct ChildError {
    int stage = 0;
    int err   = 0;
};

void read_fd(int fd, std::string &out) {
    constexpr size_t kBufferSize = 4096;
    char buffer[kBufferSize];
    while (true) {
        const ssize_t bytes_read = read(fd, buffer, kBufferSize);
        if (bytes_read > 0) {
            out.append(buffer, buffer + bytes_read);
            continue;
        }
        if (bytes_read < 0 && errno == EINTR)
            continue;
        break;
    }
    close(fd);
}

void close_pair(int (&fds)[2]) {
    for (int &fd : fds) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}

// Close-on-exec so children of concurrent cells never inherit these ends.
// dup2 clears the flag on the child's own fds 1 and 2.
bool open_pipe(int (&fds)[2]) { return pipe2(fds, O_CLOEXEC) == 0; }

[[noreturn]] void child_fail(int fd, ChildStage stage) {
    ChildError e{static_cast<int>(stage), errno};
    ssize_t    ignored = write(fd, &e, sizeof(e));
    (void)ignored;
    _exit(127);
}

// Returns true once the child has been reaped.
bool wait_with_deadline(pid_t pid, int &status, std::chrono::steady_clock::time_point deadline) {
    while (true) {
        const pid_t wait_result = waitpid(pid, &status, WNOHANG);
        if (wait_result == pid)
            return true;
        if (wait_result < 0 && errno != EINTR)
            return true;
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

std::string describe_child_error(const ChildError &e, const SubprocessOptions &options) {
    if (e.stage == static_cast<int>(ChildStage::Chdir)) {
        return fmt::format("cannot enter working directory '{}': {}", options.working_dir.value_or(""), std::strerror(e.err));
    }
    return fmt::format("cannot execute '{}': {}", options.argv.front(), std::strerror(e.err));
}

} // namespace

SubprocessResult run_subprocess(const SubprocessOptions &options) {
    SubprocessResult result;
    if (options.argv.empty()) {
        result.error = "argv is empty";
        return result;
    }

    const auto start = std::chrono::steady_clock::now();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int error_pipe[2]  = {-1, -1};
    if (!open_pipe(stdout_pipe)) {
        result.error = fmt::format("pipe stdout failed: {}", std::strerror(errno));
        return result;
    }
    if (!options.merge_stderr && !open_pipe(stderr_pipe)) {
        result.error = fmt::format("pipe stderr failed: {}", std::strerror(errno));
        close_pair(stdout_pipe);
        return result;
    }
    if (!open_pipe(error_pipe)) {
        result.error = fmt::format("pipe exec status failed: {}", std::strerror(errno));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(error_pipe);
        return result;
    }

    const pid_t pid = fork();
    if (pid < 0) {
        result.error = fmt::format("fork failed: {}", std::strerror(errno));
        close_pair(stdout_pipe);
        close_pair(stderr_pipe);
        close_pair(error_pipe);
        return result;
    }

    if (pid == 0) {
        setpgid(0, 0);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(options.merge_stderr ? stdout_pipe[1] : stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        if (!options.merge_stderr) {
            close(stderr_pipe[0]);
            close(stderr_pipe[1]);
        }
        close(error_pipe[0]);

        const int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDIN_FILENO);
            close(null_fd);
        }

        if (options.working_dir.has_value()) {
            if (chdir(options.working_dir.value().c_str()) != 0) {
                child_fail(error_pipe[1], ChildStage::Chdir);
            }
        }

        for (const auto &env : options.env) {
            setenv(env.key.c_str(), env.value.c_str(), 1);
        }

        std::vector<char *> argv_c;
        argv_c.reserve(options.argv.size() + 1);
        for (const auto &arg : options.argv) {
            argv_c.push_back(const_cast<char *>(arg.c_str()));
        }
        argv_c.push_back(nullptr);
        execvp(argv_c[0], argv_c.data());
        child_fail(error_pipe[1], ChildStage::Exec);
    }

    // Both sides call setpgid so the group exists before anyone signals it.
    setpgid(pid, pid);

    close(stdout_pipe[1]);
    if (!options.merge_stderr)
        close(stderr_pipe[1]);
    close(error_pipe[1]);

    ChildError child_error;
    ssize_t    got = 0;
    do {
        got = read(error_pipe[0], &child_error, sizeof(child_error));
    } while (got < 0 && errno == EINTR);
    close(error_pipe[0]);

    if (got == static_cast<ssize_t>(sizeof(child_error))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close(stdout_pipe[0]);
        if (!options.merge_stderr)
            close(stderr_pipe[0]);
        result.error     = describe_child_error(child_error, options);
        result.elapsed_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
        return result;
    }

    result.started = true;

    std::thread stdout_thread(read_fd, stdout_pipe[0], std::ref(result.stdout_text));
    std::thread stderr_thread;
    if (!options.merge_stderr)
        stderr_thread = std::thread(read_fd, stderr_pipe[0], std::ref(result.stderr_text));

    int        status      = 0;
    bool       finished    = false;
    const bool has_timeout = options.timeout.count() > 0;
    const auto deadline    = start + options.timeout;

    while (!finished) {
        const pid_t wait_result = waitpid(pid, &status, has_timeout ? WNOHANG : 0);
        if (wait_result == pid) {
            finished = true;
            break;
        }
        if (wait_result == 0) {
            if (std::chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                kill(-pid, SIGTERM);
                if (!wait_with_deadline(pid, status, std::chrono::steady_clock::now() + options.kill_grace)) {
                    kill(-pid, SIGKILL);
                    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
                    }
                }
                finished = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            continue;
        }
        if (wait_result < 0 && errno == EINTR) {
            continue;
        }
        result.error = fmt::format("waitpid failed: {}", std::strerror(errno));
        break;
    }

    // Background processes left in the group would keep the pipes open.
    kill(-pid, SIGKILL);

    if (finished) {
        if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            result.signaled  = true;
            result.signal    = WTERMSIG(status);
            result.exit_code = 128 + result.signal;
        }
    }

    stdout_thread.join();
    if (stderr_thread.joinable())
        stderr_thread.join();

    result.elapsed_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return result;
}

} // namespace matrixrun::process
