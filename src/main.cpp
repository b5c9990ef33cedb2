#include "matrixrun/job.h"
#include "runner_cli.h"
#include "runner_orchestrator.h"

#include <csignal>
#include <cstdlib>
#include <exception>
#include <fmt/format.h>
#include <span>
#include <unistd.h>
#include <vector>

namespace {

matrixrun::CancellationToken g_cancel;

extern "C" void on_interrupt(int sig) {
    // First signal stops issuing new steps; a second one terminates at once.
    g_cancel.request_cancel();
    std::signal(sig, SIG_DFL);
    constexpr char kMessage[] = "\nmatrixrun: cancelling; waiting for running steps (signal again to abort)\n";
    ssize_t        ignored    = write(STDERR_FILENO, kMessage, sizeof(kMessage) - 1);
    (void)ignored;
}

} // namespace

auto main(int argc, char *argv[]) -> int {
    std::vector<const char *> args(argv, argv + argc);

    matrixrun::runner::CliOptions opt;
    if (!matrixrun::runner::parse_cli(std::span<const char *>{args.data(), args.size()}, opt))
        return matrixrun::runner::kExitConfigError;

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    try {
        return matrixrun::runner::run_from_options(opt, g_cancel);
    } catch (const std::exception &e) {
        fmt::print(stderr, "matrixrun: fatal: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
