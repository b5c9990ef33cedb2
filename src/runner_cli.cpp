#include "runner_cli.h"

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace matrixrun::runner {
namespace {

const char *env_value(const char *name) {
    const char *value = std::getenv(name);
    return (value != nullptr && value[0] != '\0') ? value : nullptr;
}

bool env_has_value(const char *name) { return env_value(name) != nullptr; }

bool env_no_color() { return env_has_value("NO_COLOR") || env_has_value("MATRIXRUN_NO_COLOR"); }
bool env_github_actions() { return env_has_value("GITHUB_ACTIONS"); }

enum class ParseU64DecimalStatus {
    Ok,
    Empty,
    NonDecimal,
    Overflow,
};

struct ParseU64DecimalResult {
    std::uint64_t         value  = 0;
    ParseU64DecimalStatus status = ParseU64DecimalStatus::Ok;
};

ParseU64DecimalResult parse_u64_decimal_strict(std::string_view s) {
    if (s.empty())
        return ParseU64DecimalResult{0, ParseU64DecimalStatus::Empty};

    std::uint64_t v = 0;
    for (const char ch : s) {
        if (ch < '0' || ch > '9')
            return ParseU64DecimalResult{0, ParseU64DecimalStatus::NonDecimal};

        const std::uint64_t digit = static_cast<std::uint64_t>(ch - '0');
        const std::uint64_t maxv  = static_cast<std::uint64_t>(-1);
        if (v > (maxv - digit) / 10)
            return ParseU64DecimalResult{0, ParseU64DecimalStatus::Overflow};
        v = v * 10 + digit;
    }

    return ParseU64DecimalResult{v, ParseU64DecimalStatus::Ok};
}

// Splits "KEY=VALUE" at the first '='. The key must be non-empty.
bool split_assignment(std::string_view opt_name, std::string_view value, std::string_view &key, std::string_view &rest) {
    const std::size_t eq = value.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        fmt::print(stderr, "error: {} expects NAME=VALUE, got: '{}'\n", opt_name, value);
        return false;
    }
    key  = value.substr(0, eq);
    rest = value.substr(eq + 1);
    return true;
}

std::vector<std::string> split_values(std::string_view list) {
    std::vector<std::string> out;
    while (!list.empty()) {
        const std::size_t comma = list.find(',');
        out.emplace_back(list.substr(0, comma));
        if (comma == std::string_view::npos)
            break;
        list.remove_prefix(comma + 1);
    }
    return out;
}

} // namespace

bool parse_cli(std::span<const char *> args, CliOptions &out_opt) {
    CliOptions opt{};

    bool wants_help              = false;
    bool wants_list_cells        = false;
    bool wants_list_steps        = false;
    bool no_color_flag           = false;
    bool github_annotations_flag = false;

    bool seen_jobs        = false;
    bool seen_timeout     = false;
    bool seen_output_tail = false;
    bool seen_event       = false;
    bool seen_on          = false;

    enum class ValueMatch { No, Yes, Error };
    auto match_value = [&](std::size_t &i, std::string_view s, std::string_view opt_name, std::string_view &value) -> ValueMatch {
        if (s == opt_name) {
            if (i + 1 >= args.size() || !args[i + 1]) {
                fmt::print(stderr, "error: {} requires a value\n", opt_name);
                return ValueMatch::Error;
            }
            value = std::string_view(args[i + 1]);
            if (value.empty()) {
                fmt::print(stderr, "error: {} requires a non-empty value\n", opt_name);
                return ValueMatch::Error;
            }
            ++i;
            return ValueMatch::Yes;
        }
        if (s.rfind(opt_name, 0) == 0 && s.size() > opt_name.size() && s[opt_name.size()] == '=') {
            value = s.substr(opt_name.size() + 1);
            if (value.empty()) {
                fmt::print(stderr, "error: {} requires a non-empty value\n", opt_name);
                return ValueMatch::Error;
            }
            return ValueMatch::Yes;
        }
        return ValueMatch::No;
    };
    enum class OptionParseResult { NoMatch, Consumed, Error };
    auto parse_value_option = [&](std::size_t &i, std::string_view s, std::string_view opt_name, auto &&on_value) -> OptionParseResult {
        std::string_view value;
        switch (match_value(i, s, opt_name, value)) {
        case ValueMatch::Error: return OptionParseResult::Error;
        case ValueMatch::Yes:
            if (!on_value(value))
                return OptionParseResult::Error;
            return OptionParseResult::Consumed;
        case ValueMatch::No: return OptionParseResult::NoMatch;
        }
        return OptionParseResult::NoMatch;
    };

    auto parse_u64_option = [&](std::string_view opt_name, std::string_view value, std::uint64_t &out) -> bool {
        const ParseU64DecimalResult parsed = parse_u64_decimal_strict(value);
        if (parsed.status != ParseU64DecimalStatus::Ok) {
            if (parsed.status == ParseU64DecimalStatus::Empty) {
                fmt::print(stderr, "error: {} requires a value\n", opt_name);
            } else if (parsed.status == ParseU64DecimalStatus::Overflow) {
                fmt::print(stderr, "error: {} value is out of range for uint64: '{}'\n", opt_name, value);
            } else {
                fmt::print(stderr, "error: {} must be a non-negative decimal integer, got: '{}'\n", opt_name, value);
            }
            return false;
        }
        out = parsed.value;
        return true;
    };

    auto parse_non_negative_double_option = [&](std::string_view opt_name, std::string_view value, double &out) -> bool {
        std::size_t idx = 0;
        try {
            out = std::stod(std::string(value), &idx);
        } catch (const std::exception &) {
            fmt::print(stderr, "error: {} must be a floating-point value, got: '{}'\n", opt_name, value);
            return false;
        }
        if (idx != value.size() || !std::isfinite(out)) {
            fmt::print(stderr, "error: {} must be a finite floating-point value, got: '{}'\n", opt_name, value);
            return false;
        }
        if (out < 0.0) {
            fmt::print(stderr, "error: {} must be non-negative\n", opt_name);
            return false;
        }
        return true;
    };

    auto set_unique_string_option = [&](const char *&out_value, std::string_view opt_name, std::string_view value) -> bool {
        if (out_value) {
            fmt::print(stderr, "error: duplicate {}\n", opt_name);
            return false;
        }
        out_value = value.data();
        return true;
    };

    auto parse_axis_option = [&](std::string_view value) -> bool {
        std::string_view name;
        std::string_view list;
        if (!split_assignment("--axis", value, name, list))
            return false;
        for (const auto &existing : opt.axes) {
            if (existing.name == name) {
                fmt::print(stderr, "error: duplicate --axis '{}'\n", name);
                return false;
            }
        }
        opt.axes.push_back(Axis{std::string(name), split_values(list)});
        return true;
    };

    auto parse_step_option = [&](std::string_view value) -> bool {
        std::string_view name;
        std::string_view command;
        if (!split_assignment("--step", value, name, command))
            return false;
        opt.steps.push_back(Step{.name = std::string(name), .command = std::string(command)});
        return true;
    };

    auto parse_env_option = [&](std::string_view value) -> bool {
        std::string_view key;
        std::string_view val;
        if (!split_assignment("--env", value, key, val))
            return false;
        opt.env.push_back(process::EnvVar{std::string(key), std::string(val)});
        return true;
    };

    auto parse_event_option = [&](std::string_view value) -> bool {
        if (seen_event) {
            fmt::print(stderr, "error: duplicate --event\n");
            return false;
        }
        const auto event = parse_trigger_event(value);
        if (!event) {
            fmt::print(stderr, "error: --event must be one of push,pull_request; got: '{}'\n", value);
            return false;
        }
        opt.event  = *event;
        seen_event = true;
        return true;
    };

    std::size_t start = 0;
    if (!args.empty() && args[0] && args[0][0] != '-') {
        start = 1; // Skip argv[0] (program name) when present.
    }
    for (std::size_t i = start; i < args.size(); ++i) {
        const char *arg = args[i];
        if (!arg)
            continue;
        const std::string_view s(arg);

        if (s == "--help" || s == "-h") {
            wants_help = true;
            continue;
        }
        if (s == "--list-cells") {
            wants_list_cells = true;
            continue;
        }
        if (s == "--list-steps") {
            wants_list_steps = true;
            continue;
        }
        if (s == "--no-color") {
            no_color_flag = true;
            continue;
        }
        if (s == "--github-annotations") {
            github_annotations_flag = true;
            continue;
        }

        OptionParseResult r = parse_value_option(i, s, "--axis", parse_axis_option);
        if (r == OptionParseResult::NoMatch)
            r = parse_value_option(i, s, "--step", parse_step_option);
        if (r == OptionParseResult::NoMatch)
            r = parse_value_option(i, s, "--env", parse_env_option);
        if (r == OptionParseResult::NoMatch)
            r = parse_value_option(i, s, "--preset",
                                   [&](std::string_view value) { return set_unique_string_option(opt.preset, "--preset", value); });
        if (r == OptionParseResult::NoMatch)
            r = parse_value_option(i, s, "--filter",
                                   [&](std::string_view value) { return set_unique_string_option(opt.filter_pat, "--filter", value); });
        if (r == OptionParseResult::NoMatch)
            r = parse_value_option(i, s, "--junit",
                                   [&](std::string_view value) { return set_unique_string_option(opt.junit_path, "--junit", value); });
        if (r == OptionParseResult::NoMatch)
            r = parse_value_option(i, s, "--allure-dir",
                                   [&](std::string_view value) { return set_unique_string_option(opt.allure_dir, "--allure-dir", value); });
        if (r == OptionParseResult::NoMatch)
            r = parse_value_option(i, s, "--workspace",
                                   [&](std::string_view value) { return set_unique_string_option(opt.workspace, "--workspace", value); });
        if (r == OptionParseResult::NoMatch)
            r = parse_value_option(i, s, "--source-dir",
                                   [&](std::string_view value) { return set_unique_string_option(opt.source_dir, "--source-dir", value); });
        if (r == OptionParseResult::NoMatch)
            r = parse_value_option(i, s, "--shell",
                                   [&](std::string_view value) { return set_unique_string_option(opt.shell, "--shell", value); });
        if (r == OptionParseResult::NoMatch)
            r = parse_value_option(i, s, "--event", parse_event_option);
        if (r == OptionParseResult::NoMatch) {
            r = parse_value_option(i, s, "--on", [&](std::string_view value) {
                if (seen_on) {
                    fmt::print(stderr, "error: duplicate --on\n");
                    return false;
                }
                const auto set = parse_trigger_set(value);
                if (!set) {
                    fmt::print(stderr, "error: --on expects a comma separated list of push,pull_request; got: '{}'\n", value);
                    return false;
                }
                opt.triggers = *set;
                seen_on      = true;
                return true;
            });
        }
        if (r == OptionParseResult::NoMatch) {
            r = parse_value_option(i, s, "--jobs", [&](std::string_view value) {
                if (seen_jobs) {
                    fmt::print(stderr, "error: duplicate --jobs\n");
                    return false;
                }
                std::uint64_t jobs = 0;
                if (!parse_u64_option("--jobs", value, jobs))
                    return false;
                if (jobs > 4096) {
                    fmt::print(stderr, "error: --jobs must be at most 4096\n");
                    return false;
                }
                opt.jobs  = static_cast<std::size_t>(jobs);
                seen_jobs = true;
                return true;
            });
        }
        if (r == OptionParseResult::NoMatch) {
            r = parse_value_option(i, s, "--timeout-s", [&](std::string_view value) {
                if (seen_timeout) {
                    fmt::print(stderr, "error: duplicate --timeout-s\n");
                    return false;
                }
                double seconds = 0.0;
                if (!parse_non_negative_double_option("--timeout-s", value, seconds))
                    return false;
                if (seconds > 30.0 * 24 * 3600) {
                    fmt::print(stderr, "error: --timeout-s must be at most 30 days\n");
                    return false;
                }
                // Sub-millisecond limits round up; 0 means no limit.
                std::int64_t ms = static_cast<std::int64_t>(std::llround(seconds * 1000.0));
                if (ms == 0 && seconds > 0.0)
                    ms = 1;
                opt.step_timeout = std::chrono::milliseconds(ms);
                seen_timeout     = true;
                return true;
            });
        }
        if (r == OptionParseResult::NoMatch) {
            r = parse_value_option(i, s, "--output-tail", [&](std::string_view value) {
                if (seen_output_tail) {
                    fmt::print(stderr, "error: duplicate --output-tail\n");
                    return false;
                }
                std::uint64_t lines = 0;
                if (!parse_u64_option("--output-tail", value, lines))
                    return false;
                opt.output_tail  = static_cast<std::size_t>(lines > 100000 ? 100000 : lines);
                seen_output_tail = true;
                return true;
            });
        }

        if (r == OptionParseResult::Error)
            return false;
        if (r == OptionParseResult::Consumed)
            continue;

        if (s.starts_with("-")) {
            fmt::print(stderr, "error: unknown option '{}'\n", s);
            return false;
        }
        fmt::print(stderr, "error: unexpected argument '{}'\n", s);
        return false;
    }

    if (!seen_event) {
        if (const char *name = env_value("GITHUB_EVENT_NAME")) {
            // Events this tool does not model (schedule, workflow_dispatch, ...)
            // behave like a manual invocation.
            opt.event = parse_trigger_event(name);
        }
    }

    opt.color_output       = !no_color_flag && !env_no_color();
    opt.github_annotations = github_annotations_flag || env_github_actions();

    if (wants_help)
        opt.mode = Mode::Help;
    else if (wants_list_cells)
        opt.mode = Mode::ListCells;
    else if (wants_list_steps)
        opt.mode = Mode::ListSteps;
    else
        opt.mode = Mode::Execute;

    out_opt = std::move(opt);
    return true;
}

} // namespace matrixrun::runner
