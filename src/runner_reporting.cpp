#include "runner_reporting.h"

#include "log.h"

#include <filesystem>
#include <fmt/color.h>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <system_error>

#ifdef MATRIXRUN_USE_BOOST_JSON
#include <boost/json.hpp>
#include <boost/json/src.hpp>
#endif

namespace matrixrun::runner {

namespace {

std::string gha_escape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        switch (ch) {
        case '%': out += "%25"; break;
        case '\r': out += "%0D"; break;
        case '\n': out += "%0A"; break;
        default: out.push_back(ch); break;
        }
    }
    return out;
}

// Annotation properties additionally reserve ':' and ','.
std::string gha_escape_property(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : gha_escape(s)) {
        switch (ch) {
        case ':': out += "%3A"; break;
        case ',': out += "%2C"; break;
        default: out.push_back(ch); break;
        }
    }
    return out;
}

std::string escape_xml(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        switch (ch) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        default: out.push_back(ch); break;
        }
    }
    return out;
}

// "]]>" cannot appear inside a CDATA section; split it across two sections.
std::string cdata(std::string_view s) {
    std::string out = "<![CDATA[";
    std::size_t pos = 0;
    while (true) {
        const std::size_t hit = s.find("]]>", pos);
        if (hit == std::string_view::npos) {
            out.append(s.substr(pos));
            break;
        }
        out.append(s.substr(pos, hit - pos));
        out.append("]]]]><![CDATA[>");
        pos = hit + 3;
    }
    out.append("]]>");
    return out;
}

std::string_view status_tag(Outcome outcome) {
    switch (outcome) {
    case Outcome::Success: return "[ OK   ]";
    case Outcome::Failure: return "[ FAIL ]";
    case Outcome::Skipped: return "[ SKIP ]";
    }
    return "[ ???? ]";
}

fmt::color status_color(Outcome outcome) {
    switch (outcome) {
    case Outcome::Success: return fmt::color::green;
    case Outcome::Failure: return fmt::color::red;
    case Outcome::Skipped: return fmt::color::yellow;
    }
    return fmt::color::white;
}

struct Counts {
    std::size_t passed  = 0;
    std::size_t failed  = 0;
    std::size_t skipped = 0;
};

Counts count_cells(const RunResult &result) {
    Counts c;
    for (const auto &cell : result.cells) {
        switch (cell.outcome) {
        case Outcome::Success: ++c.passed; break;
        case Outcome::Failure: ++c.failed; break;
        case Outcome::Skipped: ++c.skipped; break;
        }
    }
    return c;
}

Counts count_steps(const CellResult &cell) {
    Counts c;
    for (const auto &step : cell.steps) {
        switch (step.outcome) {
        case Outcome::Success: ++c.passed; break;
        case Outcome::Failure: ++c.failed; break;
        case Outcome::Skipped: ++c.skipped; break;
        }
    }
    return c;
}

void write_junit(const RunResult &result, const ReportConfig &cfg) {
    std::ofstream out(cfg.junit_path, std::ios::binary);
    if (!out) {
        detail::log_err("matrixrun: cannot write JUnit report '{}'\n", cfg.junit_path);
        return;
    }

    std::size_t total_steps = 0;
    Counts      totals;
    for (const auto &cell : result.cells) {
        const auto c = count_steps(cell);
        total_steps += cell.steps.size();
        totals.failed += c.failed;
        totals.skipped += c.skipped;
    }

    out << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    out << "<testsuites name=\"" << escape_xml(cfg.job_name) << "\" tests=\"" << total_steps << "\" failures=\"" << totals.failed
        << "\" skipped=\"" << totals.skipped << "\" time=\"" << result.time_s << "\">\n";
    for (const auto &cell : result.cells) {
        const auto        c     = count_steps(cell);
        const std::string suite = escape_xml(cell_display_name(cfg.job_name, cell.cell));
        out << "  <testsuite name=\"" << suite << "\" tests=\"" << cell.steps.size() << "\" failures=\"" << c.failed << "\" skipped=\""
            << c.skipped << "\" time=\"" << cell.time_s << "\">\n";
        if (!cell.cell.bindings.empty()) {
            out << "    <properties>\n";
            for (const auto &b : cell.cell.bindings) {
                out << "      <property name=\"" << escape_xml(b.axis) << "\" value=\"" << escape_xml(b.value) << "\"/>\n";
            }
            out << "    </properties>\n";
        }
        for (const auto &step : cell.steps) {
            out << "    <testcase classname=\"" << suite << "\" name=\"" << escape_xml(step.name) << "\" time=\"" << step.time_s
                << "\">\n";
            if (step.outcome == Outcome::Failure) {
                out << "      <failure type=\"" << to_string(step.reason) << "\" message=\"" << escape_xml(step.message) << "\">"
                    << cdata(step.output) << "</failure>\n";
            } else if (step.outcome == Outcome::Skipped) {
                out << "      <skipped";
                if (!step.message.empty())
                    out << " message=\"" << escape_xml(step.message) << "\"";
                out << "/>\n";
            }
            if (step.outcome != Outcome::Failure && !step.output.empty()) {
                out << "      <system-out>" << cdata(step.output) << "</system-out>\n";
            }
            out << "    </testcase>\n";
        }
        out << "  </testsuite>\n";
    }
    out << "</testsuites>\n";

    if (!out)
        detail::log_err("matrixrun: error while writing JUnit report '{}'\n", cfg.junit_path);
}

#ifdef MATRIXRUN_USE_BOOST_JSON
std::string_view allure_status(Outcome outcome) {
    switch (outcome) {
    case Outcome::Success: return "passed";
    case Outcome::Failure: return "failed";
    case Outcome::Skipped: return "skipped";
    }
    return "unknown";
}

void write_allure(const RunResult &result, const ReportConfig &cfg) {
    std::error_code ec;
    std::filesystem::create_directories(cfg.allure_dir, ec);
    if (ec) {
        detail::log_err("matrixrun: cannot create Allure directory '{}': {}\n", cfg.allure_dir, ec.message());
        return;
    }

    for (const auto &cell : result.cells) {
        boost::json::object obj;
        obj["name"]   = cell_display_name(cfg.job_name, cell.cell);
        obj["status"] = allure_status(cell.outcome);
        obj["time"]   = cell.time_s;

        boost::json::array labels;
        labels.push_back({{"name", "suite"}, {"value", cfg.job_name}});
        obj["labels"] = std::move(labels);

        boost::json::array params;
        for (const auto &b : cell.cell.bindings) {
            params.push_back({{"name", b.axis}, {"value", b.value}});
        }
        obj["parameters"] = std::move(params);

        boost::json::array steps;
        for (const auto &step : cell.steps) {
            boost::json::object s;
            s["name"]   = step.name;
            s["status"] = allure_status(step.outcome);
            steps.push_back(std::move(s));
        }
        obj["steps"] = std::move(steps);

        if (const auto *failure = cell.first_failure()) {
            boost::json::object details;
            details["message"]   = fmt::format("{}: {}", failure->name, failure->message);
            details["trace"]     = failure->output;
            obj["statusDetails"] = std::move(details);
        }

        const std::string file = fmt::format("{}/result-{}-result.json", cfg.allure_dir, cell.cell.index);
        std::ofstream     out(file, std::ios::binary);
        if (!out) {
            detail::log_err("matrixrun: cannot write Allure result '{}'\n", file);
            continue;
        }
        out << boost::json::serialize(obj);
    }
}
#endif

} // namespace

std::string output_tail(std::string_view output, std::size_t max_lines) {
    while (!output.empty() && (output.back() == '\n' || output.back() == '\r'))
        output.remove_suffix(1);
    if (max_lines == 0 || output.empty())
        return std::string();

    std::size_t lines = 0;
    std::size_t pos   = output.size();
    while (pos > 0) {
        const std::size_t nl = output.rfind('\n', pos - 1);
        if (nl == std::string_view::npos)
            return std::string(output);
        if (++lines == max_lines)
            return std::string(output.substr(nl + 1));
        pos = nl;
    }
    return std::string(output);
}

std::string cell_display_name(std::string_view job_name, const Cell &cell) {
    if (cell.bindings.empty())
        return std::string(job_name);
    return fmt::format("{} ({})", job_name, cell.label());
}

void print_step_started(bool color, const Cell &cell, const Step &step) {
    detail::print_tagged(color, fmt::color::cyan, "[ RUN  ]", "{} :: {}", cell.label(), step.name);
}

void print_step_result(bool color, const Cell &cell, const StepResult &step) {
    const long long dur_ms = static_cast<long long>(step.time_s * 1000.0 + 0.5);
    if (step.outcome == Outcome::Skipped) {
        detail::print_tagged(color, status_color(step.outcome), status_tag(step.outcome), "{} :: {} ({})", cell.label(), step.name,
                             step.message.empty() ? std::string("skipped") : step.message);
        return;
    }
    if (step.outcome == Outcome::Failure) {
        detail::print_tagged(color, status_color(step.outcome), status_tag(step.outcome), "{} :: {} :: {} ({} ms)", cell.label(),
                             step.name, step.message, dur_ms);
        return;
    }
    detail::print_tagged(color, status_color(step.outcome), status_tag(step.outcome), "{} :: {} ({} ms)", cell.label(), step.name,
                         dur_ms);
}

std::string format_summary(const RunResult &result, std::string_view job_name, std::size_t tail_lines) {
    const auto  counts = count_cells(result);
    std::string summary;
    summary.reserve(128 + result.cells.size() * 64);
    fmt::format_to(std::back_inserter(summary), "Summary: passed {}/{} cell(s); failed {}; skipped {} ({:.1f} s).\n", counts.passed,
                   result.cells.size(), counts.failed, counts.skipped, result.time_s);
    for (const auto &cell : result.cells) {
        fmt::format_to(std::back_inserter(summary), "  {} {}\n", status_tag(cell.outcome), cell_display_name(job_name, cell.cell));
        const auto *failure = cell.first_failure();
        if (!failure)
            continue;
        fmt::format_to(std::back_inserter(summary), "      step '{}' failed: {} [{}]\n", failure->name, failure->message,
                       to_string(failure->reason));
        const std::string tail = output_tail(failure->output, tail_lines);
        if (tail.empty())
            continue;
        std::string_view rest = tail;
        while (true) {
            const std::size_t nl = rest.find('\n');
            fmt::format_to(std::back_inserter(summary), "      | {}\n", rest.substr(0, nl));
            if (nl == std::string_view::npos)
                break;
            rest.remove_prefix(nl + 1);
        }
    }
    if (result.cancelled)
        summary.append("Run cancelled; steps that were not started are marked skipped.\n");
    return summary;
}

std::string format_github_annotations(const RunResult &result, std::string_view job_name, std::size_t tail_lines) {
    std::string out;
    for (const auto *cell : result.failed_cells()) {
        const auto *failure = cell->first_failure();
        if (!failure)
            continue;
        std::string message = fmt::format("step '{}' failed: {}", failure->name, failure->message);
        const auto  tail    = output_tail(failure->output, tail_lines);
        if (!tail.empty()) {
            message.push_back('\n');
            message.append(tail);
        }
        fmt::format_to(std::back_inserter(out), "::error title={}::{}\n", gha_escape_property(cell_display_name(job_name, cell->cell)),
                       gha_escape(message));
    }
    return out;
}

void emit_github_annotations(const RunResult &result, std::string_view job_name, std::size_t tail_lines) {
    const auto text = format_github_annotations(result, job_name, tail_lines);
    if (text.empty())
        return;
    std::lock_guard<std::mutex> lock(detail::console_mutex());
    fmt::print("{}", text);
}

void write_reports(const RunResult &result, const ReportConfig &cfg) {
    if (cfg.junit_path)
        write_junit(result, cfg);

#ifdef MATRIXRUN_USE_BOOST_JSON
    if (cfg.allure_dir)
        write_allure(result, cfg);
#else
    if (cfg.allure_dir)
        detail::log_err("matrixrun: --allure-dir ignored; built without Boost.JSON\n");
#endif
}

} // namespace matrixrun::runner
