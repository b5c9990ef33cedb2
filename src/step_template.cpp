#include "matrixrun/job.h"

#include <cctype>
#include <fmt/format.h>
#include <set>

namespace matrixrun {

namespace {

constexpr std::string_view kOpen   = "${{";
constexpr std::string_view kClose  = "}}";
constexpr std::string_view kMatrix = "matrix.";

struct Placeholder {
    std::size_t      begin = 0; // offset of "${{"
    std::size_t      end   = 0; // one past "}}"
    std::string_view axis;
};

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.remove_suffix(1);
    return s;
}

std::vector<Placeholder> find_placeholders(std::string_view command) {
    std::vector<Placeholder> out;
    std::size_t              pos = 0;
    while ((pos = command.find(kOpen, pos)) != std::string_view::npos) {
        const std::size_t close = command.find(kClose, pos + kOpen.size());
        if (close == std::string_view::npos)
            throw config_error(fmt::format("unterminated '${{{{' in command: {}", command));
        const std::string_view expr = trim(command.substr(pos + kOpen.size(), close - pos - kOpen.size()));
        if (!expr.starts_with(kMatrix) || expr.size() == kMatrix.size())
            throw config_error(fmt::format("unsupported expression '${{{{ {} }}}}'; only matrix.<axis> is available", expr));
        out.push_back(Placeholder{pos, close + kClose.size(), expr.substr(kMatrix.size())});
        pos = close + kClose.size();
    }
    return out;
}

bool is_blank(std::string_view s) { return trim(s).empty(); }

} // namespace

void validate_steps(std::span<const Step> steps, std::span<const Axis> axes) {
    if (steps.empty())
        throw config_error("job has no steps");

    std::set<std::string_view> names;
    for (std::size_t i = 0; i < steps.size(); ++i) {
        const auto &step = steps[i];
        if (is_blank(step.name))
            throw config_error(fmt::format("step #{} has no name", i + 1));
        if (!names.insert(step.name).second)
            throw config_error(fmt::format("step name '{}' is used more than once", step.name));
        if (is_blank(step.command))
            throw config_error(fmt::format("step '{}' has an empty command", step.name));
        if (step.timeout.count() < 0)
            throw config_error(fmt::format("step '{}' has a negative timeout", step.name));
        for (const auto &ph : find_placeholders(step.command)) {
            bool known = false;
            for (const auto &axis : axes) {
                if (axis.name == ph.axis) {
                    known = true;
                    break;
                }
            }
            if (!known)
                throw config_error(fmt::format("step '{}' references unknown matrix axis '{}'", step.name, ph.axis));
        }
    }
}

std::string substitute_command(std::string_view command, const Cell &cell) {
    std::string out;
    out.reserve(command.size());
    std::size_t last = 0;
    for (const auto &ph : find_placeholders(command)) {
        const std::string *value = cell.value_of(ph.axis);
        if (!value)
            throw config_error(fmt::format("cell '{}' has no value for matrix axis '{}'", cell.label(), ph.axis));
        out.append(command.substr(last, ph.begin - last));
        out.append(*value);
        last = ph.end;
    }
    out.append(command.substr(last));
    return out;
}

std::string axis_env_name(std::string_view axis) {
    std::string out = "MATRIX_";
    for (char ch : axis) {
        const auto uch = static_cast<unsigned char>(ch);
        out.push_back(std::isalnum(uch) ? static_cast<char>(std::toupper(uch)) : '_');
    }
    return out;
}

} // namespace matrixrun
