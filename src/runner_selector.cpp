#include "runner_selector.h"

namespace matrixrun::runner {

bool wildcard_match(std::string_view text, std::string_view pattern) {
    std::size_t ti = 0, pi = 0, star = std::string_view::npos, mark = 0;
    while (ti < text.size()) {
        if (pi < pattern.size() && (pattern[pi] == '?' || pattern[pi] == text[ti])) {
            ++ti;
            ++pi;
            continue;
        }
        if (pi < pattern.size() && pattern[pi] == '*') {
            star = pi++;
            mark = ti;
            continue;
        }
        if (star != std::string_view::npos) {
            pi = star + 1;
            ti = ++mark;
            continue;
        }
        return false;
    }
    while (pi < pattern.size() && pattern[pi] == '*')
        ++pi;
    return pi == pattern.size();
}

SelectionResult select_cells(std::span<const Cell> cells, const char *pattern) {
    SelectionResult out;
    out.cells.reserve(cells.size());
    for (const auto &cell : cells) {
        if (pattern == nullptr || wildcard_match(cell.label(), pattern) || wildcard_match(cell.slug(), pattern))
            out.cells.push_back(cell);
        else
            ++out.filtered_out;
    }
    if (out.cells.empty())
        out.status = SelectionStatus::ZeroSelected;
    return out;
}

} // namespace matrixrun::runner
