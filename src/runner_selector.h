#pragma once

#include "matrixrun/matrix.h"

#include <span>
#include <string_view>
#include <vector>

namespace matrixrun::runner {

enum class SelectionStatus {
    Ok,
    ZeroSelected,
};

struct SelectionResult {
    SelectionStatus   status = SelectionStatus::Ok;
    std::vector<Cell> cells; // keeps the original cell indices
    std::size_t       filtered_out = 0;
};

bool wildcard_match(std::string_view text, std::string_view pattern);

// A cell is selected when the pattern (*, ?) matches its label or its slug.
// A null pattern selects everything.
SelectionResult select_cells(std::span<const Cell> cells, const char *pattern);

} // namespace matrixrun::runner
