#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace matrixrun {

// Raised for malformed matrix or step declarations. Always detected before
// any cell is executed.
class config_error : public std::runtime_error {
  public:
    explicit config_error(const std::string &message) : std::runtime_error(message) {}
};

struct Axis {
    std::string              name;
    std::vector<std::string> values;
};

struct Binding {
    std::string axis;
    std::string value;
};

// One concrete assignment of a value to every axis, in axis declaration order.
struct Cell {
    std::size_t          index = 0;
    std::vector<Binding> bindings;

    [[nodiscard]] const std::string *value_of(std::string_view axis) const;

    // "3.8" or "3.8, ubuntu"; "default" when the matrix has no axes.
    [[nodiscard]] std::string label() const;

    // Filesystem-safe form, e.g. "python-version-3.8".
    [[nodiscard]] std::string slug() const;
};

// Cartesian product of the axes. The last axis varies fastest, so the order is
// lexicographic over declaration order and identical across calls.
// Throws config_error for an empty axis, an unnamed axis or a duplicate name.
std::vector<Cell> expand_matrix(std::span<const Axis> axes);

} // namespace matrixrun
