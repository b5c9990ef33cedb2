#include "matrixrun/matrix.h"

#include <cctype>
#include <fmt/format.h>
#include <set>

namespace matrixrun {

namespace {

void validate_axes(std::span<const Axis> axes) {
    std::set<std::string_view> seen;
    for (std::size_t i = 0; i < axes.size(); ++i) {
        const auto &axis = axes[i];
        if (axis.name.empty())
            throw config_error(fmt::format("matrix axis #{} has no name", i + 1));
        if (!seen.insert(axis.name).second)
            throw config_error(fmt::format("matrix axis '{}' is declared more than once", axis.name));
        if (axis.values.empty())
            throw config_error(fmt::format("matrix axis '{}' has no values", axis.name));
        std::set<std::string_view> values;
        for (const auto &value : axis.values) {
            if (!values.insert(value).second)
                throw config_error(fmt::format("matrix axis '{}' lists value '{}' more than once", axis.name, value));
        }
    }
}

void append_slug_part(std::string &out, std::string_view part) {
    for (char ch : part) {
        const auto uch = static_cast<unsigned char>(ch);
        if (std::isalnum(uch) || ch == '.' || ch == '_' || ch == '-')
            out.push_back(ch);
        else
            out.push_back('_');
    }
}

} // namespace

const std::string *Cell::value_of(std::string_view axis) const {
    for (const auto &b : bindings) {
        if (b.axis == axis)
            return &b.value;
    }
    return nullptr;
}

std::string Cell::label() const {
    if (bindings.empty())
        return "default";
    std::string out;
    for (std::size_t i = 0; i < bindings.size(); ++i) {
        if (i != 0)
            out.append(", ");
        out.append(bindings[i].value);
    }
    return out;
}

std::string Cell::slug() const {
    if (bindings.empty())
        return "default";
    std::string out;
    for (std::size_t i = 0; i < bindings.size(); ++i) {
        if (i != 0)
            out.push_back('-');
        append_slug_part(out, bindings[i].axis);
        out.push_back('-');
        append_slug_part(out, bindings[i].value);
    }
    return out;
}

std::vector<Cell> expand_matrix(std::span<const Axis> axes) {
    validate_axes(axes);

    std::vector<std::vector<Binding>> combos;
    combos.emplace_back();
    for (const auto &axis : axes) {
        std::vector<std::vector<Binding>> next;
        next.reserve(combos.size() * axis.values.size());
        for (const auto &acc : combos) {
            for (const auto &value : axis.values) {
                auto w = acc;
                w.push_back(Binding{axis.name, value});
                next.push_back(std::move(w));
            }
        }
        combos = std::move(next);
    }

    std::vector<Cell> cells;
    cells.reserve(combos.size());
    for (auto &combo : combos) {
        Cell cell;
        cell.index    = cells.size();
        cell.bindings = std::move(combo);
        cells.push_back(std::move(cell));
    }
    return cells;
}

} // namespace matrixrun
