#ifndef GRID_H
#define GRID_H

#include "automaton.hpp"

#include <string>
#include <string_view>
#include <optional>
#include <vector>

namespace layout
{
    using Cell = std::optional<model::State>;
    using Row  = std::vector<Cell>;
    using Grid = std::vector<Row>;

    struct Position
    {
        auto operator<=>(const Position &) const = default;

        int m_row;
        int m_col;
    };

    [[nodiscard]]
    auto find_position(const Grid& grid, std::string_view state) -> std::optional<Position>;

    [[nodiscard]]
    auto manhattan_distance(const Position& a, const Position& b) -> int;

    [[nodiscard]]
    auto in_bounds(const Grid& grid, const Position& pos) -> bool;

    // in bounds and holding a state
    [[nodiscard]]
    auto occupied(const Grid& grid, const Position& pos) -> bool;

    // index of the last cell of the row holding a state
    [[nodiscard]]
    auto rightmost_occupied(const Row& row) -> std::optional<std::size_t>;

    [[nodiscard]]
    auto trim_empty_rows(Grid grid) -> Grid;

    [[nodiscard]]
    auto column_count(const Grid& grid) -> std::size_t;

    // `[[q1, q2], [q3, -]]`
    [[nodiscard]]
    auto to_string(const Grid& grid) -> std::string;
}

#endif
