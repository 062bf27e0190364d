#include "../include/grid.hpp"

#include <algorithm>
#include <cstdlib>
#include <ranges>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace layout
{
    namespace views  = std::views;
    namespace ranges = std::ranges;

    auto find_position(const Grid& grid, std::string_view state) -> std::optional<Position>
    {
        for (std::size_t row = 0; row < grid.size(); ++row)
        {
            for (std::size_t col = 0; col < grid[row].size(); ++col)
            {
                if (grid[row][col].has_value() && grid[row][col].value() == state)
                {
                    return Position{static_cast<int>(row), static_cast<int>(col)};
                }
            }
        }
        return std::nullopt;
    }

    auto manhattan_distance(const Position& a, const Position& b) -> int
    {
        return std::abs(a.m_row - b.m_row) + std::abs(a.m_col - b.m_col);
    }

    auto in_bounds(const Grid& grid, const Position& pos) -> bool
    {
        return pos.m_row >= 0
            && pos.m_row < static_cast<int>(grid.size())
            && pos.m_col >= 0
            && pos.m_col < static_cast<int>(grid[pos.m_row].size());
    }

    auto occupied(const Grid& grid, const Position& pos) -> bool
    {
        return in_bounds(grid, pos) && grid[pos.m_row][pos.m_col].has_value();
    }

    auto rightmost_occupied(const Row& row) -> std::optional<std::size_t>
    {
        for (std::size_t i = row.size(); i > 0; --i)
        {
            if (row[i - 1].has_value())
            {
                return i - 1;
            }
        }
        return std::nullopt;
    }

    auto trim_empty_rows(Grid grid) -> Grid
    {
        std::erase_if(grid, [](const Row& row){
            return ranges::none_of(row, [](const Cell& cell){ return cell.has_value(); });
        });
        return grid;
    }

    auto column_count(const Grid& grid) -> std::size_t
    {
        std::size_t cols = 0;
        for (const auto& row : grid)
        {
            cols = std::max(cols, row.size());
        }
        return cols;
    }

    auto to_string(const Grid& grid) -> std::string
    {
        auto format_row = [](const Row& row)
        {
            auto cells = row | views::transform([](const Cell& cell){ return cell.value_or("-"); });
            return fmt::format("[{}]", fmt::join(cells, ", "));
        };
        return fmt::format("[{}]", fmt::join(grid | views::transform(format_row), ", "));
    }
}
