#include "../include/router.hpp"
#include "../include/connectivity.hpp"

#include <algorithm>
#include <array>
#include <ranges>

namespace layout
{
    namespace ranges = std::ranges;

    auto to_string(Side side) -> std::string_view
    {
        switch (side)
        {
        case Side::Above: return "above";
        case Side::Below: return "below";
        case Side::Left:  return "left";
        case Side::Right: return "right";
        }
        return "below";
    }

    auto to_string(Bend bend) -> std::string_view
    {
        return bend == Bend::Left ? "bend left" : "bend right";
    }

    auto mirror(Bend bend) -> Bend
    {
        return bend == Bend::Left ? Bend::Right : Bend::Left;
    }

    auto drawn_bend(const BentEdge& edge) -> Bend
    {
        return edge.m_reversed ? mirror(edge.m_bend) : edge.m_bend;
    }

    auto loop_side(const Grid& grid, std::string_view state) -> Side
    {
        auto pos = find_position(grid, state);
        if (!pos)
        {
            return Side::Below;
        }

        const auto [row, col] = pos.value();
        const std::array<std::pair<Side, Position>, 4> neighbours{{
            {Side::Above, Position{row - 1, col}},
            {Side::Below, Position{row + 1, col}},
            {Side::Left,  Position{row, col - 1}},
            {Side::Right, Position{row, col + 1}},
        }};

        for (const auto& [side, neighbour] : neighbours)
        {
            if (in_bounds(grid, neighbour) && !occupied(grid, neighbour))
            {
                return side;
            }
        }

        // no empty cell around it, so the loop goes out over the grid border, below first
        const std::array<std::pair<Side, Position>, 4> border{{
            neighbours[1], neighbours[0], neighbours[2], neighbours[3]
        }};
        for (const auto& [side, neighbour] : border)
        {
            if (!in_bounds(grid, neighbour))
            {
                return side;
            }
        }
        return Side::Below;
    }

    auto crosses_other_states(const Grid& grid, std::string_view a, std::string_view b) -> bool
    {
        auto pos_a = find_position(grid, a);
        auto pos_b = find_position(grid, b);
        if (!pos_a || !pos_b)
        {
            return false;
        }

        const auto [x1, y1] = pos_a.value();
        const auto [x2, y2] = pos_b.value();

        for (int i = 0; i < static_cast<int>(grid.size()); ++i)
        {
            for (int j = 0; j < static_cast<int>(grid[i].size()); ++j)
            {
                if (!grid[i][j].has_value() || (i == x1 && j == y1) || (i == x2 && j == y2))
                {
                    continue;
                }

                const bool collinear = (x2 - x1) * (j - y1) == (y2 - y1) * (i - x1);
                const bool between =
                    std::min(x1, x2) <= i && i <= std::max(x1, x2) &&
                    std::min(y1, y2) <= j && j <= std::max(y1, y2);

                if (collinear && between)
                {
                    return true;
                }
            }
        }
        return false;
    }

    auto choose_bend(const Grid& grid, const Position& from, const Position& to) -> Bend
    {
        const auto last_row = static_cast<int>(grid.size()) - 1;
        const auto last_col = static_cast<int>(column_count(grid)) - 1;

        // along the border the arc bulges outwards
        if (from.m_row == to.m_row && from.m_row == 0)
        {
            return from.m_col < to.m_col ? Bend::Left : Bend::Right;
        }
        if (from.m_row == to.m_row && from.m_row == last_row)
        {
            return from.m_col < to.m_col ? Bend::Right : Bend::Left;
        }
        if (from.m_col == to.m_col && from.m_col == 0)
        {
            return from.m_row < to.m_row ? Bend::Right : Bend::Left;
        }
        if (from.m_col == to.m_col && from.m_col == last_col)
        {
            return from.m_row < to.m_row ? Bend::Left : Bend::Right;
        }
        return from.m_col <= to.m_col ? Bend::Right : Bend::Left;
    }

    auto route_pair(
        const Grid& grid,
        const model::TransitionTable& table,
        const std::vector<model::State>& states,
        std::size_t from_index,
        std::size_t to_index
    ) -> std::optional<EdgeRoute>
    {
        const auto& from = states.at(from_index);
        const auto& to   = states.at(to_index);

        auto symbols = model::symbols_between(table, from, to);
        if (!symbols)
        {
            return std::nullopt;
        }

        if (from == to)
        {
            return EdgeRoute{from, to, symbols.value(), SelfLoop{loop_side(grid, from)}};
        }

        const auto connection = model::connection_degree(table, from, to);
        if (connection == model::Connection::OneWay && !crosses_other_states(grid, from, to))
        {
            return EdgeRoute{from, to, symbols.value(), StraightEdge{Side::Above}};
        }

        // the first drawn half of the pair picks the bend, the reverse half of a mutual
        // pair is drawn with the same tikz bend which puts it on the other side
        const bool reversed = from_index > to_index;
        const bool leads = connection != model::Connection::Mutual || !reversed;
        const auto& lead_from = leads ? from : to;
        const auto& lead_to   = leads ? to : from;

        auto pos_from = find_position(grid, lead_from);
        auto pos_to   = find_position(grid, lead_to);
        const Bend drawn = (pos_from && pos_to)
            ? choose_bend(grid, pos_from.value(), pos_to.value())
            : Bend::Right;

        BentEdge edge{
            reversed ? mirror(drawn) : drawn,
            reversed,
            reversed ? Side::Above : Side::Below
        };
        return EdgeRoute{from, to, symbols.value(), edge};
    }

    auto route_edges(
        const Grid& grid,
        const model::TransitionTable& table,
        const std::vector<model::State>& states
    ) -> std::vector<EdgeRoute>
    {
        std::vector<EdgeRoute> routes;
        for (std::size_t from = 0; from < states.size(); ++from)
        {
            for (std::size_t to = 0; to < states.size(); ++to)
            {
                if (auto route = route_pair(grid, table, states, from, to))
                {
                    routes.push_back(std::move(route.value()));
                }
            }
        }
        return routes;
    }
}
