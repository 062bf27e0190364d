#ifndef ROUTER_H
#define ROUTER_H

#include "automaton.hpp"
#include "grid.hpp"
#include "transition_table.hpp"

#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace layout
{
    enum class Side
    {
        Above,
        Below,
        Left,
        Right
    };

    enum class Bend
    {
        Left,
        Right
    };

    [[nodiscard]] auto to_string(Side side) -> std::string_view;
    [[nodiscard]] auto to_string(Bend bend) -> std::string_view;
    [[nodiscard]] auto mirror(Bend bend) -> Bend;

    struct SelfLoop
    {
        auto operator<=>(const SelfLoop &) const = default;

        Side m_side;
    };

    struct StraightEdge
    {
        auto operator<=>(const StraightEdge &) const = default;

        Side m_label_side;
    };

    // m_bend is the side of the arc seen travelling along the pair orientation, i.e. from
    // the earlier declared state of the pair to the later one. The two halves of a mutual
    // pair therefore carry opposite bends and end up on opposite sides of the line.
    struct BentEdge
    {
        auto operator<=>(const BentEdge &) const = default;

        Bend m_bend;
        // drawn from the later declared state to the earlier one
        bool m_reversed;
        Side m_label_side;
    };

    // the bend relative to the edge's own drawing direction, as tikz expects it
    [[nodiscard]] auto drawn_bend(const BentEdge& edge) -> Bend;

    using EdgeShape = std::variant<SelfLoop, StraightEdge, BentEdge>;

    struct EdgeRoute
    {
        auto operator<=>(const EdgeRoute &) const = default;

        model::State m_from;
        model::State m_to;
        std::vector<model::Symbol> m_symbols;
        EdgeShape m_shape;
    };

    // first side, in the order above, below, left, right, facing an empty in-grid cell;
    // otherwise the first side facing the grid border in the order below, above, left,
    // right; below for a state surrounded on all four sides
    [[nodiscard]]
    auto loop_side(const Grid& grid, std::string_view state) -> Side;

    // does an occupied cell other than the two endpoints lie on the segment between them
    [[nodiscard]]
    auto crosses_other_states(const Grid& grid, std::string_view a, std::string_view b) -> bool;

    // bend for an edge drawn from `from` to `to`, relative to that drawing direction
    [[nodiscard]]
    auto choose_bend(const Grid& grid, const Position& from, const Position& to) -> Bend;

    // the drawing decision for from -> to, nullopt when there is nothing to draw
    [[nodiscard]]
    auto route_pair(
        const Grid& grid,
        const model::TransitionTable& table,
        const std::vector<model::State>& states,
        std::size_t from_index,
        std::size_t to_index
    ) -> std::optional<EdgeRoute>;

    // every edge to draw, in (from, to) order over the declared states
    [[nodiscard]]
    auto route_edges(
        const Grid& grid,
        const model::TransitionTable& table,
        const std::vector<model::State>& states
    ) -> std::vector<EdgeRoute>;
}

#endif
