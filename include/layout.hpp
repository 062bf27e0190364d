#ifndef LAYOUT_H
#define LAYOUT_H

#include "automaton.hpp"
#include "grid.hpp"
#include "transition_table.hpp"

#include <chrono>
#include <optional>
#include <stop_token>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

namespace layout
{
    enum class LayoutError
    {
        NoStates,
        TooManyStates,
        NoLayoutFound,
        Cancelled,
        TimedOut
    };

    void HandleLayoutError(const LayoutError err);

    [[nodiscard]]
    auto to_string(LayoutError err) -> std::string_view;

    struct LayoutConstraints
    {
        model::State m_initial_state;
        std::vector<model::State> m_accepting_states;
        // accepting states end their row, and no other accepting state sits before them
        bool m_accepting_at_row_end = true;
    };

    struct SearchOptions
    {
        // the search is factorial in the number of states, 0 disables the cutoff
        std::size_t m_max_states = 10;
        std::optional<std::chrono::milliseconds> m_time_budget;
        std::stop_token m_stop_token;
    };

    struct Shape
    {
        auto operator<=>(const Shape &) const = default;

        std::size_t m_rows;
        std::size_t m_cols;
    };

    // all rows x cols holding the states with at most one spare cell, in (rows, cols) order
    [[nodiscard]]
    auto candidate_shapes(std::size_t state_count) -> std::vector<Shape>;

    // sum of the manhattan distances of every transition, states missing from the grid are skipped
    [[nodiscard]]
    auto transition_cost(const Grid& grid, const model::TransitionTable& table) -> int;

    [[nodiscard]]
    auto satisfies_constraints(const Grid& grid, const LayoutConstraints& constraints) -> bool;

    struct Layout
    {
        Grid m_grid;
        int m_cost;
    };

    // exhaustive search over every candidate shape and permutation, the cheapest grid
    // satisfying the constraints wins and ties keep the first one enumerated
    [[nodiscard]]
    auto find_optimal_layout(
        const std::vector<model::State>& states,
        const model::TransitionTable& table,
        const LayoutConstraints& constraints,
        const SearchOptions& options = {}
    ) -> tl::expected<Layout, LayoutError>;

    // the row grouping as written, padded into a rectangle
    [[nodiscard]]
    auto layout_from_rows(
        const std::vector<std::vector<model::State>>& rows,
        const model::TransitionTable& table
    ) -> tl::expected<Layout, LayoutError>;
}

#endif
