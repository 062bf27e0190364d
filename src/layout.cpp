#include "../include/layout.hpp"
#include "../include/ranges_helpers.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <numeric>
#include <ranges>
#include <stdexcept>
#include <utility>

namespace layout
{
    namespace views  = std::views;
    namespace ranges = std::ranges;

    namespace helpers
    {
        // the search runs on state indices: cell k of a shape holds the state perm[k],
        // a shape with a spare cell leaves its last cell empty
        struct SearchProblem
        {
            std::vector<model::State> m_states;
            std::vector<std::pair<std::size_t, std::size_t>> m_edges;
            std::optional<std::size_t> m_initial;
            std::vector<bool> m_accepting;
            bool m_accepting_at_row_end;
        };

        static auto unique_states(const std::vector<model::State>& states) -> std::vector<model::State>
        {
            std::vector<model::State> unique;
            for (const auto& state : states)
            {
                if (ranges::find(unique, state) == unique.end())
                {
                    unique.push_back(state);
                }
            }
            return unique;
        }

        static auto make_problem(
            const std::vector<model::State>& states,
            const model::TransitionTable& table,
            const LayoutConstraints& constraints
        ) -> SearchProblem
        {
            SearchProblem problem;
            problem.m_states = unique_states(states);
            problem.m_accepting_at_row_end = constraints.m_accepting_at_row_end;

            auto index_of = [&problem](std::string_view state) -> std::optional<std::size_t>
            {
                auto it = ranges::find(problem.m_states, state);
                if (it == problem.m_states.end())
                {
                    return std::nullopt;
                }
                return static_cast<std::size_t>(std::distance(problem.m_states.begin(), it));
            };

            problem.m_initial = index_of(constraints.m_initial_state);
            problem.m_accepting = problem.m_states
                | views::transform([&constraints](const model::State& state){
                    return ranges::find(constraints.m_accepting_states, state) != constraints.m_accepting_states.end();
                })
                | utility::to<std::vector<bool>>();

            // self transitions and transitions naming undeclared states cost nothing
            table.for_each_transition([&](const model::State& source, const model::SymbolKey&, const model::State& destination){
                auto from = index_of(source);
                auto to   = index_of(destination);
                if (from && to && *from != *to)
                {
                    problem.m_edges.emplace_back(*from, *to);
                }
            });
            return problem;
        }

        static auto permutation_allowed(
            const SearchProblem& problem,
            const std::vector<std::size_t>& perm,
            const Shape& shape
        ) -> bool
        {
            const auto n = perm.size();
            const auto initial = problem.m_initial.value();

            const auto initial_cell = static_cast<std::size_t>(std::distance(perm.begin(), ranges::find(perm, initial)));
            if (initial_cell % shape.m_cols != 0)
            {
                return false;
            }

            if (!problem.m_accepting_at_row_end)
            {
                return true;
            }

            for (std::size_t row_start = 0; row_start < n; row_start += shape.m_cols)
            {
                const auto last = std::min(row_start + shape.m_cols, n) - 1;
                if (!problem.m_accepting[perm[last]])
                {
                    return false;
                }
                for (std::size_t cell = row_start; cell < last; ++cell)
                {
                    if (problem.m_accepting[perm[cell]] && perm[cell] != initial)
                    {
                        return false;
                    }
                }
            }
            return true;
        }

        static auto permutation_cost(
            const SearchProblem& problem,
            const std::vector<std::size_t>& perm,
            const Shape& shape,
            std::vector<std::size_t>& cell_of
        ) -> int
        {
            for (std::size_t cell = 0; cell < perm.size(); ++cell)
            {
                cell_of[perm[cell]] = cell;
            }

            const auto cols = static_cast<int>(shape.m_cols);
            int cost = 0;
            for (const auto& [from, to] : problem.m_edges)
            {
                const auto a = static_cast<int>(cell_of[from]);
                const auto b = static_cast<int>(cell_of[to]);
                cost += std::abs(a / cols - b / cols) + std::abs(a % cols - b % cols);
            }
            return cost;
        }

        static auto to_grid(
            const SearchProblem& problem,
            const std::vector<std::size_t>& perm,
            const Shape& shape
        ) -> Grid
        {
            Grid grid(shape.m_rows, Row(shape.m_cols, std::nullopt));
            for (std::size_t cell = 0; cell < perm.size(); ++cell)
            {
                grid[cell / shape.m_cols][cell % shape.m_cols] = problem.m_states[perm[cell]];
            }
            return grid;
        }
    }

    auto candidate_shapes(std::size_t state_count) -> std::vector<Shape>
    {
        std::vector<Shape> shapes;
        if (state_count == 0)
        {
            return shapes;
        }

        const auto max_side = state_count + 1;
        for (std::size_t rows = 1; rows <= max_side; ++rows)
        {
            for (std::size_t cols = 1; cols <= max_side; ++cols)
            {
                const auto cells = rows * cols;
                if (cells == state_count || cells == state_count + 1)
                {
                    shapes.push_back(Shape{rows, cols});
                }
            }
        }
        return shapes;
    }

    auto transition_cost(const Grid& grid, const model::TransitionTable& table) -> int
    {
        int cost = 0;
        table.for_each_transition([&](const model::State& source, const model::SymbolKey&, const model::State& destination){
            auto from = find_position(grid, source);
            auto to   = find_position(grid, destination);
            if (from && to)
            {
                cost += manhattan_distance(*from, *to);
            }
        });
        return cost;
    }

    auto satisfies_constraints(const Grid& grid, const LayoutConstraints& constraints) -> bool
    {
        const bool initial_leftmost = ranges::any_of(grid, [&constraints](const Row& row){
            return !row.empty() && row.front() == constraints.m_initial_state;
        });
        if (!initial_leftmost)
        {
            return false;
        }

        if (!constraints.m_accepting_at_row_end)
        {
            return true;
        }

        auto is_accepting = [&constraints](const Cell& cell)
        {
            return cell.has_value()
                && ranges::find(constraints.m_accepting_states, cell.value()) != constraints.m_accepting_states.end();
        };

        for (const auto& row : grid)
        {
            auto rightmost = rightmost_occupied(row);
            if (!rightmost)
            {
                continue;
            }
            if (!is_accepting(row[*rightmost]))
            {
                return false;
            }
            for (std::size_t col = 0; col < *rightmost; ++col)
            {
                if (is_accepting(row[col]) && row[col] != constraints.m_initial_state)
                {
                    return false;
                }
            }
        }
        return true;
    }

    auto find_optimal_layout(
        const std::vector<model::State>& states,
        const model::TransitionTable& table,
        const LayoutConstraints& constraints,
        const SearchOptions& options
    ) -> tl::expected<Layout, LayoutError>
    {
        const auto problem = helpers::make_problem(states, table, constraints);
        const auto n = problem.m_states.size();

        if (n == 0)
        {
            return tl::unexpected<LayoutError>(LayoutError::NoStates);
        }
        if (options.m_max_states != 0 && n > options.m_max_states)
        {
            return tl::unexpected<LayoutError>(LayoutError::TooManyStates);
        }
        // the initial state can never reach the first column
        if (!problem.m_initial.has_value())
        {
            return tl::unexpected<LayoutError>(LayoutError::NoLayoutFound);
        }

        using clock = std::chrono::steady_clock;
        std::optional<clock::time_point> deadline;
        if (options.m_time_budget.has_value())
        {
            deadline = clock::now() + options.m_time_budget.value();
        }

        // cancellation and the deadline are polled once every 4096 candidates
        constexpr std::uint64_t poll_mask = 4096 - 1;
        std::uint64_t visited = 0;

        std::optional<Shape> best_shape;
        std::vector<std::size_t> best_perm;
        int best_cost = std::numeric_limits<int>::max();
        std::vector<std::size_t> cell_of(n);

        for (const auto& shape : candidate_shapes(n))
        {
            std::vector<std::size_t> perm(n);
            std::iota(perm.begin(), perm.end(), std::size_t{0});
            do
            {
                if ((visited++ & poll_mask) == 0)
                {
                    if (options.m_stop_token.stop_requested())
                    {
                        return tl::unexpected<LayoutError>(LayoutError::Cancelled);
                    }
                    if (deadline.has_value() && clock::now() > deadline.value())
                    {
                        return tl::unexpected<LayoutError>(LayoutError::TimedOut);
                    }
                }

                if (!helpers::permutation_allowed(problem, perm, shape))
                {
                    continue;
                }

                const int cost = helpers::permutation_cost(problem, perm, shape, cell_of);
                if (cost < best_cost)
                {
                    best_cost  = cost;
                    best_perm  = perm;
                    best_shape = shape;
                }
            } while (std::next_permutation(perm.begin(), perm.end()));
        }

        if (!best_shape.has_value())
        {
            return tl::unexpected<LayoutError>(LayoutError::NoLayoutFound);
        }
        return Layout{trim_empty_rows(helpers::to_grid(problem, best_perm, best_shape.value())), best_cost};
    }

    auto layout_from_rows(
        const std::vector<std::vector<model::State>>& rows,
        const model::TransitionTable& table
    ) -> tl::expected<Layout, LayoutError>
    {
        std::size_t cols = 0;
        for (const auto& row : rows)
        {
            cols = std::max(cols, row.size());
        }
        if (cols == 0)
        {
            return tl::unexpected<LayoutError>(LayoutError::NoStates);
        }

        Grid grid;
        for (const auto& row : rows)
        {
            Row cells(cols, std::nullopt);
            ranges::copy(row, cells.begin());
            grid.push_back(std::move(cells));
        }
        grid = trim_empty_rows(std::move(grid));
        return Layout{grid, transition_cost(grid, table)};
    }

    auto to_string(LayoutError err) -> std::string_view
    {
        switch (err)
        {
        case LayoutError::NoStates:
            return "no states to lay out";
        case LayoutError::TooManyStates:
            return "too many states for an exhaustive layout search";
        case LayoutError::NoLayoutFound:
            return "no grid satisfies the placement constraints";
        case LayoutError::Cancelled:
            return "layout search cancelled";
        case LayoutError::TimedOut:
            return "layout search ran out of time";
        }
        return "unknown layout error";
    }

    // handle errors raised by the layout search
    void HandleLayoutError(const LayoutError err)
    {
        switch (err)
        {
        case LayoutError::NoStates:
            throw std::runtime_error(
                "<NO STATES> : you need to declare at least one state");
            break;
        case LayoutError::TooManyStates:
            throw std::runtime_error(
                "<TOO MANY STATES> : the automaton is too large to lay out"
                " - raise --max-states or use --layout rows");
            break;
        case LayoutError::NoLayoutFound:
            throw std::runtime_error(
                "<NO LAYOUT FOUND> : no grid satisfies the placement constraints"
                " - is the initial state one of the declared states?");
            break;
        case LayoutError::Cancelled:
            throw std::runtime_error(
                "<LAYOUT CANCELLED> : the layout search was cancelled");
            break;
        case LayoutError::TimedOut:
            throw std::runtime_error(
                "<LAYOUT TIMEOUT> : the layout search exceeded its time budget"
                " - raise --timeout or use --layout rows");
            break;
        default:
            throw std::runtime_error(
                "Something unexpected went wrong ... try again.");
            break;
        }
    }
}
