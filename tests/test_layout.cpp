#include <gtest/gtest.h>

#include "../include/layout.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <numeric>
#include <stop_token>
#include <string>

using namespace layout;
using model::State;
using model::TransitionRecord;
using model::TransitionTable;

namespace {

int count_cells(const Grid& grid, const State& state) {
    int count = 0;
    for (const auto& row : grid) {
        count += static_cast<int>(std::count(row.begin(), row.end(), Cell{state}));
    }
    return count;
}

// slow reference: every shape and placement, judged only through the public helpers
int brute_force_minimum(
    const std::vector<State>& states,
    const TransitionTable& table,
    const LayoutConstraints& constraints) {
    int best = std::numeric_limits<int>::max();
    for (const auto& shape : candidate_shapes(states.size())) {
        std::vector<std::size_t> perm(states.size());
        std::iota(perm.begin(), perm.end(), std::size_t{0});
        do {
            Grid grid(shape.m_rows, Row(shape.m_cols, std::nullopt));
            for (std::size_t cell = 0; cell < perm.size(); ++cell) {
                grid[cell / shape.m_cols][cell % shape.m_cols] = states[perm[cell]];
            }
            if (satisfies_constraints(grid, constraints)) {
                best = std::min(best, transition_cost(grid, table));
            }
        } while (std::next_permutation(perm.begin(), perm.end()));
    }
    return best;
}

}  // namespace

TEST(LayoutTest, CandidateShapesHoldStatesWithOneSpareCell) {
    auto shapes = candidate_shapes(3);

    std::vector<Shape> expected{{1, 3}, {1, 4}, {2, 2}, {3, 1}, {4, 1}};
    EXPECT_EQ(shapes, expected);
    EXPECT_TRUE(candidate_shapes(0).empty());
}

TEST(LayoutTest, CostSumsManhattanDistances) {
    Grid grid{
        Row{"q1", "q2"},
        Row{"q3", std::nullopt},
    };
    TransitionTable table(std::vector<TransitionRecord>{
        {"q1", {"a"}, "q2"},
        {"q2", {"a"}, "q3"},
        {"q3", {"a"}, "q3"},
        {"q3", {"a"}, "ghost"},
    });

    EXPECT_EQ(transition_cost(grid, table), 1 + 2);
}

TEST(LayoutTest, TwoStatesWithLoopAndForwardEdge) {
    TransitionTable table(std::vector<TransitionRecord>{
        {"q1", {"0"}, "q1"},
        {"q1", {"1"}, "q2"},
    });
    LayoutConstraints constraints{"q1", {"q2"}, true};

    auto layout = find_optimal_layout({"q1", "q2"}, table, constraints);

    ASSERT_TRUE(layout.has_value());
    EXPECT_EQ(to_string(layout->m_grid), "[[q1, q2]]");
    EXPECT_EQ(layout->m_cost, 1);
}

TEST(LayoutTest, SingleStateGetsOneByOneGrid) {
    TransitionTable table(std::vector<TransitionRecord>{{"q1", {"0", "1"}, "q1"}});
    LayoutConstraints constraints{"q1", {"q1"}, true};

    auto layout = find_optimal_layout({"q1"}, table, constraints);

    ASSERT_TRUE(layout.has_value());
    EXPECT_EQ(to_string(layout->m_grid), "[[q1]]");
    EXPECT_EQ(layout->m_cost, 0);
}

TEST(LayoutTest, TwoCycleWithoutAcceptingStatesNeedsRelaxedConvention) {
    TransitionTable table(std::vector<TransitionRecord>{
        {"q1", {"0"}, "q2"},
        {"q2", {"0"}, "q1"},
    });

    auto strict = find_optimal_layout({"q1", "q2"}, table, LayoutConstraints{"q1", {}, true});
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error(), LayoutError::NoLayoutFound);

    auto relaxed = find_optimal_layout({"q1", "q2"}, table, LayoutConstraints{"q1", {}, false});
    ASSERT_TRUE(relaxed.has_value());
    EXPECT_EQ(to_string(relaxed->m_grid), "[[q1, q2]]");
    EXPECT_EQ(relaxed->m_cost, 2);
}

TEST(LayoutTest, EveryStatePlacedOnceAndInitialInFirstColumn) {
    const std::vector<State> states{"q1", "q2", "q3", "q4", "q5"};
    TransitionTable table(std::vector<TransitionRecord>{
        {"q1", {"a"}, "q2"},
        {"q2", {"b"}, "q3"},
        {"q3", {"a"}, "q5"},
        {"q4", {"b"}, "q1"},
        {"q5", {"a"}, "q4"},
    });
    LayoutConstraints constraints{"q3", {"q1", "q4"}, false};

    auto layout = find_optimal_layout(states, table, constraints);

    ASSERT_TRUE(layout.has_value());
    for (const auto& state : states) {
        EXPECT_EQ(count_cells(layout->m_grid, state), 1) << state;
    }
    auto initial = find_position(layout->m_grid, "q3");
    ASSERT_TRUE(initial.has_value());
    EXPECT_EQ(initial->m_col, 0);
}

TEST(LayoutTest, AcceptingStatesEndTheirRows) {
    const std::vector<State> states{"q1", "q2", "q3", "q4"};
    TransitionTable table(std::vector<TransitionRecord>{
        {"q1", {"a"}, "q2"},
        {"q1", {"b"}, "q3"},
        {"q2", {"a"}, "q4"},
        {"q3", {"b"}, "q4"},
    });
    LayoutConstraints constraints{"q1", {"q2", "q4"}, true};

    auto layout = find_optimal_layout(states, table, constraints);

    ASSERT_TRUE(layout.has_value());
    EXPECT_TRUE(satisfies_constraints(layout->m_grid, constraints));
    for (const auto& row : layout->m_grid) {
        auto last = rightmost_occupied(row);
        ASSERT_TRUE(last.has_value());
        const auto& state = row[*last].value();
        EXPECT_TRUE(state == "q2" || state == "q4") << to_string(layout->m_grid);
    }
}

TEST(LayoutTest, CostIsMinimalAmongValidPlacements) {
    const std::vector<State> states{"a", "b", "c", "d", "e"};
    TransitionTable table(std::vector<TransitionRecord>{
        {"a", {"0"}, "c"},
        {"a", {"1"}, "e"},
        {"b", {"0"}, "d"},
        {"c", {"1"}, "b"},
        {"d", {"0"}, "a"},
        {"e", {"1"}, "e"},
        {"e", {"0"}, "b"},
    });

    for (bool row_end : {true, false}) {
        LayoutConstraints constraints{"a", {"d", "e"}, row_end};

        auto layout = find_optimal_layout(states, table, constraints);
        const int expected = brute_force_minimum(states, table, constraints);

        if (expected == std::numeric_limits<int>::max()) {
            ASSERT_FALSE(layout.has_value());
            EXPECT_EQ(layout.error(), LayoutError::NoLayoutFound);
        } else {
            ASSERT_TRUE(layout.has_value());
            EXPECT_EQ(layout->m_cost, expected);
            EXPECT_EQ(transition_cost(layout->m_grid, table), expected);
            EXPECT_TRUE(satisfies_constraints(layout->m_grid, constraints));
        }
    }
}

TEST(LayoutTest, ConstraintRejectsAcceptingStateInsideRow) {
    LayoutConstraints constraints{"q1", {"q2", "q3"}, true};

    EXPECT_TRUE(satisfies_constraints(Grid{Row{"q1", "q2"}, Row{"q4", "q3"}}, constraints));
    EXPECT_FALSE(satisfies_constraints(Grid{Row{"q1", "q2", "q3"}, Row{"q4", std::nullopt, std::nullopt}}, constraints));
    EXPECT_FALSE(satisfies_constraints(Grid{Row{"q1", "q2", "q4"}}, constraints));
    EXPECT_FALSE(satisfies_constraints(Grid{Row{"q2", "q1"}, Row{"q4", "q3"}}, constraints));
}

TEST(LayoutTest, AcceptingInitialStateMayStartARow) {
    LayoutConstraints constraints{"q1", {"q1", "q2"}, true};

    EXPECT_TRUE(satisfies_constraints(Grid{Row{"q1", "q3", "q2"}}, constraints));
    EXPECT_TRUE(satisfies_constraints(Grid{Row{"q1", std::nullopt}}, LayoutConstraints{"q1", {"q1"}, true}));
}

TEST(LayoutTest, ConventionOffOnlyRequiresInitialInFirstColumn) {
    LayoutConstraints constraints{"q1", {"q2"}, false};

    EXPECT_TRUE(satisfies_constraints(Grid{Row{"q1", "q2", "q3"}}, constraints));
    EXPECT_FALSE(satisfies_constraints(Grid{Row{"q3", "q1"}}, constraints));
}

TEST(LayoutTest, TiesKeepFirstPlacementFound) {
    TransitionTable table;

    auto layout = find_optimal_layout({"q1", "q2", "q3"}, table, LayoutConstraints{"q1", {}, false});

    ASSERT_TRUE(layout.has_value());
    EXPECT_EQ(to_string(layout->m_grid), "[[q1, q2, q3]]");
    EXPECT_EQ(layout->m_cost, 0);
}

TEST(LayoutTest, DuplicateStatesArePlacedOnce) {
    TransitionTable table;

    auto layout = find_optimal_layout({"q1", "q2", "q1"}, table, LayoutConstraints{"q1", {}, false});

    ASSERT_TRUE(layout.has_value());
    EXPECT_EQ(count_cells(layout->m_grid, "q1"), 1);
}

TEST(LayoutTest, NoStatesIsAnError) {
    auto layout = find_optimal_layout({}, TransitionTable{}, LayoutConstraints{"q1", {}, false});

    ASSERT_FALSE(layout.has_value());
    EXPECT_EQ(layout.error(), LayoutError::NoStates);
}

TEST(LayoutTest, UndeclaredInitialStateFindsNoLayout) {
    auto layout = find_optimal_layout({"q1", "q2"}, TransitionTable{}, LayoutConstraints{"q0", {}, false});

    ASSERT_FALSE(layout.has_value());
    EXPECT_EQ(layout.error(), LayoutError::NoLayoutFound);
}

TEST(LayoutTest, RefusesTooManyStates) {
    std::vector<State> states;
    for (int i = 0; i < 11; ++i) {
        states.push_back("q" + std::to_string(i));
    }

    auto layout = find_optimal_layout(states, TransitionTable{}, LayoutConstraints{"q0", {}, false});

    ASSERT_FALSE(layout.has_value());
    EXPECT_EQ(layout.error(), LayoutError::TooManyStates);
    EXPECT_THROW(HandleLayoutError(layout.error()), std::runtime_error);
}

TEST(LayoutTest, StopRequestCancelsSearch) {
    std::stop_source source;
    source.request_stop();

    SearchOptions options;
    options.m_stop_token = source.get_token();

    auto layout = find_optimal_layout({"q1", "q2"}, TransitionTable{}, LayoutConstraints{"q1", {}, false}, options);

    ASSERT_FALSE(layout.has_value());
    EXPECT_EQ(layout.error(), LayoutError::Cancelled);
}

TEST(LayoutTest, ExhaustedBudgetTimesOut) {
    SearchOptions options;
    options.m_time_budget = std::chrono::milliseconds{-1};

    auto layout = find_optimal_layout({"q1", "q2"}, TransitionTable{}, LayoutConstraints{"q1", {}, false}, options);

    ASSERT_FALSE(layout.has_value());
    EXPECT_EQ(layout.error(), LayoutError::TimedOut);
}

TEST(LayoutTest, RowsLayoutPadsToRectangle) {
    TransitionTable table(std::vector<TransitionRecord>{{"q1", {"a"}, "q3"}});

    auto layout = layout_from_rows({{"q1", "q2"}, {"q3"}}, table);

    ASSERT_TRUE(layout.has_value());
    EXPECT_EQ(to_string(layout->m_grid), "[[q1, q2], [q3, -]]");
    EXPECT_EQ(layout->m_cost, 1);
}

TEST(LayoutTest, RowsLayoutWithoutStatesIsAnError) {
    auto layout = layout_from_rows({}, TransitionTable{});

    ASSERT_FALSE(layout.has_value());
    EXPECT_EQ(layout.error(), LayoutError::NoStates);
}
