#include <gtest/gtest.h>

#include "../include/router.hpp"

#include <variant>

using namespace layout;
using model::State;
using model::TransitionRecord;
using model::TransitionTable;

namespace {

Grid three_by_three() {
    return Grid{
        Row{"q1", "q2", "q3"},
        Row{"q4", "q5", "q6"},
        Row{"q7", "q8", "q9"},
    };
}

}  // namespace

TEST(RouterTest, LoopAndStraightEdgeForForwardTransition) {
    Grid grid{Row{"q1", "q2"}};
    TransitionTable table(std::vector<TransitionRecord>{
        {"q1", {"0"}, "q1"},
        {"q1", {"1"}, "q2"},
    });

    auto routes = route_edges(grid, table, {"q1", "q2"});

    ASSERT_EQ(routes.size(), 2u);
    EXPECT_EQ(routes[0], (EdgeRoute{"q1", "q1", {"0"}, SelfLoop{Side::Below}}));
    EXPECT_EQ(routes[1], (EdgeRoute{"q1", "q2", {"1"}, StraightEdge{Side::Above}}));
}

TEST(RouterTest, SingleStateLoopGoesBelow) {
    Grid grid{Row{"q1"}};
    TransitionTable table(std::vector<TransitionRecord>{{"q1", {"1", "0"}, "q1"}});

    auto routes = route_edges(grid, table, {"q1"});

    ASSERT_EQ(routes.size(), 1u);
    EXPECT_EQ(routes[0].m_symbols, (std::vector<model::Symbol>{"0", "1"}));
    EXPECT_EQ(std::get<SelfLoop>(routes[0].m_shape).m_side, Side::Below);
}

TEST(RouterTest, MutualPairBendsOppositeWays) {
    Grid grid{Row{"q1", "q2"}};
    TransitionTable table(std::vector<TransitionRecord>{
        {"q1", {"0"}, "q2"},
        {"q2", {"0"}, "q1"},
    });

    auto routes = route_edges(grid, table, {"q1", "q2"});

    ASSERT_EQ(routes.size(), 2u);
    const auto& forward  = std::get<BentEdge>(routes[0].m_shape);
    const auto& backward = std::get<BentEdge>(routes[1].m_shape);

    EXPECT_NE(forward.m_bend, backward.m_bend);
    EXPECT_NE(forward.m_label_side, backward.m_label_side);
    EXPECT_FALSE(forward.m_reversed);
    EXPECT_TRUE(backward.m_reversed);

    // each arc is drawn along its own direction, the shared keyword splits them apart
    EXPECT_EQ(drawn_bend(forward), Bend::Left);
    EXPECT_EQ(drawn_bend(backward), Bend::Left);
}

TEST(RouterTest, UnconnectedPairsHaveNoRoute) {
    Grid grid{Row{"q1", "q2"}};
    TransitionTable table(std::vector<TransitionRecord>{{"q1", {"a"}, "q1"}});

    EXPECT_FALSE(route_pair(grid, table, {"q1", "q2"}, 0, 1).has_value());
    EXPECT_FALSE(route_pair(grid, table, {"q1", "q2"}, 1, 1).has_value());
    EXPECT_TRUE(std::holds_alternative<SelfLoop>(route_pair(grid, table, {"q1", "q2"}, 0, 0)->m_shape));
}

TEST(RouterTest, OneWayEdgeAroundAStateBends) {
    Grid grid{Row{"q1", "q2", "q3"}};
    TransitionTable table(std::vector<TransitionRecord>{{"q1", {"a"}, "q3"}});

    auto route = route_pair(grid, table, {"q1", "q2", "q3"}, 0, 2);

    ASSERT_TRUE(route.has_value());
    EXPECT_EQ(std::get<BentEdge>(route->m_shape), (BentEdge{Bend::Left, false, Side::Below}));
}

TEST(RouterTest, EdgeAgainstDeclarationOrderIsStoredMirrored) {
    Grid grid{Row{"q1", "q2", "q3"}};
    TransitionTable table(std::vector<TransitionRecord>{{"q3", {"a"}, "q1"}});

    auto route = route_pair(grid, table, {"q1", "q2", "q3"}, 2, 0);

    ASSERT_TRUE(route.has_value());
    const auto& edge = std::get<BentEdge>(route->m_shape);
    EXPECT_EQ(edge, (BentEdge{Bend::Left, true, Side::Above}));
    EXPECT_EQ(drawn_bend(edge), Bend::Right);
}

TEST(RouterTest, LoopSidePrefersEmptyNeighbours) {
    Grid grid{
        Row{std::nullopt, "q2"},
        Row{"q1", "q3"},
    };

    EXPECT_EQ(loop_side(grid, "q1"), Side::Above);
    EXPECT_EQ(loop_side(grid, "q3"), Side::Below);

    Grid row_below{
        Row{"q1", "q2"},
        Row{"q3", std::nullopt},
    };
    EXPECT_EQ(loop_side(row_below, "q3"), Side::Right);
    EXPECT_EQ(loop_side(row_below, "q2"), Side::Below);
    EXPECT_EQ(loop_side(row_below, "q1"), Side::Above);
}

TEST(RouterTest, LoopSideFallsBackToGridBorder) {
    Grid full{
        Row{"q1", "q2"},
        Row{"q3", "q4"},
    };

    // no empty neighbour anywhere, the loop leaves over the nearest border, below first
    EXPECT_EQ(loop_side(full, "q1"), Side::Above);
    EXPECT_EQ(loop_side(full, "q2"), Side::Above);
    EXPECT_EQ(loop_side(full, "q3"), Side::Below);
    EXPECT_EQ(loop_side(full, "q4"), Side::Below);

    // surrounded on all four sides
    EXPECT_EQ(loop_side(three_by_three(), "q5"), Side::Below);
}

TEST(RouterTest, CrossingOnlyCountsOccupiedCells) {
    EXPECT_TRUE(crosses_other_states(Grid{Row{"q1", "q2", "q3"}}, "q1", "q3"));
    EXPECT_FALSE(crosses_other_states(Grid{Row{"q1", std::nullopt, "q3"}}, "q1", "q3"));
    EXPECT_FALSE(crosses_other_states(Grid{Row{"q1", "q2", "q3"}}, "q1", "q2"));

    auto grid = three_by_three();
    EXPECT_TRUE(crosses_other_states(grid, "q1", "q9"));
    EXPECT_TRUE(crosses_other_states(grid, "q2", "q8"));
    EXPECT_FALSE(crosses_other_states(grid, "q1", "q6"));
}

TEST(RouterTest, BendBulgesOutwardsAlongTheBorder) {
    auto grid = three_by_three();

    EXPECT_EQ(choose_bend(grid, Position{0, 0}, Position{0, 2}), Bend::Left);
    EXPECT_EQ(choose_bend(grid, Position{0, 2}, Position{0, 0}), Bend::Right);
    EXPECT_EQ(choose_bend(grid, Position{2, 0}, Position{2, 2}), Bend::Right);
    EXPECT_EQ(choose_bend(grid, Position{2, 2}, Position{2, 0}), Bend::Left);
    EXPECT_EQ(choose_bend(grid, Position{0, 0}, Position{2, 0}), Bend::Right);
    EXPECT_EQ(choose_bend(grid, Position{2, 0}, Position{0, 0}), Bend::Left);
    EXPECT_EQ(choose_bend(grid, Position{0, 2}, Position{2, 2}), Bend::Left);
    EXPECT_EQ(choose_bend(grid, Position{2, 2}, Position{0, 2}), Bend::Right);
}

TEST(RouterTest, InteriorBendFollowsColumnOrder) {
    auto grid = three_by_three();

    EXPECT_EQ(choose_bend(grid, Position{1, 0}, Position{1, 2}), Bend::Right);
    EXPECT_EQ(choose_bend(grid, Position{1, 2}, Position{1, 0}), Bend::Left);
    EXPECT_EQ(choose_bend(grid, Position{0, 1}, Position{2, 1}), Bend::Right);
}

TEST(RouterTest, RoutesFollowDeclarationOrder) {
    Grid grid{Row{"q1", "q2"}, Row{"q3", std::nullopt}};
    TransitionTable table(std::vector<TransitionRecord>{
        {"q3", {"a"}, "q1"},
        {"q1", {"b"}, "q2"},
        {"q2", {"c"}, "q2"},
    });

    auto routes = route_edges(grid, table, {"q1", "q2", "q3"});

    ASSERT_EQ(routes.size(), 3u);
    EXPECT_EQ(routes[0].m_from, "q1");
    EXPECT_EQ(routes[1].m_from, "q2");
    EXPECT_EQ(routes[2].m_from, "q3");
    EXPECT_TRUE(std::holds_alternative<StraightEdge>(routes[2].m_shape));
}
