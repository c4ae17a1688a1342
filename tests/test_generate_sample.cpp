// Google Test for the sample generators
#include <gtest/gtest.h>
#include <random>

#include "grid.hpp"
#include "8-puzzle-bfs-solver.hpp"
#include "generate_sample_state.hpp"

TEST(GenerateSample, BfsSampleHasExactDepth) {
    std::mt19937 rng(11);
    Grid goal;
    for (int depth : {0, 1, 5, 9}) {
        Grid sample = random_state_bfs(goal, depth, rng);
        auto path = BFSPuzzleSolver(sample, goal);
        ASSERT_FALSE(path.empty());
        EXPECT_EQ(static_cast<int>(path.size()) - 1, depth);
    }
}

TEST(GenerateSample, BfsBeyondDiameterReturnsGoal) {
    std::mt19937 rng(11);
    Grid goal;
    // no 8-puzzle grid is more than 31 moves away
    EXPECT_EQ(random_state_bfs(goal, 32, rng), goal);
}

TEST(GenerateSample, RandomWalkIsReachableAndSeeded) {
    Grid goal({{2, 3, 4}, {7, 0, 1}, {8, 5, 6}});
    std::mt19937 rng_a(99);
    std::mt19937 rng_b(99);
    Grid a = random_state_random_walk(goal, 15, rng_a);
    Grid b = random_state_random_walk(goal, 15, rng_b);
    EXPECT_EQ(a, b);

    auto path = BFSPuzzleSolver(a, goal);
    ASSERT_FALSE(path.empty());
    EXPECT_LE(static_cast<int>(path.size()) - 1, 15);
    EXPECT_EQ((static_cast<int>(path.size()) - 1) % 2, 1);
}
