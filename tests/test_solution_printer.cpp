// Google Test for print_solution
#include <gtest/gtest.h>
#include <sstream>

#include "grid.hpp"
#include "8-puzzle-a-star-solver.hpp"
#include "solution_printer.hpp"

TEST(SolutionPrinter, PrintsGridRows) {
    std::ostringstream out;
    print_grid(out, Grid({{2, 1, 7}, {8, 0, 6}, {3, 4, 5}}));
    EXPECT_EQ(out.str(), "[2, 1, 7]\n[8, 0, 6]\n[3, 4, 5]\n");
}

TEST(SolutionPrinter, PrintsSolvedSteps) {
    Grid start({{1, 2, 3}, {4, 5, 6}, {7, 0, 8}});
    SearchResult result = PuzzleSolveAstar(start, Grid());
    ASSERT_TRUE(result.solved());

    std::ostringstream out;
    print_solution(out, result);
    EXPECT_EQ(out.str(),
              "Solution steps:\n"
              "Step 1:\n"
              "[1, 2, 3]\n"
              "[4, 5, 6]\n"
              "[7, 0, 8]\n"
              "\n"
              "Step 2:\n"
              "[1, 2, 3]\n"
              "[4, 5, 6]\n"
              "[7, 8, 0]\n"
              "\n");
}

TEST(SolutionPrinter, PrintsNoSolution) {
    SearchResult result;
    result.status = SearchStatus::NoSolution;

    std::ostringstream out;
    print_solution(out, result);
    EXPECT_EQ(out.str(), "No solution found.\n");
}

TEST(SolutionPrinter, PrintsAborted) {
    SearchResult result;
    result.status = SearchStatus::Aborted;
    result.expanded_nodes = 42;

    std::ostringstream out;
    print_solution(out, result);
    EXPECT_EQ(out.str(), "Search aborted after 42 expansions.\n");
}
