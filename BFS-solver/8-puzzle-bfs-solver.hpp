#ifndef __8_PUZZLE_BFS_SOLVER_HPP___
#define __8_PUZZLE_BFS_SOLVER_HPP___

#include <vector>

#include "grid.hpp"

/**
 * @file 8-puzzle-bfs-solver.hpp
 * @brief Breadth-first search solver for 8-puzzle `Grid`.
 */

/**
 * @brief Solve the puzzle using BFS.
 *
 * Uninformed and exhaustive, so the path is always a shortest one. Used as
 * the reference when checking A* results and as a benchmark baseline.
 *
 * @param start Starting grid.
 * @param goal Goal grid.
 * @param visited_nodes Optional out-parameter to receive number of visited nodes.
 * @return Sequence of grids from start to goal (empty if no solution found).
 */
std::vector<Grid> BFSPuzzleSolver(const Grid &start, const Grid &goal, int* visited_nodes = nullptr);

#endif // __8_PUZZLE_BFS_SOLVER_HPP___
