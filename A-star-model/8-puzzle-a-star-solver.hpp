#ifndef PUZZLE_ASTAR_SOLVER_HPP
#define PUZZLE_ASTAR_SOLVER_HPP

#include <vector>

#include "grid.hpp"

/**
 * @file 8-puzzle-a-star-solver.hpp
 * @brief A* solver for the 8-puzzle `Grid` type.
 */

/**
 * @brief Outcome of a search.
 */
enum class SearchStatus {
    Solved,      ///< path holds start..goal
    NoSolution,  ///< frontier exhausted, goal unreachable
    Aborted      ///< expansion budget reached first
};

/**
 * @brief Result of `PuzzleSolveAstar`.
 *
 * `path` is only filled when `status == SearchStatus::Solved`; a start
 * that already equals the goal yields a one-element path.
 */
struct SearchResult {
    SearchStatus status = SearchStatus::NoSolution;
    std::vector<Grid> path;
    int expanded_nodes = 0;   // nodes popped and expanded
    int generated_nodes = 0;  // nodes pushed onto the frontier, root included

    bool solved() const { return status == SearchStatus::Solved; }

    // Number of moves in the solution, -1 if not solved.
    int moves() const { return solved() ? static_cast<int>(path.size()) - 1 : -1; }
};

/**
 * @brief Solve the puzzle using A* with the Manhattan distance heuristic.
 *
 * Frontier ties on f = g + h are broken in insertion order. A grid is
 * expanded at most once; with the consistent Manhattan heuristic the first
 * expansion is along a shortest path, so the returned path is optimal.
 *
 * @param start Starting grid.
 * @param goal Goal grid.
 * @param max_expansions Stop with `SearchStatus::Aborted` after this many
 *        expansions; 0 means no limit.
 * @return Search status, path and node counts.
 */
SearchResult PuzzleSolveAstar(const Grid &start, const Grid &goal, int max_expansions = 0);

/**
 * @brief Validate raw 3x3 inputs, then solve them with A*.
 *
 * @throws InvalidGridError if either input is not a 3x3 permutation of 0..8.
 */
SearchResult PuzzleSolveAstar(const std::vector<std::vector<int>> &start,
                              const std::vector<std::vector<int>> &goal,
                              int max_expansions = 0);

#endif // PUZZLE_ASTAR_SOLVER_HPP
