#ifndef __DISTANCE_HPP___
#define __DISTANCE_HPP___

#include "grid.hpp"

/**
 * @file distance.hpp
 * @brief Heuristic distance function for 8-puzzle grids.
 */

/**
 * @brief Compute the Manhattan distance between a grid and a goal grid.
 *
 * Sums, over every non-blank value, the row plus column distance between
 * its cell in `grid` and its cell in `goal`. The blank contributes 0, so
 * the estimate is admissible and consistent for unit-cost moves.
 *
 * @param grid Current grid.
 * @param goal Goal grid to compare against.
 * @return Sum of Manhattan distances, 0 iff grid == goal.
 */
int manhattan_distance(const Grid& grid, const Grid& goal);

#endif // __DISTANCE_HPP___
