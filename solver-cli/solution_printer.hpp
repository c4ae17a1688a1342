#ifndef __SOLUTION_PRINTER_HPP___
#define __SOLUTION_PRINTER_HPP___

#include <ostream>

#include "grid.hpp"
#include "8-puzzle-a-star-solver.hpp"

/**
 * @file solution_printer.hpp
 * @brief Text rendering of grids and search results.
 */

/// Print the rows of a grid, one per line, as `[a, b, c]`.
void print_grid(std::ostream &out, const Grid &grid);

/**
 * @brief Print a search result.
 *
 * A solved result prints `Solution steps:` followed by every grid of the
 * path as `Step k:` (1-based) and its rows, each step followed by a blank
 * line. Otherwise a single line reports that no solution exists or that
 * the search was aborted.
 */
void print_solution(std::ostream &out, const SearchResult &result);

#endif // __SOLUTION_PRINTER_HPP___
