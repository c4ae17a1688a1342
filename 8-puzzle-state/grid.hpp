#ifndef __GRID_HPP___
#define __GRID_HPP___

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @file grid.hpp
 * @brief 8-puzzle grid representation (3x3 tiles, 0 is the blank).
 *
 * This header declares the Grid class used across solvers and tools.
 */

/**
 * @brief Raised when a grid is not a 3x3 permutation of the values 0..8.
 */
class InvalidGridError : public std::invalid_argument {
public:
    explicit InvalidGridError(const std::string& what) : std::invalid_argument(what) {}
};

/**
 * @brief Represents one 8-puzzle configuration.
 *
 * Cells are stored in row-major order. A Grid is always valid: every
 * constructor checks that each value 0..8 appears exactly once. The class
 * has no mutating member functions, transitions produce new grids.
 */
class Grid {

private:
    std::vector<int> cells_;
    void init(const std::vector<int>& cells);
public:
    static constexpr int side_length = 3;
    static constexpr int num_cells = side_length * side_length;

    /**
     * @brief Construct the ordered layout [[1,2,3],[4,5,6],[7,8,0]].
     */
    Grid();

    /**
     * @brief Construct a Grid from its rows.
     *
     * @param rows Three rows of three values each.
     * @throws InvalidGridError on wrong dimensions, out-of-range or duplicate values.
     */
    explicit Grid(const std::vector<std::vector<int>>& rows);

    /**
     * @brief Construct a Grid from 9 values in row-major order.
     *
     * @throws InvalidGridError on wrong length, out-of-range or duplicate values.
     */
    static Grid from_cells(const std::vector<int>& cells);

    ~Grid() = default;

    // Rule of five
    Grid(const Grid& other) = default;
    Grid& operator=(const Grid& other) = default;
    Grid(Grid&& other) = default;
    Grid& operator=(Grid&& other) = default;

    /**
     * @brief Value stored at (row, col), both 0-based.
     * @throws std::out_of_range when the coordinates leave the board.
     */
    int at(int row, int col) const;

    const std::vector<int>& cells() const;
    std::vector<std::vector<int>> rows() const;

    /**
     * @brief Return the (row, col) of the cell holding `value`.
     *
     * @throws InvalidGridError if the value is not on the board.
     */
    std::pair<int, int> position_of(int value) const;

    /**
     * @brief Return the (row, col) of the blank tile.
     */
    std::pair<int, int> blank_position() const;

    /**
     * @brief Generate all grids reachable by a single blank move.
     *
     * Moves are tried in a fixed order: down, up, right, left. A corner
     * blank yields 2 grids, an edge blank 3 and the center 4. Each grid
     * returned owns its own cells.
     *
     * @return Vector of successor `Grid` instances.
     */
    std::vector<Grid> neighbors() const;

    /**
     * @brief Compute a stable hash for this grid.
     *
     * Cells are packed 4 bits each, so two grids hash equal iff they are equal.
     * @return A size_t hash value.
     */
    size_t hash() const;

    bool operator==(const Grid &rhs) const;
    bool operator!=(const Grid &rhs) const;

    /**
     * @brief Strict weak ordering used for ordered containers (std::set).
     */
    bool operator<(const Grid &rhs) const;
};

/**
 * @brief True when `to` follows from `from` by exactly one blank swap.
 */
bool is_adjacent_move(const Grid& from, const Grid& to);

namespace std {
// Lets Grid be used as a key in unordered_set / unordered_map.
template<>
struct hash<Grid> {
    size_t operator()(const Grid &g) const {
        return g.hash();
    }
};
}

#endif // __GRID_HPP___
