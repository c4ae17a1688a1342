#ifndef __GRID_FILE_OPERATIONS_HPP___
#define __GRID_FILE_OPERATIONS_HPP___

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "grid.hpp"

/**
 * @file grid_file_operations.hpp
 * @brief Simple helpers to read/write `Grid` values from plain text files.
 *
 * The file format used by these helpers is a minimal plain-text format:
 * the first token is `side_length` (always 3), followed by the 9 cell
 * values in row-major order.
 */

/**
 * @brief Read a `Grid` from a simple plain-text file.
 *
 * @param filename Path to the input file.
 * @throws std::runtime_error if the file cannot be opened.
 * @throws InvalidGridError if the content is not a 3x3 grid.
 * @return Constructed `Grid` instance.
 */
inline Grid read_grid_from_file(const std::string& filename) {
    std::ifstream infile(filename);
    if (!infile.is_open()) {
        throw std::runtime_error("Could not open file: " + filename);
    }
    int side_length = 0;
    if (!(infile >> side_length)) {
        throw InvalidGridError("Missing side length in " + filename);
    }
    if (side_length != Grid::side_length) {
        throw InvalidGridError("Only 3x3 grids are supported, got side length " + std::to_string(side_length));
    }
    std::vector<int> cells(Grid::num_cells);
    for (int i = 0; i < Grid::num_cells; ++i) {
        if (!(infile >> cells[i])) {
            throw InvalidGridError("Expected 9 cell values in " + filename);
        }
    }
    return Grid::from_cells(cells);
}

/**
 * @brief Write a `Grid` to a simple plain-text file.
 *
 * @param grid Grid to serialize.
 * @param filename Output file path.
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
inline void write_grid_to_file(const Grid& grid, const std::string& filename) {
    std::ofstream outfile(filename);
    if (!outfile.is_open()) {
        throw std::runtime_error("Could not open file for writing: " + filename);
    }
    outfile << Grid::side_length << "\n";
    for (const auto& row : grid.rows()) {
        for (size_t c = 0; c < row.size(); ++c) {
            if (c) outfile << " ";
            outfile << row[c];
        }
        outfile << "\n";
    }
}

#endif // __GRID_FILE_OPERATIONS_HPP___
