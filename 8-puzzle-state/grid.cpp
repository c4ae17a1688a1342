#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <vector>

#include "grid.hpp"

using namespace std;

void Grid::init(const vector<int>& cells) {
    if (static_cast<int>(cells.size()) != num_cells) {
        throw InvalidGridError("Grid must have exactly 9 cells, got " + to_string(cells.size()));
    }
    vector<bool> seen(num_cells, false);
    for (int v : cells) {
        if (v < 0 || v >= num_cells) {
            throw InvalidGridError("Cell values must be in range [0,8], got " + to_string(v));
        }
        if (seen[v]) {
            throw InvalidGridError("Duplicate cell value " + to_string(v));
        }
        seen[v] = true;
    }
    this->cells_ = cells;
}

Grid::Grid() {
    cells_.resize(num_cells);
    for (int i = 0; i < num_cells - 1; ++i) {
        cells_[i] = i + 1;
    }
    cells_[num_cells - 1] = 0;
}

Grid::Grid(const vector<vector<int>>& rows) {
    if (static_cast<int>(rows.size()) != side_length) {
        throw InvalidGridError("Grid must have 3 rows, got " + to_string(rows.size()));
    }
    vector<int> cells;
    cells.reserve(num_cells);
    for (const auto& row : rows) {
        if (static_cast<int>(row.size()) != side_length) {
            throw InvalidGridError("Grid rows must have 3 values, got " + to_string(row.size()));
        }
        cells.insert(cells.end(), row.begin(), row.end());
    }
    init(cells);
}

Grid Grid::from_cells(const vector<int>& cells) {
    Grid g;
    g.init(cells);
    return g;
}

int Grid::at(int row, int col) const {
    if (row < 0 || row >= side_length || col < 0 || col >= side_length) {
        throw out_of_range("Grid coordinates out of range");
    }
    return cells_[row * side_length + col];
}

const vector<int>& Grid::cells() const {
    return cells_;
}

vector<vector<int>> Grid::rows() const {
    vector<vector<int>> result;
    for (int r = 0; r < side_length; ++r) {
        result.emplace_back(cells_.begin() + r * side_length, cells_.begin() + (r + 1) * side_length);
    }
    return result;
}

pair<int, int> Grid::position_of(int value) const {
    for (int i = 0; i < num_cells; ++i) {
        if (cells_[i] == value) {
            return {i / side_length, i % side_length};
        }
    }
    throw InvalidGridError("Value " + to_string(value) + " not found in grid");
}

pair<int, int> Grid::blank_position() const {
    return position_of(0);
}

vector<Grid> Grid::neighbors() const {
    // down, up, right, left
    static const int dr[] = {1, -1, 0, 0};
    static const int dc[] = {0, 0, 1, -1};

    vector<Grid> moves;
    moves.reserve(4);
    const pair<int, int> blank = blank_position();
    const int blank_pos = blank.first * side_length + blank.second;
    for (int d = 0; d < 4; ++d) {
        int r = blank.first + dr[d];
        int c = blank.second + dc[d];
        if (r < 0 || r >= side_length || c < 0 || c >= side_length) {
            continue;
        }
        Grid next(*this);
        swap(next.cells_[blank_pos], next.cells_[r * side_length + c]);
        moves.push_back(std::move(next));
    }
    return moves;
}

size_t Grid::hash() const {
    uint64_t packed = 0;
    for (int i = 0; i < num_cells; ++i) {
        packed |= static_cast<uint64_t>(cells_[i] & 0xF) << (i * 4);
    }
    return std::hash<uint64_t>{}(packed);
}

bool Grid::operator==(const Grid &rhs) const {
    return cells_ == rhs.cells_;
}

bool Grid::operator!=(const Grid &rhs) const {
    return !(*this == rhs);
}

bool Grid::operator<(const Grid &rhs) const {
    return cells_ < rhs.cells_;
}

bool is_adjacent_move(const Grid& from, const Grid& to) {
    for (const auto& next : from.neighbors()) {
        if (next == to) return true;
    }
    return false;
}
