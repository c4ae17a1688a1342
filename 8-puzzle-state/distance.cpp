#include <array>
#include <cstdlib>

#include "grid.hpp"
#include "distance.hpp"

using namespace std;

int manhattan_distance(const Grid& grid, const Grid& goal) {
    // goal cell index of each value
    array<int, Grid::num_cells> goal_index{};
    const auto& goal_cells = goal.cells();
    for (int i = 0; i < Grid::num_cells; ++i) {
        goal_index[goal_cells[i]] = i;
    }

    int distance = 0;
    const auto& cells = grid.cells();
    for (int i = 0; i < Grid::num_cells; ++i) {
        int value = cells[i];
        if (value == 0) continue;
        int current_row = i / Grid::side_length;
        int current_col = i % Grid::side_length;
        int goal_row = goal_index[value] / Grid::side_length;
        int goal_col = goal_index[value] % Grid::side_length;
        distance += abs(current_row - goal_row) + abs(current_col - goal_col);
    }
    return distance;
}
