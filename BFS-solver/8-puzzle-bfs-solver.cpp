#include <algorithm>
#include <map>
#include <queue>
#include <vector>
#include "grid.hpp"

#include "8-puzzle-bfs-solver.hpp"

std::vector<Grid> BFSPuzzleSolver(const Grid &start, const Grid &goal, int* visited_nodes) {
    std::vector<Grid> path;
    // Each discovered grid maps to the grid it was reached from.
    std::map<Grid, Grid> parent;
    std::queue<Grid> frontier;
    frontier.push(start);
    parent.emplace(start, start);
    if (visited_nodes) {
        *visited_nodes = 0;
    }
    while (!frontier.empty()) {
        Grid grid = frontier.front();
        frontier.pop();

        if (grid == goal) {
            Grid current = grid;
            path.push_back(current);
            while (current != start) {
                current = parent.at(current);
                path.push_back(current);
            }
            std::reverse(path.begin(), path.end());
            break;
        }

        if (visited_nodes) {
            (*visited_nodes)++;
        }
        for (const auto &move : grid.neighbors()) {
            if (parent.find(move) == parent.end()) {
                parent.emplace(move, grid);
                frontier.push(move);
            }
        }
    }
    return path;
}
