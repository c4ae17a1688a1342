#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "grid.hpp"
#include "grid_file_operations.hpp"
#include "8-puzzle-bfs-solver.hpp"

using namespace std;

int main(int argc, char** argv) {
    string input_file;

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--input-file" && i + 1 < argc) { input_file = argv[++i]; }
        else if (a == "--help") {
            cout << "Usage: benchmark-bfs --input-file PATH\n";
            return 0;
        }
    }
    if (input_file.empty()) {
        cerr << "Missing --input-file\n";
        return 1;
    }

    Grid start_grid;
    try {
        start_grid = read_grid_from_file(input_file);
    } catch (const std::exception& e) {
        cerr << "Error reading start grid: " << e.what() << '\n';
        return 2;
    }
    // Ordered layout [[1,2,3],[4,5,6],[7,8,0]]
    Grid goal_grid;

    auto t0 = chrono::steady_clock::now();
    int visited_nodes = 0;
    vector<Grid> path = BFSPuzzleSolver(start_grid, goal_grid, &visited_nodes);
    auto t1 = chrono::steady_clock::now();
    double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

    bool found = !path.empty();
    int moves = found ? static_cast<int>(path.size()) - 1 : -1;

    cout << "time: " << ms << "ms, solution found: " << (found?1:0) << ", moves: " << moves << ", visited nodes: " << visited_nodes << '\n';

    return 0;
}
