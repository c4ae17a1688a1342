#include <iostream>
#include <vector>
#include <random>
#include <chrono>
#include <stdexcept>
#include <string>

#include "grid.hpp"
#include "8-puzzle-a-star-solver.hpp"
#include "8-puzzle-bfs-solver.hpp"
#include "generate_sample_state.hpp"

using namespace std;

int main(int argc, char** argv) {
    int depth = 30;
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--depth" && i + 1 < argc) { depth = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
            else if (a == "--help") {
                cout << "Usage: benchmark-a-star [--depth D] [--seed S]\n";
                return 0;
            }
        }
    } catch (const std::exception& e) {
        cerr << "Error parsing arguments: " << e.what() << '\n';
        return 3;
    }

    if (depth < 0) {
        cerr << "depth must be >= 0\n";
        return 3;
    }

    mt19937 rng(seed);

    // Ordered layout [[1,2,3],[4,5,6],[7,8,0]]
    Grid goal_grid;
    Grid start_grid = random_state_random_walk(goal_grid, depth, rng);

    auto t0 = chrono::steady_clock::now();
    SearchResult astar = PuzzleSolveAstar(start_grid, goal_grid);
    auto t1 = chrono::steady_clock::now();
    int bfs_visited = 0;
    vector<Grid> bfs_path = BFSPuzzleSolver(start_grid, goal_grid, &bfs_visited);
    auto t2 = chrono::steady_clock::now();

    double astar_ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();
    double bfs_ms = chrono::duration_cast<chrono::duration<double, milli>>(t2 - t1).count();
    int bfs_moves = bfs_path.empty() ? -1 : static_cast<int>(bfs_path.size()) - 1;

    // CSV header
    cout << "solver,depth,seed,time_ms,found,moves,expanded_nodes" << '\n';
    cout << "a-star," << depth << ',' << seed << ',' << astar_ms << ',' << (astar.solved()?1:0) << ','
         << astar.moves() << ',' << astar.expanded_nodes << '\n';
    cout << "bfs," << depth << ',' << seed << ',' << bfs_ms << ',' << (bfs_path.empty()?0:1) << ','
         << bfs_moves << ',' << bfs_visited << '\n';

    if (astar.moves() != bfs_moves) {
        cerr << "A* and BFS disagree on the optimal move count\n";
        return 4;
    }
    return 0;
}
