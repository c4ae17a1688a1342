#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "grid.hpp"
#include "grid_file_operations.hpp"
#include "8-puzzle-a-star-solver.hpp"
#include "solution_printer.hpp"
#include "cli_options.hpp"

using namespace std;

int main(int argc, char** argv) {
    SolverOptions options;
    try {
        options = parse_solver_options(argc, argv);
    } catch (const std::exception& e) {
        cerr << "Error parsing arguments: " << e.what() << '\n';
        return 3;
    }
    if (options.help) {
        cout << "Usage: eight-puzzle [--initial-file PATH] [--goal-file PATH] [--max-expansions N]\n";
        return 0;
    }

    vector<vector<int>> initial_rows = {
        {2, 1, 7},
        {8, 0, 6},
        {3, 4, 5}
    };
    vector<vector<int>> goal_rows = {
        {2, 3, 4},
        {7, 0, 1},
        {8, 5, 6}
    };

    Grid initial;
    Grid goal;
    try {
        initial = options.initial_file.empty() ? Grid(initial_rows) : read_grid_from_file(options.initial_file);
        goal = options.goal_file.empty() ? Grid(goal_rows) : read_grid_from_file(options.goal_file);
    } catch (const std::exception& e) {
        cerr << "Error loading grids: " << e.what() << '\n';
        return 2;
    }

    auto t0 = chrono::steady_clock::now();
    SearchResult result = PuzzleSolveAstar(initial, goal, options.max_expansions);
    auto t1 = chrono::steady_clock::now();
    double ms = chrono::duration_cast<chrono::duration<double, milli>>(t1 - t0).count();

    print_solution(cout, result);

    cerr << "time: " << ms << "ms, solution found: " << (result.solved()?1:0) << ", moves: " << result.moves()
         << ", expanded nodes: " << result.expanded_nodes << ", generated nodes: " << result.generated_nodes << '\n';

    return result.solved() ? 0 : 1;
}
