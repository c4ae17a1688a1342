#include <iostream>
#include <random>
#include <stdexcept>
#include <string>

#include "grid.hpp"
#include "grid_file_operations.hpp"
#include "generate_sample_state.hpp"

using namespace std;

int main(int argc, char** argv) {
    int depth = 10;
    unsigned int seed = 1;
    bool random_walk = false;
    string output_file;

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--depth" && i + 1 < argc) { depth = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = static_cast<unsigned int>(stoul(argv[++i])); }
            else if (a == "--random-walk") { random_walk = true; }
            else if (a == "--output-file" && i + 1 < argc) { output_file = argv[++i]; }
            else if (a == "--help") {
                cout << "Usage: generate-sample [--depth D] [--seed S] [--random-walk] --output-file PATH\n";
                return 0;
            }
        }
    } catch (const std::exception& e) {
        cerr << "Error parsing arguments: " << e.what() << '\n';
        return 3;
    }
    if (output_file.empty()) {
        cerr << "Missing --output-file\n";
        return 1;
    }
    if (depth < 0) {
        cerr << "depth must be >= 0\n";
        return 3;
    }

    mt19937 rng(seed);
    Grid goal;
    Grid sample = random_walk ? random_state_random_walk(goal, depth, rng)
                              : random_state_bfs(goal, depth, rng);
    try {
        write_grid_to_file(sample, output_file);
    } catch (const std::exception& e) {
        cerr << "Error writing sample: " << e.what() << '\n';
        return 2;
    }
    return 0;
}
