#ifndef __GENERATE_SAMPLE_STATE_HPP___
#define __GENERATE_SAMPLE_STATE_HPP___

#include "grid.hpp"
#include <random>
#include <unordered_set>
#include <utility>
#include <vector>

/**
 * @file generate_sample_state.hpp
 * @brief Utilities to create random puzzle grids for benchmarks and testing.
 *
 * Two sampling strategies are provided:
 * - random walk: perform `target_depth` random legal moves from the goal grid
 * - BFS sampling: collect all grids at exact depth and pick one uniformly
 *
 * Both only ever move the blank, so every sample is solvable toward `goal`.
 */

/**
 * @brief Generate a random grid by performing a random walk from the goal.
 *
 * The walk may step back onto grids it has already visited, so the optimal
 * distance of the result is at most `target_depth`.
 *
 * @param goal Grid the walk starts from.
 * @param target_depth Number of random moves to perform.
 * @param rng Random number generator to use (std::mt19937).
 * @return A sampled `Grid`.
 */
inline Grid random_state_random_walk(const Grid &goal, int target_depth, std::mt19937 &rng) {
    Grid temp_grid = goal;
    for (int i = 0; i < target_depth; ++i) {
        auto moves = temp_grid.neighbors();
        std::uniform_int_distribution<size_t> dist(0, moves.size() - 1);
        temp_grid = moves[dist(rng)];
    }
    return temp_grid;
}

/**
 * @brief Generate a random grid by uniform sampling among grids at exact BFS depth.
 *
 * The function performs a breadth-first search from `goal` up to
 * `target_depth` and uniformly selects one of the grids at that depth, so
 * the optimal distance of the result is exactly `target_depth`.
 *
 * @param goal Grid the search starts from.
 * @param target_depth Depth to sample at (distance from goal).
 * @param rng Random number generator to use (std::mt19937).
 * @return A sampled `Grid`. Returns `goal` if no grid exists at that depth.
 */
inline Grid random_state_bfs(const Grid &goal, int target_depth, std::mt19937 &rng) {
    // Expand one whole depth layer at a time; `layer` ends up holding
    // every grid exactly `depth` moves away from goal.
    std::unordered_set<Grid> seen = {goal};
    std::vector<Grid> layer = {goal};
    for (int depth = 0; depth < target_depth && !layer.empty(); ++depth) {
        std::vector<Grid> next_layer;
        for (const auto &grid : layer) {
            for (auto &move : grid.neighbors()) {
                if (seen.insert(move).second) {
                    next_layer.push_back(std::move(move));
                }
            }
        }
        layer.swap(next_layer);
    }

    if (layer.empty()) {
        // target_depth is past the farthest reachable grid
        return goal;
    }

    std::uniform_int_distribution<size_t> dist(0, layer.size() - 1);
    return layer[dist(rng)];
}

#endif // __GENERATE_SAMPLE_STATE_HPP___
