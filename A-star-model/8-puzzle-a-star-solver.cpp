#include <algorithm>
#include <functional>
#include <queue>
#include <unordered_set>
#include <vector>

#include "grid.hpp"
#include "distance.hpp"
#include "8-puzzle-a-star-solver.hpp"

namespace {

// Search tree node. Nodes live in one arena vector and point at their
// parent by index; the root has parent -1.
struct SearchNode {
    Grid grid;
    int parent;
    int g;
    int h;

    int f() const { return g + h; }
};

struct FrontierEntry {
    int f;
    long long sequence;  // insertion order, breaks ties FIFO
    int node;
};

// Makes std::priority_queue a min-heap on (f, sequence).
struct FrontierGreater {
    bool operator()(const FrontierEntry &a, const FrontierEntry &b) const {
        if (a.f != b.f) return a.f > b.f;
        return a.sequence > b.sequence;
    }
};

std::vector<Grid> reconstruct_path(const std::vector<SearchNode> &nodes, int last) {
    std::vector<Grid> path;
    for (int i = last; i != -1; i = nodes[i].parent) {
        path.push_back(nodes[i].grid);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace

SearchResult PuzzleSolveAstar(const Grid &start, const Grid &goal, int max_expansions) {
    SearchResult result;

    std::vector<SearchNode> nodes;
    std::priority_queue<FrontierEntry, std::vector<FrontierEntry>, FrontierGreater> frontier;
    std::unordered_set<Grid> explored;
    long long sequence = 0;

    auto push = [&](const Grid &grid, int parent, int g) {
        int h = manhattan_distance(grid, goal);
        nodes.push_back(SearchNode{grid, parent, g, h});
        int id = static_cast<int>(nodes.size()) - 1;
        frontier.push(FrontierEntry{nodes[id].f(), sequence++, id});
        ++result.generated_nodes;
    };

    push(start, -1, 0);

    while (!frontier.empty()) {
        int current = frontier.top().node;
        frontier.pop();

        if (nodes[current].grid == goal) {
            result.status = SearchStatus::Solved;
            result.path = reconstruct_path(nodes, current);
            return result;
        }

        // Already finalized through an equal or cheaper path.
        if (explored.count(nodes[current].grid)) {
            continue;
        }

        if (max_expansions > 0 && result.expanded_nodes >= max_expansions) {
            result.status = SearchStatus::Aborted;
            return result;
        }

        explored.insert(nodes[current].grid);
        ++result.expanded_nodes;

        // push() may reallocate the arena, so copy what is needed first.
        const int g = nodes[current].g;
        const std::vector<Grid> successors = nodes[current].grid.neighbors();
        for (const auto &next : successors) {
            if (!explored.count(next)) {
                push(next, current, g + 1);
            }
        }
    }

    result.status = SearchStatus::NoSolution;
    return result;
}

SearchResult PuzzleSolveAstar(const std::vector<std::vector<int>> &start,
                              const std::vector<std::vector<int>> &goal,
                              int max_expansions) {
    Grid start_grid(start);
    Grid goal_grid(goal);
    return PuzzleSolveAstar(start_grid, goal_grid, max_expansions);
}
