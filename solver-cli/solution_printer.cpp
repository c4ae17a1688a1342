#include "solution_printer.hpp"

void print_grid(std::ostream &out, const Grid &grid)
{
    for (const auto &row : grid.rows()) {
        out << '[';
        for (std::size_t c = 0; c < row.size(); ++c) {
            if (c) {
                out << ", ";
            }
            out << row[c];
        }
        out << "]\n";
    }
}

void print_solution(std::ostream &out, const SearchResult &result)
{
    switch (result.status) {
        case SearchStatus::Solved:
            out << "Solution steps:\n";
            for (std::size_t i = 0; i < result.path.size(); ++i) {
                out << "Step " << (i + 1) << ":\n";
                print_grid(out, result.path[i]);
                out << '\n';
            }
            break;
        case SearchStatus::NoSolution:
            out << "No solution found.\n";
            break;
        case SearchStatus::Aborted:
            out << "Search aborted after " << result.expanded_nodes << " expansions.\n";
            break;
    }
}
