#include <stdexcept>
#include <string>

#include "cli_options.hpp"

using namespace std;

int parse_int_argument(const string& flag, const string& text) {
    size_t pos = 0;
    int value = 0;
    try {
        value = stoi(text, &pos);
    } catch (const logic_error&) {
        // stoi reports both bad input and overflow as logic_error subclasses
        pos = 0;
    }
    if (pos == 0 || pos != text.size()) {
        throw invalid_argument(flag + " expects an integer, got '" + text + "'");
    }
    return value;
}

SolverOptions parse_solver_options(int argc, const char* const* argv) {
    SolverOptions options;
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--initial-file" && i + 1 < argc) { options.initial_file = argv[++i]; }
        else if (a == "--goal-file" && i + 1 < argc) { options.goal_file = argv[++i]; }
        else if (a == "--max-expansions" && i + 1 < argc) { options.max_expansions = parse_int_argument(a, argv[++i]); }
        else if (a == "--help") { options.help = true; }
    }
    if (options.max_expansions < 0) {
        throw invalid_argument("--max-expansions must be >= 0");
    }
    return options;
}
