#ifndef __CLI_OPTIONS_HPP___
#define __CLI_OPTIONS_HPP___

#include <string>

/**
 * @file cli_options.hpp
 * @brief Command line options of the `eight-puzzle` tool.
 */

struct SolverOptions {
    std::string initial_file;  // empty: built-in reference instance
    std::string goal_file;     // empty: built-in reference goal
    int max_expansions = 0;    // 0: no limit
    bool help = false;
};

/**
 * @brief Parse a whole string as a base-10 int.
 *
 * @param flag Option name, used in the error message.
 * @param text Value given on the command line.
 * @throws std::invalid_argument if `text` is not an integer or does not fit an int.
 */
int parse_int_argument(const std::string& flag, const std::string& text);

/**
 * @brief Parse `--initial-file`, `--goal-file`, `--max-expansions` and `--help`.
 *
 * Unknown arguments are ignored.
 *
 * @throws std::invalid_argument on a malformed or negative `--max-expansions`.
 */
SolverOptions parse_solver_options(int argc, const char* const* argv);

#endif // __CLI_OPTIONS_HPP___
