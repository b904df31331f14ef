#pragma once
/**
 * @file cli_runner.hpp
 * @brief The modes of cadastro-cli, separated from option parsing.
 *
 * @details
 * cli/main.cpp only turns argv into a CliOptions (CLI11) and calls run_cli().
 * Everything after that (reading stdin, validating, printing, choosing the exit
 * status) lives here so it can be driven from tests with string streams.
 *
 * EXIT STATUS
 * -----------
 * - EXIT_VALID   (0): every input valid, or --compare found the same number
 * - EXIT_INVALID (1): some input invalid, or --compare found different numbers
 * - EXIT_USAGE   (2): no input, or options that cannot be combined
 */

#include <iosfwd>
#include <string>
#include <vector>

namespace cadastro {

static constexpr int EXIT_VALID   = 0;
static constexpr int EXIT_INVALID = 1;
static constexpr int EXIT_USAGE   = 2;

/// @brief Parsed command line of cadastro-cli.
struct CliOptions {
    std::vector<std::string> inputs;           ///< Positional CPF arguments
    std::vector<std::string> compare;          ///< --compare A B (empty or exactly two)
    std::string format = "pretty";             ///< pretty|json|raw
    bool show  = false;                        ///< --show
    bool allow_missing_check_digits = false;   ///< --allow-missing-check-digits
    bool quiet = false;                        ///< -q/--quiet
    bool color = false;                        ///< ANSI styling (decided by the caller)
    bool read_stdin = false;                   ///< Take inputs from `in` when none are given
};

/**
 * @brief Run one cadastro-cli invocation.
 * @param opts Parsed options.
 * @param in   Line source used when `opts.inputs` is empty and `opts.read_stdin`.
 *             Blank lines are skipped; surrounding spaces/tabs/CR are trimmed.
 * @param out  Results.
 * @param err  Diagnostics ("error: ..." lines).
 * @return EXIT_VALID, EXIT_INVALID or EXIT_USAGE. Never throws on bad input text.
 */
int run_cli(CliOptions opts, std::istream& in, std::ostream& out, std::ostream& err);

} // namespace cadastro
