/**
 * @file main.cpp
 * @brief cadastro-cli — one-shot CPF validator, formatter and comparer.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11) into a cadastro::CliOptions.
 *  - Decide terminal-dependent settings (colors, whether stdin is a pipe).
 *  - Hand over to cadastro::run_cli(), which does the work and picks the exit status.
 *
 * Exit status:
 *  - 0: every input is valid (or --compare found the same number)
 *  - 1: at least one input is invalid (or --compare found different numbers)
 *  - 2: usage error (bad options, no input)
 *
 * Notes:
 *  - Colors only when stdout is a TTY, --format is pretty, --no-color is not
 *    given and NO_COLOR is unset.
 *  - Nothing is written to disk.
 */

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>
#include <iostream>

#include <unistd.h> // isatty

#include "CLI/CLI11.hpp"

#include "cli_runner.hpp"

using namespace cadastro;

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }
static bool is_tty_stdin()  { return ::isatty(fileno(stdin)); }

static bool no_color_env() {
  const char* v = std::getenv("NO_COLOR");
  return v && *v;
}

int main(int argc, char** argv) {
  CliOptions opts;
  bool opt_no_color = false;

  CLI::App app{"cadastro-cli — validate, format and compare CPF numbers"};

  app.add_option("cpf", opts.inputs, "CPF numbers (dots, dashes and spaces allowed); read from stdin when omitted");
  app.add_flag("--show", opts.show, "Print the components of each number");
  app.add_option("--compare", opts.compare, "Check whether two strings are the same CPF: --compare <a> <b>")->expected(2);
  app.add_flag("--allow-missing-check-digits", opts.allow_missing_check_digits, "Accept 9-digit numbers without check digits");
  app.add_option("--format", opts.format, "Output format: pretty|json|raw")->check(CLI::IsMember({"pretty","json","raw"}));
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");
  app.add_flag("-q,--quiet", opts.quiet, "No output; exit status only");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    // --help prints and succeeds; every real parse error maps to the usage status.
    int code = app.exit(e);
    return code == 0 ? EXIT_VALID : EXIT_USAGE;
  }

  opts.color = !opt_no_color && !no_color_env() && is_tty_stdout();
  opts.read_stdin = !is_tty_stdin();

  int status = run_cli(opts, std::cin, std::cout, std::cerr);
  if (status == EXIT_USAGE && opts.inputs.empty() && opts.compare.empty()) {
    std::cerr << app.help();
  }
  return status;
}
