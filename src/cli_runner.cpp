// ============================================================================
// cli_runner.cpp — implementation for cli_runner.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "cli_runner.hpp"

#include <istream>
#include <ostream>

#include "nlohmann/json.hpp"

#include "cadastro/cpf.hpp"
#include "cpf_report.hpp"

using json = nlohmann::json;

namespace cadastro {

namespace {

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string dim  (const std::string& s) const { return enabled ? "\033[2m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
  std::string green(const std::string& s) const { return enabled ? "\033[32m"+s+"\033[0m" : s; }
};

// Trim spaces/tabs/CR at both ends (stdin lines may come from Windows files).
std::string trim(const std::string& s) {
  size_t a = 0, b = s.size();
  while (a < b && (s[a]==' ' || s[a]=='\t' || s[a]=='\r')) ++a;
  while (b > a && (s[b-1]==' ' || s[b-1]=='\t' || s[b-1]=='\r')) --b;
  return s.substr(a, b-a);
}

std::vector<std::string> read_lines(std::istream& in) {
  std::vector<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (!line.empty()) lines.push_back(line);
  }
  return lines;
}

// One line per input: "<input>  →  <formatted>  ok" or the failure reason.
void print_verdict(const CpfReport& r, const Ansi& ansi, std::ostream& out) {
  out << r.input;
  if (r.parsed) out << ansi.dim("  \xE2\x86\x92  ") << r.formatted;
  if (r.valid) out << "  " << ansi.green("ok") << "\n";
  else         out << "  " << ansi.red(describe(r.error, r.allow_missing_check_digits)) << "\n";
}

int run_compare(const CliOptions& opts, const Ansi& ansi, std::ostream& out) {
  const std::string& a = opts.compare[0];
  const std::string& b = opts.compare[1];
  bool same = compare_strings(a.c_str(), b.c_str());
  if (!opts.quiet) {
    if (opts.format == "json") {
      json j;
      j["a"] = a;
      j["b"] = b;
      j["same"] = same;
      out << dump_json(j) << "\n";
    } else if (opts.format == "raw") {
      out << (same ? "same" : "different") << "\n";
    } else {
      out << a << "  " << b << "  "
          << (same ? ansi.green("same CPF") : ansi.red("different CPF (or malformed input)"))
          << "\n";
    }
  }
  return same ? EXIT_VALID : EXIT_INVALID;
}

} // namespace

int run_cli(CliOptions opts, std::istream& in, std::ostream& out, std::ostream& err) {
  Ansi ansi;
  ansi.enabled = opts.color && opts.format == "pretty";

  // -------- compare mode --------
  if (!opts.compare.empty()) {
    if (opts.compare.size() != 2) {
      err << ansi.red("error: --compare takes exactly two values") << "\n";
      return EXIT_USAGE;
    }
    if (!opts.inputs.empty()) {
      err << ansi.red("error: --compare does not take extra CPF arguments") << "\n";
      return EXIT_USAGE;
    }
    return run_compare(opts, ansi, out);
  }

  // -------- validate mode --------
  if (opts.inputs.empty() && opts.read_stdin) {
    opts.inputs = read_lines(in);
  }
  if (opts.inputs.empty()) {
    err << ansi.red("error: no CPF given") << "\n";
    return EXIT_USAGE;
  }

  std::vector<CpfReport> reports;
  reports.reserve(opts.inputs.size());
  for (const auto& s : opts.inputs) {
    reports.push_back(make_report(s, opts.allow_missing_check_digits));
  }

  bool all_valid = true;
  for (const auto& r : reports) all_valid = all_valid && r.valid;
  const int status = all_valid ? EXIT_VALID : EXIT_INVALID;

  if (opts.quiet) return status;

  if (opts.format == "json") {
    json arr = json::array();
    for (const auto& r : reports) arr.push_back(to_json(r));
    out << dump_json(arr) << "\n";
  } else if (opts.format == "raw") {
    // Only valid numbers are printed, in canonical form.
    for (const auto& r : reports) {
      if (r.valid && r.parsed) out << r.formatted << "\n";
    }
  } else if (opts.show) {
    size_t idx = 1;
    for (const auto& r : reports) {
      out << ansi.bold("#" + std::to_string(idx++)) << "\n" << to_pretty(r) << "\n";
    }
  } else {
    for (const auto& r : reports) print_verdict(r, ansi, out);
  }

  return status;
}

} // namespace cadastro
