#pragma once
/**
 * @file cpf_report.hpp
 * @brief Host-side summaries of CPF checks, for the CLI and scripts.
 *
 * @details
 * PURPOSE
 * -------
 * The core (`cadastro/cpf.hpp`) answers yes/no questions and returns error kinds.
 * Tools running on a Linux host also need to *show* the answer: which rule
 * failed, in words a person understands, or as a JSON document another
 * program can read. This header collects that presentation layer so the CLI
 * stays a thin option parser.
 *
 * WHAT THIS DOES
 * --------------
 * - make_report() runs require_valid() and Cpf::create() on one input and
 *   records everything worth printing in a CpfReport.
 * - describe() turns a CpfError into one sentence.
 * - to_json() / to_pretty() render a report; dump_json() serializes JSON
 *   without throwing on non-UTF-8 input text.
 *
 * Unlike the core, this layer uses std::string and nlohmann::json freely; it is
 * not built for microcontrollers.
 *
 * EXAMPLE
 * -------
 * @code
 *   auto r = cadastro::make_report("123.456.789-09");
 *   std::cout << cadastro::dump_json(cadastro::to_json(r)) << "\n";
 *   // { "input": "123.456.789-09", "valid": true, "error": "none",
 *   //   "parsed": true, "digits": "12345678909", ... }
 * @endcode
 */

#include <string>
#include "nlohmann/json.hpp"
#include "cadastro/cpf.hpp"

namespace cadastro {

/// @brief Everything known about one input after validation.
struct CpfReport {
    std::string input;                   ///< Text as received
    CpfError    error  = CpfError::None; ///< require_valid() result
    bool        valid  = false;          ///< error == None
    bool        parsed = false;          ///< Cpf::create() succeeded; fields below are set

    std::string digits;                  ///< 11 digits, check digits appended if missing
    std::string formatted;               ///< "AAA.AAA.AAB-ZZ"
    std::string random_digits;           ///< digits 0–7
    char        region_digit = 0;        ///< digit 8
    int         region       = 0;        ///< 1–10
    std::string check_digits;            ///< digits 9–10

    bool        allow_missing_check_digits = false;  ///< Mode the input was checked in
};

/**
 * @brief Validate one input and collect the results.
 * @param raw Text to check (punctuation allowed).
 * @param allow_missing_check_digits Accept 9-digit input as valid.
 */
CpfReport make_report(const std::string& raw, bool allow_missing_check_digits = false);

/**
 * @brief One-sentence explanation of an error kind.
 * @param allow_missing_check_digits Changes the length hint to "9 or 11 digits".
 */
std::string describe(CpfError error, bool allow_missing_check_digits = false);

/// @brief JSON object for a report. Structural keys appear only when `parsed`.
nlohmann::json to_json(const CpfReport& report);

/**
 * @brief Serialize JSON for output, indented by 2.
 *
 * Inputs are user text and may not be valid UTF-8; invalid bytes are written
 * as U+FFFD instead of making nlohmann::json throw.
 */
std::string dump_json(const nlohmann::json& j);

/// @brief Multi-line "[KEY] value" dump of a report, one field per line.
std::string to_pretty(const CpfReport& report);

} // namespace cadastro
