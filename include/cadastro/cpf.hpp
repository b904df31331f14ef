/**
 * @page cadastro-cpf Cadastro CPF
 * @file cpf.hpp
 * @brief Cadastro CPF — validation and formatting of Brazilian taxpayer numbers.
 *
 * This header defines the `Cpf` value type and the free functions used to check
 * CPF (Cadastro de Pessoas Físicas) numbers typed by people or read from records.
 *
 * @section cadastro_cpf_layout CPF Layout
 *
 * A CPF is 11 decimal digits, usually written as `AAA.AAA.AAB-ZZ`:
 *
 * | Positions | Field          | Description                                  |
 * |-----------|----------------|----------------------------------------------|
 * | 0–7       | Random digits  | Sequential registry number                   |
 * | 8         | Region digit   | Issuing fiscal region (0 means region 10)    |
 * | 9–10      | Check digits   | Derived from positions 0–8                   |
 *
 * @section cadastro_cpf_check Check Digits
 *
 * Both check digits are a weighted sum reduced `mod 11` and then `mod 10`:
 * - `dv1`: digits 0–8 weighted 1..9
 * - `dv2`: digits 0–8 followed by `dv1`, weighted 0..9
 *
 * Numbers made of one repeated digit (`000.000.000-00` … `999.999.999-99`) pass
 * the checksum but are not issued, so they are always reported invalid.
 *
 * ### Example
 * @code
 * auto cpf = cadastro::Cpf::create("123.456.789-09");
 * if (cpf) {
 *     cpf->to_string();    // "123.456.789-09"
 *     cpf->digits_only();  // "12345678909"
 *     cpf->region();       // 9
 *     cpf->is_valid();     // true
 * }
 *
 * cadastro::is_valid("111.111.111-11");                // false (repeated digits)
 * cadastro::compare_strings("12345678909", "123.456.789-09"); // true
 * @endcode
 *
 * Input handling: spaces (and other ASCII whitespace), dots and dashes are
 * ignored anywhere in the input. Any other non-digit character makes the input
 * malformed.
 *
 * @note No exceptions, no heap: ETL fixed-capacity strings only, so the same
 *       code runs on Linux hosts and on ESP32/Arduino boards.
 */

#ifndef CADASTRO_CPF_HPP
#define CADASTRO_CPF_HPP

#include "etl/string.h"
#include "etl/optional.h"
#include "cadastro/cpf_error.hpp"
#include <stdint.h>
#include <stddef.h>

#ifndef ARDUINO
  #include <functional>
#endif

namespace cadastro {

// Tunables and fixed sizes.
static constexpr size_t CPF_DIGITS       = 11;  ///< Digits in a complete CPF
static constexpr size_t CPF_BASE_DIGITS  = 9;   ///< Digits before the check digits
static constexpr size_t CPF_CHECK_DIGITS = 2;   ///< Trailing check digits
static constexpr size_t CPF_FORMATTED    = 14;  ///< Length of "AAA.AAA.AAB-ZZ"
static constexpr size_t CADASTRO_RAW_MAX = 64;  ///< Capacity of strip_symbols() output

using DigitStr     = etl::string<CPF_DIGITS>;
using RandomStr    = etl::string<8>;
using CheckStr     = etl::string<CPF_CHECK_DIGITS>;
using FormattedStr = etl::string<CPF_FORMATTED>;
using ReprStr      = etl::string<CPF_FORMATTED + 7>;  ///< `Cpf("...")`
using StrippedStr  = etl::string<CADASTRO_RAW_MAX>;

/**
 * @class Cpf
 * @brief Immutable CPF number held as its 11 canonical digits.
 *
 * A `Cpf` can only be obtained from `Cpf::create()`, so every instance holds
 * exactly 11 ASCII digits. Whether those digits form a *valid* CPF is decided
 * once at creation and exposed by `is_valid()`; a well-formed but invalid
 * number is still a `Cpf`.
 *
 * Equality and hashing use the stored digits only:
 * `"111.111.111-11"`, `"11111111111"` and `"111111111"` (check digits
 * computed) all create equal values.
 */
class Cpf {
public:
    /**
     * @brief Parse a CPF string.
     *
     * Whitespace, `.` and `-` are removed first. The remaining text must be
     * 11 digits, or 9 digits in which case both check digits are computed
     * and appended.
     *
     * @param raw   Null-terminated input. nullptr is treated as "".
     * @param error Optional out-parameter; receives `CpfError::None` on success
     *              or `InvalidCharacters` / `InvalidLength` on failure.
     * @return The parsed value, or an empty optional when the input is malformed.
     *
     * @note A wrong checksum does NOT make creation fail; check `is_valid()`.
     */
    static etl::optional<Cpf> create(const char* raw, CpfError* error = nullptr);

    /**
     * @brief Compare with a number given as text.
     * @return false if `raw` cannot be parsed; otherwise `*this == Cpf(raw)`.
     */
    bool equals_string(const char* raw) const;

    /// @brief True if the check digits match and the number is not a repeated-digit one.
    bool is_valid() const { return valid_; }

    /// @brief The 11 digits, no punctuation (e.g. "12345678909").
    const DigitStr& digits_only() const { return digits_; }

    /// @brief Digits 0–7.
    RandomStr random_digits() const;

    /// @brief Digit 8, as a character.
    char region_digit() const { return digits_[8]; }

    /**
     * @brief Fiscal region number, 1–10.
     *
     * Same as `region_digit()` except digit '0', which stands for region 10.
     */
    uint8_t region() const;

    /// @brief Digits 9–10.
    CheckStr check_digits() const;

    /// @brief Canonical form "AAA.AAA.AAB-ZZ".
    FormattedStr to_string() const;

    /// @brief Diagnostic form, e.g. `Cpf("123.456.789-09")`. Not meant to be parsed.
    ReprStr repr() const;

    /// @brief FNV-1a over the 11 stored digits.
    size_t hash() const;

    bool operator==(const Cpf& other) const { return digits_ == other.digits_; }
    bool operator!=(const Cpf& other) const { return !(*this == other); }

private:
    Cpf(const DigitStr& digits, bool valid) : digits_(digits), valid_(valid) {}

    DigitStr digits_;
    bool     valid_;
};

// =============================================================================
// Free functions
// =============================================================================

/**
 * @brief Remove ASCII whitespace, `.` and `-` from a string into `out`.
 *
 * Every other character is kept, in order ("123/456.789-XX" → "123/456789XX").
 * `out` is cleared first; its capacity is chosen by the caller.
 *
 * @return true if every kept character fit; false if `out` filled up and the
 *         rest of the input was dropped.
 */
bool strip_symbols(const char* raw, etl::istring& out);

/**
 * @brief Remove ASCII whitespace, `.` and `-` from a string.
 *
 * Convenience form with a fixed capacity of `CADASTRO_RAW_MAX` characters.
 * Anything kept beyond that is DROPPED; use the `etl::istring&` overload to
 * learn whether that happened. Validation functions never go through here;
 * they scan the raw input directly, so long input is still judged correctly.
 */
StrippedStr strip_symbols(const char* raw);

/**
 * @brief Check that an already-stripped string looks like a CPF.
 * @param digits Candidate text (no stripping is done here).
 * @param allow_missing_check_digits Also accept 9 digits.
 * @return `InvalidCharacters` if empty or any character is not a digit,
 *         `InvalidLength` if the digit count is not accepted, else `None`.
 */
CpfError require_format(const char* digits, bool allow_missing_check_digits = false);

/**
 * @brief Compute the two check digits for a CPF.
 * @param digits At least 9 digits; only the first 9 are used, so a complete
 *               11-digit CPF may be passed.
 * @return Two characters, e.g. "44" for "100000987".
 */
CheckStr compute_check_digits(const char* digits);

/**
 * @brief True if the last two of 11 digits match `compute_check_digits()`.
 * @return false when `digits` is not exactly 11 characters long.
 */
bool has_correct_check_digits(const char* digits);

/**
 * @brief True if the first 9 digits are all the same (111.111.111-11 etc.).
 *
 * These numbers always satisfy the checksum but are never issued.
 */
bool is_degenerate(const char* digits);

/**
 * @brief Validate a CPF string. Never fails; every problem yields false.
 * @see require_valid
 */
bool is_valid(const char* raw, bool allow_missing_check_digits = false);

/**
 * @brief Validate a CPF string and report the first failing rule.
 *
 * Checks, in order: characters, length (counted after stripping), check
 * digits, repeated-digit numbers.
 *
 * @note With `allow_missing_check_digits` and only 9 digits supplied there is
 *       nothing to verify, so the result is `None` on format grounds alone.
 */
CpfError require_valid(const char* raw, bool allow_missing_check_digits = false);

/**
 * @brief True if two strings denote the same CPF.
 *
 * Both strings are parsed (9 or 11 digits). If either is malformed the answer
 * is false.
 */
bool compare_strings(const char* a, const char* b);

} // namespace cadastro

#ifndef ARDUINO
namespace std {
template <>
struct hash<cadastro::Cpf> {
    size_t operator()(const cadastro::Cpf& cpf) const { return cpf.hash(); }
};
} // namespace std
#endif

#endif // CADASTRO_CPF_HPP
