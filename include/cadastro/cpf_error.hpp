/**
 * @file cpf_error.hpp
 * @brief Cadastro error kinds — why a CPF string was rejected.
 *
 * Every validating call in cadastro-core reports failure as a `CpfError` value
 * instead of throwing. The kinds form two categories so callers can react
 * coarsely (the text could not be read as a CPF at all) or precisely (which
 * rule failed):
 *
 * | Kind                | Category | Meaning                                         |
 * |---------------------|----------|-------------------------------------------------|
 * | `InvalidCharacters` | format   | something other than digits, spaces, `.` or `-` |
 * | `InvalidLength`     | format   | digit count is not 11 (or 9 when allowed)       |
 * | `InvalidCheckDigit` | value    | the two check digits do not match               |
 * | `InvalidSpecificId` | value    | repeated-digit number such as 111.111.111-11    |
 *
 * `CpfError::None` means the check passed.
 *
 * ### Example
 * @code
 * switch (cadastro::require_valid(user_text)) {
 *   case CpfError::None:              puts("ok"); break;
 *   case CpfError::InvalidCharacters: puts("digits, dots and dashes only"); break;
 *   case CpfError::InvalidLength:     puts("type 11 digits"); break;
 *   case CpfError::InvalidCheckDigit: puts("mistyped number"); break;
 *   case CpfError::InvalidSpecificId: puts("this CPF does not exist"); break;
 * }
 * @endcode
 *
 * @note No exceptions, no heap — safe on Linux and on Arduino/ESP32 builds.
 */

#pragma once
#include <stdint.h>

namespace cadastro {

/// @brief Result of a CPF format or value check.
enum class CpfError : uint8_t {
    None = 0,           ///< Check passed
    InvalidCharacters,  ///< Stripped input contains a non-digit (or is empty)
    InvalidLength,      ///< Stripped input has an unaccepted number of digits
    InvalidCheckDigit,  ///< Check digits do not match the first nine digits
    InvalidSpecificId   ///< Checksum matches but the number is administratively invalid
};

/// @brief True for any failure kind.
inline bool is_error(CpfError e) { return e != CpfError::None; }

/// @brief True when the input could not be read as a 9/11-digit candidate.
inline bool is_format_error(CpfError e) {
    return e == CpfError::InvalidCharacters || e == CpfError::InvalidLength;
}

/// @brief True when the input was well formed but names an invalid number.
inline bool is_value_error(CpfError e) {
    return e == CpfError::InvalidCheckDigit || e == CpfError::InvalidSpecificId;
}

/**
 * @brief Stable snake_case name for an error kind (used in JSON output and logs).
 * @return A static string; never nullptr.
 */
inline const char* to_string(CpfError e) {
    switch (e) {
        case CpfError::None:              return "none";
        case CpfError::InvalidCharacters: return "invalid_characters";
        case CpfError::InvalidLength:     return "invalid_length";
        case CpfError::InvalidCheckDigit: return "invalid_check_digit";
        case CpfError::InvalidSpecificId: return "invalid_specific_id";
    }
    return "unknown";
}

} // namespace cadastro
