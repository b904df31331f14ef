// -----------------------------------------------------------------------------
// @file cpf.cpp
// @brief Implementation of the Cpf value type and the CPF check functions.
//
// Implemented here:
// - Input scanning (symbol stripping + format classification in one pass)
// - Check digit computation and verification
// - Repeated-digit (degenerate) number detection
// - Cpf creation, accessors, rendering and hashing
// - String-level validation and comparison helpers
//
// @note Heap-free and exception-free; ETL strings only.
// -----------------------------------------------------------------------------
#include "cadastro/cpf.hpp"

namespace cadastro {

namespace {

// Characters ignored in CPF input: ASCII whitespace, dots and dashes.
bool is_symbol(char c) {
    switch (c) {
        case ' ': case '\t': case '\n': case '\v': case '\f': case '\r':
        case '.': case '-':
            return true;
        default:
            return false;
    }
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

int digit_value(char c) { return is_digit(c) ? c - '0' : 0; }

// Length of a C string, capped at `cap` so long inputs are never walked fully.
size_t bounded_length(const char* s, size_t cap) {
    if (!s) return 0;
    size_t n = 0;
    while (n < cap && s[n]) ++n;
    return n;
}

// Walk `raw` once, optionally skipping symbols. Digits are copied to `out`
// until it is full; the full count is still returned through `count` so that
// overlong inputs are reported as such.
CpfError scan(const char* raw, bool strip, bool allow_missing_check_digits, DigitStr& out) {
    out.clear();
    size_t count = 0;
    bool bad_char = false;

    for (const char* p = raw ? raw : ""; *p; ++p) {
        if (strip && is_symbol(*p)) continue;
        if (!is_digit(*p)) { bad_char = true; break; }
        if (!out.full()) out.push_back(*p);
        ++count;
    }

    // An empty candidate counts as having no valid characters.
    if (bad_char || count == 0) return CpfError::InvalidCharacters;

    if (count == CPF_DIGITS) return CpfError::None;
    if (allow_missing_check_digits && count == CPF_BASE_DIGITS) return CpfError::None;
    return CpfError::InvalidLength;
}

} // namespace

// =============================================================================
// Free functions
// =============================================================================

bool strip_symbols(const char* raw, etl::istring& out) {
    out.clear();
    if (!raw) return true;
    for (const char* p = raw; *p; ++p) {
        if (is_symbol(*p)) continue;
        if (out.full()) return false;
        out.push_back(*p);
    }
    return true;
}

StrippedStr strip_symbols(const char* raw) {
    StrippedStr out;
    strip_symbols(raw, out);
    return out;
}

CpfError require_format(const char* digits, bool allow_missing_check_digits) {
    DigitStr unused;
    return scan(digits, false, allow_missing_check_digits, unused);
}

CheckStr compute_check_digits(const char* digits) {
    size_t n = bounded_length(digits, CPF_BASE_DIGITS);

    // First pass: weights 1..9.
    int sum = 0;
    for (size_t i = 0; i < n; ++i) {
        sum += digit_value(digits[i]) * static_cast<int>(i + 1);
    }
    const int dv1 = (sum % 11) % 10;

    // Second pass: the same digits plus dv1, weights 0..9.
    sum = 0;
    for (size_t i = 0; i < n; ++i) {
        sum += digit_value(digits[i]) * static_cast<int>(i);
    }
    sum += dv1 * static_cast<int>(CPF_BASE_DIGITS);
    const int dv2 = (sum % 11) % 10;

    CheckStr out;
    out.push_back(static_cast<char>('0' + dv1));
    out.push_back(static_cast<char>('0' + dv2));
    return out;
}

bool has_correct_check_digits(const char* digits) {
    if (bounded_length(digits, CPF_DIGITS + 1) != CPF_DIGITS) return false;
    CheckStr expected = compute_check_digits(digits);
    return expected[0] == digits[9] && expected[1] == digits[10];
}

bool is_degenerate(const char* digits) {
    if (bounded_length(digits, CPF_BASE_DIGITS) < CPF_BASE_DIGITS) return false;
    for (size_t i = 1; i < CPF_BASE_DIGITS; ++i) {
        if (digits[i] != digits[0]) return false;
    }
    return true;
}

CpfError require_valid(const char* raw, bool allow_missing_check_digits) {
    DigitStr digits;
    CpfError err = scan(raw, true, allow_missing_check_digits, digits);
    if (err != CpfError::None) return err;

    // Nine digits (permissive mode): no check digits to verify.
    if (digits.size() != CPF_DIGITS) return CpfError::None;

    if (!has_correct_check_digits(digits.c_str())) return CpfError::InvalidCheckDigit;
    if (is_degenerate(digits.c_str()))             return CpfError::InvalidSpecificId;
    return CpfError::None;
}

bool is_valid(const char* raw, bool allow_missing_check_digits) {
    return require_valid(raw, allow_missing_check_digits) == CpfError::None;
}

bool compare_strings(const char* a, const char* b) {
    etl::optional<Cpf> cpf_a = Cpf::create(a);
    etl::optional<Cpf> cpf_b = Cpf::create(b);
    if (!cpf_a.has_value() || !cpf_b.has_value()) return false;
    return *cpf_a == *cpf_b;
}

// =============================================================================
// Cpf
// =============================================================================

etl::optional<Cpf> Cpf::create(const char* raw, CpfError* error) {
    DigitStr digits;
    CpfError err = scan(raw, true, /*allow_missing_check_digits*/true, digits);
    if (error) *error = err;
    if (err != CpfError::None) return etl::nullopt;

    if (digits.size() == CPF_BASE_DIGITS) {
        digits += compute_check_digits(digits.c_str());
    }

    const bool valid = has_correct_check_digits(digits.c_str())
                    && !is_degenerate(digits.c_str());
    return Cpf(digits, valid);
}

bool Cpf::equals_string(const char* raw) const {
    etl::optional<Cpf> other = create(raw);
    return other.has_value() && *this == *other;
}

RandomStr Cpf::random_digits() const {
    return RandomStr(digits_.c_str(), 8);
}

uint8_t Cpf::region() const {
    // Digit zero identifies the tenth fiscal region.
    uint8_t r = static_cast<uint8_t>(region_digit() - '0');
    return r == 0 ? 10 : r;
}

CheckStr Cpf::check_digits() const {
    return CheckStr(digits_.c_str() + 9, CPF_CHECK_DIGITS);
}

FormattedStr Cpf::to_string() const {
    // AAA.AAA.AAB-ZZ
    FormattedStr out;
    for (size_t i = 0; i < CPF_DIGITS; ++i) {
        if (i == 3 || i == 6) out.push_back('.');
        if (i == 9)           out.push_back('-');
        out.push_back(digits_[i]);
    }
    return out;
}

ReprStr Cpf::repr() const {
    ReprStr out("Cpf(\"");
    out += to_string();
    out += "\")";
    return out;
}

size_t Cpf::hash() const {
    uint32_t h = 2166136261u;
    for (size_t i = 0; i < digits_.size(); ++i) {
        h ^= static_cast<uint8_t>(digits_[i]);
        h *= 16777619u;
    }
    return static_cast<size_t>(h);
}

} // namespace cadastro
