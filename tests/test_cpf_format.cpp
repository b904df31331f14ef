#include <doctest/doctest.h>
#include "cadastro/cpf.hpp"
#include <string>

using namespace cadastro;

TEST_CASE("strip_symbols removes whitespace, dots and dashes") {
    CHECK(strip_symbols("12345678910") == StrippedStr("12345678910"));
    CHECK(strip_symbols("123.456.789-10") == StrippedStr("12345678910"));
    CHECK(strip_symbols(" 123.456.789 10  ") == StrippedStr("12345678910"));
    CHECK(strip_symbols("\t123\n456\r789-10") == StrippedStr("12345678910"));
    CHECK(strip_symbols(nullptr).empty());
}

TEST_CASE("strip_symbols keeps every other character") {
    CHECK(strip_symbols("123/456.789-XX") == StrippedStr("123/456789XX"));
    CHECK(strip_symbols("a_b,c") == StrippedStr("a_b,c"));
}

TEST_CASE("strip_symbols is idempotent") {
    const char* samples[] = { "", "...", " 1-2.3 ", "123/456.789-XX", "111.111.111-11", "-. \t" };
    for (const char* s : samples) {
        CAPTURE(s);
        StrippedStr once = strip_symbols(s);
        CHECK(strip_symbols(once.c_str()) == once);
    }
}

TEST_CASE("require_format: characters") {
    CHECK(require_format("123456789XX") == CpfError::InvalidCharacters);
    CHECK(require_format("123456789XX", true) == CpfError::InvalidCharacters);
    // No stripping here: punctuation is a bad character.
    CHECK(require_format("123.456.789-10") == CpfError::InvalidCharacters);
    // Empty input has no digits at all.
    CHECK(require_format("") == CpfError::InvalidCharacters);
    CHECK(require_format(nullptr) == CpfError::InvalidCharacters);
}

TEST_CASE("require_format: characters are checked before length") {
    CHECK(require_format("1X") == CpfError::InvalidCharacters);
    CHECK(require_format("12345678910999999999999999X") == CpfError::InvalidCharacters);
}

TEST_CASE("require_format: length in strict mode") {
    CHECK(require_format("12345678910") == CpfError::None);
    CHECK(require_format("1234567891099") == CpfError::InvalidLength);
    CHECK(require_format("123456789") == CpfError::InvalidLength);
    CHECK(require_format("1") == CpfError::InvalidLength);
}

TEST_CASE("require_format: length in permissive mode") {
    CHECK(require_format("123456789", true) == CpfError::None);
    CHECK(require_format("12345678910", true) == CpfError::None);
    CHECK(require_format("1234567891099", true) == CpfError::InvalidLength);
    CHECK(require_format("1234567891", true) == CpfError::InvalidLength);
}

TEST_CASE("error categories") {
    CHECK(is_format_error(CpfError::InvalidCharacters));
    CHECK(is_format_error(CpfError::InvalidLength));
    CHECK_FALSE(is_format_error(CpfError::InvalidCheckDigit));
    CHECK(is_value_error(CpfError::InvalidCheckDigit));
    CHECK(is_value_error(CpfError::InvalidSpecificId));
    CHECK_FALSE(is_value_error(CpfError::InvalidLength));
    CHECK_FALSE(is_error(CpfError::None));
    CHECK(is_error(CpfError::InvalidSpecificId));
    CHECK(std::string(to_string(CpfError::InvalidLength)) == "invalid_length");
}

TEST_CASE("strip_symbols reports when output capacity runs out") {
    // 100 digits separated by dots: every digit is kept.
    std::string raw;
    for (int i = 0; i < 100; ++i) { raw += char('0' + i % 10); raw += '.'; }

    etl::string<128> wide;
    CHECK(strip_symbols(raw.c_str(), wide));
    CHECK(wide.size() == 100);
    CHECK(wide[99] == '9');

    etl::string<16> narrow;
    CHECK_FALSE(strip_symbols(raw.c_str(), narrow));
    CHECK(narrow.size() == 16);

    // The convenience form keeps the first CADASTRO_RAW_MAX characters.
    CHECK(strip_symbols(raw.c_str()).size() == CADASTRO_RAW_MAX);
}

TEST_CASE("long input is still validated on the full text") {
    std::string raw = "123.456.789-09";
    raw += std::string(200, ' ');
    CHECK(require_valid(raw.c_str()) == CpfError::None);
    raw += "1";
    CHECK(require_valid(raw.c_str()) == CpfError::InvalidLength);
}
