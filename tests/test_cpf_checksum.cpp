#include <doctest/doctest.h>
#include "cadastro/cpf.hpp"

using namespace cadastro;

TEST_CASE("compute_check_digits matches known numbers") {
    CHECK(compute_check_digits("100000987") == CheckStr("44"));
    CHECK(compute_check_digits("280012389") == CheckStr("38"));
    CHECK(compute_check_digits("111111111") == CheckStr("11"));
    CHECK(compute_check_digits("123456789") == CheckStr("09"));
}

TEST_CASE("compute_check_digits uses only the first nine digits") {
    CHECK(compute_check_digits("10000098744") == CheckStr("44"));
    CHECK(compute_check_digits("10000098799") == CheckStr("44"));
}

TEST_CASE("compute_check_digits reduces mod 11 then mod 10") {
    // 123456789: first sum 285, 285 % 11 == 10 -> dv1 0
    CHECK(compute_check_digits("123456789")[0] == '0');
    // 000000018: second sum 98, 98 % 11 == 10 -> dv2 0
    CHECK(compute_check_digits("000000018") == CheckStr("30"));
    CHECK(compute_check_digits("000000000") == CheckStr("00"));
}

TEST_CASE("has_correct_check_digits") {
    CHECK(has_correct_check_digits("11111111111"));
    CHECK_FALSE(has_correct_check_digits("11111111122"));
    CHECK(has_correct_check_digits("12345678909"));
    CHECK_FALSE(has_correct_check_digits("12345678910"));
    CHECK(has_correct_check_digits("10000098744"));
}

TEST_CASE("has_correct_check_digits requires exactly eleven characters") {
    CHECK_FALSE(has_correct_check_digits("123456789"));
    CHECK_FALSE(has_correct_check_digits("123456789090"));
    CHECK_FALSE(has_correct_check_digits(""));
    CHECK_FALSE(has_correct_check_digits(nullptr));
}

TEST_CASE("is_degenerate flags every repeated-digit number") {
    const char* repeated[] = {
        "00000000000", "11111111111", "22222222222", "33333333333", "44444444444",
        "55555555555", "66666666666", "77777777777", "88888888888", "99999999999",
    };
    for (const char* s : repeated) {
        CAPTURE(s);
        CHECK(is_degenerate(s));
        // They all pass the checksum, which is why they need their own rule.
        CHECK(has_correct_check_digits(s));
    }
    CHECK_FALSE(is_degenerate("12312312312"));
}

TEST_CASE("is_degenerate looks at the first nine digits only") {
    CHECK(is_degenerate("11111111199"));
    CHECK_FALSE(is_degenerate("11111111211"));
    CHECK_FALSE(is_degenerate("1111"));
}
