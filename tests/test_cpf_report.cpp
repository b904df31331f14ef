#include <doctest/doctest.h>
#include "cpf_report.hpp"

using namespace cadastro;

TEST_CASE("make_report fills components for a valid number") {
    CpfReport r = make_report("123.456.789-09");
    CHECK(r.valid);
    CHECK(r.parsed);
    CHECK(r.error == CpfError::None);
    CHECK(r.digits == "12345678909");
    CHECK(r.formatted == "123.456.789-09");
    CHECK(r.random_digits == "12345678");
    CHECK(r.region_digit == '9');
    CHECK(r.region == 9);
    CHECK(r.check_digits == "09");
}

TEST_CASE("make_report keeps components of well-formed invalid numbers") {
    CpfReport r = make_report("111.111.111-11");
    CHECK_FALSE(r.valid);
    CHECK(r.parsed);
    CHECK(r.error == CpfError::InvalidSpecificId);
    CHECK(r.formatted == "111.111.111-11");
}

TEST_CASE("make_report on nine digits depends on the mode") {
    CpfReport strict = make_report("100000987");
    CHECK(strict.error == CpfError::InvalidLength);
    CHECK(strict.parsed);
    CHECK(strict.digits == "10000098744");

    CpfReport permissive = make_report("100000987", true);
    CHECK(permissive.valid);
    CHECK(permissive.formatted == "100.000.987-44");
}

TEST_CASE("make_report on malformed input") {
    CpfReport r = make_report("12x");
    CHECK_FALSE(r.valid);
    CHECK_FALSE(r.parsed);
    CHECK(r.error == CpfError::InvalidCharacters);
    CHECK(r.digits.empty());
}

TEST_CASE("describe mentions the accepted lengths") {
    CHECK(describe(CpfError::InvalidLength).find("11 digits") != std::string::npos);
    CHECK(describe(CpfError::InvalidLength, true).find("9 or 11") != std::string::npos);
    CHECK(describe(CpfError::None) == "valid CPF");
}

TEST_CASE("to_json carries structural keys only for parsed input") {
    nlohmann::json ok = to_json(make_report("280.012.389-38"));
    CHECK(ok["valid"] == true);
    CHECK(ok["error"] == "none");
    CHECK(ok["digits"] == "28001238938");
    CHECK(ok["region_digit"] == "9");
    CHECK(ok["region"] == 9);
    CHECK(ok["check_digits"] == "38");

    nlohmann::json bad = to_json(make_report("abc"));
    CHECK(bad["valid"] == false);
    CHECK(bad["error"] == "invalid_characters");
    CHECK(bad["parsed"] == false);
    CHECK_FALSE(bad.contains("digits"));
}

TEST_CASE("to_pretty lists fields and the failure reason") {
    std::string text = to_pretty(make_report("123.456.789-10"));
    CHECK(text.find("[CPF]") != std::string::npos);
    CHECK(text.find("123.456.789-10") != std::string::npos);
    CHECK(text.find("[VALID]") != std::string::npos);
    CHECK(text.find("mistyped") != std::string::npos);
}

TEST_CASE("dump_json accepts input that is not valid UTF-8") {
    CpfReport r = make_report("123\xff");
    CHECK(r.error == CpfError::InvalidCharacters);

    nlohmann::json arr = nlohmann::json::array();
    arr.push_back(to_json(r));

    std::string text;
    CHECK_NOTHROW(text = dump_json(arr));
    // The bad byte becomes U+FFFD.
    CHECK(text.find("123\xEF\xBF\xBD") != std::string::npos);
    CHECK(text.find("invalid_characters") != std::string::npos);
}
