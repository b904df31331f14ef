// ============================================================================
// cpf_report.cpp — implementation for cpf_report.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "cpf_report.hpp"

#include <iomanip>   // std::setw for aligned pretty output
#include <sstream>   // std::ostringstream to assemble to_pretty()

namespace cadastro {

CpfReport make_report(const std::string& raw, bool allow_missing_check_digits) {
    CpfReport r;
    r.input = raw;
    r.allow_missing_check_digits = allow_missing_check_digits;
    r.error = require_valid(raw.c_str(), allow_missing_check_digits);
    r.valid = (r.error == CpfError::None);

    // Parsing always accepts 9 digits, so strict-mode length failures on
    // 9-digit input still get their components filled in.
    etl::optional<Cpf> cpf = Cpf::create(raw.c_str());
    if (!cpf.has_value()) return r;

    r.parsed        = true;
    r.digits        = cpf->digits_only().c_str();
    r.formatted     = cpf->to_string().c_str();
    r.random_digits = cpf->random_digits().c_str();
    r.region_digit  = cpf->region_digit();
    r.region        = cpf->region();
    r.check_digits  = cpf->check_digits().c_str();
    return r;
}

std::string describe(CpfError error, bool allow_missing_check_digits) {
    switch (error) {
        case CpfError::None:
            return "valid CPF";
        case CpfError::InvalidCharacters:
            return "contains letters or other characters that are not digits, dots or dashes";
        case CpfError::InvalidLength:
            return allow_missing_check_digits ? "wrong length: expected 9 or 11 digits"
                                              : "wrong length: expected 11 digits";
        case CpfError::InvalidCheckDigit:
            return "check digits do not match; the number was probably mistyped";
        case CpfError::InvalidSpecificId:
            return "this CPF does not exist (repeated-digit number)";
    }
    return "unknown error";
}

nlohmann::json to_json(const CpfReport& report) {
    nlohmann::json j;
    j["input"]  = report.input;
    j["valid"]  = report.valid;
    j["error"]  = to_string(report.error);
    j["parsed"] = report.parsed;
    if (report.parsed) {
        j["digits"]        = report.digits;
        j["formatted"]     = report.formatted;
        j["random_digits"] = report.random_digits;
        j["region_digit"]  = std::string(1, report.region_digit);
        j["region"]        = report.region;
        j["check_digits"]  = report.check_digits;
    }
    return j;
}

std::string dump_json(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string to_pretty(const CpfReport& report) {
    std::ostringstream os;
    auto kv = [&os](const char* k, const std::string& v) {
        os << "  " << std::left << std::setw(16) << (std::string("[") + k + "]")
           << (v.empty() ? "(empty)" : v) << "\n";
    };

    kv("INPUT", report.input);
    if (report.parsed) {
        kv("CPF",          report.formatted);
        kv("RANDOM",       report.random_digits);
        kv("REGION DIGIT", std::string(1, report.region_digit));
        kv("REGION",       std::to_string(report.region));
        kv("CHECK DIGITS", report.check_digits);
    }
    kv("VALID", report.valid ? "yes" : "no");
    if (!report.valid) kv("REASON", describe(report.error, report.allow_missing_check_digits));
    return os.str();
}

} // namespace cadastro
