/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: bank_profile.cpp
 * ============================================================================
 */

#include "bank_profile.hpp"
#include "core/errors.hpp"

namespace tally {
namespace profiles {

namespace {

SignConvention sign_from_string(const std::string& s) {
    if (s == "signed") return SignConvention::Signed;
    if (s == "debit_credit") return SignConvention::DebitCredit;
    if (s == "type_column") return SignConvention::TypeColumn;
    throw ConfigError("Unknown sign convention: " + s);
}

} // namespace

const char* to_string(SignConvention sign) {
    switch (sign) {
    case SignConvention::Signed:      return "signed";
    case SignConvention::DebitCredit: return "debit_credit";
    case SignConvention::TypeColumn:  return "type_column";
    }
    return "signed";
}

void to_json(nlohmann::json& j, const BankProfile& p) {
    j = nlohmann::json{
        {"id", p.id},
        {"institution", p.institution},
        {"account_name", p.account_name},
        {"signature", p.signature},
        {"filename_hint", p.filename_hint},
        {"columns", {
            {"date", p.columns.date},
            {"description", p.columns.description},
            {"amount", p.columns.amount},
            {"debit", p.columns.debit},
            {"credit", p.columns.credit},
            {"type", p.columns.type},
            {"memo", p.columns.memo},
            {"category", p.columns.category},
            {"account", p.columns.account}
        }},
        {"date_formats", p.date_formats},
        {"sign", to_string(p.sign)},
        {"debit_types", p.debit_types},
        {"combine_memo", p.combine_memo},
        {"decimal_separator", std::string(1, p.decimal_separator)}
    };
}

void from_json(const nlohmann::json& j, BankProfile& p) {
    j.at("id").get_to(p.id);
    p.institution = j.value("institution", p.id);
    p.account_name = j.value("account_name", p.institution);
    j.at("signature").get_to(p.signature);
    p.filename_hint = j.value("filename_hint", std::string());

    const nlohmann::json& c = j.at("columns");
    c.at("date").get_to(p.columns.date);
    c.at("description").get_to(p.columns.description);
    p.columns.amount = c.value("amount", std::string());
    p.columns.debit = c.value("debit", std::string());
    p.columns.credit = c.value("credit", std::string());
    p.columns.type = c.value("type", std::string());
    p.columns.memo = c.value("memo", std::string());
    p.columns.category = c.value("category", std::string());
    p.columns.account = c.value("account", std::string());

    p.date_formats = j.value("date_formats", std::vector<std::string>{"%m/%d/%Y", "%Y-%m-%d"});
    p.sign = sign_from_string(j.value("sign", std::string("signed")));
    p.debit_types = j.value("debit_types", std::vector<std::string>());
    p.combine_memo = j.value("combine_memo", false);

    std::string separator = j.value("decimal_separator", std::string("."));
    if (separator != "." && separator != ",") {
        throw ConfigError("Profile '" + p.id + "' has an unsupported decimal separator: " + separator);
    }
    p.decimal_separator = separator[0];

    bool needs_amount = p.sign != SignConvention::DebitCredit;
    if (needs_amount && p.columns.amount.empty()) {
        throw ConfigError("Profile '" + p.id + "' needs an amount column");
    }
    if (p.sign == SignConvention::DebitCredit && (p.columns.debit.empty() || p.columns.credit.empty())) {
        throw ConfigError("Profile '" + p.id + "' needs debit and credit columns");
    }
    if (p.sign == SignConvention::TypeColumn && p.columns.type.empty()) {
        throw ConfigError("Profile '" + p.id + "' needs a type column");
    }
    if (p.signature.empty()) {
        throw ConfigError("Profile '" + p.id + "' has an empty header signature");
    }
}

} // namespace profiles
} // namespace tally
