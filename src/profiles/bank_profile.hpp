/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: bank_profile.hpp
 * ============================================================================
 * * DESCRIPTION:
 * A BankProfile is plain data describing one institution's export layout.
 * There is no per-bank subclass: every profile is mapped by the same
 * map_row() function (mapper.hpp), driven by the fields below.
 * * To support a new bank, add a descriptor to builtin_profiles.cpp or declare
 * it under "profiles" in tally_config.json.
 * ============================================================================
 */

#ifndef TALLY_BANK_PROFILE_HPP
#define TALLY_BANK_PROFILE_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tally {
namespace profiles {

    /**
     * @brief How the raw export expresses debits.
     */
    enum class SignConvention {
        Signed,       // Amount column carries the sign already.
        DebitCredit,  // Separate debit and credit columns, both unsigned.
        TypeColumn    // Amount plus a type column naming debits; other types keep their sign.
    };

    /**
     * @brief Header names of the columns a profile reads. Empty = not present.
     */
    struct ColumnMap {
        std::string date;
        std::string description;
        std::string amount;
        std::string debit;
        std::string credit;
        std::string type;
        std::string memo;
        std::string category;
        std::string account;
    };

    struct BankProfile {
        std::string id;             // Unique ID (e.g., "capital_one")
        std::string institution;    // Human readable (e.g., "Capital One")
        std::string account_name;   // Account the rows post into unless an account column overrides it
        std::vector<std::string> signature; // Header columns that must appear, in this relative order
        std::string filename_hint;  // Lower-case substring the file name must contain (optional)
        ColumnMap columns;
        std::vector<std::string> date_formats; // strptime patterns, tried in order
        SignConvention sign = SignConvention::Signed;
        std::vector<std::string> debit_types;  // TypeColumn only, compared case-insensitively
        bool combine_memo = false;
        char decimal_separator = '.';          // ',' for "1.234,56" style exports
    };

    const char* to_string(SignConvention sign);

    void to_json(nlohmann::json& j, const BankProfile& p);
    // Throws nlohmann::json::exception on missing keys or wrong types.
    void from_json(const nlohmann::json& j, BankProfile& p);

} // namespace profiles
} // namespace tally

#endif // TALLY_BANK_PROFILE_HPP
