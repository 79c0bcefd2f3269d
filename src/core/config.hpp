/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.hpp
 * ============================================================================
 * * DESCRIPTION:
 * TallyConfig is built once at startup and handed to the pipeline by const
 * reference. Nothing below main() reads the environment.
 * ============================================================================
 */

#ifndef TALLY_CONFIG_HPP
#define TALLY_CONFIG_HPP

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "model.hpp"
#include "profiles/bank_profile.hpp"

namespace tally {

    enum class AccountPolicy {
        AutoCreate,  // Unknown account names are created on first import.
        Reject       // Rows for unknown accounts fail validation.
    };

    struct StorageConfig {
        std::string connection;          // libpq connection string
        int connect_timeout_s = 5;
        int statement_timeout_ms = 10000;
    };

    struct ImportConfig {
        std::string watch_dir = "csv_files";
        std::string archive_dir = "csv_files/csv_files_added";
        int max_parallel_files = 4;
        int file_timeout_ms = 60000;
        int archive_attempts = 3;
        AccountPolicy account_policy = AccountPolicy::AutoCreate;
        std::string default_account = "Default";
    };

    struct ValidationConfig {
        int earliest_year = 1970;
        int future_tolerance_days = 3;
        money_micro max_abs_amount = 50000LL * 1000000LL;
    };

    struct TallyConfig {
        StorageConfig storage;
        ImportConfig import;
        ValidationConfig validation;
        bool builtin_profiles = true;
        std::vector<profiles::BankProfile> profiles;  // Declared in the config file, tried before the built-ins
    };

    /**
     * @brief Parses a config document. Absent keys keep their defaults.
     * Throws ConfigError on wrong types or invalid values.
     */
    TallyConfig parse_config(const nlohmann::json& doc);

    /**
     * @brief Loads the config file at path. A missing file yields the defaults
     * (logged as WARN); an unparseable one throws ConfigError.
     */
    TallyConfig load_config(const std::string& path);

    const char* to_string(AccountPolicy policy);

} // namespace tally

#endif // TALLY_CONFIG_HPP
