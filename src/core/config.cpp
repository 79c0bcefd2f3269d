/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: config.cpp
 * ============================================================================
 */

#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "money.hpp"
#include <fstream>

using json = nlohmann::json;

namespace tally {

namespace {

AccountPolicy policy_from_string(const std::string& s) {
    if (s == "auto_create") return AccountPolicy::AutoCreate;
    if (s == "reject") return AccountPolicy::Reject;
    throw ConfigError("import.account_policy must be 'auto_create' or 'reject', got '" + s + "'");
}

void require_positive(int value, const std::string& key) {
    if (value <= 0) {
        throw ConfigError(key + " must be positive");
    }
}

} // namespace

const char* to_string(AccountPolicy policy) {
    return policy == AccountPolicy::AutoCreate ? "auto_create" : "reject";
}

TallyConfig parse_config(const json& doc) {
    TallyConfig cfg;
    try {
        if (doc.contains("storage")) {
            const json& s = doc.at("storage");
            cfg.storage.connection = s.value("connection", cfg.storage.connection);
            cfg.storage.connect_timeout_s = s.value("connect_timeout_s", cfg.storage.connect_timeout_s);
            cfg.storage.statement_timeout_ms = s.value("statement_timeout_ms", cfg.storage.statement_timeout_ms);
        }

        if (doc.contains("import")) {
            const json& i = doc.at("import");
            cfg.import.watch_dir = i.value("watch_dir", cfg.import.watch_dir);
            cfg.import.archive_dir = i.value("archive_dir", cfg.import.archive_dir);
            cfg.import.max_parallel_files = i.value("max_parallel_files", cfg.import.max_parallel_files);
            cfg.import.file_timeout_ms = i.value("file_timeout_ms", cfg.import.file_timeout_ms);
            cfg.import.archive_attempts = i.value("archive_attempts", cfg.import.archive_attempts);
            cfg.import.default_account = i.value("default_account", cfg.import.default_account);
            if (i.contains("account_policy")) {
                cfg.import.account_policy = policy_from_string(i.at("account_policy").get<std::string>());
            }
        }

        if (doc.contains("validation")) {
            const json& v = doc.at("validation");
            cfg.validation.earliest_year = v.value("earliest_year", cfg.validation.earliest_year);
            cfg.validation.future_tolerance_days = v.value("future_tolerance_days", cfg.validation.future_tolerance_days);
            if (v.contains("max_abs_amount")) {
                // Given as a decimal string so no floating point sneaks in.
                std::string text = v.at("max_abs_amount").get<std::string>();
                auto parsed = parse_money(text);
                if (!parsed || *parsed <= 0) {
                    throw ConfigError("validation.max_abs_amount is not a positive amount: " + text);
                }
                cfg.validation.max_abs_amount = *parsed;
            }
        }

        cfg.builtin_profiles = doc.value("builtin_profiles", cfg.builtin_profiles);
        if (doc.contains("profiles")) {
            for (const auto& p : doc.at("profiles")) {
                cfg.profiles.push_back(p.get<profiles::BankProfile>());
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }

    require_positive(cfg.storage.connect_timeout_s, "storage.connect_timeout_s");
    require_positive(cfg.storage.statement_timeout_ms, "storage.statement_timeout_ms");
    require_positive(cfg.import.max_parallel_files, "import.max_parallel_files");
    require_positive(cfg.import.file_timeout_ms, "import.file_timeout_ms");
    require_positive(cfg.import.archive_attempts, "import.archive_attempts");
    if (cfg.validation.future_tolerance_days < 0) {
        throw ConfigError("validation.future_tolerance_days must not be negative");
    }
    if (cfg.import.default_account.empty()) {
        throw ConfigError("import.default_account must not be empty");
    }
    return cfg;
}

TallyConfig load_config(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        tally_log("WARN", "Config file " + path + " missing. Using system defaults.");
        return TallyConfig{};
    }

    json doc;
    try {
        doc = json::parse(ifs);
    } catch (const json::exception& e) {
        tally_log("ERROR", "Config Parse Error: " + std::string(e.what()));
        throw ConfigError("Configuration file " + path + " is corrupt: " + e.what());
    }
    return parse_config(doc);
}

} // namespace tally
