/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: main.cpp
 * ============================================================================
 */

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "config.hpp"
#include "errors.hpp"
#include "export.hpp"
#include "log.hpp"
#include "pg_store.hpp"
#include "serialize.hpp"
#include "pipeline/ImportOrchestrator.hpp"
#include "profiles/ProfileRegistry.hpp"

using json = nlohmann::json;
using namespace tally;

namespace {

bool is_admin(const httplib::Request &req) {
    if (req.has_header("Remote-Groups")) {
        std::string groups = req.get_header_value("Remote-Groups");
        return groups.find("admins") != std::string::npos;
    }
    return false;
}

bool is_authenticated(const httplib::Request &req) {
    return req.has_header("Remote-User") && !req.get_header_value("Remote-User").empty();
}

void send_error(httplib::Response &res, int status, const std::string& message) {
    res.status = status;
    res.set_content(json{{"error", message}}.dump(), "application/json");
}

void send_success(httplib::Response &res) {
    res.status = 200;
    res.set_content("{\"status\":\"SUCCESS\"}", "application/json");
}

// Reads account_id, from, to and category from the query string.
TransactionFilter filter_from_query(const httplib::Request &req) {
    TransactionFilter filter;
    if (req.has_param("account_id")) {
        filter.account_id = std::stoll(req.get_param_value("account_id"));
    }
    if (req.has_param("from")) {
        filter.from = Date::parse_iso(req.get_param_value("from"));
        if (!filter.from) throw std::invalid_argument("from must be YYYY-MM-DD");
    }
    if (req.has_param("to")) {
        filter.to = Date::parse_iso(req.get_param_value("to"));
        if (!filter.to) throw std::invalid_argument("to must be YYYY-MM-DD");
    }
    if (req.has_param("category")) {
        filter.category = req.get_param_value("category");
    }
    return filter;
}

json runs_to_json(const std::vector<ImportRun>& runs) {
    json out = json::array();
    for (const auto& run : runs) out.push_back(run);
    return out;
}

// Config-file profiles first so they can shadow a built-in signature.
void register_profiles(const TallyConfig& config, profiles::ProfileRegistry& registry) {
    for (const auto& profile : config.profiles) {
        registry.RegisterProfile(profile);
    }
    if (config.builtin_profiles) {
        for (const auto& profile : profiles::builtin_profiles(config.import.default_account)) {
            registry.RegisterProfile(profile);
        }
    }
    tally_log("INFO", "Loaded " + std::to_string(registry.Profiles().size()) + " bank profile(s).");
}

} // namespace

int main() {
    const char* env_config = std::getenv("TALLY_CONFIG");
    std::string config_path = env_config ? env_config : "config/tally_config.json";

    TallyConfig config;
    try {
        config = load_config(config_path);
    } catch (const ConfigError &e) {
        tally_log("FATAL", std::string("Configuration rejected: ") + e.what());
        return 1;
    }

    const char* env_db = std::getenv("TALLY_DB_CONN");
    if (env_db) config.storage.connection = env_db;
    if (config.storage.connection.empty()) {
        tally_log("FATAL", "Database connection variable missing. System halted.");
        return 1;
    }

    PgLedgerStore store(config.storage);
    try {
        store.init_schema();
    } catch (const StorageError &e) {
        tally_log("FATAL", std::string("Schema initialization failed: ") + e.what());
        return 1;
    }

    profiles::ProfileRegistry registry;
    register_profiles(config, registry);

    ImportOrchestrator orchestrator(config, registry, store);

    httplib::Server svr;
    tally_log("INFO", "Tally Statement Ingestion Engine active. Account policy: " +
              std::string(to_string(config.import.account_policy)) + ".");

    svr.set_logger([](const httplib::Request &req, const httplib::Response &res) {
        tally_log("INFO", "API Request: " + req.method + " " + req.path + " -> Status " + std::to_string(res.status));
    });

    // === IMPORTS ===
    svr.Post("/api/import", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_authenticated(req)) { res.status = 401; return; }
        std::vector<std::string> paths;
        try {
            auto j = json::parse(req.body);
            paths = j.at("paths").get<std::vector<std::string>>();
        } catch (const json::exception &e) {
            send_error(res, 400, std::string("Expected {\"paths\": [...]}: ") + e.what());
            return;
        }
        res.set_content(runs_to_json(orchestrator.import_files(paths)).dump(), "application/json");
    });

    svr.Post("/api/import/pending", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_authenticated(req)) { res.status = 401; return; }
        res.set_content(runs_to_json(orchestrator.import_pending()).dump(), "application/json");
    });

    svr.Post("/api/import/cancel", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_authenticated(req)) { res.status = 401; return; }
        orchestrator.cancel();
        send_success(res);
    });

    svr.Get("/api/imports", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_authenticated(req)) { res.status = 401; return; }
        try {
            res.set_content(runs_to_json(store.list_import_runs()).dump(), "application/json");
        } catch (const StorageError &e) {
            send_error(res, 500, e.what());
        }
    });

    svr.Post("/api/imports/undo", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_authenticated(req)) { res.status = 401; return; }
        try {
            int64_t run_id = json::parse(req.body).at("run_id").get<int64_t>();
            size_t removed = store.undo_import(run_id);
            tally_log("WARN", "User " + req.get_header_value("Remote-User") + " undid import run " +
                      std::to_string(run_id) + " (" + std::to_string(removed) + " transaction(s)).");
            res.set_content(json{{"status", "SUCCESS"}, {"removed", removed}}.dump(), "application/json");
        } catch (const json::exception &e) {
            send_error(res, 400, e.what());
        } catch (const StorageError &e) {
            send_error(res, 500, e.what());
        }
    });

    svr.Post("/api/imports/restore", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_authenticated(req)) { res.status = 401; return; }
        try {
            int64_t run_id = json::parse(req.body).at("run_id").get<int64_t>();
            std::string restored = orchestrator.restore_archived_file(run_id);
            tally_log("INFO", "Archived file of run " + std::to_string(run_id) + " restored to " + restored);
            res.set_content(json{{"status", "SUCCESS"}, {"path", restored}}.dump(), "application/json");
        } catch (const json::exception &e) {
            send_error(res, 400, e.what());
        } catch (const ArchiveError &e) {
            send_error(res, 409, e.what());
        } catch (const StorageError &e) {
            send_error(res, 500, e.what());
        }
    });

    // === TRANSACTIONS ===
    svr.Get("/api/transactions", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_authenticated(req)) { res.status = 401; return; }
        TransactionFilter filter;
        try {
            filter = filter_from_query(req);
        } catch (const std::exception &e) {
            send_error(res, 400, std::string("Invalid filter: ") + e.what());
            return;
        }
        try {
            json out = json::array();
            for (const auto& t : store.list_transactions(filter)) out.push_back(t);
            res.set_content(out.dump(), "application/json");
        } catch (const StorageError &e) {
            send_error(res, 500, e.what());
        }
    });

    svr.Post("/api/transactions/category", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_authenticated(req)) { res.status = 401; return; }
        try {
            auto j = json::parse(req.body);
            int64_t tx_id = j.at("id").get<int64_t>();
            std::optional<std::string> category;
            if (j.contains("category") && !j.at("category").is_null()) {
                category = j.at("category").get<std::string>();
            }
            store.update_category(tx_id, category);
            send_success(res);
        } catch (const json::exception &e) {
            send_error(res, 400, e.what());
        } catch (const StorageError &e) {
            send_error(res, 500, e.what());
        }
    });

    svr.Post("/api/transactions/purge", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_admin(req)) { res.status = 403; return; }
        try {
            auto j = json::parse(req.body);
            std::string confirm = j.at("confirmation").get<std::string>();
            if (confirm != "PURGE DATA") {
                send_error(res, 400, "Invalid confirmation string provided.");
                return;
            }
            store.delete_all_transactions();
            tally_log("CRITICAL", "User " + req.get_header_value("Remote-User") + " executed transaction data purge.");
            send_success(res);
        } catch (const json::exception &e) {
            send_error(res, 400, e.what());
        } catch (const StorageError &e) {
            send_error(res, 500, e.what());
        }
    });

    svr.Get("/api/export", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_authenticated(req)) { res.status = 401; return; }
        TransactionFilter filter;
        try {
            filter = filter_from_query(req);
        } catch (const std::exception &e) {
            send_error(res, 400, std::string("Invalid filter: ") + e.what());
            return;
        }
        try {
            res.set_header("Content-Disposition", "attachment; filename=\"transactions.csv\"");
            res.set_content(export_transactions(store, filter), "text/csv");
        } catch (const StorageError &e) {
            send_error(res, 500, e.what());
        }
    });

    // === ACCOUNTS ===
    svr.Get("/api/accounts", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_authenticated(req)) { res.status = 401; return; }
        try {
            json out = json::array();
            for (const auto& a : store.list_accounts()) out.push_back(a);
            res.set_content(out.dump(), "application/json");
        } catch (const StorageError &e) {
            send_error(res, 500, e.what());
        }
    });

    svr.Post("/api/accounts/add", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_authenticated(req)) { res.status = 401; return; }
        try {
            auto j = json::parse(req.body);
            std::string name = j.at("name").get<std::string>();
            if (name.empty()) {
                send_error(res, 400, "Account name is required.");
                return;
            }
            Account created = store.create_account(name, j.value("institution", std::string()));
            tally_log("INFO", "Account '" + created.name + "' created.");
            res.set_content(json(created).dump(), "application/json");
        } catch (const json::exception &e) {
            send_error(res, 400, e.what());
        } catch (const StorageError &e) {
            send_error(res, 409, e.what());
        }
    });

    svr.Post("/api/accounts/update", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_authenticated(req)) { res.status = 401; return; }
        try {
            auto j = json::parse(req.body);
            store.update_account(j.at("id").get<int64_t>(), j.at("name").get<std::string>(),
                                 j.value("institution", std::string()));
            send_success(res);
        } catch (const json::exception &e) {
            send_error(res, 400, e.what());
        } catch (const StorageError &e) {
            send_error(res, 409, e.what());
        }
    });

    svr.Post("/api/accounts/delete", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_authenticated(req)) { res.status = 401; return; }
        try {
            int64_t id = json::parse(req.body).at("id").get<int64_t>();
            store.delete_account(id);
            tally_log("WARN", "User " + req.get_header_value("Remote-User") + " deleted account " + std::to_string(id) + ".");
            send_success(res);
        } catch (const json::exception &e) {
            send_error(res, 400, e.what());
        } catch (const StorageError &e) {
            send_error(res, 500, e.what());
        }
    });

    // === SYSTEM ===
    svr.Get("/api/system/logs", [&](const httplib::Request &req, httplib::Response &res) {
        if (!is_admin(req)) { res.status = 403; return; }
        json response;
        response["database"] = store.ping() ? "ONLINE" : "OFFLINE";
        response["logs"] = recent_logs();
        res.set_content(response.dump(), "application/json");
    });

    int listen_port = std::getenv("TALLY_PORT") ? std::atoi(std::getenv("TALLY_PORT")) : 8080;
    tally_log("INFO", "Tally server running on port " + std::to_string(listen_port));

    if (!svr.listen("0.0.0.0", listen_port)) {
        tally_log("FATAL", "Could not bind port " + std::to_string(listen_port) + ".");
        return 1;
    }
    return 0;
}
