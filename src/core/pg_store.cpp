/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: pg_store.cpp
 * ============================================================================
 * * DESCRIPTION:
 * PostgreSQL implementation of LedgerStore. Schema:
 *   accounts      - cached balance_micros, unique name
 *   import_runs   - append-only audit trail, row errors as JSONB
 *   transactions  - UNIQUE (account_id, fingerprint), cascade on account delete
 * ============================================================================
 */

#include "pg_store.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "serialize.hpp"
#include <map>
#include <set>
#include <utility>
#include <pqxx/pqxx>

using json = nlohmann::json;

namespace tally {

namespace {

const char* kAccountColumns =
    "id, name, institution, balance_micros, "
    "to_char(created_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS\"Z\"')";

const char* kTransactionColumns =
    "id, account_id, posted_date::text, amount_micros, description, category, fingerprint, "
    "COALESCE(import_run_id, 0)";

const char* kImportRunColumns =
    "id, source_path, COALESCE(profile_id, ''), "
    "to_char(started_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS\"Z\"'), "
    "COALESCE(to_char(completed_at AT TIME ZONE 'UTC', 'YYYY-MM-DD\"T\"HH24:MI:SS\"Z\"'), ''), "
    "COALESCE(outcome, 'failed'), COALESCE(stage, 'detecting'), COALESCE(failed_stage, 'detecting'), "
    "COALESCE(failure, 'none'), COALESCE(error, ''), "
    "rows_seen, rows_imported, rows_duplicate, rows_invalid, "
    "COALESCE(archive_path, ''), COALESCE(archive_warning, ''), row_errors::text";

// libpq accepts both key=value strings and URIs; connect_timeout has to be
// spelled the way the string already is.
std::string with_connect_timeout(const std::string& conn, int seconds) {
    if (conn.find("connect_timeout") != std::string::npos) return conn;
    std::string value = std::to_string(seconds);
    if (conn.find("://") != std::string::npos) {
        return conn + (conn.find('?') == std::string::npos ? "?" : "&") + "connect_timeout=" + value;
    }
    return conn + (conn.empty() ? "" : " ") + "connect_timeout=" + value;
}

/**
 * Runs fn inside one database transaction on a fresh connection, with the
 * statement timeout applied. fn commits itself when it writes; leaving
 * without commit rolls back. Every non-Tally exception becomes StorageError.
 */
template <typename Fn>
auto with_work(const std::string& conn_str, int timeout_ms, const std::string& what, Fn&& fn)
    -> decltype(fn(std::declval<pqxx::work&>())) {
    try {
        pqxx::connection C(conn_str);
        pqxx::work W(C);
        W.exec("SET LOCAL statement_timeout = " + std::to_string(timeout_ms));
        return fn(W);
    } catch (const StorageError&) {
        throw;
    } catch (const std::exception& e) {
        tally_log("ERROR", "Storage failure during " + what + ": " + e.what());
        throw StorageError(what + ": " + e.what());
    }
}

Account account_from_row(const pqxx::row& row) {
    Account a;
    a.id = row[0].as<int64_t>();
    a.name = row[1].as<std::string>();
    a.institution = row[2].as<std::string>();
    a.balance = row[3].as<int64_t>();
    a.created_at = row[4].as<std::string>();
    return a;
}

Transaction transaction_from_row(const pqxx::row& row) {
    Transaction t;
    t.id = row[0].as<int64_t>();
    t.account_id = row[1].as<int64_t>();
    auto posted = Date::parse_iso(row[2].as<std::string>());
    if (!posted) {
        throw StorageError("Corrupt posted_date on transaction " + std::to_string(t.id));
    }
    t.posted = *posted;
    t.amount = row[3].as<int64_t>();
    t.description = row[4].as<std::string>();
    if (!row[5].is_null()) t.category = row[5].as<std::string>();
    t.fingerprint = row[6].as<std::string>();
    t.import_run_id = row[7].as<int64_t>();
    return t;
}

ImportRun import_run_from_row(const pqxx::row& row) {
    ImportRun r;
    r.id = row[0].as<int64_t>();
    r.source_path = row[1].as<std::string>();
    r.profile_id = row[2].as<std::string>();
    r.started_at = row[3].as<std::string>();
    r.completed_at = row[4].as<std::string>();
    r.outcome = outcome_from_string(row[5].as<std::string>());
    r.stage = stage_from_string(row[6].as<std::string>());
    r.failed_stage = stage_from_string(row[7].as<std::string>());
    r.failure = failure_from_string(row[8].as<std::string>());
    r.error = row[9].as<std::string>();
    r.rows_seen = row[10].as<int64_t>();
    r.rows_imported = row[11].as<int64_t>();
    r.rows_duplicate = row[12].as<int64_t>();
    r.rows_invalid = row[13].as<int64_t>();
    r.archive_path = row[14].as<std::string>();
    r.archive_warning = row[15].as<std::string>();
    r.row_errors = json::parse(row[16].as<std::string>()).get<std::vector<RowError>>();
    return r;
}

// Takes the row lock on each account, lowest id first so that two batches
// spanning the same accounts cannot deadlock.
void lock_accounts(pqxx::work& W, const std::set<int64_t>& ids) {
    for (int64_t id : ids) {
        pqxx::result r = W.exec_params("SELECT id FROM accounts WHERE id = $1 FOR UPDATE", id);
        if (r.empty()) {
            throw StorageError("Account " + std::to_string(id) + " does not exist");
        }
    }
}

} // namespace

PgLedgerStore::PgLedgerStore(const StorageConfig& config)
    : conn_str_(with_connect_timeout(config.connection, config.connect_timeout_s)),
      statement_timeout_ms_(config.statement_timeout_ms) {}

void PgLedgerStore::init_schema() {
    with_work(conn_str_, statement_timeout_ms_, "init schema", [](pqxx::work& W) {
        W.exec(
            "CREATE TABLE IF NOT EXISTS accounts ("
            " id BIGSERIAL PRIMARY KEY,"
            " name TEXT NOT NULL UNIQUE,"
            " institution TEXT NOT NULL DEFAULT '',"
            " balance_micros BIGINT NOT NULL DEFAULT 0,"
            " created_at TIMESTAMPTZ NOT NULL DEFAULT CURRENT_TIMESTAMP)");
        W.exec(
            "CREATE TABLE IF NOT EXISTS import_runs ("
            " id BIGSERIAL PRIMARY KEY,"
            " source_path TEXT NOT NULL,"
            " profile_id TEXT,"
            " started_at TIMESTAMPTZ NOT NULL,"
            " completed_at TIMESTAMPTZ,"
            " outcome TEXT,"
            " stage TEXT,"
            " failed_stage TEXT,"
            " failure TEXT,"
            " error TEXT,"
            " rows_seen BIGINT NOT NULL DEFAULT 0,"
            " rows_imported BIGINT NOT NULL DEFAULT 0,"
            " rows_duplicate BIGINT NOT NULL DEFAULT 0,"
            " rows_invalid BIGINT NOT NULL DEFAULT 0,"
            " archive_path TEXT,"
            " archive_warning TEXT,"
            " row_errors JSONB NOT NULL DEFAULT '[]'::jsonb)");
        W.exec(
            "CREATE TABLE IF NOT EXISTS transactions ("
            " id BIGSERIAL PRIMARY KEY,"
            " account_id BIGINT NOT NULL REFERENCES accounts (id) ON DELETE CASCADE,"
            " posted_date DATE NOT NULL,"
            " amount_micros BIGINT NOT NULL,"
            " description TEXT NOT NULL,"
            " category TEXT,"
            " fingerprint TEXT NOT NULL,"
            " import_run_id BIGINT REFERENCES import_runs (id),"
            " UNIQUE (account_id, fingerprint))");
        W.exec("CREATE INDEX IF NOT EXISTS transactions_posted_idx ON transactions (posted_date DESC, id DESC)");
        W.exec("CREATE INDEX IF NOT EXISTS transactions_run_idx ON transactions (import_run_id)");
        W.commit();
    });
    tally_log("INFO", "Ledger schema verified.");
}

// === [ACCOUNTS] ===

Account PgLedgerStore::create_account(const std::string& name, const std::string& institution) {
    return with_work(conn_str_, statement_timeout_ms_, "create account", [&](pqxx::work& W) {
        pqxx::result r = W.exec_params(
            std::string("INSERT INTO accounts (name, institution) VALUES ($1, $2) RETURNING ") + kAccountColumns,
            name, institution);
        W.commit();
        tally_log("INFO", "Account created: " + name);
        return account_from_row(r[0]);
    });
}

std::optional<Account> PgLedgerStore::find_account(int64_t id) {
    return with_work(conn_str_, statement_timeout_ms_, "find account", [&](pqxx::work& W) {
        pqxx::result r = W.exec_params(
            std::string("SELECT ") + kAccountColumns + " FROM accounts WHERE id = $1", id);
        return r.empty() ? std::optional<Account>() : std::optional<Account>(account_from_row(r[0]));
    });
}

std::optional<Account> PgLedgerStore::find_account_by_name(const std::string& name) {
    return with_work(conn_str_, statement_timeout_ms_, "find account", [&](pqxx::work& W) {
        pqxx::result r = W.exec_params(
            std::string("SELECT ") + kAccountColumns + " FROM accounts WHERE name = $1", name);
        return r.empty() ? std::optional<Account>() : std::optional<Account>(account_from_row(r[0]));
    });
}

std::vector<Account> PgLedgerStore::list_accounts() {
    return with_work(conn_str_, statement_timeout_ms_, "list accounts", [&](pqxx::work& W) {
        pqxx::result r = W.exec(std::string("SELECT ") + kAccountColumns + " FROM accounts ORDER BY name ASC");
        std::vector<Account> accounts;
        for (auto row : r) accounts.push_back(account_from_row(row));
        return accounts;
    });
}

void PgLedgerStore::update_account(int64_t id, const std::string& name, const std::string& institution) {
    with_work(conn_str_, statement_timeout_ms_, "update account", [&](pqxx::work& W) {
        pqxx::result r = W.exec_params(
            "UPDATE accounts SET name = $2, institution = $3 WHERE id = $1", id, name, institution);
        if (r.affected_rows() == 0) {
            throw StorageError("Account " + std::to_string(id) + " does not exist");
        }
        W.commit();
    });
}

void PgLedgerStore::delete_account(int64_t id) {
    with_work(conn_str_, statement_timeout_ms_, "delete account", [&](pqxx::work& W) {
        lock_accounts(W, {id});
        W.exec_params("DELETE FROM accounts WHERE id = $1", id);
        W.commit();
        tally_log("INFO", "Account " + std::to_string(id) + " deleted with its transactions.");
    });
}

// === [TRANSACTIONS] ===

std::vector<Transaction> PgLedgerStore::list_transactions(const TransactionFilter& filter) {
    std::optional<std::string> from;
    std::optional<std::string> to;
    if (filter.from) from = filter.from->to_iso();
    if (filter.to) to = filter.to->to_iso();

    return with_work(conn_str_, statement_timeout_ms_, "list transactions", [&](pqxx::work& W) {
        pqxx::result r = W.exec_params(
            std::string("SELECT ") + kTransactionColumns + " FROM transactions"
            " WHERE ($1::bigint IS NULL OR account_id = $1::bigint)"
            " AND ($2::date IS NULL OR posted_date >= $2::date)"
            " AND ($3::date IS NULL OR posted_date <= $3::date)"
            " AND ($4::text IS NULL OR category = $4::text)"
            " ORDER BY posted_date DESC, id DESC",
            filter.account_id, from, to, filter.category);
        std::vector<Transaction> out;
        out.reserve(r.size());
        for (auto row : r) out.push_back(transaction_from_row(row));
        return out;
    });
}

void PgLedgerStore::update_category(int64_t transaction_id, const std::optional<std::string>& category) {
    with_work(conn_str_, statement_timeout_ms_, "update category", [&](pqxx::work& W) {
        pqxx::result r = W.exec_params(
            "UPDATE transactions SET category = $2 WHERE id = $1", transaction_id, category);
        if (r.affected_rows() == 0) {
            throw StorageError("Transaction " + std::to_string(transaction_id) + " does not exist");
        }
        W.commit();
    });
}

void PgLedgerStore::delete_all_transactions() {
    with_work(conn_str_, statement_timeout_ms_, "delete all transactions", [&](pqxx::work& W) {
        // Lock every account first so no commit can slip a balance change in between.
        W.exec("SELECT id FROM accounts ORDER BY id FOR UPDATE");
        W.exec("DELETE FROM transactions");
        W.exec("UPDATE accounts SET balance_micros = 0");
        W.commit();
    });
    tally_log("WARN", "All transactions deleted; balances reset.");
}

std::unordered_set<std::string> PgLedgerStore::fingerprints_for_account(int64_t account_id) {
    return with_work(conn_str_, statement_timeout_ms_, "load fingerprints", [&](pqxx::work& W) {
        pqxx::result r = W.exec_params("SELECT fingerprint FROM transactions WHERE account_id = $1", account_id);
        std::unordered_set<std::string> out;
        out.reserve(r.size());
        for (auto row : r) out.insert(row[0].as<std::string>());
        return out;
    });
}

CommitResult PgLedgerStore::commit_batch(const CommitBatch& batch, const AbortCheck& abort_check) {
    return with_work(conn_str_, statement_timeout_ms_, "commit batch", [&](pqxx::work& W) {
        // A concurrent commit may create the same account first; its row is then adopted.
        std::map<std::string, int64_t> created;
        std::vector<std::string> inserted_names;
        for (const auto& a : batch.new_accounts) {
            pqxx::result r = W.exec_params(
                "INSERT INTO accounts (name, institution) VALUES ($1, $2) ON CONFLICT (name) DO NOTHING RETURNING id",
                a.name, a.institution);
            if (r.empty()) {
                r = W.exec_params("SELECT id FROM accounts WHERE name = $1", a.name);
                if (r.empty()) throw StorageError("Account " + a.name + " could not be created");
            } else {
                inserted_names.push_back(a.name);
            }
            created[a.name] = r[0][0].as<int64_t>();
        }

        std::vector<NewTransaction> rows = batch.rows;
        for (auto& row : rows) {
            if (row.new_account.empty()) continue;
            auto it = created.find(row.new_account);
            if (it == created.end()) {
                throw StorageError("Account " + row.new_account + " is not part of the batch");
            }
            row.account_id = it->second;
            row.fingerprint = TallyCrypto::calculate_fingerprint(row.account_id, row.posted, row.amount, row.description);
        }

        std::set<int64_t> account_ids;
        for (const auto& row : rows) account_ids.insert(row.account_id);
        lock_accounts(W, account_ids);

        // 0 means the batch belongs to no import run.
        std::optional<int64_t> run_id;
        if (batch.import_run_id != 0) run_id = batch.import_run_id;

        CommitResult result;
        std::map<int64_t, money_micro> deltas;
        for (size_t i = 0; i < rows.size(); ++i) {
            const NewTransaction& t = rows[i];
            pqxx::result r = W.exec_params(
                "INSERT INTO transactions"
                " (account_id, posted_date, amount_micros, description, category, fingerprint, import_run_id)"
                " VALUES ($1, $2::date, $3, $4, $5, $6, $7)"
                " ON CONFLICT (account_id, fingerprint) DO NOTHING RETURNING id",
                t.account_id, t.posted.to_iso(), t.amount, t.description, t.category,
                t.fingerprint, run_id);
            if (r.empty()) {
                result.duplicates++;
                result.duplicate_rows.push_back(i);
                continue;
            }
            result.inserted++;
            result.balance_delta += t.amount;
            deltas[t.account_id] += t.amount;
        }

        for (const auto& d : deltas) {
            W.exec_params("UPDATE accounts SET balance_micros = balance_micros + $1 WHERE id = $2",
                          d.second, d.first);
        }

        if (abort_check && abort_check()) {
            throw CommitAborted("Commit of import run " + std::to_string(batch.import_run_id) + " aborted");
        }
        W.commit();
        for (const auto& name : inserted_names) tally_log("INFO", "Account created: " + name);
        return result;
    });
}

size_t PgLedgerStore::undo_import(int64_t import_run_id) {
    return with_work(conn_str_, statement_timeout_ms_, "undo import", [&](pqxx::work& W) {
        pqxx::result owners = W.exec_params(
            "SELECT DISTINCT account_id FROM transactions WHERE import_run_id = $1", import_run_id);
        std::set<int64_t> account_ids;
        for (auto row : owners) account_ids.insert(row[0].as<int64_t>());
        lock_accounts(W, account_ids);

        pqxx::result removed = W.exec_params(
            "DELETE FROM transactions WHERE import_run_id = $1 RETURNING account_id, amount_micros",
            import_run_id);
        std::map<int64_t, money_micro> deltas;
        for (auto row : removed) deltas[row[0].as<int64_t>()] += row[1].as<int64_t>();

        for (const auto& d : deltas) {
            W.exec_params("UPDATE accounts SET balance_micros = balance_micros - $1 WHERE id = $2",
                          d.second, d.first);
        }
        W.commit();
        tally_log("INFO", "Import run " + std::to_string(import_run_id) + " undone: " +
                  std::to_string(removed.size()) + " transactions removed.");
        return static_cast<size_t>(removed.size());
    });
}

// === [IMPORT RUNS] ===

int64_t PgLedgerStore::begin_import_run(const std::string& source_path, const std::string& started_at) {
    return with_work(conn_str_, statement_timeout_ms_, "begin import run", [&](pqxx::work& W) {
        pqxx::result r = W.exec_params(
            "INSERT INTO import_runs (source_path, started_at) VALUES ($1, $2::timestamptz) RETURNING id",
            source_path, started_at);
        W.commit();
        return r[0][0].as<int64_t>();
    });
}

void PgLedgerStore::finalize_import_run(const ImportRun& run) {
    std::string row_errors = json(run.row_errors).dump();
    std::optional<std::string> completed;
    if (!run.completed_at.empty()) completed = run.completed_at;

    with_work(conn_str_, statement_timeout_ms_, "finalize import run", [&](pqxx::work& W) {
        pqxx::result r = W.exec_params(
            "UPDATE import_runs SET profile_id = $2, completed_at = COALESCE($3::timestamptz, CURRENT_TIMESTAMP),"
            " outcome = $4, stage = $5, failed_stage = $6, failure = $7, error = $8,"
            " rows_seen = $9, rows_imported = $10, rows_duplicate = $11, rows_invalid = $12,"
            " archive_path = $13, archive_warning = $14, row_errors = $15::jsonb"
            " WHERE id = $1 AND completed_at IS NULL",
            run.id, run.profile_id, completed,
            std::string(to_string(run.outcome)), std::string(to_string(run.stage)),
            std::string(to_string(run.failed_stage)), std::string(to_string(run.failure)), run.error,
            static_cast<int64_t>(run.rows_seen), static_cast<int64_t>(run.rows_imported),
            static_cast<int64_t>(run.rows_duplicate), static_cast<int64_t>(run.rows_invalid),
            run.archive_path, run.archive_warning, row_errors);
        if (r.affected_rows() == 0) {
            throw StorageError("Import run " + std::to_string(run.id) + " is unknown or already finalized");
        }
        W.commit();
    });
}

std::optional<ImportRun> PgLedgerStore::find_import_run(int64_t id) {
    return with_work(conn_str_, statement_timeout_ms_, "find import run", [&](pqxx::work& W) {
        pqxx::result r = W.exec_params(
            std::string("SELECT ") + kImportRunColumns + " FROM import_runs WHERE id = $1", id);
        return r.empty() ? std::optional<ImportRun>() : std::optional<ImportRun>(import_run_from_row(r[0]));
    });
}

std::vector<ImportRun> PgLedgerStore::list_import_runs() {
    return with_work(conn_str_, statement_timeout_ms_, "list import runs", [&](pqxx::work& W) {
        pqxx::result r = W.exec(
            std::string("SELECT ") + kImportRunColumns + " FROM import_runs ORDER BY started_at DESC, id DESC");
        std::vector<ImportRun> runs;
        for (auto row : r) runs.push_back(import_run_from_row(row));
        return runs;
    });
}

bool PgLedgerStore::ping() {
    try {
        pqxx::connection C(conn_str_);
        pqxx::work W(C);
        W.exec("SELECT 1");
        return true;
    } catch (const std::exception& e) {
        tally_log("WARN", std::string("Database ping failed: ") + e.what());
        return false;
    }
}

} // namespace tally
