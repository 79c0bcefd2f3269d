/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: pg_store.hpp
 * ============================================================================
 * * DESCRIPTION:
 * LedgerStore on PostgreSQL through libpqxx.
 * * Every operation opens its own connection, so one PgLedgerStore can be
 * shared by all import workers and HTTP handlers without further locking.
 * Same-account serialization comes from SELECT ... FOR UPDATE on the account
 * rows, taken in ascending id order.
 * ============================================================================
 */

#ifndef TALLY_PG_STORE_HPP
#define TALLY_PG_STORE_HPP

#include <string>
#include "config.hpp"
#include "store.hpp"

namespace tally {

class PgLedgerStore : public LedgerStore {
public:
    explicit PgLedgerStore(const StorageConfig& config);

    void init_schema() override;

    Account create_account(const std::string& name, const std::string& institution) override;
    std::optional<Account> find_account(int64_t id) override;
    std::optional<Account> find_account_by_name(const std::string& name) override;
    std::vector<Account> list_accounts() override;
    void update_account(int64_t id, const std::string& name, const std::string& institution) override;
    void delete_account(int64_t id) override;

    std::vector<Transaction> list_transactions(const TransactionFilter& filter) override;
    void update_category(int64_t transaction_id, const std::optional<std::string>& category) override;
    void delete_all_transactions() override;
    std::unordered_set<std::string> fingerprints_for_account(int64_t account_id) override;
    CommitResult commit_batch(const CommitBatch& batch, const AbortCheck& abort_check) override;
    size_t undo_import(int64_t import_run_id) override;

    int64_t begin_import_run(const std::string& source_path, const std::string& started_at) override;
    void finalize_import_run(const ImportRun& run) override;
    std::optional<ImportRun> find_import_run(int64_t id) override;
    std::vector<ImportRun> list_import_runs() override;

    // True when a connection can be opened and a trivial query answered.
    bool ping();

private:
    std::string conn_str_;
    int statement_timeout_ms_;
};

} // namespace tally

#endif // TALLY_PG_STORE_HPP
