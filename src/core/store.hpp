/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: store.hpp
 * ============================================================================
 * * DESCRIPTION:
 * The persistence contract of the engine. The import pipeline and the HTTP
 * service only ever talk to this interface; PgLedgerStore is the production
 * implementation.
 * * GUARANTEES EVERY IMPLEMENTATION MUST GIVE:
 * - commit_batch applies completely or not at all.
 * - Commits touching the same account are serialized by the store itself;
 *   commits on disjoint accounts do not wait for each other.
 * - An account's cached balance only moves inside the same atomic operation
 *   that inserts or removes its transactions.
 * - Failures surface as StorageError.
 * ============================================================================
 */

#ifndef TALLY_STORE_HPP
#define TALLY_STORE_HPP

#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include "model.hpp"

namespace tally {

    struct NewTransaction {
        int64_t account_id = 0;
        // Set instead of account_id for rows of an account the commit creates;
        // the fingerprint is then computed once the account has an id.
        std::string new_account;
        Date posted;
        money_micro amount = 0;
        std::string description;
        std::optional<std::string> category;
        std::string fingerprint;
    };

    struct NewAccount {
        std::string name;
        std::string institution;
    };

    struct CommitBatch {
        int64_t import_run_id = 0;   // 0 = not tied to an import run
        // Created (or adopted, when another commit created them first) inside
        // the same transaction as the rows.
        std::vector<NewAccount> new_accounts;
        std::vector<NewTransaction> rows;
    };

    struct CommitResult {
        size_t inserted = 0;
        // Rows skipped because (account_id, fingerprint) was already stored
        // by the time the commit ran.
        size_t duplicates = 0;
        // Index into CommitBatch::rows of every skipped row.
        std::vector<size_t> duplicate_rows;
        money_micro balance_delta = 0;
    };

    // Consulted right before commit; returning true rolls the batch back.
    typedef std::function<bool()> AbortCheck;

    class LedgerStore {
    public:
        virtual ~LedgerStore() {}

        // Creates tables and constraints if they do not exist.
        virtual void init_schema() = 0;

        // --- Accounts ---
        virtual Account create_account(const std::string& name, const std::string& institution) = 0;
        virtual std::optional<Account> find_account(int64_t id) = 0;
        virtual std::optional<Account> find_account_by_name(const std::string& name) = 0;
        virtual std::vector<Account> list_accounts() = 0;
        // Throws StorageError when the account does not exist or the name is taken.
        virtual void update_account(int64_t id, const std::string& name, const std::string& institution) = 0;
        // Deletes the account and, by cascade, its transactions.
        virtual void delete_account(int64_t id) = 0;

        // --- Transactions ---
        // Ordered by posted date descending, then id descending.
        virtual std::vector<Transaction> list_transactions(const TransactionFilter& filter) = 0;
        // The only in-place update a transaction ever receives. nullopt clears it.
        virtual void update_category(int64_t transaction_id, const std::optional<std::string>& category) = 0;
        // Removes every transaction and resets all balances to zero.
        virtual void delete_all_transactions() = 0;
        virtual std::unordered_set<std::string> fingerprints_for_account(int64_t account_id) = 0;

        /**
         * @brief Inserts the batch and moves each owning account's balance by
         * the sum of the rows actually inserted, in one atomic unit.
         * Rows whose fingerprint is already stored for their account are
         * skipped and reported as duplicates, never as a failure.
         * Throws CommitAborted when abort_check says so, StorageError on
         * any other failure; in both cases nothing is applied.
         */
        virtual CommitResult commit_batch(const CommitBatch& batch, const AbortCheck& abort_check) = 0;

        /**
         * @brief Removes the transactions created by one import run and
         * reverses their effect on balances atomically.
         * @return Number of transactions removed.
         */
        virtual size_t undo_import(int64_t import_run_id) = 0;

        // --- Import runs (append-only audit trail) ---
        virtual int64_t begin_import_run(const std::string& source_path, const std::string& started_at) = 0;
        // Writes the final state of a run. A second finalize of the same run throws StorageError.
        virtual void finalize_import_run(const ImportRun& run) = 0;
        virtual std::optional<ImportRun> find_import_run(int64_t id) = 0;
        // Newest first.
        virtual std::vector<ImportRun> list_import_runs() = 0;
    };

} // namespace tally

#endif // TALLY_STORE_HPP
