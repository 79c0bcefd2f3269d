/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: memory_store.hpp
 * ============================================================================
 * * DESCRIPTION:
 * In-memory LedgerStore for tests. Gives the same atomicity and duplicate
 * guarantees as PgLedgerStore under a single mutex, plus failure injection:
 *   - fail_next_commit(): the next commit_batch throws StorageError
 *   - on_commit(hook):   runs inside commit_batch before the abort check
 *   - fail_finalize():    every finalize_import_run throws StorageError
 *   - on_fingerprints():  runs whenever stored fingerprints are loaded
 * ============================================================================
 */

#ifndef TALLY_TEST_MEMORY_STORE_HPP
#define TALLY_TEST_MEMORY_STORE_HPP

#include <algorithm>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include "core/crypto.hpp"
#include "core/errors.hpp"
#include "core/store.hpp"

namespace tally {
namespace test {

class MemoryLedgerStore : public LedgerStore {
public:
    void init_schema() override {}

    Account create_account(const std::string& name, const std::string& institution) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : accounts_) {
            if (entry.second.name == name) throw StorageError("Account name already exists: " + name);
        }
        Account a;
        a.id = ++account_seq_;
        a.name = name;
        a.institution = institution;
        a.created_at = utc_timestamp();
        accounts_[a.id] = a;
        return a;
    }

    std::optional<Account> find_account(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accounts_.find(id);
        if (it == accounts_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<Account> find_account_by_name(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : accounts_) {
            if (entry.second.name == name) return entry.second;
        }
        return std::nullopt;
    }

    std::vector<Account> list_accounts() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Account> out;
        for (const auto& entry : accounts_) out.push_back(entry.second);
        return out;
    }

    void update_account(int64_t id, const std::string& name, const std::string& institution) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accounts_.find(id);
        if (it == accounts_.end()) throw StorageError("Account " + std::to_string(id) + " does not exist");
        it->second.name = name;
        it->second.institution = institution;
    }

    void delete_account(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (accounts_.erase(id) == 0) throw StorageError("Account " + std::to_string(id) + " does not exist");
        transactions_.erase(std::remove_if(transactions_.begin(), transactions_.end(),
                                           [id](const Transaction& t) { return t.account_id == id; }),
                            transactions_.end());
    }

    std::vector<Transaction> list_transactions(const TransactionFilter& filter) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Transaction> out;
        for (const auto& t : transactions_) {
            if (filter.account_id && t.account_id != *filter.account_id) continue;
            if (filter.from && t.posted < *filter.from) continue;
            if (filter.to && *filter.to < t.posted) continue;
            if (filter.category && t.category != filter.category) continue;
            out.push_back(t);
        }
        std::sort(out.begin(), out.end(), [](const Transaction& a, const Transaction& b) {
            if (a.posted != b.posted) return b.posted < a.posted;
            return a.id > b.id;
        });
        return out;
    }

    void update_category(int64_t transaction_id, const std::optional<std::string>& category) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& t : transactions_) {
            if (t.id == transaction_id) {
                t.category = category;
                return;
            }
        }
        throw StorageError("Transaction " + std::to_string(transaction_id) + " does not exist");
    }

    void delete_all_transactions() override {
        std::lock_guard<std::mutex> lock(mutex_);
        transactions_.clear();
        for (auto& entry : accounts_) entry.second.balance = 0;
    }

    std::unordered_set<std::string> fingerprints_for_account(int64_t account_id) override {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hook = fingerprint_hook_;
        }
        if (hook) hook();

        std::lock_guard<std::mutex> lock(mutex_);
        std::unordered_set<std::string> out;
        for (const auto& t : transactions_) {
            if (t.account_id == account_id) out.insert(t.fingerprint);
        }
        return out;
    }

    CommitResult commit_batch(const CommitBatch& batch, const AbortCheck& abort_check) override {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hook = commit_hook_;
        }
        if (hook) hook();

        std::lock_guard<std::mutex> lock(mutex_);
        commit_calls_++;
        if (fail_next_commit_) {
            fail_next_commit_ = false;
            throw StorageError("injected commit failure");
        }

        // Stage everything, then apply only if nothing aborts.
        CommitResult result;
        std::vector<Transaction> staged;
        std::vector<Account> staged_accounts;
        std::map<std::string, int64_t> created;
        int64_t next_account_id = account_seq_;
        for (const auto& a : batch.new_accounts) {
            int64_t id = 0;
            for (const auto& entry : accounts_) {
                if (entry.second.name == a.name) id = entry.first;
            }
            if (id == 0) {
                Account account;
                account.id = ++next_account_id;
                account.name = a.name;
                account.institution = a.institution;
                account.created_at = utc_timestamp();
                staged_accounts.push_back(account);
                id = account.id;
            }
            created[a.name] = id;
        }

        std::map<int64_t, money_micro> deltas;
        std::set<std::pair<int64_t, std::string>> seen;
        for (const auto& t : transactions_) seen.insert({t.account_id, t.fingerprint});

        for (size_t i = 0; i < batch.rows.size(); ++i) {
            NewTransaction row = batch.rows[i];
            if (!row.new_account.empty()) {
                auto it = created.find(row.new_account);
                if (it == created.end()) throw StorageError("Account " + row.new_account + " is not part of the batch");
                row.account_id = it->second;
                row.fingerprint = TallyCrypto::calculate_fingerprint(row.account_id, row.posted, row.amount,
                                                                     row.description);
            }
            bool staged_account = std::any_of(staged_accounts.begin(), staged_accounts.end(),
                                              [&](const Account& a) { return a.id == row.account_id; });
            if (!staged_account && accounts_.find(row.account_id) == accounts_.end()) {
                throw StorageError("Account " + std::to_string(row.account_id) + " does not exist");
            }
            if (!seen.insert({row.account_id, row.fingerprint}).second) {
                result.duplicates++;
                result.duplicate_rows.push_back(i);
                continue;
            }
            Transaction t;
            t.account_id = row.account_id;
            t.posted = row.posted;
            t.amount = row.amount;
            t.description = row.description;
            t.category = row.category;
            t.fingerprint = row.fingerprint;
            t.import_run_id = batch.import_run_id;
            staged.push_back(t);
            deltas[row.account_id] += row.amount;
            result.balance_delta += row.amount;
        }

        if (abort_check && abort_check()) {
            throw CommitAborted("commit aborted before completion");
        }

        for (const auto& a : staged_accounts) accounts_[a.id] = a;
        account_seq_ = next_account_id;
        for (auto& t : staged) {
            t.id = ++transaction_seq_;
            transactions_.push_back(t);
        }
        for (const auto& d : deltas) accounts_[d.first].balance += d.second;
        result.inserted = staged.size();
        return result;
    }

    size_t undo_import(int64_t import_run_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t removed = 0;
        auto it = transactions_.begin();
        while (it != transactions_.end()) {
            if (it->import_run_id == import_run_id) {
                accounts_[it->account_id].balance -= it->amount;
                it = transactions_.erase(it);
                removed++;
            } else {
                ++it;
            }
        }
        return removed;
    }

    int64_t begin_import_run(const std::string& source_path, const std::string& started_at) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ImportRun run;
        run.id = ++run_seq_;
        run.source_path = source_path;
        run.started_at = started_at;
        runs_[run.id] = run;
        return run.id;
    }

    void finalize_import_run(const ImportRun& run) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_finalize_) throw StorageError("injected finalize failure");
        auto it = runs_.find(run.id);
        if (it == runs_.end()) throw StorageError("Import run " + std::to_string(run.id) + " does not exist");
        if (!it->second.completed_at.empty()) {
            throw StorageError("Import run " + std::to_string(run.id) + " is already finalized");
        }
        it->second = run;
    }

    std::optional<ImportRun> find_import_run(int64_t id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = runs_.find(id);
        if (it == runs_.end()) return std::nullopt;
        return it->second;
    }

    std::vector<ImportRun> list_import_runs() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<ImportRun> out;
        for (auto it = runs_.rbegin(); it != runs_.rend(); ++it) out.push_back(it->second);
        return out;
    }

    // --- Failure injection and inspection ---
    void fail_next_commit() {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_next_commit_ = true;
    }

    void fail_finalize(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_finalize_ = fail;
    }

    void on_commit(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        commit_hook_ = std::move(hook);
    }

    void on_fingerprints(std::function<void()> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        fingerprint_hook_ = std::move(hook);
    }

    size_t commit_calls() {
        std::lock_guard<std::mutex> lock(mutex_);
        return commit_calls_;
    }

    size_t transaction_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return transactions_.size();
    }

private:
    std::mutex mutex_;
    std::map<int64_t, Account> accounts_;
    std::vector<Transaction> transactions_;
    std::map<int64_t, ImportRun> runs_;
    int64_t account_seq_ = 0;
    int64_t transaction_seq_ = 0;
    int64_t run_seq_ = 0;

    bool fail_next_commit_ = false;
    bool fail_finalize_ = false;
    size_t commit_calls_ = 0;
    std::function<void()> commit_hook_;
    std::function<void()> fingerprint_hook_;
};

} // namespace test
} // namespace tally

#endif // TALLY_TEST_MEMORY_STORE_HPP
