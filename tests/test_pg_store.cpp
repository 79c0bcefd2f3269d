/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: test_pg_store.cpp
 * ============================================================================
 * * Runs against the database named by TALLY_TEST_DB (a libpq connection
 * string). Skipped when the variable is unset. The database is assumed to be
 * disposable: accounts created here carry a per-run suffix and are removed
 * again, but nothing else is guaranteed.
 * ============================================================================
 */

#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <memory>
#include "core/crypto.hpp"
#include "core/errors.hpp"
#include "core/pg_store.hpp"

using namespace tally;

namespace {

class PgLedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        const char* conn = std::getenv("TALLY_TEST_DB");
        if (conn == nullptr || *conn == '\0') {
            GTEST_SKIP() << "TALLY_TEST_DB not set";
        }
        StorageConfig config;
        config.connection = conn;
        store = std::make_unique<PgLedgerStore>(config);
        store->init_schema();
        suffix = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
    }

    void TearDown() override {
        if (!store) return;
        for (int64_t id : created) {
            try {
                store->delete_account(id);
            } catch (const StorageError&) {
                // Already deleted by the test itself.
            }
        }
    }

    Account account(const std::string& name) {
        Account a = store->create_account(name + "_" + suffix, "Test Bank");
        created.push_back(a.id);
        return a;
    }

    NewTransaction row(int64_t account_id, int day, money_micro amount, const std::string& description) {
        NewTransaction t;
        t.account_id = account_id;
        t.posted = Date{2024, 1, day};
        t.amount = amount;
        t.description = description;
        t.fingerprint = TallyCrypto::calculate_fingerprint(account_id, t.posted, amount, description);
        return t;
    }

    std::unique_ptr<PgLedgerStore> store;
    std::string suffix;
    std::vector<int64_t> created;
};

} // namespace

TEST_F(PgLedgerStoreTest, PingSucceeds) {
    EXPECT_TRUE(store->ping());
}

TEST_F(PgLedgerStoreTest, AccountLifecycle) {
    Account a = account("Checking");
    EXPECT_GT(a.id, 0);
    EXPECT_EQ(a.balance, 0);

    auto by_name = store->find_account_by_name(a.name);
    ASSERT_TRUE(by_name.has_value());
    EXPECT_EQ(by_name->id, a.id);

    store->update_account(a.id, a.name + "_renamed", "Other Bank");
    auto renamed = store->find_account(a.id);
    ASSERT_TRUE(renamed.has_value());
    EXPECT_EQ(renamed->institution, "Other Bank");

    EXPECT_THROW(store->create_account(renamed->name, "Dup"), StorageError);
    EXPECT_THROW(store->update_account(-1, "x", "y"), StorageError);
}

TEST_F(PgLedgerStoreTest, CommitMovesBalanceAndSkipsStoredFingerprints) {
    Account a = account("Checking");
    int64_t run_id = store->begin_import_run("/tmp/a.csv", utc_timestamp());

    CommitBatch batch;
    batch.import_run_id = run_id;
    batch.rows.push_back(row(a.id, 5, -4500000, "Coffee"));
    batch.rows.push_back(row(a.id, 6, 2000000000, "Salary"));
    CommitResult first = store->commit_batch(batch, AbortCheck());
    EXPECT_EQ(first.inserted, 2u);
    EXPECT_EQ(first.balance_delta, 1995500000);
    EXPECT_EQ(store->find_account(a.id)->balance, 1995500000);

    CommitResult again = store->commit_batch(batch, AbortCheck());
    EXPECT_EQ(again.inserted, 0u);
    EXPECT_EQ(again.duplicates, 2u);
    EXPECT_EQ(store->find_account(a.id)->balance, 1995500000);
    EXPECT_EQ(store->fingerprints_for_account(a.id).size(), 2u);
}

TEST_F(PgLedgerStoreTest, AbortedCommitAppliesNothing) {
    Account a = account("Checking");
    CommitBatch batch;
    batch.rows.push_back(row(a.id, 5, -4500000, "Coffee"));

    EXPECT_THROW(store->commit_batch(batch, []() { return true; }), CommitAborted);
    EXPECT_EQ(store->find_account(a.id)->balance, 0);
    TransactionFilter filter;
    filter.account_id = a.id;
    EXPECT_TRUE(store->list_transactions(filter).empty());
}

TEST_F(PgLedgerStoreTest, BatchAccountsExistOnlyWhenTheBatchCommits) {
    const std::string name = "Joint_" + suffix;
    CommitBatch batch;
    batch.new_accounts.push_back(NewAccount{name, "Test Bank"});
    NewTransaction t = row(0, 5, -4500000, "Coffee");
    t.new_account = name;
    batch.rows.push_back(t);

    EXPECT_THROW(store->commit_batch(batch, []() { return true; }), CommitAborted);
    EXPECT_FALSE(store->find_account_by_name(name).has_value());

    CommitResult committed = store->commit_batch(batch, AbortCheck());
    EXPECT_EQ(committed.inserted, 1u);
    auto joint = store->find_account_by_name(name);
    ASSERT_TRUE(joint.has_value());
    created.push_back(joint->id);
    EXPECT_EQ(joint->balance, -4500000);

    // Committing again adopts the account and finds the row already stored.
    CommitResult again = store->commit_batch(batch, AbortCheck());
    EXPECT_EQ(again.duplicates, 1u);
    EXPECT_EQ(store->fingerprints_for_account(joint->id).count(
                  TallyCrypto::calculate_fingerprint(joint->id, t.posted, t.amount, t.description)), 1u);
}

TEST_F(PgLedgerStoreTest, CommitToMissingAccountFails) {
    CommitBatch batch;
    batch.rows.push_back(row(-42, 5, -4500000, "Coffee"));
    EXPECT_THROW(store->commit_batch(batch, AbortCheck()), StorageError);
}

TEST_F(PgLedgerStoreTest, ListFiltersAndCategoryUpdate) {
    Account a = account("Checking");
    CommitBatch batch;
    batch.rows.push_back(row(a.id, 5, -4500000, "Coffee"));
    batch.rows.push_back(row(a.id, 20, -20000000, "Books"));
    store->commit_batch(batch, AbortCheck());

    TransactionFilter filter;
    filter.account_id = a.id;
    std::vector<Transaction> all = store->list_transactions(filter);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].description, "Books");

    store->update_category(all[1].id, std::string("Food"));
    filter.category = std::string("Food");
    std::vector<Transaction> food = store->list_transactions(filter);
    ASSERT_EQ(food.size(), 1u);
    EXPECT_EQ(food[0].description, "Coffee");

    filter.category.reset();
    filter.from = Date{2024, 1, 10};
    EXPECT_EQ(store->list_transactions(filter).size(), 1u);

    store->update_category(all[1].id, std::nullopt);
    EXPECT_FALSE(store->list_transactions(TransactionFilter{a.id, std::nullopt, Date{2024, 1, 5}, std::nullopt})[0]
                     .category.has_value());
    EXPECT_THROW(store->update_category(-1, std::string("x")), StorageError);
}

TEST_F(PgLedgerStoreTest, UndoImportReversesBalances) {
    Account a = account("Checking");
    int64_t run_id = store->begin_import_run("/tmp/undo.csv", utc_timestamp());
    CommitBatch batch;
    batch.import_run_id = run_id;
    batch.rows.push_back(row(a.id, 5, -4500000, "Coffee"));
    store->commit_batch(batch, AbortCheck());

    EXPECT_EQ(store->undo_import(run_id), 1u);
    EXPECT_EQ(store->find_account(a.id)->balance, 0);
    EXPECT_TRUE(store->fingerprints_for_account(a.id).empty());
}

TEST_F(PgLedgerStoreTest, ImportRunIsFinalizedExactlyOnce) {
    ImportRun run;
    run.source_path = "/tmp/run.csv";
    run.started_at = utc_timestamp();
    run.id = store->begin_import_run(run.source_path, run.started_at);
    run.profile_id = "generic";
    run.outcome = ImportOutcome::PartiallySucceeded;
    run.stage = ImportStage::Done;
    run.rows_seen = 3;
    run.rows_imported = 2;
    run.rows_invalid = 1;
    run.row_errors.push_back(RowError{4, RowErrorCode::BadDate, "unparseable date 'x'"});
    run.completed_at = utc_timestamp();
    store->finalize_import_run(run);

    auto stored = store->find_import_run(run.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->outcome, ImportOutcome::PartiallySucceeded);
    EXPECT_EQ(stored->rows_imported, 2u);
    ASSERT_EQ(stored->row_errors.size(), 1u);
    EXPECT_EQ(stored->row_errors[0].code, RowErrorCode::BadDate);
    EXPECT_EQ(stored->row_errors[0].line, 4u);

    EXPECT_THROW(store->finalize_import_run(run), StorageError);
    EXPECT_EQ(store->list_import_runs().front().id, run.id);
}

TEST_F(PgLedgerStoreTest, DeletingAccountCascadesTransactions) {
    Account a = account("Checking");
    CommitBatch batch;
    batch.rows.push_back(row(a.id, 5, -4500000, "Coffee"));
    store->commit_batch(batch, AbortCheck());

    store->delete_account(a.id);
    EXPECT_FALSE(store->find_account(a.id).has_value());
    EXPECT_TRUE(store->fingerprints_for_account(a.id).empty());
}
