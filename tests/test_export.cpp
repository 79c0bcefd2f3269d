/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: test_export.cpp
 * ============================================================================
 */

#include <gtest/gtest.h>
#include "core/crypto.hpp"
#include "core/export.hpp"
#include "support/memory_store.hpp"

using namespace tally;

namespace {

NewTransaction row(int64_t account_id, Date posted, money_micro amount, const std::string& description,
                   std::optional<std::string> category = std::nullopt) {
    NewTransaction t;
    t.account_id = account_id;
    t.posted = posted;
    t.amount = amount;
    t.description = description;
    t.category = category;
    t.fingerprint = TallyCrypto::calculate_fingerprint(account_id, posted, amount, description);
    return t;
}

} // namespace

TEST(ExportTest, WritesHeaderAndRowsNewestFirst) {
    test::MemoryLedgerStore store;
    int64_t id = store.create_account("Checking", "Bank").id;
    CommitBatch batch;
    batch.rows.push_back(row(id, Date{2024, 1, 5}, -4500000, "Coffee", std::string("Food")));
    batch.rows.push_back(row(id, Date{2024, 1, 6}, 2000000000, "Salary"));
    store.commit_batch(batch, AbortCheck());

    std::string csv = export_transactions(store, TransactionFilter());
    EXPECT_EQ(csv,
              "Date,Account,Description,Amount,Category\r\n"
              "2024-01-06,Checking,Salary,2000.00,\r\n"
              "2024-01-05,Checking,Coffee,-4.50,Food\r\n");
}

TEST(ExportTest, QuotesFieldsThatNeedIt) {
    EXPECT_EQ(csv_escape("plain"), "plain");
    EXPECT_EQ(csv_escape("Smith, J"), "\"Smith, J\"");
    EXPECT_EQ(csv_escape("say \"hi\""), "\"say \"\"hi\"\"\"");
}

TEST(ExportTest, AppliesFilter) {
    test::MemoryLedgerStore store;
    int64_t a = store.create_account("Checking", "Bank").id;
    int64_t b = store.create_account("Savings", "Bank").id;
    CommitBatch batch;
    batch.rows.push_back(row(a, Date{2024, 1, 5}, -4500000, "Coffee"));
    batch.rows.push_back(row(b, Date{2024, 2, 1}, 100000000, "Interest, monthly"));
    store.commit_batch(batch, AbortCheck());

    TransactionFilter filter;
    filter.account_id = b;
    std::string csv = export_transactions(store, filter);
    EXPECT_EQ(csv,
              "Date,Account,Description,Amount,Category\r\n"
              "2024-02-01,Savings,\"Interest, monthly\",100.00,\r\n");

    filter = TransactionFilter();
    filter.from = Date{2024, 3, 1};
    EXPECT_EQ(export_transactions(store, filter), "Date,Account,Description,Amount,Category\r\n");
}
