/**
 * ============================================================================
 * SOFTWARE: Tally: Statement Ingestion Engine
 * AUTHOR & COPYRIGHT: Cel-Tech-Serv Pty Ltd
 * MODULE: test_dedup.cpp
 * ============================================================================
 */

#include <gtest/gtest.h>
#include "core/crypto.hpp"
#include "pipeline/dedup.hpp"
#include "support/memory_store.hpp"

using namespace tally;

namespace {

TransactionDraft draft(int64_t account_id, size_t line, const std::string& description) {
    TransactionDraft d;
    d.line = line;
    d.account_name = "Checking";
    d.account_id = account_id;
    d.posted = Date{2024, 1, 5};
    d.amount = -4500000;
    d.description = description;
    return d;
}

} // namespace

TEST(DuplicateDetectorTest, FirstOccurrenceWinsWithinFile) {
    test::MemoryLedgerStore store;
    int64_t id = store.create_account("Checking", "Bank").id;
    DuplicateDetector detector(store);

    TransactionDraft first = draft(id, 2, "Coffee");
    TransactionDraft second = draft(id, 3, "  COFFEE ");
    EXPECT_FALSE(detector.check(first).has_value());
    EXPECT_FALSE(first.fingerprint.empty());

    auto dup = detector.check(second);
    ASSERT_TRUE(dup.has_value());
    EXPECT_EQ(dup->code, RowErrorCode::DuplicateInFile);
    EXPECT_EQ(dup->line, 3u);
    EXPECT_EQ(first.fingerprint, second.fingerprint);
}

TEST(DuplicateDetectorTest, StoredFingerprintsAreDuplicates) {
    test::MemoryLedgerStore store;
    int64_t id = store.create_account("Checking", "Bank").id;

    CommitBatch batch;
    NewTransaction row;
    row.account_id = id;
    row.posted = Date{2024, 1, 5};
    row.amount = -4500000;
    row.description = "Coffee";
    row.fingerprint = TallyCrypto::calculate_fingerprint(id, row.posted, row.amount, row.description);
    batch.rows.push_back(row);
    store.commit_batch(batch, AbortCheck());

    DuplicateDetector detector(store);
    TransactionDraft again = draft(id, 2, "Coffee");
    auto dup = detector.check(again);
    ASSERT_TRUE(dup.has_value());
    EXPECT_EQ(dup->code, RowErrorCode::DuplicateStored);
    EXPECT_EQ(kind_of(dup->code), RowErrorKind::Duplicate);
}

TEST(DuplicateDetectorTest, SameLineInDifferentAccountsIsNotDuplicate) {
    test::MemoryLedgerStore store;
    int64_t a = store.create_account("Checking", "Bank").id;
    int64_t b = store.create_account("Savings", "Bank").id;
    DuplicateDetector detector(store);

    TransactionDraft in_a = draft(a, 2, "Transfer");
    TransactionDraft in_b = draft(b, 3, "Transfer");
    EXPECT_FALSE(detector.check(in_a).has_value());
    EXPECT_FALSE(detector.check(in_b).has_value());
    EXPECT_NE(in_a.fingerprint, in_b.fingerprint);
}

TEST(DuplicateDetectorTest, AccountsNotCreatedYetAreKeptApartByName) {
    test::MemoryLedgerStore store;
    DuplicateDetector detector(store);

    TransactionDraft joint = draft(0, 2, "Transfer");
    joint.account_name = "Joint";
    joint.new_account = true;
    TransactionDraft holiday = draft(0, 3, "Transfer");
    holiday.account_name = "Holiday";
    holiday.new_account = true;
    TransactionDraft joint_again = joint;
    joint_again.line = 4;

    EXPECT_FALSE(detector.check(joint).has_value());
    EXPECT_FALSE(detector.check(holiday).has_value());
    auto dup = detector.check(joint_again);
    ASSERT_TRUE(dup.has_value());
    EXPECT_EQ(dup->code, RowErrorCode::DuplicateInFile);
}
