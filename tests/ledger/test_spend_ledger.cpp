#include <gtest/gtest.h>
#include "ledger/spend_ledger.hpp"

TEST(SpendLedgerTest, StartsEmpty) {
    dp_ledger::SpendLedger ledger;
    EXPECT_TRUE(ledger.empty());
    EXPECT_EQ(ledger.size(), 0u);
    EXPECT_TRUE(ledger.records().empty());
}

TEST(SpendLedgerTest, AppendKeepsInsertionOrder) {
    dp_ledger::SpendLedger ledger;
    ledger.append({1.0, 0.0});
    ledger.append({0.5, 1e-6});
    ledger.append({2.0, 0.0});

    ASSERT_EQ(ledger.size(), 3u);
    EXPECT_DOUBLE_EQ(ledger.records()[0].epsilon, 1.0);
    EXPECT_DOUBLE_EQ(ledger.records()[1].epsilon, 0.5);
    EXPECT_DOUBLE_EQ(ledger.records()[1].delta, 1e-6);
    EXPECT_DOUBLE_EQ(ledger.records()[2].epsilon, 2.0);
}

TEST(SpendLedgerTest, AppendDoesNotTouchEarlierEntries) {
    dp_ledger::SpendLedger ledger;
    ledger.append({0.25, 0.0});
    const dp_ledger::SpendRecord first = ledger.records().front();

    for (int i = 0; i < 100; ++i) {
        ledger.append({1.0, 0.0});
    }

    EXPECT_DOUBLE_EQ(ledger.records().front().epsilon, first.epsilon);
    EXPECT_DOUBLE_EQ(ledger.records().front().delta, first.delta);
    EXPECT_EQ(ledger.size(), 101u);
}

TEST(SpendLedgerTest, ViewIsRestartable) {
    dp_ledger::SpendLedger ledger({{1.0, 0.0}, {2.0, 0.0}, {3.0, 0.0}});

    double first_pass = 0.0;
    for (const auto& record : ledger) {
        first_pass += record.epsilon;
    }
    double second_pass = 0.0;
    for (const auto& record : ledger) {
        second_pass += record.epsilon;
    }

    EXPECT_DOUBLE_EQ(first_pass, 6.0);
    EXPECT_DOUBLE_EQ(second_pass, first_pass);
}

TEST(SpendLedgerTest, LedgerPerformsNoBudgetCheck) {
    dp_ledger::SpendLedger ledger;
    ledger.append({1e6, 0.9});
    ledger.append({1e6, 0.9});
    EXPECT_EQ(ledger.size(), 2u);
}
