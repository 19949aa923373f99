/**
 * @file BalanceHistoryServiceTest.cpp
 * @brief Unit tests for BalanceHistoryService (backward reconstruction)
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "fixtures/LedgerFixture.hpp"
#include "mocks/MockRepositories.hpp"
#include <stdexcept>

using namespace penny;
using namespace penny::tests;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Throw;

class BalanceHistoryServiceTest : public LedgerFixture {
protected:
    void SetUp() override {
        LedgerFixture::SetUp();
        addCategory("food");
        addCategory("salary", std::nullopt, domain::CategoryType::INCOME);
    }

    /// Снимки счёта за март в виде "дата=баланс"
    std::vector<std::string> marchSnapshots(const std::string& accountId) {
        std::vector<std::string> rows;
        for (const auto& s : history_->getBalanceHistory(accountId, date("2025-03-01"), date("2025-03-31"))) {
            rows.push_back(s.date.toString() + "=" + s.balance.toString());
        }
        return rows;
    }

    /// Счёт A: создан 2025-01-10, текущий баланс 1000.00 с учётом всех операций
    void seedAccountA() {
        addAccount("A", "1000.00", "USD", "2025-01-10T08:00:00Z");
        addOperation("inc", domain::OperationType::INCOME, "200.00", "A", "2025-03-05", std::string("salary"));
        addExpense("e10", "50.00", "A", "2025-03-10", "food");
        addExpense("e15", "30.00", "A", "2025-03-15", "food");
        addExpense("e20", "20.00", "A", "2025-03-20", "food");
    }
};

// ============================================================================
// RECONSTRUCTION
// ============================================================================

TEST_F(BalanceHistoryServiceTest, Populate_WritesEndOfDayBalancesWithoutDuplicates) {
    seedAccountA();

    history_->populateCurrentMonthHistory();

    EXPECT_THAT(marchSnapshots("A"),
                ::testing::ElementsAre("2025-03-04=900.00", "2025-03-09=1100.00", "2025-03-14=1050.00"));
}

TEST_F(BalanceHistoryServiceTest, Populate_NeverWritesTodayOrFuture) {
    seedAccountA();

    history_->populateCurrentMonthHistory();

    EXPECT_FALSE(history_->getAccountBalanceOnDate("A", today()).has_value());
    EXPECT_EQ(history_->getBalanceHistory("A", today(), date("2025-12-31")).size(), 0u);
}

TEST_F(BalanceHistoryServiceTest, Populate_AccountCreatedMidMonth_StartsAtCreation) {
    addAccount("late", "500.00", "USD", "2025-03-12T10:00:00Z");
    addExpense("x", "40.00", "late", "2025-03-13", "food");

    history_->populateCurrentMonthHistory();

    EXPECT_THAT(marchSnapshots("late"), ::testing::ElementsAre("2025-03-12=540.00", "2025-03-14=500.00"));
}

TEST_F(BalanceHistoryServiceTest, Populate_AccountCreatedToday_Nothing) {
    addAccount("fresh", "10.00", "USD", "2025-03-15T01:00:00Z");

    history_->populateCurrentMonthHistory();

    EXPECT_TRUE(marchSnapshots("fresh").empty());
}

TEST_F(BalanceHistoryServiceTest, Populate_IncomingTransfer_UsesDestinationAmount) {
    addAccount("src", "50.00");
    addAccount("B", "45.00", "EUR");

    domain::Operation transfer;
    transfer.id = "t1";
    transfer.type = domain::OperationType::TRANSFER;
    transfer.amount = money("50.00");
    transfer.destinationAmount = money("45.00");
    transfer.accountId = "src";
    transfer.toAccountId = std::string("B");
    transfer.date = date("2025-03-10");
    operationRepo_->save(transfer);

    history_->populateCurrentMonthHistory();

    EXPECT_THAT(marchSnapshots("B"), ::testing::ElementsAre("2025-03-09=0.00", "2025-03-14=45.00"));
    EXPECT_THAT(marchSnapshots("src"), ::testing::ElementsAre("2025-03-09=100.00", "2025-03-14=50.00"));
}

TEST_F(BalanceHistoryServiceTest, Populate_TransferWithinOneAccount_NetsToZero) {
    addAccount("B", "100.00");
    addOperation("t1", domain::OperationType::TRANSFER, "50.00", "B", "2025-03-10", std::nullopt, std::string("B"));
    addExpense("e12", "10.00", "B", "2025-03-12", "food");

    history_->populateCurrentMonthHistory();

    EXPECT_THAT(marchSnapshots("B"), ::testing::ElementsAre("2025-03-11=110.00", "2025-03-14=100.00"));
}

TEST_F(BalanceHistoryServiceTest, Populate_Rebuild_Idempotent) {
    seedAccountA();
    history_->populateCurrentMonthHistory();
    auto first = marchSnapshots("A");

    EXPECT_EQ(history_->deleteAccountHistory("A"), 3);
    history_->populateCurrentMonthHistory();
    history_->populateCurrentMonthHistory();

    EXPECT_EQ(marchSnapshots("A"), first);
}

TEST_F(BalanceHistoryServiceTest, Populate_ExistingSnapshotNotOverwritten) {
    seedAccountA();
    history_->upsertBalanceHistory("A", date("2025-03-14"), money("7777.00"));

    history_->populateCurrentMonthHistory();

    EXPECT_EQ(history_->getAccountBalanceOnDate("A", date("2025-03-14"))->toString(), "7777.00");
    EXPECT_EQ(history_->getAccountBalanceOnDate("A", date("2025-03-09"))->toString(), "1100.00");
}

// ============================================================================
// TRANSACTIONS
// ============================================================================

TEST_F(BalanceHistoryServiceTest, Populate_NestedInTransaction_SkippedWithoutChanges) {
    seedAccountA();

    txManager_->runInTransaction([&](ports::output::ITransaction&) {
        EXPECT_NO_THROW(history_->populateCurrentMonthHistory());
    });

    EXPECT_TRUE(marchSnapshots("A").empty());
}

TEST_F(BalanceHistoryServiceTest, Populate_WithCallerTransaction_Writes) {
    seedAccountA();

    txManager_->runInTransaction([&](ports::output::ITransaction& tx) {
        history_->populateCurrentMonthHistory(&tx);
    });

    EXPECT_EQ(marchSnapshots("A").size(), 3u);
}

TEST_F(BalanceHistoryServiceTest, Populate_Failure_SwallowedOnlyWithCallerTransaction) {
    auto brokenAccounts = std::make_shared<NiceMock<MockAccountRepository>>();
    ON_CALL(*brokenAccounts, findAll()).WillByDefault(Throw(std::runtime_error("connection lost")));

    application::BalanceHistoryService service(brokenAccounts, operationRepo_, historyRepo_, txManager_, clock_);

    StubTransaction tx;
    EXPECT_NO_THROW(service.populateCurrentMonthHistory(&tx));
    EXPECT_THROW(service.populateCurrentMonthHistory(), std::runtime_error);
    EXPECT_FALSE(txManager_->inTransaction());
}

// ============================================================================
// TODAY SNAPSHOT
// ============================================================================

TEST_F(BalanceHistoryServiceTest, UpdateToday_UpsertsSingleRow) {
    addAccount("A", "10.00");

    history_->updateTodayBalance("A", money("10.00"));
    history_->updateTodayBalance("A", money("12.50"));

    auto rows = history_->getBalanceHistory("A", today(), today());
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].balance.toString(), "12.50");
    EXPECT_EQ(history_->getLastSnapshotDate("A"), today());
}

TEST_F(BalanceHistoryServiceTest, UpdateToday_StorageFailure_Swallowed) {
    auto brokenHistory = std::make_shared<NiceMock<MockBalanceHistoryRepository>>();
    ON_CALL(*brokenHistory, upsert(_)).WillByDefault(Throw(std::runtime_error("disk full")));

    application::BalanceHistoryService service(accountRepo_, operationRepo_, brokenHistory, txManager_, clock_);

    EXPECT_NO_THROW(service.updateTodayBalance("A", money("1.00")));
    StubTransaction tx;
    EXPECT_NO_THROW(service.updateTodayBalance("A", money("1.00"), &tx));
}

// ============================================================================
// MANUAL EDITS / READS
// ============================================================================

TEST_F(BalanceHistoryServiceTest, AllAccountsOnDate_FollowsDisplayOrder) {
    addAccount("second", "0", "USD", "2025-01-01T09:00:00Z", 2);
    addAccount("first", "0", "EUR", "2025-01-01T09:00:00Z", 1);
    history_->upsertBalanceHistory("second", date("2025-03-01"), money("2.00"));
    history_->upsertBalanceHistory("first", date("2025-03-01"), money("1.00"));

    auto rows = history_->getAllAccountsBalanceOnDate(date("2025-03-01"));

    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].accountId, "first");
    EXPECT_EQ(rows[0].currency, "EUR");
    EXPECT_EQ(rows[1].balance.toString(), "2.00");
}

TEST_F(BalanceHistoryServiceTest, DeleteBalanceHistory_RemovesOneDay) {
    addAccount("A", "0");
    history_->upsertBalanceHistory("A", date("2025-03-01"), money("1.00"));
    history_->upsertBalanceHistory("A", date("2025-03-02"), money("2.00"));

    history_->deleteBalanceHistory("A", date("2025-03-01"));
    history_->deleteBalanceHistory("A", date("2025-02-01"));

    EXPECT_FALSE(history_->getAccountBalanceOnDate("A", date("2025-03-01")).has_value());
    EXPECT_EQ(history_->getLastSnapshotDate("A"), date("2025-03-02"));
}

TEST_F(BalanceHistoryServiceTest, LastSnapshotDate_NoHistory_Empty) {
    EXPECT_FALSE(history_->getLastSnapshotDate("ghost").has_value());
}
