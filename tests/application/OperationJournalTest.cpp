/**
 * @file OperationJournalTest.cpp
 * @brief Unit tests for OperationJournal
 */

#include <gtest/gtest.h>
#include "fixtures/LedgerFixture.hpp"

using namespace penny;
using namespace penny::tests;

class OperationJournalTest : public LedgerFixture {
protected:
    void SetUp() override {
        LedgerFixture::SetUp();
        addAccount("a", "100.00");
        addAccount("b", "0.00");
        addAccount("eur", "0.00", "EUR");
        addCategory("food");
        addCategory("salary", std::nullopt, domain::CategoryType::INCOME);
    }

    static domain::OperationRequest expense(const std::string& amount, const std::string& accountId = "a") {
        domain::OperationRequest request;
        request.type = "expense";
        request.amount = amount;
        request.accountId = accountId;
        request.categoryId = "food";
        request.date = "2025-03-10";
        return request;
    }

    std::string balance(const std::string& accountId) {
        return ledger_->getAccountBalance(accountId).toString();
    }
};

// ============================================================================
// CREATE
// ============================================================================

TEST_F(OperationJournalTest, CreateExpense_DecreasesBalance) {
    auto op = journal_->createOperation(expense("30.00"));

    EXPECT_EQ(balance("a"), "70.00");
    EXPECT_EQ(op.type, domain::OperationType::EXPENSE);
    EXPECT_TRUE(journal_->getOperationById(op.id).has_value());
    EXPECT_EQ(history_->getAccountBalanceOnDate("a", today())->toString(), "70.00");
    EXPECT_EQ(publisher_->countByRoutingKey("operation.changed"), 1);
}

TEST_F(OperationJournalTest, CreateIncome_IncreasesBalance) {
    domain::OperationRequest request;
    request.type = "income";
    request.amount = "1500.25";
    request.accountId = "a";
    request.categoryId = "salary";
    request.date = "2025-03-01";

    journal_->createOperation(request);

    EXPECT_EQ(balance("a"), "1600.25");
}

TEST_F(OperationJournalTest, CreateTransfer_CrossCurrency_UsesDestinationAmount) {
    domain::OperationRequest request;
    request.type = "transfer";
    request.amount = "50.00";
    request.accountId = "a";
    request.toAccountId = "eur";
    request.destinationAmount = "45.00";
    request.exchangeRate = "0.9";
    request.sourceCurrency = "USD";
    request.destinationCurrency = "EUR";
    request.date = "2025-03-12";

    auto op = journal_->createOperation(request);

    EXPECT_EQ(balance("a"), "50.00");
    EXPECT_EQ(balance("eur"), "45.00");
    EXPECT_FALSE(op.categoryId.has_value());
    ASSERT_TRUE(op.destinationAmount.has_value());
    EXPECT_EQ(op.destinationAmount->toString(), "45.00");
}

TEST_F(OperationJournalTest, CreateTransfer_SameCurrency_UsesAmount) {
    domain::OperationRequest request;
    request.type = "transfer";
    request.amount = "25.00";
    request.accountId = "a";
    request.toAccountId = "b";

    journal_->createOperation(request);

    EXPECT_EQ(balance("a"), "75.00");
    EXPECT_EQ(balance("b"), "25.00");
}

TEST_F(OperationJournalTest, Create_EmptyDate_UsesToday) {
    auto request = expense("1");
    request.date = "";

    auto op = journal_->createOperation(request);

    EXPECT_EQ(op.date, today());
}

// ============================================================================
// VALIDATION
// ============================================================================

TEST_F(OperationJournalTest, Create_InvalidType_Throws) {
    auto request = expense("10");
    request.type = "refund";

    try {
        journal_->createOperation(request);
        FAIL() << "Expected ValidationError";
    } catch (const domain::ValidationError& e) {
        EXPECT_STREQ(e.what(), "Invalid operation type: refund");
    }
}

TEST_F(OperationJournalTest, Create_InvalidInput_ThrowsAndLeavesBalances) {
    auto zero = expense("0");
    EXPECT_THROW(journal_->createOperation(zero), domain::ValidationError);

    auto noCategory = expense("10");
    noCategory.categoryId.reset();
    EXPECT_THROW(journal_->createOperation(noCategory), domain::ValidationError);

    auto unknownCategory = expense("10");
    unknownCategory.categoryId = "ghost";
    EXPECT_THROW(journal_->createOperation(unknownCategory), domain::NotFoundError);

    auto unknownAccount = expense("10", "ghost");
    EXPECT_THROW(journal_->createOperation(unknownAccount), domain::NotFoundError);

    domain::OperationRequest selfTransfer;
    selfTransfer.type = "transfer";
    selfTransfer.amount = "10";
    selfTransfer.accountId = "a";
    selfTransfer.toAccountId = "a";
    EXPECT_THROW(journal_->createOperation(selfTransfer), domain::ValidationError);

    EXPECT_EQ(balance("a"), "100.00");
    EXPECT_TRUE(journal_->getOperationsByAccount("a").empty());
}

// ============================================================================
// UPDATE / DELETE
// ============================================================================

TEST_F(OperationJournalTest, Update_AppliesDifference) {
    auto op = journal_->createOperation(expense("30.00"));

    journal_->updateOperation(op.id, expense("50.00"));

    EXPECT_EQ(balance("a"), "50.00");
    EXPECT_EQ(journal_->getOperationById(op.id)->amount.toString(), "50.00");
}

TEST_F(OperationJournalTest, Update_MovesEffectToOtherAccount) {
    auto op = journal_->createOperation(expense("30.00"));

    journal_->updateOperation(op.id, expense("30.00", "b"));

    EXPECT_EQ(balance("a"), "100.00");
    EXPECT_EQ(balance("b"), "-30.00");
}

TEST_F(OperationJournalTest, Delete_ReversesEffect) {
    auto op = journal_->createOperation(expense("30.00"));

    journal_->deleteOperation(op.id);

    EXPECT_EQ(balance("a"), "100.00");
    EXPECT_FALSE(journal_->getOperationById(op.id).has_value());
}

TEST_F(OperationJournalTest, Delete_Unknown_Throws) {
    EXPECT_THROW(journal_->deleteOperation("ghost"), domain::NotFoundError);
}

TEST_F(OperationJournalTest, Delete_TransferMovedOntoItsDestination_BalanceUnchanged) {
    domain::OperationRequest request;
    request.type = "transfer";
    request.amount = "50.00";
    request.accountId = "a";
    request.toAccountId = "b";
    auto op = journal_->createOperation(request);
    ASSERT_EQ(balance("b"), "50.00");

    ledger_->transferOperations("a", "b");
    journal_->deleteOperation(op.id);

    EXPECT_EQ(balance("a"), "50.00");
    EXPECT_EQ(balance("b"), "50.00");
}

TEST_F(OperationJournalTest, Update_TransferMovedOntoItsDestination_AppliesOnlyNewEffect) {
    domain::OperationRequest request;
    request.type = "transfer";
    request.amount = "50.00";
    request.accountId = "a";
    request.toAccountId = "b";
    auto op = journal_->createOperation(request);
    ledger_->transferOperations("a", "b");

    request.accountId = "b";
    request.toAccountId = "a";
    request.amount = "20.00";
    journal_->updateOperation(op.id, request);

    EXPECT_EQ(balance("a"), "70.00");
    EXPECT_EQ(balance("b"), "30.00");
}

// ============================================================================
// EVENTS
// ============================================================================

TEST_F(OperationJournalTest, CreateTransfer_PublishesBalanceEventsForBothAccounts) {
    domain::OperationRequest request;
    request.type = "transfer";
    request.amount = "25.00";
    request.accountId = "a";
    request.toAccountId = "b";

    journal_->createOperation(request);

    const auto& messages = publisher_->getPublishedMessages();
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].routingKey, "account.balance_changed");
    EXPECT_EQ(messages[1].routingKey, "account.balance_changed");
    EXPECT_EQ(messages[2].routingKey, "operation.changed");
    EXPECT_EQ(publisher_->lastPayload("account.balance_changed")["balance"].get<std::string>(), "25.00");
    EXPECT_FALSE(txManager_->inTransaction());
}

TEST_F(OperationJournalTest, Create_InvalidInput_PublishesNothing) {
    auto request = expense("10");
    request.categoryId = "ghost";

    EXPECT_THROW(journal_->createOperation(request), domain::NotFoundError);

    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

// ============================================================================
// QUERIES
// ============================================================================

TEST_F(OperationJournalTest, GetByDateRange_InclusiveNewestFirst) {
    auto early = expense("1");
    early.date = "2025-03-01";
    auto late = expense("2");
    late.date = "2025-03-31";
    auto outside = expense("3");
    outside.date = "2025-04-01";

    journal_->createOperation(early);
    journal_->createOperation(late);
    journal_->createOperation(outside);

    auto ops = journal_->getOperationsByDateRange(date("2025-03-01"), date("2025-03-31"));

    ASSERT_EQ(ops.size(), 2u);
    EXPECT_EQ(ops[0].date.toString(), "2025-03-31");
    EXPECT_EQ(ops[1].date.toString(), "2025-03-01");
}
