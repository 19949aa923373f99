/**
 * @file BudgetServiceTest.cpp
 * @brief Unit tests for BudgetService
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
using ::testing::Return;
using ::testing::Throw;

class BudgetServiceTest : public LedgerFixture {
protected:
    void SetUp() override {
        LedgerFixture::SetUp();
        addCategory("food");
        addCategory("groceries", std::string("food"));
        addCategory("salary", std::nullopt, domain::CategoryType::INCOME);
        addAccount("A", "0.00", "USD");
        addAccount("E", "0.00", "EUR");
    }

    static domain::BudgetRequest request(
        const std::string& categoryId = "food",
        const std::string& amount = "500.00",
        const std::string& periodType = "monthly",
        const std::string& startDate = "2025-01-01")
    {
        domain::BudgetRequest r;
        r.categoryId = categoryId;
        r.amount = amount;
        r.currency = "USD";
        r.periodType = periodType;
        r.startDate = startDate;
        return r;
    }

    domain::Budget foodBudget(const std::optional<std::string>& endDate = std::nullopt,
                              const std::string& startDate = "2025-01-01")
    {
        auto r = request("food", "500.00", "monthly", startDate);
        r.id = std::string("food-m");
        r.endDate = endDate;
        return budgets_->createBudget(r);
    }

    int opSeq_ = 0;

    void spend(const std::string& amount, const std::string& onDate,
               const std::string& categoryId = "food", const std::string& accountId = "A")
    {
        addExpense("op" + std::to_string(++opSeq_), amount, accountId, onDate, categoryId);
    }
};

// ============================================================================
// STATUS
// ============================================================================

TEST_F(BudgetServiceTest, Status_IncludesChildCategories_Danger) {
    foodBudget();
    spend("300.00", "2025-03-02");
    spend("150.00", "2025-03-14", "groceries");

    auto status = budgets_->calculateBudgetStatus("food-m");

    EXPECT_EQ(status.spent.toString(), "450.00");
    EXPECT_EQ(status.remaining.toString(), "50.00");
    EXPECT_EQ(status.percentage, 90);
    EXPECT_FALSE(status.isExceeded);
    EXPECT_EQ(status.status, domain::BudgetHealth::DANGER);
    EXPECT_EQ(status.periodStart.toString(), "2025-03-01");
    EXPECT_EQ(status.periodEnd.toString(), "2025-03-31");
}

TEST_F(BudgetServiceTest, Status_OverLimit_Exceeded) {
    foodBudget();
    spend("600.00", "2025-03-05");

    auto status = budgets_->calculateBudgetStatus("food-m");

    EXPECT_TRUE(status.isExceeded);
    EXPECT_EQ(status.remaining.toString(), "-100.00");
    EXPECT_EQ(status.percentage, 120);
    EXPECT_EQ(status.status, domain::BudgetHealth::EXCEEDED);
}

TEST_F(BudgetServiceTest, Status_Bands_WarningAndSafe) {
    foodBudget();
    spend("350.00", "2025-03-05");
    EXPECT_EQ(budgets_->calculateBudgetStatus("food-m").status, domain::BudgetHealth::WARNING);

    addCategory("books");
    auto r = request("books");
    r.id = std::string("books-m");
    budgets_->createBudget(r);
    spend("300.00", "2025-03-05", "books");
    EXPECT_EQ(budgets_->calculateBudgetStatus("books-m").status, domain::BudgetHealth::SAFE);
}

TEST_F(BudgetServiceTest, Status_IgnoresOtherPeriodsCurrenciesAndIncome) {
    foodBudget();
    spend("10.00", "2025-02-28");
    spend("20.00", "2025-04-01");
    spend("30.00", "2025-03-05", "food", "E");
    addOperation("inc", domain::OperationType::INCOME, "40.00", "A", "2025-03-05", std::string("salary"));
    spend("5.00", "2025-03-31");

    EXPECT_EQ(budgets_->calculateBudgetStatus("food-m").spent.toString(), "5.00");
}

TEST_F(BudgetServiceTest, Status_BudgetStartInsidePeriod_ClipsWindow) {
    foodBudget(std::nullopt, "2025-03-10");
    spend("100.00", "2025-03-09");
    spend("25.00", "2025-03-10");

    auto status = budgets_->calculateBudgetStatus("food-m");

    EXPECT_EQ(status.spent.toString(), "25.00");
    EXPECT_EQ(status.periodStart.toString(), "2025-03-01");
}

TEST_F(BudgetServiceTest, Status_BudgetEndInsidePeriod_EndExclusive) {
    foodBudget(std::string("2025-03-12"));
    spend("7.00", "2025-03-11");
    spend("100.00", "2025-03-12");

    EXPECT_EQ(budgets_->calculateBudgetStatus("food-m").spent.toString(), "7.00");
}

TEST_F(BudgetServiceTest, Status_UnknownBudget_Throws) {
    EXPECT_THROW(budgets_->calculateBudgetStatus("ghost"), domain::NotFoundError);
}

// ============================================================================
// SPENDING
// ============================================================================

TEST_F(BudgetServiceTest, Spending_WithoutChildren_OnlyOwnCategory) {
    spend("300.00", "2025-03-02");
    spend("150.00", "2025-03-14", "groceries");

    auto own = budgets_->calculateSpendingForBudget("food", "USD", date("2025-03-01"), date("2025-04-01"), false);
    auto all = budgets_->calculateSpendingForBudget("food", "USD", date("2025-03-01"), date("2025-04-01"));

    EXPECT_EQ(own.toString(), "300.00");
    EXPECT_EQ(all.toString(), "450.00");
}

TEST_F(BudgetServiceTest, Spending_NoMatches_Zero) {
    EXPECT_TRUE(budgets_->calculateSpendingForBudget("food", "USD", date("2025-03-01"), date("2025-04-01")).isZero());
}

// ============================================================================
// VALIDATION
// ============================================================================

TEST_F(BudgetServiceTest, Validate_FirstErrorInOrder) {
    auto r = request("", "0");
    r.currency = "";
    EXPECT_EQ(budgets_->validateBudget(r), std::optional<std::string>("Category is required"));

    r.categoryId = "food";
    EXPECT_EQ(budgets_->validateBudget(r), std::optional<std::string>("Amount must be greater than zero"));

    r.amount = "abc";
    EXPECT_EQ(budgets_->validateBudget(r), std::optional<std::string>("Amount must be greater than zero"));

    r.amount = "10";
    EXPECT_EQ(budgets_->validateBudget(r), std::optional<std::string>("Currency is required"));

    r.currency = "USD";
    r.periodType = "daily";
    EXPECT_EQ(budgets_->validateBudget(r), std::optional<std::string>("Invalid period type"));

    r.periodType = "weekly";
    r.startDate = "";
    EXPECT_EQ(budgets_->validateBudget(r), std::optional<std::string>("Start date is required"));

    r.startDate = "2025-13-01";
    EXPECT_EQ(budgets_->validateBudget(r), std::optional<std::string>("Invalid start date"));

    r.startDate = "2025-03-01";
    r.endDate = "2025-03-01";
    EXPECT_EQ(budgets_->validateBudget(r), std::optional<std::string>("End date must be after start date"));

    r.endDate = "2025-03-02";
    EXPECT_FALSE(budgets_->validateBudget(r).has_value());
}

TEST_F(BudgetServiceTest, Create_Invalid_ThrowsValidation) {
    EXPECT_THROW(budgets_->createBudget(request("food", "-5")), domain::ValidationError);
    EXPECT_TRUE(budgets_->getAllBudgets().empty());
}

// ============================================================================
// DUPLICATES / UPDATE / DELETE
// ============================================================================

TEST_F(BudgetServiceTest, Create_Duplicate_Throws) {
    foodBudget();

    try {
        budgets_->createBudget(request());
        FAIL() << "Expected IntegrityError";
    } catch (const domain::IntegrityError& e) {
        EXPECT_STREQ(e.what(), "A budget already exists for this category, currency, and period type.");
    }

    auto eur = request();
    eur.currency = "EUR";
    EXPECT_NO_THROW(budgets_->createBudget(eur));
    EXPECT_NO_THROW(budgets_->createBudget(request("food", "100", "weekly")));
    EXPECT_EQ(budgets_->getBudgetsByCategory("food").size(), 3u);
}

TEST_F(BudgetServiceTest, Update_Self_NotDuplicate) {
    foodBudget();

    domain::BudgetUpdate update;
    update.amount = "750.00";
    auto updated = budgets_->updateBudget("food-m", update);

    EXPECT_EQ(updated.amount.toString(), "750.00");
    EXPECT_EQ(budgets_->getBudgetById("food-m")->amount.toString(), "750.00");
}

TEST_F(BudgetServiceTest, Update_CollidesWithOther_Throws) {
    foodBudget();
    auto weekly = budgets_->createBudget(request("food", "100", "weekly"));

    domain::BudgetUpdate update;
    update.periodType = "monthly";

    EXPECT_THROW(budgets_->updateBudget(weekly.id, update), domain::IntegrityError);
    EXPECT_EQ(budgets_->getBudgetById(weekly.id)->periodType, domain::PeriodType::WEEKLY);
}

TEST_F(BudgetServiceTest, Update_EmptyEndDate_MakesOpenEnded) {
    foodBudget(std::string("2025-12-31"));

    domain::BudgetUpdate update;
    update.endDate = "";
    auto updated = budgets_->updateBudget("food-m", update);

    EXPECT_FALSE(updated.endDate.has_value());
    EXPECT_FALSE(budgets_->getBudgetById("food-m")->endDate.has_value());
}

TEST_F(BudgetServiceTest, Delete_RemovesAndPublishes) {
    foodBudget();

    budgets_->deleteBudget("food-m");

    EXPECT_FALSE(budgets_->budgetExists("food-m"));
    EXPECT_EQ(publisher_->countByRoutingKey("budget.changed"), 2);
    EXPECT_EQ(publisher_->lastPayload("budget.changed")["action"].get<std::string>(), "deleted");
    EXPECT_EQ(publisher_->lastPayload("budget.changed")["budget_id"].get<std::string>(), "food-m");
}

TEST_F(BudgetServiceTest, Delete_Unknown_Throws) {
    EXPECT_THROW(budgets_->deleteBudget("ghost"), domain::NotFoundError);
    EXPECT_EQ(publisher_->publishCallCount(), 0);
}

// ============================================================================
// PERIODS / LOOKUPS
// ============================================================================

TEST_F(BudgetServiceTest, PeriodDates_ByName) {
    auto current = budgets_->getCurrentPeriodDates("weekly", date("2025-03-15"));
    EXPECT_EQ(current.start.toString(), "2025-03-09");
    EXPECT_EQ(current.end.toString(), "2025-03-15");

    auto next = budgets_->getNextPeriodDates("monthly", date("2025-03-15"));
    EXPECT_EQ(next.start.toString(), "2025-04-01");
    EXPECT_EQ(next.end.toString(), "2025-04-30");

    auto previous = budgets_->getPreviousPeriodDates("yearly", date("2025-03-15"));
    EXPECT_EQ(previous.start.toString(), "2024-01-01");
    EXPECT_EQ(previous.end.toString(), "2024-12-31");

    EXPECT_THROW(budgets_->getCurrentPeriodDates("daily", date("2025-03-15")), domain::ValidationError);
}

TEST_F(BudgetServiceTest, HasActiveBudget_UsesToday) {
    foodBudget();
    budgets_->createBudget(request("groceries", "50", "monthly", "2025-04-01"));
    auto expired = request("salary");
    expired.endDate = "2025-03-15";
    budgets_->createBudget(expired);

    EXPECT_TRUE(budgets_->hasActiveBudget("food"));
    EXPECT_FALSE(budgets_->hasActiveBudget("groceries"));
    EXPECT_FALSE(budgets_->hasActiveBudget("salary"));
}

TEST_F(BudgetServiceTest, FindDuplicate_ExcludesGivenId) {
    foodBudget();

    EXPECT_TRUE(budgets_->findDuplicateBudget("food", "USD", "monthly").has_value());
    EXPECT_FALSE(budgets_->findDuplicateBudget("food", "USD", "monthly", std::string("food-m")).has_value());
    EXPECT_FALSE(budgets_->findDuplicateBudget("food", "USD", "yearly").has_value());
}

TEST_F(BudgetServiceTest, AllStatuses_OnlyActiveBudgets) {
    foodBudget();
    auto expired = request("groceries", "50", "monthly", "2025-01-01");
    expired.id = std::string("old");
    expired.endDate = "2025-02-01";
    budgets_->createBudget(expired);

    auto statuses = budgets_->calculateAllBudgetStatuses();

    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses.count("food-m"), 1u);
}

TEST_F(BudgetServiceTest, AllStatuses_FailingBudgetSkipped) {
    auto budgetRepo = std::make_shared<NiceMock<MockBudgetRepository>>();

    domain::Budget good;
    good.id = "good";
    good.categoryId = "food";
    good.amount = money("100");
    good.currency = "USD";
    good.startDate = date("2025-01-01");
    domain::Budget bad = good;
    bad.id = "bad";

    ON_CALL(*budgetRepo, findActive(_)).WillByDefault(Return(std::vector<domain::Budget>{bad, good}));
    ON_CALL(*budgetRepo, findById("bad")).WillByDefault(Throw(std::runtime_error("row is corrupted")));
    ON_CALL(*budgetRepo, findById("good")).WillByDefault(Return(good));

    application::BudgetService service(budgetRepo, operationRepo_, categories_, clock_, publisher_);
    spend("40.00", "2025-03-03");

    auto statuses = service.calculateAllBudgetStatuses();

    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses.at("good").spent.toString(), "40.00");
}
