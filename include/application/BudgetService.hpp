#pragma once

#include "ports/input/IBudgetService.hpp"
#include "ports/input/ICategoryService.hpp"
#include "ports/output/IBudgetRepository.hpp"
#include "ports/output/IOperationRepository.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/events/LedgerEvents.hpp"
#include "domain/errors/LedgerError.hpp"
#include "utils/IdGenerator.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <cmath>
#include <iostream>

namespace penny::application {

/**
 * @brief Бюджеты: валидация, периоды, расходы и статус
 */
class BudgetService : public ports::input::IBudgetService {
public:
    BudgetService(
        std::shared_ptr<ports::output::IBudgetRepository> budgetRepo,
        std::shared_ptr<ports::output::IOperationRepository> operationRepo,
        std::shared_ptr<ports::input::ICategoryService> categories,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher
    ) : budgetRepo_(std::move(budgetRepo))
      , operationRepo_(std::move(operationRepo))
      , categories_(std::move(categories))
      , clock_(std::move(clock))
      , eventPublisher_(std::move(eventPublisher))
    {
        std::cout << "[BudgetService] Created" << std::endl;
    }

    // ================================================================
    // CRUD
    // ================================================================

    std::optional<std::string> validateBudget(const domain::BudgetRequest& request) override {
        if (request.categoryId.empty()) {
            return "Category is required";
        }
        if (!domain::Money::isValid(request.amount) || !domain::Money::parse(request.amount).isPositive()) {
            return "Amount must be greater than zero";
        }
        if (request.currency.empty()) {
            return "Currency is required";
        }
        if (!domain::isValidPeriodType(request.periodType)) {
            return "Invalid period type";
        }
        if (request.startDate.empty()) {
            return "Start date is required";
        }

        auto start = parseDate(request.startDate);
        if (!start) {
            return "Invalid start date";
        }

        if (request.endDate && !request.endDate->empty()) {
            auto end = parseDate(*request.endDate);
            if (!end) {
                return "Invalid end date";
            }
            if (*end <= *start) {
                return "End date must be after start date";
            }
        }

        return std::nullopt;
    }

    domain::Budget createBudget(const domain::BudgetRequest& request) override {
        auto budget = buildBudget(request, std::nullopt);
        budget.id = request.id ? *request.id : utils::IdGenerator::newId("bud");
        budget.createdAt = clock_->now();
        budget.updatedAt = budget.createdAt;

        budgetRepo_->save(budget);
        std::cout << "[BudgetService] Created budget " << budget.id << " for " << budget.categoryId
                  << ": " << budget.amount.toString() << " " << budget.currency
                  << " " << domain::toString(budget.periodType) << std::endl;

        publishBudgetChanged(budget.id, "created");
        return budget;
    }

    domain::Budget updateBudget(const std::string& budgetId, const domain::BudgetUpdate& update) override {
        auto existing = requireBudget(budgetId);

        auto request = toRequest(existing);
        if (update.categoryId) request.categoryId = *update.categoryId;
        if (update.amount) request.amount = *update.amount;
        if (update.currency) request.currency = *update.currency;
        if (update.periodType) request.periodType = *update.periodType;
        if (update.startDate) request.startDate = *update.startDate;
        if (update.endDate) request.endDate = *update.endDate;
        if (update.isRecurring) request.isRecurring = *update.isRecurring;
        if (update.rolloverEnabled) request.rolloverEnabled = *update.rolloverEnabled;

        auto budget = buildBudget(request, budgetId);
        budget.id = budgetId;
        budget.createdAt = existing.createdAt;
        budget.updatedAt = clock_->now();

        budgetRepo_->update(budget);
        std::cout << "[BudgetService] Updated budget " << budgetId << std::endl;

        publishBudgetChanged(budgetId, "updated");
        return budget;
    }

    void deleteBudget(const std::string& budgetId) override {
        requireBudget(budgetId);
        budgetRepo_->deleteById(budgetId);
        std::cout << "[BudgetService] Deleted budget " << budgetId << std::endl;
        publishBudgetChanged(budgetId, "deleted");
    }

    std::optional<domain::Budget> getBudgetById(const std::string& budgetId) override {
        return budgetRepo_->findById(budgetId);
    }

    std::vector<domain::Budget> getAllBudgets() override {
        return budgetRepo_->findAll();
    }

    std::vector<domain::Budget> getActiveBudgets(const domain::CalendarDate& date) override {
        return budgetRepo_->findActive(date);
    }

    std::vector<domain::Budget> getBudgetsByCategory(const std::string& categoryId) override {
        return budgetRepo_->findByCategory(categoryId);
    }

    // ================================================================
    // Периоды
    // ================================================================

    domain::PeriodRange getCurrentPeriodDates(const std::string& periodType, const domain::CalendarDate& reference) override {
        return domain::currentPeriod(domain::periodTypeFromString(periodType), reference);
    }

    domain::PeriodRange getNextPeriodDates(const std::string& periodType, const domain::CalendarDate& reference) override {
        return domain::nextPeriod(domain::periodTypeFromString(periodType), reference);
    }

    domain::PeriodRange getPreviousPeriodDates(const std::string& periodType, const domain::CalendarDate& reference) override {
        return domain::previousPeriod(domain::periodTypeFromString(periodType), reference);
    }

    // ================================================================
    // Расходы и статус
    // ================================================================

    domain::Money calculateSpendingForBudget(
        const std::string& categoryId,
        const std::string& currency,
        const domain::CalendarDate& start,
        const domain::CalendarDate& endExclusive,
        bool includeChildren = true) override
    {
        std::vector<std::string> categoryIds{categoryId};
        if (includeChildren) {
            auto descendants = categories_->getAllDescendants(categoryId);
            categoryIds.insert(categoryIds.end(), descendants.begin(), descendants.end());
        }

        domain::Money total;
        for (const auto& op : operationRepo_->findExpenses(categoryIds, currency, start, endExclusive)) {
            total += op.amount;
        }
        return total;
    }

    domain::BudgetStatus calculateBudgetStatus(const std::string& budgetId) override {
        auto budget = requireBudget(budgetId);
        auto period = domain::currentPeriod(budget.periodType, clock_->today());

        // Период, ограниченный окном бюджета [startDate, endDate)
        auto start = budget.startDate > period.start ? budget.startDate : period.start;
        auto endExclusive = period.endExclusive();
        if (budget.endDate && *budget.endDate < endExclusive) {
            endExclusive = *budget.endDate;
        }

        domain::Money spent;
        if (start < endExclusive) {
            spent = calculateSpendingForBudget(budget.categoryId, budget.currency, start, endExclusive, true);
        }

        domain::BudgetStatus status;
        status.budgetId = budget.id;
        status.amount = budget.amount;
        status.spent = spent;
        status.remaining = budget.amount - spent;
        status.percentage = budget.amount.isPositive()
            ? std::lround(spent.toDouble() * 100.0 / budget.amount.toDouble())
            : 0;
        status.isExceeded = spent > budget.amount;
        status.periodStart = period.start;
        status.periodEnd = period.end;
        status.status = domain::budgetHealthFor(status.percentage, status.isExceeded);
        return status;
    }

    std::map<std::string, domain::BudgetStatus> calculateAllBudgetStatuses() override {
        std::map<std::string, domain::BudgetStatus> statuses;

        for (const auto& budget : budgetRepo_->findActive(clock_->today())) {
            try {
                statuses[budget.id] = calculateBudgetStatus(budget.id);
            } catch (const std::exception& e) {
                std::cerr << "[BudgetService] Failed to calculate status for budget "
                          << budget.id << ": " << e.what() << std::endl;
            }
        }

        return statuses;
    }

    // ================================================================
    // Поиск
    // ================================================================

    std::optional<domain::Budget> findDuplicateBudget(
        const std::string& categoryId,
        const std::string& currency,
        const std::string& periodType,
        const std::optional<std::string>& excludeId = std::nullopt) override
    {
        return budgetRepo_->findDuplicate(categoryId, currency, domain::periodTypeFromString(periodType), excludeId);
    }

    bool hasActiveBudget(const std::string& categoryId) override {
        const auto today = clock_->today();
        for (const auto& budget : budgetRepo_->findByCategory(categoryId)) {
            if (budget.isActiveOn(today)) {
                return true;
            }
        }
        return false;
    }

    bool budgetExists(const std::string& budgetId) override {
        return budgetRepo_->findById(budgetId).has_value();
    }

private:
    std::shared_ptr<ports::output::IBudgetRepository> budgetRepo_;
    std::shared_ptr<ports::output::IOperationRepository> operationRepo_;
    std::shared_ptr<ports::input::ICategoryService> categories_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;

    static std::optional<domain::CalendarDate> parseDate(const std::string& text) {
        try {
            return domain::CalendarDate::fromString(text);
        } catch (const domain::ValidationError&) {
            return std::nullopt;
        }
    }

    domain::Budget requireBudget(const std::string& budgetId) {
        auto budget = budgetRepo_->findById(budgetId);
        if (!budget) {
            throw domain::NotFoundError("Budget " + budgetId + " not found");
        }
        return *budget;
    }

    /**
     * @brief Проверить запрос, отклонить дубликат и собрать бюджет
     * @throws ValidationError, IntegrityError
     */
    domain::Budget buildBudget(const domain::BudgetRequest& request, const std::optional<std::string>& selfId) {
        if (auto error = validateBudget(request)) {
            throw domain::ValidationError(*error);
        }

        domain::Budget budget;
        budget.categoryId = request.categoryId;
        budget.amount = domain::Money::parse(request.amount);
        budget.currency = request.currency;
        budget.periodType = domain::periodTypeFromString(request.periodType);
        budget.startDate = domain::CalendarDate::fromString(request.startDate);
        if (request.endDate && !request.endDate->empty()) {
            budget.endDate = domain::CalendarDate::fromString(*request.endDate);
        }
        budget.isRecurring = request.isRecurring;
        budget.rolloverEnabled = request.rolloverEnabled;

        if (budgetRepo_->findDuplicate(budget.categoryId, budget.currency, budget.periodType, selfId)) {
            throw domain::IntegrityError("A budget already exists for this category, currency, and period type.");
        }

        return budget;
    }

    static domain::BudgetRequest toRequest(const domain::Budget& budget) {
        domain::BudgetRequest request;
        request.categoryId = budget.categoryId;
        request.amount = budget.amount.toString();
        request.currency = budget.currency;
        request.periodType = domain::toString(budget.periodType);
        request.startDate = budget.startDate.toString();
        if (budget.endDate) {
            request.endDate = budget.endDate->toString();
        }
        request.isRecurring = budget.isRecurring;
        request.rolloverEnabled = budget.rolloverEnabled;
        return request;
    }

    void publishBudgetChanged(const std::string& budgetId, const std::string& action) {
        nlohmann::json event;
        event["budget_id"] = budgetId;
        event["action"] = action;
        events::publishEvent(eventPublisher_, "BudgetService", events::BUDGET_CHANGED, event);
    }
};

} // namespace penny::application
