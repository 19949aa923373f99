#pragma once

#include "ports/output/IBudgetRepository.hpp"
#include "InMemoryLedgerStore.hpp"
#include <memory>
#include <algorithm>

namespace penny::adapters::secondary {

/**
 * @brief In-Memory реализация репозитория бюджетов
 */
class InMemoryBudgetRepository : public ports::output::IBudgetRepository {
public:
    explicit InMemoryBudgetRepository(std::shared_ptr<InMemoryLedgerStore> store)
        : store_(std::move(store)) {}

    domain::Budget save(const domain::Budget& budget) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        store_->tables.budgets[budget.id] = budget;
        return budget;
    }

    bool update(const domain::Budget& budget) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        auto it = store_->tables.budgets.find(budget.id);
        if (it == store_->tables.budgets.end()) return false;
        it->second = budget;
        return true;
    }

    bool deleteById(const std::string& budgetId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        return store_->tables.budgets.erase(budgetId) > 0;
    }

    std::optional<domain::Budget> findById(const std::string& budgetId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        auto it = store_->tables.budgets.find(budgetId);
        if (it == store_->tables.budgets.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::Budget> findAll() override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        std::vector<domain::Budget> result;
        for (const auto& [id, budget] : store_->tables.budgets) {
            result.push_back(budget);
        }
        sortNewestFirst(result);
        return result;
    }

    std::vector<domain::Budget> findByCategory(const std::string& categoryId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        std::vector<domain::Budget> result;
        for (const auto& [id, budget] : store_->tables.budgets) {
            if (budget.categoryId == categoryId) {
                result.push_back(budget);
            }
        }
        sortNewestFirst(result);
        return result;
    }

    std::vector<domain::Budget> findActive(const domain::CalendarDate& date) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        std::vector<domain::Budget> result;
        for (const auto& [id, budget] : store_->tables.budgets) {
            if (budget.isActiveOn(date)) {
                result.push_back(budget);
            }
        }
        sortNewestFirst(result);
        return result;
    }

    std::optional<domain::Budget> findDuplicate(
        const std::string& categoryId,
        const std::string& currency,
        domain::PeriodType periodType,
        const std::optional<std::string>& excludeId) override
    {
        std::lock_guard<std::mutex> lock(store_->mutex);
        for (const auto& [id, budget] : store_->tables.budgets) {
            if (excludeId && id == *excludeId) continue;
            if (budget.categoryId == categoryId && budget.currency == currency && budget.periodType == periodType) {
                return budget;
            }
        }
        return std::nullopt;
    }

private:
    /// Новые первыми, при равном createdAt больший id
    static void sortNewestFirst(std::vector<domain::Budget>& budgets) {
        std::stable_sort(budgets.begin(), budgets.end(), [](const domain::Budget& a, const domain::Budget& b) {
            if (!(a.createdAt == b.createdAt)) return a.createdAt > b.createdAt;
            return a.id > b.id;
        });
    }

    std::shared_ptr<InMemoryLedgerStore> store_;
};

} // namespace penny::adapters::secondary
