#pragma once

#include "ports/output/IOperationRepository.hpp"
#include "InMemoryLedgerStore.hpp"
#include <memory>
#include <algorithm>
#include <functional>

namespace penny::adapters::secondary {

/**
 * @brief In-Memory реализация журнала операций
 */
class InMemoryOperationRepository : public ports::output::IOperationRepository {
public:
    explicit InMemoryOperationRepository(std::shared_ptr<InMemoryLedgerStore> store)
        : store_(std::move(store)) {}

    domain::Operation save(const domain::Operation& operation) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        store_->tables.operations[operation.id] = operation;
        return operation;
    }

    bool update(const domain::Operation& operation) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        auto it = store_->tables.operations.find(operation.id);
        if (it == store_->tables.operations.end()) return false;
        it->second = operation;
        return true;
    }

    bool deleteById(const std::string& operationId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        return store_->tables.operations.erase(operationId) > 0;
    }

    std::optional<domain::Operation> findById(const std::string& operationId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        auto it = store_->tables.operations.find(operationId);
        if (it == store_->tables.operations.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::Operation> findByAccount(const std::string& accountId) override {
        return select([&](const domain::Operation& op) { return op.touches(accountId); });
    }

    std::vector<domain::Operation> findByDateRange(
        const domain::CalendarDate& start,
        const domain::CalendarDate& end) override
    {
        return select([&](const domain::Operation& op) { return start <= op.date && op.date <= end; });
    }

    std::vector<domain::Operation> findByAccountAfter(
        const std::string& accountId,
        const domain::CalendarDate& after) override
    {
        return select([&](const domain::Operation& op) { return op.touches(accountId) && op.date > after; });
    }

    int countByAccount(const std::string& accountId) override {
        return static_cast<int>(findByAccount(accountId).size());
    }

    int countByCategory(const std::string& categoryId) override {
        return static_cast<int>(select([&](const domain::Operation& op) {
            return op.categoryId && *op.categoryId == categoryId;
        }).size());
    }

    int reassignSourceAccount(const std::string& fromAccountId, const std::string& toAccountId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        int moved = 0;
        for (auto& [id, op] : store_->tables.operations) {
            if (op.accountId == fromAccountId) {
                op.accountId = toAccountId;
                ++moved;
            }
        }
        return moved;
    }

    int reassignDestinationAccount(const std::string& fromAccountId, const std::string& toAccountId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        int moved = 0;
        for (auto& [id, op] : store_->tables.operations) {
            if (op.toAccountId && *op.toAccountId == fromAccountId) {
                op.toAccountId = toAccountId;
                ++moved;
            }
        }
        return moved;
    }

    std::optional<domain::Operation> findLatestInCategoriesOn(
        const std::string& accountId,
        const domain::CalendarDate& date,
        const std::vector<std::string>& categoryIds) override
    {
        auto matches = select([&](const domain::Operation& op) {
            return op.accountId == accountId && op.date == date && inCategories(op, categoryIds);
        });
        if (matches.empty()) return std::nullopt;
        return matches.front();
    }

    std::vector<domain::Operation> findExpenses(
        const std::vector<std::string>& categoryIds,
        const std::string& currency,
        const domain::CalendarDate& start,
        const domain::CalendarDate& endExclusive) override
    {
        std::lock_guard<std::mutex> lock(store_->mutex);
        std::vector<domain::Operation> result;
        for (const auto& [id, op] : store_->tables.operations) {
            if (op.type != domain::OperationType::EXPENSE) continue;
            if (op.date < start || !(op.date < endExclusive)) continue;
            if (!inCategories(op, categoryIds)) continue;

            auto account = store_->tables.accounts.find(op.accountId);
            if (account == store_->tables.accounts.end() || account->second.currency != currency) continue;

            result.push_back(op);
        }
        return result;
    }

private:
    std::shared_ptr<InMemoryLedgerStore> store_;

    static bool inCategories(const domain::Operation& op, const std::vector<std::string>& categoryIds) {
        return op.categoryId &&
               std::find(categoryIds.begin(), categoryIds.end(), *op.categoryId) != categoryIds.end();
    }

    /// Выборка с сортировкой date DESC, createdAt DESC
    std::vector<domain::Operation> select(const std::function<bool(const domain::Operation&)>& predicate) {
        std::lock_guard<std::mutex> lock(store_->mutex);
        std::vector<domain::Operation> result;
        for (const auto& [id, op] : store_->tables.operations) {
            if (predicate(op)) {
                result.push_back(op);
            }
        }
        std::stable_sort(result.begin(), result.end(), [](const domain::Operation& a, const domain::Operation& b) {
            if (a.date != b.date) return a.date > b.date;
            if (!(a.createdAt == b.createdAt)) return a.createdAt > b.createdAt;
            return a.id > b.id;
        });
        return result;
    }
};

} // namespace penny::adapters::secondary
