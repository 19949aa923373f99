#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "InMemoryLedgerStore.hpp"
#include <memory>
#include <algorithm>

namespace penny::adapters::secondary {

/**
 * @brief In-Memory реализация репозитория счетов
 *
 * Удаление счёта каскадно удаляет его снимки баланса.
 */
class InMemoryAccountRepository : public ports::output::IAccountRepository {
public:
    explicit InMemoryAccountRepository(std::shared_ptr<InMemoryLedgerStore> store)
        : store_(std::move(store)) {}

    std::vector<domain::Account> findAll() override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        std::vector<domain::Account> result;
        for (const auto& [id, account] : store_->tables.accounts) {
            result.push_back(account);
        }
        std::stable_sort(result.begin(), result.end(), [](const domain::Account& a, const domain::Account& b) {
            if (a.displayOrder != b.displayOrder) return a.displayOrder < b.displayOrder;
            if (!(a.createdAt == b.createdAt)) return a.createdAt > b.createdAt;
            return a.id > b.id;
        });
        return result;
    }

    std::optional<domain::Account> findById(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        auto it = store_->tables.accounts.find(accountId);
        if (it == store_->tables.accounts.end()) return std::nullopt;
        return it->second;
    }

    domain::Account save(const domain::Account& account) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        store_->tables.accounts[account.id] = account;
        return account;
    }

    bool update(const domain::Account& account) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        auto it = store_->tables.accounts.find(account.id);
        if (it == store_->tables.accounts.end()) return false;
        it->second = account;
        return true;
    }

    bool updateBalance(const std::string& accountId, const domain::Money& balance) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        auto it = store_->tables.accounts.find(accountId);
        if (it == store_->tables.accounts.end()) return false;
        it->second.balance = balance;
        it->second.updatedAt = domain::Timestamp::now();
        return true;
    }

    bool updateDisplayOrder(const std::string& accountId, int displayOrder) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        auto it = store_->tables.accounts.find(accountId);
        if (it == store_->tables.accounts.end()) return false;
        it->second.displayOrder = displayOrder;
        it->second.updatedAt = domain::Timestamp::now();
        return true;
    }

    bool deleteById(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        auto& history = store_->tables.history;
        for (auto it = history.begin(); it != history.end();) {
            it = it->first.first == accountId ? history.erase(it) : std::next(it);
        }
        return store_->tables.accounts.erase(accountId) > 0;
    }

    int maxDisplayOrder() override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        int result = -1;
        for (const auto& [id, account] : store_->tables.accounts) {
            result = std::max(result, account.displayOrder);
        }
        return result;
    }

private:
    std::shared_ptr<InMemoryLedgerStore> store_;
};

} // namespace penny::adapters::secondary
