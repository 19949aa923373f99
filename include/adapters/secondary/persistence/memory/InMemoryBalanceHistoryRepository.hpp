#pragma once

#include "ports/output/IBalanceHistoryRepository.hpp"
#include "InMemoryLedgerStore.hpp"
#include <memory>
#include <algorithm>

namespace penny::adapters::secondary {

/**
 * @brief In-Memory реализация таблицы снимков баланса
 */
class InMemoryBalanceHistoryRepository : public ports::output::IBalanceHistoryRepository {
public:
    explicit InMemoryBalanceHistoryRepository(std::shared_ptr<InMemoryLedgerStore> store)
        : store_(std::move(store)) {}

    bool insertIfAbsent(const domain::BalanceSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        return store_->tables.history.emplace(keyOf(snapshot.accountId, snapshot.date), snapshot).second;
    }

    void upsert(const domain::BalanceSnapshot& snapshot) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        store_->tables.history[keyOf(snapshot.accountId, snapshot.date)] = snapshot;
    }

    std::vector<domain::BalanceSnapshot> findRange(
        const std::string& accountId,
        const domain::CalendarDate& start,
        const domain::CalendarDate& end) override
    {
        std::lock_guard<std::mutex> lock(store_->mutex);
        std::vector<domain::BalanceSnapshot> result;
        // Ключи упорядочены по (accountId, дата)
        auto it = store_->tables.history.lower_bound(keyOf(accountId, start));
        for (; it != store_->tables.history.end() && it->first.first == accountId; ++it) {
            if (it->second.date > end) break;
            result.push_back(it->second);
        }
        return result;
    }

    std::optional<domain::BalanceSnapshot> findOn(
        const std::string& accountId,
        const domain::CalendarDate& date) override
    {
        std::lock_guard<std::mutex> lock(store_->mutex);
        auto it = store_->tables.history.find(keyOf(accountId, date));
        if (it == store_->tables.history.end()) return std::nullopt;
        return it->second;
    }

    std::optional<domain::CalendarDate> findLastDate(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        std::optional<domain::CalendarDate> last;
        for (const auto& [key, snapshot] : store_->tables.history) {
            if (key.first == accountId) {
                last = snapshot.date;
            }
        }
        return last;
    }

    std::vector<domain::AccountBalanceOnDate> findAllOnDate(const domain::CalendarDate& date) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        std::vector<std::pair<int, domain::AccountBalanceOnDate>> rows;
        for (const auto& [key, snapshot] : store_->tables.history) {
            if (snapshot.date != date) continue;

            auto account = store_->tables.accounts.find(snapshot.accountId);
            if (account == store_->tables.accounts.end()) continue;

            rows.push_back({account->second.displayOrder,
                            {snapshot.accountId, account->second.name, account->second.currency, snapshot.balance}});
        }
        std::stable_sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) { return a.first < b.first; });

        std::vector<domain::AccountBalanceOnDate> result;
        for (auto& row : rows) {
            result.push_back(std::move(row.second));
        }
        return result;
    }

    bool deleteEntry(const std::string& accountId, const domain::CalendarDate& date) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        return store_->tables.history.erase(keyOf(accountId, date)) > 0;
    }

    int deleteByAccount(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        int removed = 0;
        auto& history = store_->tables.history;
        for (auto it = history.begin(); it != history.end();) {
            if (it->first.first == accountId) {
                it = history.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

private:
    std::shared_ptr<InMemoryLedgerStore> store_;

    static std::pair<std::string, std::string> keyOf(const std::string& accountId, const domain::CalendarDate& date) {
        return {accountId, date.toString()};
    }
};

} // namespace penny::adapters::secondary
