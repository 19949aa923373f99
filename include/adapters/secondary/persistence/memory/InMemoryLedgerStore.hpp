#pragma once

#include "domain/Account.hpp"
#include "domain/Operation.hpp"
#include "domain/Category.hpp"
#include "domain/Budget.hpp"
#include "domain/BalanceSnapshot.hpp"
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace penny::adapters::secondary {

/**
 * @brief Общее хранилище in-memory адаптеров
 *
 * Все таблицы в одном объекте: транзакция копирует Tables целиком
 * и восстанавливает копию при откате.
 */
struct InMemoryLedgerStore {
    InMemoryLedgerStore() = default;

    struct Tables {
        std::map<std::string, domain::Account> accounts;
        std::map<std::string, domain::Operation> operations;
        std::map<std::string, domain::Category> categories;
        std::map<std::string, domain::Budget> budgets;
        /// Ключ: (accountId, YYYY-MM-DD)
        std::map<std::pair<std::string, std::string>, domain::BalanceSnapshot> history;
    };

    Tables tables;
    bool inTransaction = false;
    mutable std::mutex mutex;
};

} // namespace penny::adapters::secondary
