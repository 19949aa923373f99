#pragma once

#include "settings/DbSettings.hpp"
#include "domain/errors/LedgerError.hpp"
#include <pqxx/pqxx>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <iostream>

namespace penny::adapters::secondary {

/**
 * @brief Единственное подключение к PostgreSQL на процесс
 *
 * Вне транзакции каждый запрос выполняется в собственной pqxx::work.
 * Внутри открытой транзакции запрос идёт через savepoint
 * (pqxx::subtransaction): ошибка одного запроса не обрывает всю
 * транзакцию.
 */
class PgSession {
public:
    using Statement = std::function<pqxx::result(pqxx::transaction_base&)>;

    explicit PgSession(std::shared_ptr<settings::DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PgSession] Connecting to " << settings_->getHost() << ":"
                  << settings_->getPort() << "/" << settings_->getName() << "..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PgSession] Connected" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PgSession] Connection failed: " << e.what() << std::endl;
            throw;
        }
        initSchema();
    }

    ~PgSession() {
        active_.reset();
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    pqxx::result run(const Statement& statement) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (active_) {
            pqxx::subtransaction savepoint(*active_, "penny_stmt");
            auto result = statement(savepoint);
            savepoint.commit();
            return result;
        }

        pqxx::work txn(*connection_);
        auto result = statement(txn);
        txn.commit();
        return result;
    }

    void begin() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_) {
            throw domain::TransactionConflictError(domain::ConflictKind::NESTED_TRANSACTION);
        }
        active_ = std::make_unique<pqxx::work>(*connection_);
    }

    void commit() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) {
            throw domain::TransactionConflictError(domain::ConflictKind::NO_ACTIVE_TRANSACTION);
        }
        auto txn = std::move(active_);
        txn->commit();
    }

    void rollback() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!active_) {
            throw domain::TransactionConflictError(domain::ConflictKind::NO_ACTIVE_TRANSACTION);
        }
        auto txn = std::move(active_);
        try {
            txn->abort();
        } catch (const std::exception& e) {
            throw domain::TransactionConflictError(domain::ConflictKind::CANNOT_ROLLBACK, e.what());
        }
    }

    bool inTransaction() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return active_ != nullptr;
    }

private:
    std::shared_ptr<settings::DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    std::unique_ptr<pqxx::work> active_;
    mutable std::mutex mutex_;

    void initSchema() {
        try {
            pqxx::work txn(*connection_);

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS accounts (
                    id TEXT PRIMARY KEY,
                    name TEXT NOT NULL,
                    balance TEXT NOT NULL DEFAULT '0',
                    currency TEXT NOT NULL DEFAULT 'USD',
                    display_order INTEGER NOT NULL DEFAULT 0,
                    hidden BOOLEAN NOT NULL DEFAULT FALSE,
                    monthly_target TEXT,
                    created_at TEXT NOT NULL,
                    updated_at TEXT NOT NULL
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS categories (
                    id TEXT PRIMARY KEY,
                    name TEXT NOT NULL,
                    type TEXT NOT NULL,
                    category_type TEXT NOT NULL,
                    parent_id TEXT REFERENCES categories(id),
                    icon TEXT,
                    color TEXT,
                    is_shadow BOOLEAN NOT NULL DEFAULT FALSE,
                    exclude_from_forecast BOOLEAN NOT NULL DEFAULT FALSE,
                    created_at TEXT NOT NULL,
                    updated_at TEXT NOT NULL
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS operations (
                    id TEXT PRIMARY KEY,
                    type TEXT NOT NULL,
                    amount TEXT NOT NULL,
                    account_id TEXT NOT NULL REFERENCES accounts(id),
                    category_id TEXT REFERENCES categories(id),
                    to_account_id TEXT REFERENCES accounts(id),
                    date TEXT NOT NULL,
                    created_at TEXT NOT NULL,
                    description TEXT,
                    exchange_rate TEXT,
                    destination_amount TEXT,
                    source_currency TEXT,
                    destination_currency TEXT
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS budgets (
                    id TEXT PRIMARY KEY,
                    category_id TEXT NOT NULL REFERENCES categories(id) ON DELETE CASCADE,
                    amount TEXT NOT NULL,
                    currency TEXT NOT NULL,
                    period_type TEXT NOT NULL,
                    start_date TEXT NOT NULL,
                    end_date TEXT,
                    is_recurring BOOLEAN NOT NULL DEFAULT TRUE,
                    rollover_enabled BOOLEAN NOT NULL DEFAULT FALSE,
                    created_at TEXT NOT NULL,
                    updated_at TEXT NOT NULL
                )
            )");

            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS accounts_balance_history (
                    id SERIAL PRIMARY KEY,
                    account_id TEXT NOT NULL REFERENCES accounts(id) ON DELETE CASCADE,
                    date TEXT NOT NULL,
                    balance TEXT NOT NULL,
                    created_at TEXT NOT NULL,
                    UNIQUE (account_id, date)
                )
            )");

            txn.exec("CREATE INDEX IF NOT EXISTS idx_operations_date ON operations (date)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_operations_account ON operations (account_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_operations_category ON operations (category_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_categories_parent ON categories (parent_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_budgets_category ON budgets (category_id)");

            txn.commit();
            std::cout << "[PgSession] Schema initialized" << std::endl;

        } catch (const std::exception& e) {
            std::cerr << "[PgSession] initSchema error: " << e.what() << std::endl;
            throw;
        }
    }
};

/// NULL -> nullopt
inline std::optional<std::string> optionalText(const pqxx::field& field) {
    if (field.is_null()) return std::nullopt;
    return field.as<std::string>();
}

} // namespace penny::adapters::secondary
