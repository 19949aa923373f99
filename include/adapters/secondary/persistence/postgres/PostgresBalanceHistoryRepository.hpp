#pragma once

#include "ports/output/IBalanceHistoryRepository.hpp"
#include "PgSession.hpp"
#include <memory>
#include <iostream>

namespace penny::adapters::secondary {

/**
 * @brief Снимки баланса в accounts_balance_history (UNIQUE account_id, date)
 */
class PostgresBalanceHistoryRepository : public ports::output::IBalanceHistoryRepository {
public:
    explicit PostgresBalanceHistoryRepository(std::shared_ptr<PgSession> session)
        : session_(std::move(session)) {}

    bool insertIfAbsent(const domain::BalanceSnapshot& snapshot) override {
        return execute("insertIfAbsent",
                       R"(
                           INSERT INTO accounts_balance_history (account_id, date, balance, created_at)
                           VALUES ($1, $2, $3, $4)
                           ON CONFLICT (account_id, date) DO NOTHING
                       )",
                       snapshot.accountId, snapshot.date.toString(),
                       snapshot.balance.toString(), snapshot.createdAt.toString()) > 0;
    }

    void upsert(const domain::BalanceSnapshot& snapshot) override {
        execute("upsert",
                R"(
                    INSERT INTO accounts_balance_history (account_id, date, balance, created_at)
                    VALUES ($1, $2, $3, $4)
                    ON CONFLICT (account_id, date) DO UPDATE SET
                        balance = EXCLUDED.balance,
                        created_at = EXCLUDED.created_at
                )",
                snapshot.accountId, snapshot.date.toString(),
                snapshot.balance.toString(), snapshot.createdAt.toString());
    }

    std::vector<domain::BalanceSnapshot> findRange(
        const std::string& accountId,
        const domain::CalendarDate& start,
        const domain::CalendarDate& end) override
    {
        auto result = select("findRange",
                             "SELECT account_id, date, balance, created_at FROM accounts_balance_history "
                             "WHERE account_id = $1 AND date >= $2 AND date <= $3 ORDER BY date ASC",
                             accountId, start.toString(), end.toString());

        std::vector<domain::BalanceSnapshot> snapshots;
        for (const auto& row : result) {
            snapshots.push_back(rowToSnapshot(row));
        }
        return snapshots;
    }

    std::optional<domain::BalanceSnapshot> findOn(
        const std::string& accountId,
        const domain::CalendarDate& date) override
    {
        auto result = select("findOn",
                             "SELECT account_id, date, balance, created_at FROM accounts_balance_history "
                             "WHERE account_id = $1 AND date = $2 LIMIT 1",
                             accountId, date.toString());
        if (result.empty()) return std::nullopt;
        return rowToSnapshot(result[0]);
    }

    std::optional<domain::CalendarDate> findLastDate(const std::string& accountId) override {
        auto result = select("findLastDate",
                             "SELECT date FROM accounts_balance_history "
                             "WHERE account_id = $1 ORDER BY date DESC LIMIT 1",
                             accountId);
        if (result.empty()) return std::nullopt;
        return domain::CalendarDate::fromString(result[0]["date"].as<std::string>());
    }

    std::vector<domain::AccountBalanceOnDate> findAllOnDate(const domain::CalendarDate& date) override {
        auto result = select("findAllOnDate",
                             "SELECT abh.account_id, a.name, a.currency, abh.balance "
                             "FROM accounts_balance_history abh "
                             "JOIN accounts a ON abh.account_id = a.id "
                             "WHERE abh.date = $1 ORDER BY a.display_order ASC",
                             date.toString());

        std::vector<domain::AccountBalanceOnDate> balances;
        for (const auto& row : result) {
            balances.push_back({
                row["account_id"].as<std::string>(),
                row["name"].as<std::string>(),
                row["currency"].as<std::string>(),
                domain::Money::parse(row["balance"].as<std::string>())
            });
        }
        return balances;
    }

    bool deleteEntry(const std::string& accountId, const domain::CalendarDate& date) override {
        return execute("deleteEntry",
                       "DELETE FROM accounts_balance_history WHERE account_id = $1 AND date = $2",
                       accountId, date.toString()) > 0;
    }

    int deleteByAccount(const std::string& accountId) override {
        return execute("deleteByAccount",
                       "DELETE FROM accounts_balance_history WHERE account_id = $1",
                       accountId);
    }

private:
    std::shared_ptr<PgSession> session_;

    template <typename... Args>
    pqxx::result select(const char* name, const std::string& sql, const Args&... args) {
        try {
            return session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params(sql, args...);
            });
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBalanceHistoryRepository] " << name << "() failed: " << e.what() << std::endl;
            throw;
        }
    }

    template <typename... Args>
    int execute(const char* name, const std::string& sql, const Args&... args) {
        return static_cast<int>(select(name, sql, args...).affected_rows());
    }

    static domain::BalanceSnapshot rowToSnapshot(const pqxx::row& row) {
        return {
            row["account_id"].as<std::string>(),
            domain::CalendarDate::fromString(row["date"].as<std::string>()),
            domain::Money::parse(row["balance"].as<std::string>()),
            domain::Timestamp::fromString(row["created_at"].as<std::string>())
        };
    }
};

} // namespace penny::adapters::secondary
