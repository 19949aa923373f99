#pragma once

#include "ports/output/IOperationRepository.hpp"
#include "PgSession.hpp"
#include <memory>
#include <iostream>

namespace penny::adapters::secondary {

/**
 * @brief Журнал операций в PostgreSQL
 *
 * Даты хранятся текстом YYYY-MM-DD, поэтому сравниваются строками.
 */
class PostgresOperationRepository : public ports::output::IOperationRepository {
public:
    explicit PostgresOperationRepository(std::shared_ptr<PgSession> session)
        : session_(std::move(session)) {}

    domain::Operation save(const domain::Operation& op) override {
        try {
            session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params(
                    R"(
                        INSERT INTO operations (id, type, amount, account_id, category_id, to_account_id,
                                                date, created_at, description, exchange_rate,
                                                destination_amount, source_currency, destination_currency)
                        VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13)
                    )",
                    op.id,
                    domain::toString(op.type),
                    op.amount.toString(),
                    op.accountId,
                    op.categoryId,
                    op.toAccountId,
                    op.date.toString(),
                    op.createdAt.toString(),
                    op.description,
                    op.exchangeRate,
                    destinationText(op),
                    op.sourceCurrency,
                    op.destinationCurrency
                );
            });
            return op;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOperationRepository] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool update(const domain::Operation& op) override {
        try {
            auto result = session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params(
                    R"(
                        UPDATE operations SET type = $2, amount = $3, account_id = $4, category_id = $5,
                                              to_account_id = $6, date = $7, description = $8,
                                              exchange_rate = $9, destination_amount = $10,
                                              source_currency = $11, destination_currency = $12
                        WHERE id = $1
                    )",
                    op.id,
                    domain::toString(op.type),
                    op.amount.toString(),
                    op.accountId,
                    op.categoryId,
                    op.toAccountId,
                    op.date.toString(),
                    op.description,
                    op.exchangeRate,
                    destinationText(op),
                    op.sourceCurrency,
                    op.destinationCurrency
                );
            });
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOperationRepository] update() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool deleteById(const std::string& operationId) override {
        return execute("deleteById", "DELETE FROM operations WHERE id = $1", operationId) > 0;
    }

    std::optional<domain::Operation> findById(const std::string& operationId) override {
        auto operations = query("findById", "SELECT " + COLUMNS + " FROM operations WHERE id = $1", operationId);
        if (operations.empty()) return std::nullopt;
        return operations.front();
    }

    std::vector<domain::Operation> findByAccount(const std::string& accountId) override {
        return query("findByAccount",
                     "SELECT " + COLUMNS + " FROM operations WHERE account_id = $1 OR to_account_id = $1 " + ORDER,
                     accountId);
    }

    std::vector<domain::Operation> findByDateRange(
        const domain::CalendarDate& start,
        const domain::CalendarDate& end) override
    {
        return query("findByDateRange",
                     "SELECT " + COLUMNS + " FROM operations WHERE date >= $1 AND date <= $2 " + ORDER,
                     start.toString(), end.toString());
    }

    std::vector<domain::Operation> findByAccountAfter(
        const std::string& accountId,
        const domain::CalendarDate& after) override
    {
        return query("findByAccountAfter",
                     "SELECT " + COLUMNS + " FROM operations "
                     "WHERE (account_id = $1 OR to_account_id = $1) AND date > $2 " + ORDER,
                     accountId, after.toString());
    }

    int countByAccount(const std::string& accountId) override {
        return count("countByAccount",
                     "SELECT COUNT(*) AS cnt FROM operations WHERE account_id = $1 OR to_account_id = $1",
                     accountId);
    }

    int countByCategory(const std::string& categoryId) override {
        return count("countByCategory",
                     "SELECT COUNT(*) AS cnt FROM operations WHERE category_id = $1",
                     categoryId);
    }

    int reassignSourceAccount(const std::string& fromAccountId, const std::string& toAccountId) override {
        return execute("reassignSourceAccount",
                       "UPDATE operations SET account_id = $2 WHERE account_id = $1",
                       fromAccountId, toAccountId);
    }

    int reassignDestinationAccount(const std::string& fromAccountId, const std::string& toAccountId) override {
        return execute("reassignDestinationAccount",
                       "UPDATE operations SET to_account_id = $2 WHERE to_account_id = $1",
                       fromAccountId, toAccountId);
    }

    std::optional<domain::Operation> findLatestInCategoriesOn(
        const std::string& accountId,
        const domain::CalendarDate& date,
        const std::vector<std::string>& categoryIds) override
    {
        std::optional<domain::Operation> latest;
        for (const auto& categoryId : categoryIds) {
            auto found = query("findLatestInCategoriesOn",
                               "SELECT " + COLUMNS + " FROM operations "
                               "WHERE account_id = $1 AND date = $2 AND category_id = $3 "
                               "ORDER BY created_at DESC, id DESC LIMIT 1",
                               accountId, date.toString(), categoryId);
            if (!found.empty() && (!latest || found.front().createdAt > latest->createdAt)) {
                latest = found.front();
            }
        }
        return latest;
    }

    std::vector<domain::Operation> findExpenses(
        const std::vector<std::string>& categoryIds,
        const std::string& currency,
        const domain::CalendarDate& start,
        const domain::CalendarDate& endExclusive) override
    {
        std::vector<domain::Operation> expenses;
        for (const auto& categoryId : categoryIds) {
            auto found = query("findExpenses",
                               "SELECT " + PREFIXED_COLUMNS + " FROM operations o "
                               "JOIN accounts a ON o.account_id = a.id "
                               "WHERE o.type = 'expense' AND o.category_id = $1 AND a.currency = $2 "
                               "AND o.date >= $3 AND o.date < $4",
                               categoryId, currency, start.toString(), endExclusive.toString());
            expenses.insert(expenses.end(), found.begin(), found.end());
        }
        return expenses;
    }

private:
    inline static const std::string COLUMNS =
        "id, type, amount, account_id, category_id, to_account_id, date, created_at, description, "
        "exchange_rate, destination_amount, source_currency, destination_currency";

    inline static const std::string PREFIXED_COLUMNS =
        "o.id, o.type, o.amount, o.account_id, o.category_id, o.to_account_id, o.date, o.created_at, "
        "o.description, o.exchange_rate, o.destination_amount, o.source_currency, o.destination_currency";

    inline static const std::string ORDER = "ORDER BY date DESC, created_at DESC, id DESC";

    std::shared_ptr<PgSession> session_;

    template <typename... Args>
    std::vector<domain::Operation> query(const char* name, const std::string& sql, const Args&... args) {
        try {
            auto result = session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params(sql, args...);
            });

            std::vector<domain::Operation> operations;
            for (const auto& row : result) {
                operations.push_back(rowToOperation(row));
            }
            return operations;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOperationRepository] " << name << "() failed: " << e.what() << std::endl;
            throw;
        }
    }

    template <typename... Args>
    int execute(const char* name, const std::string& sql, const Args&... args) {
        try {
            auto result = session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params(sql, args...);
            });
            return static_cast<int>(result.affected_rows());

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOperationRepository] " << name << "() failed: " << e.what() << std::endl;
            throw;
        }
    }

    template <typename... Args>
    int count(const char* name, const std::string& sql, const Args&... args) {
        try {
            auto result = session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params(sql, args...);
            });
            return result[0]["cnt"].as<int>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresOperationRepository] " << name << "() failed: " << e.what() << std::endl;
            throw;
        }
    }

    static std::optional<std::string> destinationText(const domain::Operation& op) {
        if (!op.destinationAmount) return std::nullopt;
        return op.destinationAmount->toString();
    }

    static domain::Operation rowToOperation(const pqxx::row& row) {
        domain::Operation op;
        op.id = row["id"].as<std::string>();
        op.type = domain::operationTypeFromString(row["type"].as<std::string>());
        op.amount = domain::Money::parse(row["amount"].as<std::string>());
        op.accountId = row["account_id"].as<std::string>();
        op.categoryId = optionalText(row["category_id"]);
        op.toAccountId = optionalText(row["to_account_id"]);
        op.date = domain::CalendarDate::fromString(row["date"].as<std::string>());
        op.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
        op.description = optionalText(row["description"]).value_or("");
        op.exchangeRate = optionalText(row["exchange_rate"]);
        if (auto destination = optionalText(row["destination_amount"])) {
            op.destinationAmount = domain::Money::parse(*destination);
        }
        op.sourceCurrency = optionalText(row["source_currency"]);
        op.destinationCurrency = optionalText(row["destination_currency"]);
        return op;
    }
};

} // namespace penny::adapters::secondary
