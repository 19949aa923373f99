#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "PgSession.hpp"
#include <memory>
#include <iostream>

namespace penny::adapters::secondary {

class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(std::shared_ptr<PgSession> session)
        : session_(std::move(session)) {}

    std::vector<domain::Account> findAll() override {
        try {
            auto result = session_->run([](pqxx::transaction_base& txn) {
                return txn.exec(
                    "SELECT " + COLUMNS + " FROM accounts ORDER BY display_order ASC, created_at DESC, id DESC");
            });

            std::vector<domain::Account> accounts;
            for (const auto& row : result) {
                accounts.push_back(rowToAccount(row));
            }
            return accounts;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] findAll() failed: " << e.what() << std::endl;
            throw;
        }
    }

    std::optional<domain::Account> findById(const std::string& accountId) override {
        try {
            auto result = session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params("SELECT " + COLUMNS + " FROM accounts WHERE id = $1", accountId);
            });

            if (result.empty()) return std::nullopt;
            return rowToAccount(result[0]);

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] findById() failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::Account save(const domain::Account& account) override {
        try {
            session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params(
                    R"(
                        INSERT INTO accounts (id, name, balance, currency, display_order, hidden,
                                              monthly_target, created_at, updated_at)
                        VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9)
                    )",
                    account.id,
                    account.name,
                    account.balance.toString(),
                    account.currency,
                    account.displayOrder,
                    account.hidden,
                    targetText(account),
                    account.createdAt.toString(),
                    account.updatedAt.toString()
                );
            });
            return account;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool update(const domain::Account& account) override {
        try {
            auto result = session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params(
                    R"(
                        UPDATE accounts SET name = $2, currency = $3, display_order = $4, hidden = $5,
                                            monthly_target = $6, updated_at = $7
                        WHERE id = $1
                    )",
                    account.id,
                    account.name,
                    account.currency,
                    account.displayOrder,
                    account.hidden,
                    targetText(account),
                    account.updatedAt.toString()
                );
            });
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] update() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool updateBalance(const std::string& accountId, const domain::Money& balance) override {
        try {
            auto result = session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params(
                    "UPDATE accounts SET balance = $2, updated_at = $3 WHERE id = $1",
                    accountId,
                    balance.toString(),
                    domain::Timestamp::now().toString()
                );
            });
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] updateBalance() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool updateDisplayOrder(const std::string& accountId, int displayOrder) override {
        try {
            auto result = session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params(
                    "UPDATE accounts SET display_order = $2, updated_at = $3 WHERE id = $1",
                    accountId,
                    displayOrder,
                    domain::Timestamp::now().toString()
                );
            });
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] updateDisplayOrder() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool deleteById(const std::string& accountId) override {
        try {
            auto result = session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params("DELETE FROM accounts WHERE id = $1", accountId);
            });
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] deleteById() failed: " << e.what() << std::endl;
            throw;
        }
    }

    int maxDisplayOrder() override {
        try {
            auto result = session_->run([](pqxx::transaction_base& txn) {
                return txn.exec("SELECT COALESCE(MAX(display_order), -1) AS max_order FROM accounts");
            });
            return result[0]["max_order"].as<int>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] maxDisplayOrder() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    inline static const std::string COLUMNS =
        "id, name, balance, currency, display_order, hidden, monthly_target, created_at, updated_at";

    std::shared_ptr<PgSession> session_;

    static std::optional<std::string> targetText(const domain::Account& account) {
        if (!account.monthlyTarget) return std::nullopt;
        return account.monthlyTarget->toString();
    }

    static domain::Account rowToAccount(const pqxx::row& row) {
        domain::Account account;
        account.id = row["id"].as<std::string>();
        account.name = row["name"].as<std::string>();
        account.balance = domain::Money::parse(row["balance"].as<std::string>());
        account.currency = row["currency"].as<std::string>();
        account.displayOrder = row["display_order"].as<int>();
        account.hidden = row["hidden"].as<bool>();
        if (auto target = optionalText(row["monthly_target"])) {
            account.monthlyTarget = domain::Money::parse(*target);
        }
        account.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
        account.updatedAt = domain::Timestamp::fromString(row["updated_at"].as<std::string>());
        return account;
    }
};

} // namespace penny::adapters::secondary
