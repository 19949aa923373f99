#pragma once

#include "ports/output/IBudgetRepository.hpp"
#include "PgSession.hpp"
#include <memory>
#include <iostream>

namespace penny::adapters::secondary {

class PostgresBudgetRepository : public ports::output::IBudgetRepository {
public:
    explicit PostgresBudgetRepository(std::shared_ptr<PgSession> session)
        : session_(std::move(session)) {}

    domain::Budget save(const domain::Budget& budget) override {
        execute("save",
                R"(
                    INSERT INTO budgets (id, category_id, amount, currency, period_type, start_date, end_date,
                                         is_recurring, rollover_enabled, created_at, updated_at)
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11)
                )",
                budget.id, budget.categoryId, budget.amount.toString(), budget.currency,
                domain::toString(budget.periodType), budget.startDate.toString(), endDateText(budget),
                budget.isRecurring, budget.rolloverEnabled,
                budget.createdAt.toString(), budget.updatedAt.toString());
        return budget;
    }

    bool update(const domain::Budget& budget) override {
        return execute("update",
                       R"(
                           UPDATE budgets SET category_id = $2, amount = $3, currency = $4, period_type = $5,
                                              start_date = $6, end_date = $7, is_recurring = $8,
                                              rollover_enabled = $9, updated_at = $10
                           WHERE id = $1
                       )",
                       budget.id, budget.categoryId, budget.amount.toString(), budget.currency,
                       domain::toString(budget.periodType), budget.startDate.toString(), endDateText(budget),
                       budget.isRecurring, budget.rolloverEnabled, budget.updatedAt.toString()) > 0;
    }

    bool deleteById(const std::string& budgetId) override {
        return execute("deleteById", "DELETE FROM budgets WHERE id = $1", budgetId) > 0;
    }

    std::optional<domain::Budget> findById(const std::string& budgetId) override {
        auto budgets = query("findById", "SELECT " + COLUMNS + " FROM budgets WHERE id = $1", budgetId);
        if (budgets.empty()) return std::nullopt;
        return budgets.front();
    }

    std::vector<domain::Budget> findAll() override {
        return query("findAll", "SELECT " + COLUMNS + " FROM budgets ORDER BY created_at DESC, id DESC");
    }

    std::vector<domain::Budget> findByCategory(const std::string& categoryId) override {
        return query("findByCategory",
                     "SELECT " + COLUMNS + " FROM budgets WHERE category_id = $1 ORDER BY created_at DESC, id DESC",
                     categoryId);
    }

    std::vector<domain::Budget> findActive(const domain::CalendarDate& date) override {
        return query("findActive",
                     "SELECT " + COLUMNS + " FROM budgets "
                     "WHERE start_date <= $1 AND (end_date IS NULL OR end_date > $1) "
                     "ORDER BY created_at DESC, id DESC",
                     date.toString());
    }

    std::optional<domain::Budget> findDuplicate(
        const std::string& categoryId,
        const std::string& currency,
        domain::PeriodType periodType,
        const std::optional<std::string>& excludeId) override
    {
        auto budgets = query("findDuplicate",
                             "SELECT " + COLUMNS + " FROM budgets "
                             "WHERE category_id = $1 AND currency = $2 AND period_type = $3 "
                             "AND ($4::TEXT IS NULL OR id <> $4) LIMIT 1",
                             categoryId, currency, domain::toString(periodType), excludeId);
        if (budgets.empty()) return std::nullopt;
        return budgets.front();
    }

private:
    inline static const std::string COLUMNS =
        "id, category_id, amount, currency, period_type, start_date, end_date, is_recurring, "
        "rollover_enabled, created_at, updated_at";

    std::shared_ptr<PgSession> session_;

    template <typename... Args>
    pqxx::result run(const char* name, const std::string& sql, const Args&... args) {
        try {
            return session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params(sql, args...);
            });
        } catch (const std::exception& e) {
            std::cerr << "[PostgresBudgetRepository] " << name << "() failed: " << e.what() << std::endl;
            throw;
        }
    }

    template <typename... Args>
    int execute(const char* name, const std::string& sql, const Args&... args) {
        return static_cast<int>(run(name, sql, args...).affected_rows());
    }

    template <typename... Args>
    std::vector<domain::Budget> query(const char* name, const std::string& sql, const Args&... args) {
        std::vector<domain::Budget> budgets;
        for (const auto& row : run(name, sql, args...)) {
            budgets.push_back(rowToBudget(row));
        }
        return budgets;
    }

    static std::optional<std::string> endDateText(const domain::Budget& budget) {
        if (!budget.endDate) return std::nullopt;
        return budget.endDate->toString();
    }

    static domain::Budget rowToBudget(const pqxx::row& row) {
        domain::Budget budget;
        budget.id = row["id"].as<std::string>();
        budget.categoryId = row["category_id"].as<std::string>();
        budget.amount = domain::Money::parse(row["amount"].as<std::string>());
        budget.currency = row["currency"].as<std::string>();
        budget.periodType = domain::periodTypeFromString(row["period_type"].as<std::string>());
        budget.startDate = domain::CalendarDate::fromString(row["start_date"].as<std::string>());
        if (auto end = optionalText(row["end_date"])) {
            budget.endDate = domain::CalendarDate::fromString(*end);
        }
        budget.isRecurring = row["is_recurring"].as<bool>();
        budget.rolloverEnabled = row["rollover_enabled"].as<bool>();
        budget.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
        budget.updatedAt = domain::Timestamp::fromString(row["updated_at"].as<std::string>());
        return budget;
    }
};

} // namespace penny::adapters::secondary
