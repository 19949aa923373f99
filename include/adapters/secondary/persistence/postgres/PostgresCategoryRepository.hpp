#pragma once

#include "ports/output/ICategoryRepository.hpp"
#include "PgSession.hpp"
#include <memory>
#include <iostream>

namespace penny::adapters::secondary {

class PostgresCategoryRepository : public ports::output::ICategoryRepository {
public:
    explicit PostgresCategoryRepository(std::shared_ptr<PgSession> session)
        : session_(std::move(session)) {}

    std::vector<domain::Category> findAll() override {
        return query("findAll", "SELECT " + COLUMNS + " FROM categories ORDER BY name");
    }

    std::optional<domain::Category> findById(const std::string& categoryId) override {
        auto categories = query("findById", "SELECT " + COLUMNS + " FROM categories WHERE id = $1", categoryId);
        if (categories.empty()) return std::nullopt;
        return categories.front();
    }

    std::vector<domain::Category> findChildren(const std::optional<std::string>& parentId) override {
        if (!parentId) {
            return query("findChildren", "SELECT " + COLUMNS + " FROM categories WHERE parent_id IS NULL ORDER BY name");
        }
        return query("findChildren", "SELECT " + COLUMNS + " FROM categories WHERE parent_id = $1 ORDER BY name", *parentId);
    }

    std::vector<domain::Category> findByCategoryType(domain::CategoryType type) override {
        return query("findByCategoryType",
                     "SELECT " + COLUMNS + " FROM categories WHERE category_type = $1 ORDER BY name",
                     domain::toString(type));
    }

    std::optional<domain::Category> findShadow(domain::CategoryType type) override {
        auto categories = query("findShadow",
                                "SELECT " + COLUMNS + " FROM categories "
                                "WHERE is_shadow = TRUE AND category_type = $1 LIMIT 1",
                                domain::toString(type));
        if (categories.empty()) return std::nullopt;
        return categories.front();
    }

    int countChildren(const std::string& categoryId) override {
        try {
            auto result = session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params("SELECT COUNT(*) AS cnt FROM categories WHERE parent_id = $1", categoryId);
            });
            return result[0]["cnt"].as<int>();

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCategoryRepository] countChildren() failed: " << e.what() << std::endl;
            throw;
        }
    }

    domain::Category save(const domain::Category& category) override {
        try {
            session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params(
                    R"(
                        INSERT INTO categories (id, name, type, category_type, parent_id, icon, color,
                                                is_shadow, exclude_from_forecast, created_at, updated_at)
                        VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11)
                    )",
                    category.id,
                    category.name,
                    domain::toString(category.kind),
                    domain::toString(category.categoryType),
                    category.parentId,
                    category.icon,
                    category.color,
                    category.isShadow,
                    category.excludeFromForecast,
                    category.createdAt.toString(),
                    category.updatedAt.toString()
                );
            });
            return category;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCategoryRepository] save() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool update(const domain::Category& category) override {
        try {
            auto result = session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params(
                    R"(
                        UPDATE categories SET name = $2, type = $3, parent_id = $4, icon = $5, color = $6,
                                              exclude_from_forecast = $7, updated_at = $8
                        WHERE id = $1
                    )",
                    category.id,
                    category.name,
                    domain::toString(category.kind),
                    category.parentId,
                    category.icon,
                    category.color,
                    category.excludeFromForecast,
                    category.updatedAt.toString()
                );
            });
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCategoryRepository] update() failed: " << e.what() << std::endl;
            throw;
        }
    }

    bool deleteById(const std::string& categoryId) override {
        try {
            auto result = session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params("DELETE FROM categories WHERE id = $1", categoryId);
            });
            return result.affected_rows() > 0;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCategoryRepository] deleteById() failed: " << e.what() << std::endl;
            throw;
        }
    }

private:
    inline static const std::string COLUMNS =
        "id, name, type, category_type, parent_id, icon, color, is_shadow, exclude_from_forecast, "
        "created_at, updated_at";

    std::shared_ptr<PgSession> session_;

    template <typename... Args>
    std::vector<domain::Category> query(const char* name, const std::string& sql, const Args&... args) {
        try {
            auto result = session_->run([&](pqxx::transaction_base& txn) {
                return txn.exec_params(sql, args...);
            });

            std::vector<domain::Category> categories;
            for (const auto& row : result) {
                categories.push_back(rowToCategory(row));
            }
            return categories;

        } catch (const std::exception& e) {
            std::cerr << "[PostgresCategoryRepository] " << name << "() failed: " << e.what() << std::endl;
            throw;
        }
    }

    static domain::Category rowToCategory(const pqxx::row& row) {
        domain::Category category;
        category.id = row["id"].as<std::string>();
        category.name = row["name"].as<std::string>();
        category.kind = domain::categoryKindFromString(row["type"].as<std::string>());
        category.categoryType = domain::categoryTypeFromString(row["category_type"].as<std::string>());
        category.parentId = optionalText(row["parent_id"]);
        category.icon = optionalText(row["icon"]).value_or("");
        category.color = optionalText(row["color"]).value_or("");
        category.isShadow = row["is_shadow"].as<bool>();
        category.excludeFromForecast = row["exclude_from_forecast"].as<bool>();
        category.createdAt = domain::Timestamp::fromString(row["created_at"].as<std::string>());
        category.updatedAt = domain::Timestamp::fromString(row["updated_at"].as<std::string>());
        return category;
    }
};

} // namespace penny::adapters::secondary
