#pragma once

#include "ports/output/ICategoryRepository.hpp"
#include "InMemoryLedgerStore.hpp"
#include <memory>

namespace penny::adapters::secondary {

/**
 * @brief In-Memory реализация репозитория категорий
 */
class InMemoryCategoryRepository : public ports::output::ICategoryRepository {
public:
    explicit InMemoryCategoryRepository(std::shared_ptr<InMemoryLedgerStore> store)
        : store_(std::move(store)) {}

    std::vector<domain::Category> findAll() override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        std::vector<domain::Category> result;
        for (const auto& [id, category] : store_->tables.categories) {
            result.push_back(category);
        }
        return result;
    }

    std::optional<domain::Category> findById(const std::string& categoryId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        auto it = store_->tables.categories.find(categoryId);
        if (it == store_->tables.categories.end()) return std::nullopt;
        return it->second;
    }

    std::vector<domain::Category> findChildren(const std::optional<std::string>& parentId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        std::vector<domain::Category> result;
        for (const auto& [id, category] : store_->tables.categories) {
            if (category.parentId == parentId) {
                result.push_back(category);
            }
        }
        return result;
    }

    std::vector<domain::Category> findByCategoryType(domain::CategoryType type) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        std::vector<domain::Category> result;
        for (const auto& [id, category] : store_->tables.categories) {
            if (category.categoryType == type) {
                result.push_back(category);
            }
        }
        return result;
    }

    std::optional<domain::Category> findShadow(domain::CategoryType type) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        for (const auto& [id, category] : store_->tables.categories) {
            if (category.isShadow && category.categoryType == type) {
                return category;
            }
        }
        return std::nullopt;
    }

    int countChildren(const std::string& categoryId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        int count = 0;
        for (const auto& [id, category] : store_->tables.categories) {
            if (category.parentId && *category.parentId == categoryId) {
                ++count;
            }
        }
        return count;
    }

    domain::Category save(const domain::Category& category) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        store_->tables.categories[category.id] = category;
        return category;
    }

    bool update(const domain::Category& category) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        auto it = store_->tables.categories.find(category.id);
        if (it == store_->tables.categories.end()) return false;
        it->second = category;
        return true;
    }

    bool deleteById(const std::string& categoryId) override {
        std::lock_guard<std::mutex> lock(store_->mutex);
        return store_->tables.categories.erase(categoryId) > 0;
    }

private:
    std::shared_ptr<InMemoryLedgerStore> store_;
};

} // namespace penny::adapters::secondary
