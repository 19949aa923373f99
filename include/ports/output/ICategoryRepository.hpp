#pragma once

#include "domain/Category.hpp"
#include <string>
#include <optional>
#include <vector>

namespace penny::ports::output {

/**
 * @brief Интерфейс репозитория категорий
 */
class ICategoryRepository {
public:
    virtual ~ICategoryRepository() = default;

    virtual std::vector<domain::Category> findAll() = 0;
    virtual std::optional<domain::Category> findById(const std::string& categoryId) = 0;

    /// Прямые потомки; parentId == nullopt: корневые категории
    virtual std::vector<domain::Category> findChildren(const std::optional<std::string>& parentId) = 0;
    virtual std::vector<domain::Category> findByCategoryType(domain::CategoryType type) = 0;
    virtual std::optional<domain::Category> findShadow(domain::CategoryType type) = 0;

    virtual int countChildren(const std::string& categoryId) = 0;

    virtual domain::Category save(const domain::Category& category) = 0;
    virtual bool update(const domain::Category& category) = 0;
    virtual bool deleteById(const std::string& categoryId) = 0;
};

} // namespace penny::ports::output
