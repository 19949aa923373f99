#pragma once

#include "domain/Category.hpp"
#include "domain/ShadowCategories.hpp"
#include <string>
#include <optional>
#include <vector>

namespace penny::ports::input {

/**
 * @brief Интерфейс дерева категорий
 *
 * Обычные списки не содержат теневых категорий, если
 * includeShadow не задан явно.
 */
class ICategoryService {
public:
    virtual ~ICategoryService() = default;

    virtual domain::Category createCategory(const domain::CategoryRequest& request) = 0;
    virtual domain::Category updateCategory(const std::string& categoryId, const domain::CategoryUpdate& update) = 0;

    /**
     * @brief Удалить категорию
     *
     * Сначала проверяются подкатегории, затем использование в операциях.
     * @throws IntegrityError с количеством связанных записей
     */
    virtual void deleteCategory(const std::string& categoryId) = 0;

    /**
     * @brief Перенести категорию под нового родителя (nullopt: в корень)
     * @throws IntegrityError если новый родитель: сама категория или её потомок
     */
    virtual domain::Category moveCategory(const std::string& categoryId, const std::optional<std::string>& newParentId) = 0;

    /// Все потомки (без самой категории)
    virtual std::vector<std::string> getAllDescendants(const std::string& categoryId) = 0;

    /// Путь от корня до категории включительно
    virtual std::vector<domain::Category> getCategoryPath(const std::string& categoryId) = 0;

    virtual domain::ShadowCategories getShadowCategories() = 0;

    /// Создаёт недостающие теневые категории
    virtual domain::ShadowCategories ensureShadowCategories() = 0;

    virtual bool categoryExists(const std::string& categoryId) = 0;
    virtual int countCategoryUsage(const std::string& categoryId) = 0;

    virtual std::vector<domain::Category> getAllCategories(bool includeShadow = false) = 0;
    virtual std::optional<domain::Category> getCategoryById(const std::string& categoryId) = 0;
    virtual std::vector<domain::Category> getChildCategories(
        const std::optional<std::string>& parentId,
        bool includeShadow = false) = 0;
    virtual std::vector<domain::Category> getCategoriesByType(
        domain::CategoryType type,
        bool includeShadow = false) = 0;
};

} // namespace penny::ports::input
