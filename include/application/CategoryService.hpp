#pragma once

#include "ports/input/ICategoryService.hpp"
#include "ports/output/ICategoryRepository.hpp"
#include "ports/output/IOperationRepository.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/events/LedgerEvents.hpp"
#include "domain/errors/LedgerError.hpp"
#include "utils/IdGenerator.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <deque>
#include <set>
#include <algorithm>
#include <iostream>

namespace penny::application {

/**
 * @brief Дерево категорий
 *
 * Обход дерева (потомки, путь к корню, проверка цикла) идёт по
 * индексу parentId через явную очередь, без рекурсивных запросов
 * к хранилищу.
 */
class CategoryService : public ports::input::ICategoryService {
public:
    CategoryService(
        std::shared_ptr<ports::output::ICategoryRepository> categoryRepo,
        std::shared_ptr<ports::output::IOperationRepository> operationRepo,
        std::shared_ptr<ports::output::IClock> clock,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher
    ) : categoryRepo_(std::move(categoryRepo))
      , operationRepo_(std::move(operationRepo))
      , clock_(std::move(clock))
      , eventPublisher_(std::move(eventPublisher))
    {
        std::cout << "[CategoryService] Created" << std::endl;
    }

    domain::Category createCategory(const domain::CategoryRequest& request) override {
        if (request.name.empty()) {
            throw domain::ValidationError("Category name is required");
        }

        domain::Category category;
        category.id = request.id ? *request.id : utils::IdGenerator::newId("cat");

        if (isShadowId(category.id)) {
            throw domain::IntegrityError("Shadow categories are managed by the system");
        }
        if (categoryRepo_->findById(category.id)) {
            throw domain::IntegrityError("Category " + category.id + " already exists");
        }
        if (request.parentId) {
            requireParent(*request.parentId);
        }

        category.name = request.name;
        category.kind = request.kind;
        category.categoryType = request.categoryType;
        category.parentId = request.parentId;
        category.icon = request.icon;
        category.color = request.color;
        category.excludeFromForecast = request.excludeFromForecast;
        category.createdAt = clock_->now();
        category.updatedAt = category.createdAt;

        categoryRepo_->save(category);
        std::cout << "[CategoryService] Created category " << category.id << " (" << category.name << ")" << std::endl;

        publishCategoryChanged(category.id, "created");
        return category;
    }

    domain::Category updateCategory(const std::string& categoryId, const domain::CategoryUpdate& update) override {
        auto category = requireCategory(categoryId);

        if (update.parentId && *update.parentId != category.parentId) {
            checkMove(category, *update.parentId);
            category.parentId = *update.parentId;
        }
        if (update.name) {
            if (update.name->empty()) {
                throw domain::ValidationError("Category name is required");
            }
            category.name = *update.name;
        }
        if (update.kind) category.kind = *update.kind;
        if (update.icon) category.icon = *update.icon;
        if (update.color) category.color = *update.color;
        if (update.excludeFromForecast) category.excludeFromForecast = *update.excludeFromForecast;
        category.updatedAt = clock_->now();

        categoryRepo_->update(category);
        publishCategoryChanged(category.id, "updated");
        return category;
    }

    void deleteCategory(const std::string& categoryId) override {
        auto category = requireCategory(categoryId);

        if (category.isShadow) {
            throw domain::IntegrityError("Shadow categories cannot be deleted");
        }

        // Подкатегории проверяются до использования в операциях
        const int children = categoryRepo_->countChildren(categoryId);
        if (children > 0) {
            throw domain::IntegrityError(
                "Cannot delete category: " + std::to_string(children) +
                " subcategory(ies) exist. Please delete or reassign the subcategories first.",
                children);
        }

        const int usage = operationRepo_->countByCategory(categoryId);
        if (usage > 0) {
            throw domain::IntegrityError(
                "Cannot delete category: " + std::to_string(usage) +
                " transaction(s) use this category. Please reassign or delete the transactions first.",
                usage);
        }

        categoryRepo_->deleteById(categoryId);
        std::cout << "[CategoryService] Deleted category " << categoryId << std::endl;
        publishCategoryChanged(categoryId, "deleted");
    }

    domain::Category moveCategory(const std::string& categoryId, const std::optional<std::string>& newParentId) override {
        auto category = requireCategory(categoryId);

        checkMove(category, newParentId);

        category.parentId = newParentId;
        category.updatedAt = clock_->now();
        categoryRepo_->update(category);

        std::cout << "[CategoryService] Moved " << categoryId << " under "
                  << (newParentId ? *newParentId : std::string("<root>")) << std::endl;
        publishCategoryChanged(categoryId, "moved");
        return category;
    }

    std::vector<std::string> getAllDescendants(const std::string& categoryId) override {
        std::vector<std::string> descendants;
        std::set<std::string> seen{categoryId};
        std::deque<std::string> queue{categoryId};

        while (!queue.empty()) {
            auto current = queue.front();
            queue.pop_front();

            for (const auto& child : categoryRepo_->findChildren(current)) {
                if (!seen.insert(child.id).second) {
                    continue;
                }
                descendants.push_back(child.id);
                queue.push_back(child.id);
            }
        }

        return descendants;
    }

    std::vector<domain::Category> getCategoryPath(const std::string& categoryId) override {
        std::vector<domain::Category> path;
        std::set<std::string> visited;
        std::optional<std::string> current = categoryId;

        while (current && visited.insert(*current).second) {
            auto category = categoryRepo_->findById(*current);
            if (!category) {
                break;
            }
            current = category->parentId;
            path.push_back(std::move(*category));
        }

        std::reverse(path.begin(), path.end());
        return path;
    }

    domain::ShadowCategories getShadowCategories() override {
        domain::ShadowCategories shadow;
        if (auto expense = categoryRepo_->findShadow(domain::CategoryType::EXPENSE)) {
            shadow.expenseId = expense->id;
        }
        if (auto income = categoryRepo_->findShadow(domain::CategoryType::INCOME)) {
            shadow.incomeId = income->id;
        }
        return shadow;
    }

    domain::ShadowCategories ensureShadowCategories() override {
        if (!categoryRepo_->findShadow(domain::CategoryType::EXPENSE)) {
            categoryRepo_->save(makeShadow(domain::ShadowCategories::EXPENSE_ID,
                                           "Balance Adjustment (Expense)",
                                           domain::CategoryType::EXPENSE, "cash-minus"));
            std::cout << "[CategoryService] Shadow expense category added" << std::endl;
        }
        if (!categoryRepo_->findShadow(domain::CategoryType::INCOME)) {
            categoryRepo_->save(makeShadow(domain::ShadowCategories::INCOME_ID,
                                           "Balance Adjustment (Income)",
                                           domain::CategoryType::INCOME, "cash-plus"));
            std::cout << "[CategoryService] Shadow income category added" << std::endl;
        }
        return getShadowCategories();
    }

    bool categoryExists(const std::string& categoryId) override {
        return categoryRepo_->findById(categoryId).has_value();
    }

    int countCategoryUsage(const std::string& categoryId) override {
        return operationRepo_->countByCategory(categoryId);
    }

    std::vector<domain::Category> getAllCategories(bool includeShadow = false) override {
        return filterShadow(categoryRepo_->findAll(), includeShadow);
    }

    std::optional<domain::Category> getCategoryById(const std::string& categoryId) override {
        return categoryRepo_->findById(categoryId);
    }

    std::vector<domain::Category> getChildCategories(
        const std::optional<std::string>& parentId,
        bool includeShadow = false) override
    {
        return filterShadow(categoryRepo_->findChildren(parentId), includeShadow);
    }

    std::vector<domain::Category> getCategoriesByType(
        domain::CategoryType type,
        bool includeShadow = false) override
    {
        return filterShadow(categoryRepo_->findByCategoryType(type), includeShadow);
    }

private:
    std::shared_ptr<ports::output::ICategoryRepository> categoryRepo_;
    std::shared_ptr<ports::output::IOperationRepository> operationRepo_;
    std::shared_ptr<ports::output::IClock> clock_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;

    static bool isShadowId(const std::string& categoryId) {
        return categoryId == domain::ShadowCategories::EXPENSE_ID ||
               categoryId == domain::ShadowCategories::INCOME_ID;
    }

    domain::Category requireCategory(const std::string& categoryId) {
        auto category = categoryRepo_->findById(categoryId);
        if (!category) {
            throw domain::NotFoundError("Category " + categoryId + " not found");
        }
        return *category;
    }

    void requireParent(const std::string& parentId) {
        auto parent = categoryRepo_->findById(parentId);
        if (!parent) {
            throw domain::NotFoundError("Parent category " + parentId + " not found");
        }
        if (parent->isShadow) {
            throw domain::IntegrityError("Shadow categories cannot have subcategories");
        }
    }

    /**
     * @brief Проверка переноса: новый родитель не может быть самой
     *        категорией или её потомком. Перенос в корень не проверяется.
     */
    void checkMove(const domain::Category& category, const std::optional<std::string>& newParentId) {
        if (!newParentId) {
            return;
        }
        if (category.isShadow) {
            throw domain::IntegrityError("Shadow categories cannot be moved");
        }

        std::set<std::string> visited;
        std::optional<std::string> current = newParentId;

        while (current) {
            if (*current == category.id) {
                throw domain::IntegrityError("Cannot move category to its own descendant");
            }
            if (!visited.insert(*current).second) {
                break;
            }
            auto node = categoryRepo_->findById(*current);
            if (!node) {
                break;
            }
            current = node->parentId;
        }

        requireParent(*newParentId);
    }

    domain::Category makeShadow(
        const std::string& id,
        const std::string& name,
        domain::CategoryType type,
        const std::string& icon)
    {
        domain::Category category;
        category.id = id;
        category.name = name;
        category.kind = domain::CategoryKind::ENTRY;
        category.categoryType = type;
        category.icon = icon;
        category.isShadow = true;
        category.createdAt = clock_->now();
        category.updatedAt = category.createdAt;
        return category;
    }

    static std::vector<domain::Category> filterShadow(std::vector<domain::Category> categories, bool includeShadow) {
        if (!includeShadow) {
            categories.erase(
                std::remove_if(categories.begin(), categories.end(),
                               [](const domain::Category& c) { return c.isShadow; }),
                categories.end());
        }
        return categories;
    }

    void publishCategoryChanged(const std::string& categoryId, const std::string& action) {
        nlohmann::json event;
        event["category_id"] = categoryId;
        event["action"] = action;
        events::publishEvent(eventPublisher_, "CategoryService", events::CATEGORY_CHANGED, event);
    }
};

} // namespace penny::application
