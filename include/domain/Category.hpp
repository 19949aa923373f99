#pragma once

#include "enums/CategoryKind.hpp"
#include "enums/CategoryType.hpp"
#include "Timestamp.hpp"
#include <string>
#include <optional>

namespace penny::domain {

/**
 * @brief Узел иерархии категорий
 *
 * Граф parentId ацикличен. Теневые (isShadow) категории: системные,
 * по одной на тип, в них пишутся только корректировки баланса.
 */
struct Category {
    std::string id;
    std::string name;
    CategoryKind kind = CategoryKind::ENTRY;
    CategoryType categoryType = CategoryType::EXPENSE;
    std::optional<std::string> parentId;
    std::string icon;
    std::string color;
    bool isShadow = false;
    bool excludeFromForecast = false;
    Timestamp createdAt;
    Timestamp updatedAt;
};

/**
 * @brief Запрос на создание категории
 */
struct CategoryRequest {
    std::optional<std::string> id;
    std::string name;
    CategoryKind kind = CategoryKind::ENTRY;
    CategoryType categoryType = CategoryType::EXPENSE;
    std::optional<std::string> parentId;
    std::string icon;
    std::string color;
    bool excludeFromForecast = false;
};

/**
 * @brief Частичное изменение категории
 */
struct CategoryUpdate {
    std::optional<std::string> name;
    std::optional<CategoryKind> kind;
    /// nullopt: не менять; std::optional<std::string>{}: перенести в корень
    std::optional<std::optional<std::string>> parentId;
    std::optional<std::string> icon;
    std::optional<std::string> color;
    std::optional<bool> excludeFromForecast;
};

} // namespace penny::domain
