#pragma once

#include <string>
#include <stdexcept>

namespace penny::domain {

/**
 * @brief Узел дерева категорий: папка или конечная категория
 */
enum class CategoryKind {
    FOLDER,
    ENTRY
};

inline std::string toString(CategoryKind kind) {
    switch (kind) {
        case CategoryKind::FOLDER: return "folder";
        case CategoryKind::ENTRY:  return "entry";
    }
    return "unknown";
}

inline CategoryKind categoryKindFromString(const std::string& str) {
    if (str == "folder") return CategoryKind::FOLDER;
    if (str == "entry")  return CategoryKind::ENTRY;
    throw std::invalid_argument("Unknown CategoryKind: " + str);
}

} // namespace penny::domain
