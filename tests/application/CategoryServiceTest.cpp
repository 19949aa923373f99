/**
 * @file CategoryServiceTest.cpp
 * @brief Unit tests for CategoryService over the in-memory store
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "fixtures/LedgerFixture.hpp"

using namespace penny;
using namespace penny::tests;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

class CategoryServiceTest : public LedgerFixture {
protected:
    void SetUp() override {
        LedgerFixture::SetUp();
        // food -> groceries -> fruit, food -> cafe; transport отдельно
        addCategory("food");
        addCategory("groceries", std::string("food"));
        addCategory("fruit", std::string("groceries"));
        addCategory("cafe", std::string("food"));
        addCategory("transport");
    }

    static domain::CategoryRequest request(const std::string& name, const std::optional<std::string>& parentId = std::nullopt) {
        domain::CategoryRequest r;
        r.name = name;
        r.parentId = parentId;
        return r;
    }

    std::optional<std::string> parentOf(const std::string& id) {
        return categories_->getCategoryById(id)->parentId;
    }
};

// ============================================================================
// CREATE
// ============================================================================

TEST_F(CategoryServiceTest, Create_UnderParent) {
    auto category = categories_->createCategory(request("Vegetables", std::string("groceries")));

    EXPECT_FALSE(category.id.empty());
    EXPECT_EQ(category.parentId, std::optional<std::string>("groceries"));
    EXPECT_TRUE(categories_->categoryExists(category.id));
    EXPECT_EQ(publisher_->countByRoutingKey("category.changed"), 1);
}

TEST_F(CategoryServiceTest, Create_MissingParent_Throws) {
    try {
        categories_->createCategory(request("Orphan", std::string("ghost")));
        FAIL() << "Expected NotFoundError";
    } catch (const domain::NotFoundError& e) {
        EXPECT_STREQ(e.what(), "Parent category ghost not found");
    }
}

TEST_F(CategoryServiceTest, Create_EmptyName_Throws) {
    EXPECT_THROW(categories_->createCategory(request("")), domain::ValidationError);
}

// ============================================================================
// MOVE
// ============================================================================

TEST_F(CategoryServiceTest, Move_IntoOwnDescendant_FailsWithoutWrite) {
    try {
        categories_->moveCategory("food", std::string("fruit"));
        FAIL() << "Expected IntegrityError";
    } catch (const domain::IntegrityError& e) {
        EXPECT_STREQ(e.what(), "Cannot move category to its own descendant");
    }

    EXPECT_FALSE(parentOf("food").has_value());
}

TEST_F(CategoryServiceTest, Move_UnderItself_Fails) {
    EXPECT_THROW(categories_->moveCategory("groceries", std::string("groceries")), domain::IntegrityError);
    EXPECT_EQ(parentOf("groceries"), std::optional<std::string>("food"));
}

TEST_F(CategoryServiceTest, Move_ToUnrelatedBranch_Persists) {
    auto moved = categories_->moveCategory("groceries", std::string("transport"));

    EXPECT_EQ(moved.parentId, std::optional<std::string>("transport"));
    EXPECT_EQ(parentOf("groceries"), std::optional<std::string>("transport"));
    EXPECT_THAT(categories_->getAllDescendants("food"), ElementsAre("cafe"));
}

TEST_F(CategoryServiceTest, Move_DescendantUpToAncestorLevel_Allowed) {
    categories_->moveCategory("fruit", std::string("food"));

    EXPECT_EQ(parentOf("fruit"), std::optional<std::string>("food"));
}

TEST_F(CategoryServiceTest, Move_ToRoot_Persists) {
    categories_->moveCategory("fruit", std::nullopt);

    EXPECT_FALSE(parentOf("fruit").has_value());
}

TEST_F(CategoryServiceTest, Update_ParentChange_UsesCycleCheck) {
    domain::CategoryUpdate update;
    update.name = "Food & Drinks";
    update.parentId.emplace("cafe");

    EXPECT_THROW(categories_->updateCategory("food", update), domain::IntegrityError);
    EXPECT_EQ(categories_->getCategoryById("food")->name, "food");
}

TEST_F(CategoryServiceTest, Update_ClearParent_MovesToRoot) {
    domain::CategoryUpdate update;
    update.parentId.emplace();

    auto updated = categories_->updateCategory("cafe", update);

    EXPECT_FALSE(updated.parentId.has_value());
}

// ============================================================================
// TRAVERSAL
// ============================================================================

TEST_F(CategoryServiceTest, Descendants_AllLevels_ExcludesSelf) {
    EXPECT_THAT(categories_->getAllDescendants("food"), UnorderedElementsAre("groceries", "fruit", "cafe"));
    EXPECT_TRUE(categories_->getAllDescendants("fruit").empty());
}

TEST_F(CategoryServiceTest, Path_RootToNode) {
    auto path = categories_->getCategoryPath("fruit");

    std::vector<std::string> ids;
    for (const auto& c : path) ids.push_back(c.id);
    EXPECT_THAT(ids, ElementsAre("food", "groceries", "fruit"));
}

TEST_F(CategoryServiceTest, Path_Unknown_Empty) {
    EXPECT_TRUE(categories_->getCategoryPath("ghost").empty());
}

// ============================================================================
// DELETE
// ============================================================================

TEST_F(CategoryServiceTest, Delete_WithChildren_SubcategoryMessage) {
    addAccount("a", "0");
    addExpense("e1", "1", "a", "2025-03-01", "groceries");

    try {
        categories_->deleteCategory("groceries");
        FAIL() << "Expected IntegrityError";
    } catch (const domain::IntegrityError& e) {
        EXPECT_EQ(e.count(), 1);
        EXPECT_NE(std::string(e.what()).find("1 subcategory(ies)"), std::string::npos);
    }
    EXPECT_TRUE(categories_->categoryExists("groceries"));
}

TEST_F(CategoryServiceTest, Delete_UsedByOperations_Throws) {
    addAccount("a", "0");
    addExpense("e1", "1", "a", "2025-03-01", "cafe");
    addExpense("e2", "2", "a", "2025-03-02", "cafe");

    try {
        categories_->deleteCategory("cafe");
        FAIL() << "Expected IntegrityError";
    } catch (const domain::IntegrityError& e) {
        EXPECT_EQ(e.count(), 2);
        EXPECT_NE(std::string(e.what()).find("2 transaction(s) use this category"), std::string::npos);
    }
    EXPECT_EQ(categories_->countCategoryUsage("cafe"), 2);
}

TEST_F(CategoryServiceTest, Delete_Leaf_Removed) {
    categories_->deleteCategory("transport");

    EXPECT_FALSE(categories_->categoryExists("transport"));
}

// ============================================================================
// SHADOW CATEGORIES
// ============================================================================

TEST_F(CategoryServiceTest, EnsureShadow_Idempotent_OnePerType) {
    auto first = categories_->ensureShadowCategories();
    auto second = categories_->ensureShadowCategories();

    EXPECT_TRUE(first.isComplete());
    EXPECT_EQ(first.expenseId, second.expenseId);
    EXPECT_EQ(first.incomeId, second.incomeId);

    int shadowCount = 0;
    for (const auto& c : categories_->getAllCategories(true)) {
        if (c.isShadow) ++shadowCount;
    }
    EXPECT_EQ(shadowCount, 2);
}

TEST_F(CategoryServiceTest, Listings_HideShadowUnlessRequested) {
    categories_->ensureShadowCategories();

    for (const auto& c : categories_->getAllCategories()) {
        EXPECT_FALSE(c.isShadow) << c.id;
    }
    EXPECT_EQ(categories_->getAllCategories(true).size(), categories_->getAllCategories().size() + 2);
    EXPECT_EQ(categories_->getCategoriesByType(domain::CategoryType::INCOME).size(), 0u);
    EXPECT_EQ(categories_->getCategoriesByType(domain::CategoryType::INCOME, true).size(), 1u);
    EXPECT_EQ(categories_->getChildCategories(std::nullopt).size(), 2u);  // food, transport
}

TEST_F(CategoryServiceTest, GetShadow_BeforeBootstrap_Incomplete) {
    EXPECT_FALSE(categories_->getShadowCategories().isComplete());
}

TEST_F(CategoryServiceTest, Shadow_CannotBeDeletedMovedOrParented) {
    auto shadow = categories_->ensureShadowCategories();

    EXPECT_THROW(categories_->deleteCategory(shadow.expenseId), domain::IntegrityError);
    EXPECT_THROW(categories_->moveCategory(shadow.incomeId, std::string("food")), domain::IntegrityError);
    EXPECT_THROW(categories_->createCategory(request("Child", shadow.expenseId)), domain::IntegrityError);

    domain::CategoryRequest impostor = request("Fake");
    impostor.id = std::string(domain::ShadowCategories::INCOME_ID);
    EXPECT_THROW(categories_->createCategory(impostor), domain::IntegrityError);
}
