#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace BatchStore {

/**
 * Closed set of bufferable write categories.
 * Each category maps 1:1 to a target table and one parameterized insert.
 */
enum class Category : uint8_t {
    MESSAGE = 0,
    CONSUMPTION = 1,
    SUBSCRIPTION = 2
};

constexpr size_t CATEGORY_COUNT = 3;

constexpr std::array<Category, CATEGORY_COUNT> ALL_CATEGORIES = {
    Category::MESSAGE,
    Category::CONSUMPTION,
    Category::SUBSCRIPTION
};

constexpr size_t categoryIndex(Category c) {
    return static_cast<size_t>(c);
}

const char* toString(Category c);

/**
 * @struct CategorySpec
 * @brief Target table, insert statement and expected column count
 *
 * The schema itself is owned by migration tooling; the core only relies on
 * "category -> statement text + column count".
 */
struct CategorySpec {
    std::string table;
    std::string insert_sql;
    size_t column_count = 0;
};

/**
 * @brief Default statements for the fixed schema
 */
CategorySpec defaultCategorySpec(Category c);

using CategorySpecs = std::array<CategorySpec, CATEGORY_COUNT>;

CategorySpecs defaultCategorySpecs();

} // namespace BatchStore
