#pragma once

#include <batchstore/core/records/category.hpp>
#include <batchstore/core/utils/clock.hpp>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace BatchStore {

// NULL, INTEGER, REAL, TEXT
using ColumnValue = std::variant<std::monostate, int64_t, double, std::string>;
using ColumnValues = std::vector<ColumnValue>;

/**
 * @class WriteRecord
 * @brief One bufferable row for a category, immutable once created.
 *
 * Values are positional and must match the category's insert statement.
 * Arity is checked in create(); no other schema validation is performed.
 */
class WriteRecord {
public:
    /**
     * @throws RecordArityError if values.size() != expected column count
     */
    static WriteRecord create(Category category, ColumnValues values, size_t expected_columns);
    static WriteRecord create(Category category, ColumnValues values);

    Category category() const { return category_; }
    const ColumnValues& values() const { return values_; }
    size_t arity() const { return values_.size(); }
    Clock::SteadyTime enqueuedAt() const { return enqueued_at_; }

private:
    WriteRecord(Category category, ColumnValues values);

    Category category_;
    ColumnValues values_;
    Clock::SteadyTime enqueued_at_;
};

} // namespace BatchStore
