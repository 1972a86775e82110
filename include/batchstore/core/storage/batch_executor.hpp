#pragma once

#include <batchstore/core/records/write_record.hpp>
#include <batchstore/core/storage/sqlite_store.hpp>
#include <batchstore/core/utils/clock.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace BatchStore {

enum class FlushOutcome : uint8_t {
    COMMITTED = 0,
    FAILED = 1,
    TIMED_OUT = 2       // Store lock not acquired before the deadline, nothing attempted
};

const char* toString(FlushOutcome outcome);

struct BatchOutcome {
    FlushOutcome outcome = FlushOutcome::COMMITTED;
    size_t count = 0;       // Rows committed (0 on failure)
    std::string error;      // Failure cause, empty on success

    bool committed() const { return outcome == FlushOutcome::COMMITTED; }

    static BatchOutcome success(size_t n) { return {FlushOutcome::COMMITTED, n, {}}; }
    static BatchOutcome failure(std::string why) { return {FlushOutcome::FAILED, 0, std::move(why)}; }
    static BatchOutcome timedOut(std::string why) { return {FlushOutcome::TIMED_OUT, 0, std::move(why)}; }
};

/**
 * @class BatchExecutor
 * @brief Commits a snapshot of records as one explicit transaction.
 *
 * BEGIN IMMEDIATE, one parameterized insert per record in original order,
 * COMMIT. Any failure rolls the whole batch back; partial commits are never
 * observable. Arity mismatches fail before the transaction opens.
 */
class BatchExecutor {
public:
    BatchExecutor(SqliteStore& store, CategorySpecs specs = defaultCategorySpecs());
    ~BatchExecutor();

    BatchExecutor(const BatchExecutor&) = delete;
    BatchExecutor& operator=(const BatchExecutor&) = delete;

    BatchOutcome executeBatch(Category category, const std::vector<WriteRecord>& records);

    /**
     * @brief Same, but gives up with TIMED_OUT if the shared store is still
     *        busy at the deadline (used by the shutdown drain)
     */
    BatchOutcome executeBatch(Category category, const std::vector<WriteRecord>& records,
                              Clock::SteadyTime deadline);

    const CategorySpec& spec(Category category) const { return specs_[categoryIndex(category)]; }

private:
    // Empty string when the batch may be committed
    std::string validate(Category category, const std::vector<WriteRecord>& records) const;

    // Must be called while holding the store lock
    BatchOutcome commitLocked(Category category, const std::vector<WriteRecord>& records);
    sqlite3_stmt* statementFor(Category category, std::string& err);
    static int bindValue(sqlite3_stmt* stmt, int index, const ColumnValue& value);
    void rollbackLocked(Category category);

    SqliteStore& store_;
    CategorySpecs specs_;
    std::array<sqlite3_stmt*, CATEGORY_COUNT> statements_{};
};

} // namespace BatchStore
