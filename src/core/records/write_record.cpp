#include <batchstore/core/records/write_record.hpp>
#include <batchstore/core/errors.hpp>
#include <spdlog/fmt/fmt.h>

namespace BatchStore {

WriteRecord::WriteRecord(Category category, ColumnValues values)
    : category_(category),
      values_(std::move(values)),
      enqueued_at_(Clock::now()) {}

WriteRecord WriteRecord::create(Category category, ColumnValues values, size_t expected_columns) {
    if (values.size() != expected_columns) {
        throw RecordArityError(fmt::format(
            "{} record expects {} columns, got {}",
            toString(category), expected_columns, values.size()));
    }
    return WriteRecord(category, std::move(values));
}

WriteRecord WriteRecord::create(Category category, ColumnValues values) {
    return create(category, std::move(values), defaultCategorySpec(category).column_count);
}

} // namespace BatchStore
