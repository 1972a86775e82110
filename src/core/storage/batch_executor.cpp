#include <batchstore/core/storage/batch_executor.hpp>
#include <spdlog/spdlog.h>
#include <type_traits>

namespace BatchStore {

const char* toString(FlushOutcome outcome) {
    switch (outcome) {
        case FlushOutcome::COMMITTED:  return "committed";
        case FlushOutcome::FAILED:     return "failed";
        case FlushOutcome::TIMED_OUT:  return "timed_out";
        default:                       return "unknown";
    }
}

BatchExecutor::BatchExecutor(SqliteStore& store, CategorySpecs specs)
    : store_(store), specs_(std::move(specs)) {
    for (auto c : ALL_CATEGORIES) {
        spdlog::debug("[BatchExecutor] {} -> {} ({} columns)",
                      toString(c), specs_[categoryIndex(c)].table,
                      specs_[categoryIndex(c)].column_count);
    }
}

BatchExecutor::~BatchExecutor() {
    auto lock = store_.lock();
    for (auto& stmt : statements_) {
        if (stmt) {
            sqlite3_finalize(stmt);
            stmt = nullptr;
        }
    }
}

sqlite3_stmt* BatchExecutor::statementFor(Category category, std::string& err) {
    sqlite3_stmt*& cached = statements_[categoryIndex(category)];
    if (cached) {
        return cached;
    }

    const CategorySpec& s = spec(category);
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(store_.handle(), s.insert_sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        err = std::string("prepare failed: ") + sqlite3_errmsg(store_.handle());
        sqlite3_finalize(stmt);
        return nullptr;
    }

    int params = sqlite3_bind_parameter_count(stmt);
    if (static_cast<size_t>(params) != s.column_count) {
        err = "statement for " + s.table + " declares " + std::to_string(params)
              + " parameters, expected " + std::to_string(s.column_count);
        sqlite3_finalize(stmt);
        return nullptr;
    }

    cached = stmt;
    return cached;
}

int BatchExecutor::bindValue(sqlite3_stmt* stmt, int index, const ColumnValue& value) {
    return std::visit([stmt, index](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(v));
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, index, v);
        } else {
            return sqlite3_bind_text(stmt, index, v.c_str(), static_cast<int>(v.size()),
                                     SQLITE_TRANSIENT);
        }
    }, value);
}

void BatchExecutor::rollbackLocked(Category category) {
    std::string err;
    if (store_.executeLocked("ROLLBACK", err) != SQLITE_OK) {
        // SQLite may already have rolled back on its own (e.g. SQLITE_FULL)
        spdlog::debug("[BatchExecutor] ROLLBACK for {} reported: {}", toString(category), err);
    }
}

std::string BatchExecutor::validate(Category category, const std::vector<WriteRecord>& records) const {
    const CategorySpec& s = spec(category);
    for (size_t i = 0; i < records.size(); ++i) {
        const WriteRecord& r = records[i];
        if (r.category() != category) {
            return "record " + std::to_string(i) + " belongs to "
                   + toString(r.category()) + ", not " + toString(category);
        }
        if (r.arity() != s.column_count) {
            return "record " + std::to_string(i) + " has " + std::to_string(r.arity())
                   + " values, " + s.table + " expects " + std::to_string(s.column_count);
        }
    }
    return {};
}

BatchOutcome BatchExecutor::executeBatch(Category category, const std::vector<WriteRecord>& records) {
    if (records.empty()) {
        return BatchOutcome::success(0);
    }
    // Fail fast, before any transaction is opened
    std::string invalid = validate(category, records);
    if (!invalid.empty()) {
        return BatchOutcome::failure(invalid);
    }

    auto lock = store_.lock();
    return commitLocked(category, records);
}

BatchOutcome BatchExecutor::executeBatch(Category category, const std::vector<WriteRecord>& records,
                                         Clock::SteadyTime deadline) {
    if (records.empty()) {
        return BatchOutcome::success(0);
    }
    std::string invalid = validate(category, records);
    if (!invalid.empty()) {
        return BatchOutcome::failure(invalid);
    }

    auto lock = store_.lockUntil(deadline);
    if (!lock.owns_lock()) {
        spdlog::warn("[BatchExecutor] Store busy past deadline, {} {} records not attempted",
                     records.size(), toString(category));
        return BatchOutcome::timedOut("store busy past deadline");
    }
    return commitLocked(category, records);
}

BatchOutcome BatchExecutor::commitLocked(Category category, const std::vector<WriteRecord>& records) {
    const CategorySpec& s = spec(category);

    std::string err;
    sqlite3_stmt* stmt = statementFor(category, err);
    if (!stmt) {
        spdlog::error("[BatchExecutor] {}: {}", s.table, err);
        return BatchOutcome::failure(err);
    }

    if (store_.executeLocked("BEGIN IMMEDIATE", err) != SQLITE_OK) {
        spdlog::error("[BatchExecutor] BEGIN failed for {}: {}", s.table, err);
        return BatchOutcome::failure("begin failed: " + err);
    }

    for (size_t i = 0; i < records.size(); ++i) {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);

        const ColumnValues& values = records[i].values();
        for (size_t col = 0; col < values.size(); ++col) {
            int rc = bindValue(stmt, static_cast<int>(col + 1), values[col]);
            if (rc != SQLITE_OK) {
                err = "bind failed at record " + std::to_string(i) + " column "
                      + std::to_string(col) + ": " + sqlite3_errmsg(store_.handle());
                sqlite3_reset(stmt);
                rollbackLocked(category);
                spdlog::error("[BatchExecutor] {}: {}", s.table, err);
                return BatchOutcome::failure(err);
            }
        }

        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE) {
            err = "insert failed at record " + std::to_string(i) + ": "
                  + sqlite3_errmsg(store_.handle());
            sqlite3_reset(stmt);
            rollbackLocked(category);
            spdlog::error("[BatchExecutor] {}: {}", s.table, err);
            return BatchOutcome::failure(err);
        }
    }
    sqlite3_reset(stmt);

    if (store_.executeLocked("COMMIT", err) != SQLITE_OK) {
        rollbackLocked(category);
        spdlog::error("[BatchExecutor] COMMIT failed for {}: {}", s.table, err);
        return BatchOutcome::failure("commit failed: " + err);
    }

    spdlog::debug("[BatchExecutor] Committed {} rows into {}", records.size(), s.table);
    return BatchOutcome::success(records.size());
}

} // namespace BatchStore
