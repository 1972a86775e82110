#pragma once

#include <batchstore/core/config/app_config.hpp>
#include <batchstore/core/utils/clock.hpp>
#include <sqlite3.h>
#include <mutex>
#include <string>

namespace BatchStore {

/**
 * @class SqliteStore
 * @brief Owns the single shared SQLite connection.
 *
 * The handle is shared by every BatchExecutor invocation. Callers that run a
 * transaction must hold lock() for its whole duration; no transaction is ever
 * kept open across calls.
 */
class SqliteStore {
public:
    /**
     * @brief Open (or create) the database and apply the configured pragmas
     * @throws StoreError on open or pragma failure
     */
    explicit SqliteStore(const AppConfig::StorageConfig& config);
    ~SqliteStore();

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    /**
     * @brief Run one or more statements (schema setup, pragmas, tests)
     * @throws StoreError with the SQLite error message
     */
    void execute(const std::string& sql);

    /**
     * @brief Run statements while the caller already holds lock()
     * @return SQLITE_OK or the SQLite error code; err receives the message
     */
    int executeLocked(const char* sql, std::string& err);

    std::unique_lock<std::timed_mutex> lock() { return std::unique_lock<std::timed_mutex>(mutex_); }

    /**
     * @brief Lock, giving up at the deadline
     * @return a lock that does not own the mutex if the deadline passed first
     */
    std::unique_lock<std::timed_mutex> lockUntil(Clock::SteadyTime deadline) {
        return std::unique_lock<std::timed_mutex>(mutex_, deadline);
    }

    // Raw handle; only valid for use while holding lock()
    sqlite3* handle() const { return db_; }


private:
    void applyPragmas(const AppConfig::StorageConfig& config);

    std::string path_;
    sqlite3* db_ = nullptr;
    std::timed_mutex mutex_;
};

} // namespace BatchStore
