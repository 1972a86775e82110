#include <batchstore/core/storage/sqlite_store.hpp>
#include <batchstore/core/errors.hpp>
#include <spdlog/spdlog.h>

namespace BatchStore {

SqliteStore::SqliteStore(const AppConfig::StorageConfig& config) : path_(config.path) {
    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        spdlog::error("[SqliteStore] Failed to open database at {}: {}", path_, msg);
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw StoreError("Failed to open database " + path_ + ": " + msg);
    }

    try {
        applyPragmas(config);
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    spdlog::info("[SqliteStore] Opened {} (journal_mode={}, synchronous={})",
                 path_, config.journalMode, config.synchronous);
}

SqliteStore::~SqliteStore() {
    if (db_) {
        int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK) {
            spdlog::warn("[SqliteStore] Close of {} returned {}: {}", path_, rc, sqlite3_errstr(rc));
        }
    }
}

void SqliteStore::applyPragmas(const AppConfig::StorageConfig& config) {
    // journal_mode=WAL is silently ignored for :memory: databases
    execute("PRAGMA journal_mode = " + config.journalMode);
    execute("PRAGMA synchronous = " + config.synchronous);
    execute("PRAGMA cache_size = " + std::to_string(config.cacheSize));

    std::lock_guard<std::timed_mutex> lock(mutex_);
    sqlite3_busy_timeout(db_, config.busyTimeoutMs);
}

void SqliteStore::execute(const std::string& sql) {
    std::lock_guard<std::timed_mutex> lock(mutex_);
    std::string err;
    if (executeLocked(sql.c_str(), err) != SQLITE_OK) {
        spdlog::error("[SqliteStore] Statement failed: {} ({})", err, sql);
        throw StoreError(err);
    }
}

int SqliteStore::executeLocked(const char* sql, std::string& err) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        err = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
    }
    return rc;
}

} // namespace BatchStore
