// EN: SQLite-backed transactional key-value store.
// FR: Stockage clé-valeur transactionnel adossé à SQLite.

#include "storage/sqlite_key_value_store.hpp"
#include "infrastructure/logging/logger.hpp"

#include <sqlite3.h>

namespace CKW::Storage {

namespace {

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS kv_entries ("
    " bucket TEXT NOT NULL,"
    " key BLOB NOT NULL,"
    " value BLOB NOT NULL,"
    " PRIMARY KEY (bucket, key)"
    ") WITHOUT ROWID";

// EN: Finalizes the statement when leaving scope.
// FR: Finalise la requête à la sortie du scope.
struct StatementGuard {
    sqlite3_stmt* stmt_ = nullptr;

    explicit StatementGuard(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~StatementGuard() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    StatementGuard(const StatementGuard&) = delete;
    StatementGuard& operator=(const StatementGuard&) = delete;
};

std::string errorMessage(sqlite3* db, const std::string& context) {
    return context + ": " + std::string(db ? sqlite3_errmsg(db) : "no database handle");
}

sqlite3_stmt* prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw StorageError(errorMessage(db, "Failed to prepare statement"));
    }
    return stmt;
}

void bindText(sqlite3* db, sqlite3_stmt* stmt, int index, const std::string& value) {
    if (sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
        throw StorageError(errorMessage(db, "Failed to bind parameter"));
    }
}

void bindBlob(sqlite3* db, sqlite3_stmt* stmt, int index, const std::string& value) {
    if (sqlite3_bind_blob(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT) != SQLITE_OK) {
        throw StorageError(errorMessage(db, "Failed to bind parameter"));
    }
}

std::string columnBlob(sqlite3_stmt* stmt, int column) {
    const void* data = sqlite3_column_blob(stmt, column);
    const int size = sqlite3_column_bytes(stmt, column);
    if (!data || size <= 0) {
        return {};
    }
    return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
}

class SqliteReadTransaction : public ReadTransaction {
public:
    explicit SqliteReadTransaction(sqlite3* db) : db_(db) {}

    std::optional<std::string> get(const std::string& bucket, const std::string& key) const override {
        StatementGuard guard(prepare(db_, "SELECT value FROM kv_entries WHERE bucket = ?1 AND key = ?2"));
        bindText(db_, guard.stmt_, 1, bucket);
        bindBlob(db_, guard.stmt_, 2, key);

        const int rc = sqlite3_step(guard.stmt_);
        if (rc == SQLITE_ROW) {
            return columnBlob(guard.stmt_, 0);
        }
        if (rc != SQLITE_DONE) {
            throw StorageError(errorMessage(db_, "Failed to read key"));
        }
        return std::nullopt;
    }

    void scanPrefix(const std::string& bucket, const std::string& prefix,
                    const ScanVisitor& visitor) const override {
        StatementGuard guard(prepare(db_,
            "SELECT key, value FROM kv_entries WHERE bucket = ?1 AND key >= ?2 ORDER BY key ASC"));
        bindText(db_, guard.stmt_, 1, bucket);
        bindBlob(db_, guard.stmt_, 2, prefix);

        int rc;
        while ((rc = sqlite3_step(guard.stmt_)) == SQLITE_ROW) {
            std::string key = columnBlob(guard.stmt_, 0);
            if (key.compare(0, prefix.size(), prefix) != 0) {
                return;
            }
            if (!visitor(key, columnBlob(guard.stmt_, 1))) {
                return;
            }
        }
        if (rc != SQLITE_DONE) {
            throw StorageError(errorMessage(db_, "Failed to scan bucket '" + bucket + "'"));
        }
    }

protected:
    sqlite3* db_;
};

class SqliteWriteTransaction : public WriteTransaction {
public:
    explicit SqliteWriteTransaction(sqlite3* db) : reader_(db), db_(db) {}

    std::optional<std::string> get(const std::string& bucket, const std::string& key) const override {
        return reader_.get(bucket, key);
    }

    void scanPrefix(const std::string& bucket, const std::string& prefix,
                    const ScanVisitor& visitor) const override {
        reader_.scanPrefix(bucket, prefix, visitor);
    }

    void put(const std::string& bucket, const std::string& key, const std::string& value) override {
        StatementGuard guard(prepare(db_,
            "INSERT INTO kv_entries (bucket, key, value) VALUES (?1, ?2, ?3) "
            "ON CONFLICT(bucket, key) DO UPDATE SET value = excluded.value"));
        bindText(db_, guard.stmt_, 1, bucket);
        bindBlob(db_, guard.stmt_, 2, key);
        bindBlob(db_, guard.stmt_, 3, value);
        if (sqlite3_step(guard.stmt_) != SQLITE_DONE) {
            throw StorageError(errorMessage(db_, "Failed to write key"));
        }
    }

    bool remove(const std::string& bucket, const std::string& key) override {
        StatementGuard guard(prepare(db_, "DELETE FROM kv_entries WHERE bucket = ?1 AND key = ?2"));
        bindText(db_, guard.stmt_, 1, bucket);
        bindBlob(db_, guard.stmt_, 2, key);
        if (sqlite3_step(guard.stmt_) != SQLITE_DONE) {
            throw StorageError(errorMessage(db_, "Failed to delete key"));
        }
        return sqlite3_changes(db_) > 0;
    }

private:
    SqliteReadTransaction reader_;
    sqlite3* db_;
};

} // namespace

SqliteKeyValueStore::SqliteKeyValueStore(const std::string& path, const SqliteStoreOptions& options)
    : path_(path) {
    const int rc = sqlite3_open_v2(path.c_str(), &db_,
                                   SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string message = errorMessage(db_, "Failed to open database '" + path + "'");
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageError(message);
    }

    try {
        sqlite3_busy_timeout(db_, options.busy_timeout_ms);
        if (options.enable_wal && path != ":memory:") {
            execute("PRAGMA journal_mode=WAL");
        }
        execute("PRAGMA synchronous=FULL");
        execute(kSchema);
    } catch (const StorageError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    LOG_DEBUG("sqlite_store", "Opened key-value store at " + path);
}

SqliteKeyValueStore::~SqliteKeyValueStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteKeyValueStore::view(const std::function<void(const ReadTransaction&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    runInTransaction("BEGIN DEFERRED", [&] {
        SqliteReadTransaction txn(db_);
        fn(txn);
    });
}

void SqliteKeyValueStore::update(const std::function<void(WriteTransaction&)>& fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    runInTransaction("BEGIN IMMEDIATE", [&] {
        SqliteWriteTransaction txn(db_);
        fn(txn);
    });
}

void SqliteKeyValueStore::execute(const std::string& sql) {
    char* error = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = "SQL execution failed (" + sql + "): " + (error ? std::string(error) : "unknown error");
        sqlite3_free(error);
        throw StorageError(message);
    }
}

// EN: The body's exception is rethrown after rollback; a rollback failure is only logged so the
//     original cause reaches the caller.
// FR: L'exception du corps est relancée après rollback ; un échec de rollback est seulement
//     journalisé pour que la cause d'origine parvienne à l'appelant.
void SqliteKeyValueStore::runInTransaction(const char* begin_statement, const std::function<void()>& body) {
    execute(begin_statement);
    try {
        body();
    } catch (...) {
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            LOG_ERROR("sqlite_store", errorMessage(db_, "Rollback failed"));
        }
        throw;
    }
    try {
        execute("COMMIT");
    } catch (const StorageError&) {
        if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            LOG_ERROR("sqlite_store", errorMessage(db_, "Rollback after failed commit failed"));
        }
        throw;
    }
}

} // namespace CKW::Storage
