#pragma once

#include "storage/key_value_store.hpp"

#include <mutex>
#include <string>

struct sqlite3;

namespace CKW::Storage {

// EN: Options applied when the database is opened.
// FR: Options appliquées à l'ouverture de la base.
struct SqliteStoreOptions {
    // EN: Write-ahead logging for file databases (ignored for ":memory:").
    // FR: Journalisation WAL pour les bases fichier (ignorée pour ":memory:").
    bool enable_wal = true;

    // EN: Milliseconds SQLite waits on a locked database before failing.
    // FR: Millisecondes d'attente de SQLite sur une base verrouillée avant échec.
    int busy_timeout_ms = 5000;
};

// EN: Durable single-file store on SQLite. All buckets share one table keyed by (bucket, key);
//     keys are stored as BLOBs so scans follow byte order. One connection guarded by a mutex.
// FR: Stockage durable mono-fichier sur SQLite. Tous les buckets partagent une table indexée par
//     (bucket, key) ; les clés sont des BLOB pour un parcours en ordre d'octets. Une connexion
//     protégée par un mutex.
class SqliteKeyValueStore : public KeyValueStore {
public:
    explicit SqliteKeyValueStore(const std::string& path,
                                 const SqliteStoreOptions& options = SqliteStoreOptions{});
    ~SqliteKeyValueStore() override;

    SqliteKeyValueStore(const SqliteKeyValueStore&) = delete;
    SqliteKeyValueStore& operator=(const SqliteKeyValueStore&) = delete;

    void view(const std::function<void(const ReadTransaction&)>& fn) override;
    void update(const std::function<void(WriteTransaction&)>& fn) override;

    const std::string& path() const { return path_; }

private:
    void execute(const std::string& sql);
    void runInTransaction(const char* begin_statement, const std::function<void()>& body);

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace CKW::Storage
