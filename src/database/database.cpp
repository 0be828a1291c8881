#include "database/database.h"
#include <sqlite3.h>
#include <mutex>

namespace rentledger {
namespace database {

struct WriteBatch::Impl {
    std::vector<std::pair<std::string, std::vector<uint8_t>>> puts;
    std::vector<std::string> dels;
    std::vector<std::string> prefixDels;
};

WriteBatch::WriteBatch() : impl_(std::make_unique<Impl>()) {}
WriteBatch::~WriteBatch() = default;

void WriteBatch::put(const std::string& key, const std::vector<uint8_t>& value) {
    impl_->puts.emplace_back(key, value);
}

void WriteBatch::del(const std::string& key) {
    impl_->dels.push_back(key);
}

void WriteBatch::delPrefix(const std::string& prefix) {
    impl_->prefixDels.push_back(prefix);
}

void WriteBatch::clear() {
    impl_->puts.clear();
    impl_->dels.clear();
    impl_->prefixDels.clear();
}

size_t WriteBatch::size() const {
    return impl_->puts.size() + impl_->dels.size() + impl_->prefixDels.size();
}

struct Database::Impl {
    sqlite3* db = nullptr;
    std::string path;
    std::string lastError;
    mutable std::mutex mtx;
    bool isOpen = false;
    bool inTransaction = false;

    bool exec(const char* sql) {
        char* errMsg = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errMsg);
        if (rc != SQLITE_OK) {
            lastError = errMsg ? errMsg : sqlite3_errstr(rc);
            sqlite3_free(errMsg);
            return false;
        }
        return true;
    }

    bool run(const char* sql, const std::string& key, const std::vector<uint8_t>* value) {
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            lastError = sqlite3_errmsg(db);
            return false;
        }
        sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);
        if (value) {
            sqlite3_bind_blob(stmt, 2, value->data(), static_cast<int>(value->size()), SQLITE_STATIC);
        }
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            lastError = sqlite3_errmsg(db);
            return false;
        }
        return true;
    }
};

// Prefix match without LIKE, which would treat '_' as a wildcard.
static const char* PREFIX_CLAUSE = " WHERE substr(key, 1, length(?1)) = ?1";

Database::Database() : impl_(std::make_unique<Impl>()) {}

Database::~Database() { close(); }

bool Database::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->isOpen) return false;

    int rc = sqlite3_open(path.c_str(), &impl_->db);
    if (rc != SQLITE_OK) {
        impl_->lastError = impl_->db ? sqlite3_errmsg(impl_->db) : sqlite3_errstr(rc);
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    const char* createTable =
        "CREATE TABLE IF NOT EXISTS kv ("
        "key TEXT PRIMARY KEY,"
        "value BLOB"
        ");";

    if (!impl_->exec(createTable)) {
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    impl_->exec("PRAGMA journal_mode=WAL;");
    impl_->exec("PRAGMA synchronous=FULL;");

    impl_->path = path;
    impl_->isOpen = true;
    return true;
}

void Database::close() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->db) {
        if (impl_->inTransaction) impl_->exec("ROLLBACK;");
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
    }
    impl_->inTransaction = false;
    impl_->isOpen = false;
}

bool Database::isOpen() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->isOpen;
}

bool Database::put(const std::string& key, const std::vector<uint8_t>& value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->run("INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?);", key, &value);
}

bool Database::put(const std::string& key, const std::string& value) {
    return put(key, std::vector<uint8_t>(value.begin(), value.end()));
}

std::vector<uint8_t> Database::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return {};

    sqlite3_stmt* stmt;
    const char* sql = "SELECT value FROM kv WHERE key = ?;";

    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) return {};

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);

    std::vector<uint8_t> result;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        const void* blob = sqlite3_column_blob(stmt, 0);
        int blobSize = sqlite3_column_bytes(stmt, 0);
        if (blob && blobSize > 0) {
            result.assign(static_cast<const uint8_t*>(blob),
                          static_cast<const uint8_t*>(blob) + blobSize);
        }
    }

    sqlite3_finalize(stmt);
    return result;
}

std::string Database::getString(const std::string& key) const {
    auto data = get(key);
    return std::string(data.begin(), data.end());
}

bool Database::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;
    return impl_->run("DELETE FROM kv WHERE key = ?;", key, nullptr);
}

bool Database::exists(const std::string& key) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    sqlite3_stmt* stmt;
    const char* sql = "SELECT 1 FROM kv WHERE key = ? LIMIT 1;";

    if (sqlite3_prepare_v2(impl_->db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;

    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_STATIC);

    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);

    return found;
}

bool Database::write(WriteBatch& batch) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    if (!impl_->exec("SAVEPOINT batch;")) return false;

    bool ok = true;
    std::string deletePrefix = std::string("DELETE FROM kv") + PREFIX_CLAUSE + ";";
    for (const auto& prefix : batch.impl_->prefixDels) {
        if (!ok) break;
        ok = impl_->run(deletePrefix.c_str(), prefix, nullptr);
    }
    for (const auto& key : batch.impl_->dels) {
        if (!ok) break;
        ok = impl_->run("DELETE FROM kv WHERE key = ?;", key, nullptr);
    }
    for (const auto& [key, value] : batch.impl_->puts) {
        if (!ok) break;
        ok = impl_->run("INSERT OR REPLACE INTO kv (key, value) VALUES (?, ?);", key, &value);
    }

    if (!ok) {
        std::string err = impl_->lastError;
        impl_->exec("ROLLBACK TO batch;");
        impl_->exec("RELEASE batch;");
        impl_->lastError = err;
        return false;
    }
    if (!impl_->exec("RELEASE batch;")) return false;
    batch.clear();
    return true;
}

void Database::forEach(const std::string& prefix,
                       std::function<bool(const std::string&, const std::vector<uint8_t>&)> fn) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return;

    sqlite3_stmt* stmt;
    std::string sql = "SELECT key, value FROM kv";
    if (!prefix.empty()) {
        sql += PREFIX_CLAUSE;
    }
    sql += " ORDER BY key;";

    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return;

    if (!prefix.empty()) {
        sqlite3_bind_text(stmt, 1, prefix.c_str(), -1, SQLITE_STATIC);
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        std::string key = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
        const void* blob = sqlite3_column_blob(stmt, 1);
        int blobSize = sqlite3_column_bytes(stmt, 1);
        std::vector<uint8_t> value;
        if (blob && blobSize > 0) {
            value.assign(static_cast<const uint8_t*>(blob),
                         static_cast<const uint8_t*>(blob) + blobSize);
        }
        if (!fn(key, value)) break;
    }

    sqlite3_finalize(stmt);
}

std::vector<std::string> Database::keys(const std::string& prefix) const {
    std::vector<std::string> result;
    forEach(prefix, [&result](const std::string& key, const std::vector<uint8_t>&) {
        result.push_back(key);
        return true;
    });
    return result;
}

size_t Database::count(const std::string& prefix) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db) return 0;

    sqlite3_stmt* stmt;
    std::string sql = "SELECT COUNT(*) FROM kv";
    if (!prefix.empty()) {
        sql += PREFIX_CLAUSE;
    }
    sql += ";";

    if (sqlite3_prepare_v2(impl_->db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) return 0;

    if (!prefix.empty()) {
        sqlite3_bind_text(stmt, 1, prefix.c_str(), -1, SQLITE_STATIC);
    }

    size_t cnt = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        cnt = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return cnt;
}

std::string Database::getPath() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->path;
}

std::string Database::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->lastError;
}

bool Database::beginTransaction() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db || impl_->inTransaction) return false;
    if (!impl_->exec("BEGIN IMMEDIATE TRANSACTION;")) return false;
    impl_->inTransaction = true;
    return true;
}

bool Database::commitTransaction() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db || !impl_->inTransaction) return false;
    if (!impl_->exec("COMMIT;")) return false;
    impl_->inTransaction = false;
    return true;
}

bool Database::rollbackTransaction() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (!impl_->db || !impl_->inTransaction) return false;
    impl_->inTransaction = false;
    return impl_->exec("ROLLBACK;");
}

bool Database::inTransaction() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->inTransaction;
}

}
}
