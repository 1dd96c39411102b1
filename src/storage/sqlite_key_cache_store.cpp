#include "fedtrust/storage/sqlite_key_cache_store.hpp"
#include "fedtrust/core/logger.hpp"
#include "fedtrust/core/utils.hpp"
#include <sqlite3.h>

namespace fedtrust::storage {

using core::utils::TimeUtils;

namespace {

std::string column_text(sqlite3_stmt* stmt, int column) {
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? std::string(text) : std::string();
}

}

SqliteKeyCacheStore::SqliteKeyCacheStore(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

SqliteKeyCacheStore::~SqliteKeyCacheStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool SqliteKeyCacheStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Failed to open key database {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        return false;
    }
    
    return create_tables();
}

bool SqliteKeyCacheStore::exec(const char* sql) {
    char* error_msg = nullptr;
    int result = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("SQLite error: {}", error_msg ? error_msg : "unknown");
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

bool SqliteKeyCacheStore::create_tables() {
    const char* create_local_keys = R"(
        CREATE TABLE IF NOT EXISTS server_signing_keys (
            server_name TEXT NOT NULL,
            key_id TEXT NOT NULL,
            private_key TEXT,
            public_key TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            expires_at INTEGER,
            is_active INTEGER NOT NULL DEFAULT 1,
            PRIMARY KEY (server_name, key_id)
        );
    )";
    
    const char* create_remote_keys = R"(
        CREATE TABLE IF NOT EXISTS remote_server_keys (
            server_name TEXT NOT NULL,
            key_id TEXT NOT NULL,
            public_key TEXT NOT NULL,
            fetched_at INTEGER NOT NULL,
            expires_at INTEGER NOT NULL,
            PRIMARY KEY (server_name, key_id)
        );
    )";
    
    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_remote_keys_expires ON remote_server_keys(expires_at);
        CREATE INDEX IF NOT EXISTS idx_signing_keys_active ON server_signing_keys(server_name, is_active);
    )";
    
    return exec(create_local_keys) && exec(create_remote_keys) && exec(create_indexes);
}

std::optional<CachedServerKey> SqliteKeyCacheStore::get(const std::string& server_name, const std::string& key_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }
    
    const char* select_sql = R"(
        SELECT public_key, fetched_at, expires_at FROM remote_server_keys
        WHERE server_name = ? AND key_id = ?;
    )";
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    
    sqlite3_bind_text(stmt, 1, server_name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, key_id.c_str(), -1, SQLITE_STATIC);
    
    std::optional<CachedServerKey> entry;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        CachedServerKey key;
        key.public_key = column_text(stmt, 0);
        key.fetched_at = TimeUtils::from_unix_millis(sqlite3_column_int64(stmt, 1));
        key.expires_at = TimeUtils::from_unix_millis(sqlite3_column_int64(stmt, 2));
        entry = std::move(key);
    }
    
    sqlite3_finalize(stmt);
    return entry;
}

bool SqliteKeyCacheStore::put(const std::string& server_name,
                              const std::string& key_id,
                              const std::string& public_key,
                              TimePoint fetched_at,
                              TimePoint expires_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    
    const char* insert_sql = R"(
        INSERT OR REPLACE INTO remote_server_keys
        (server_name, key_id, public_key, fetched_at, expires_at)
        VALUES (?, ?, ?, ?, ?);
    )";
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }
    
    sqlite3_bind_text(stmt, 1, server_name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, key_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, public_key.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 4, TimeUtils::to_unix_millis(fetched_at));
    sqlite3_bind_int64(stmt, 5, TimeUtils::to_unix_millis(expires_at));
    
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        LOG_ERROR("Failed to cache key {} for {}: {}", key_id, server_name, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<ServerSigningKey> SqliteKeyCacheStore::get_local_key(const std::string& server_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return std::nullopt;
    }
    
    const char* select_sql = R"(
        SELECT key_id, private_key, public_key, created_at, expires_at, is_active
        FROM server_signing_keys
        WHERE server_name = ? AND is_active = 1
        ORDER BY created_at DESC LIMIT 1;
    )";
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, select_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }
    
    sqlite3_bind_text(stmt, 1, server_name.c_str(), -1, SQLITE_STATIC);
    
    std::optional<ServerSigningKey> entry;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        ServerSigningKey key;
        key.server_name = server_name;
        key.key_id = column_text(stmt, 0);
        if (sqlite3_column_type(stmt, 1) != SQLITE_NULL) {
            key.private_key = column_text(stmt, 1);
        }
        key.public_key = column_text(stmt, 2);
        key.created_at = TimeUtils::from_unix_millis(sqlite3_column_int64(stmt, 3));
        if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
            key.expires_at = TimeUtils::from_unix_millis(sqlite3_column_int64(stmt, 4));
        }
        key.is_active = sqlite3_column_int(stmt, 5) != 0;
        entry = std::move(key);
    }
    
    sqlite3_finalize(stmt);
    return entry;
}

bool SqliteKeyCacheStore::put_local_key(const ServerSigningKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return false;
    }
    
    if (!exec("BEGIN IMMEDIATE;")) {
        return false;
    }
    
    if (key.is_active) {
        const char* deactivate_sql = "UPDATE server_signing_keys SET is_active = 0 WHERE server_name = ?;";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db_, deactivate_sql, -1, &stmt, nullptr) != SQLITE_OK) {
            exec("ROLLBACK;");
            return false;
        }
        sqlite3_bind_text(stmt, 1, key.server_name.c_str(), -1, SQLITE_STATIC);
        int result = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (result != SQLITE_DONE) {
            exec("ROLLBACK;");
            return false;
        }
    }
    
    const char* insert_sql = R"(
        INSERT OR REPLACE INTO server_signing_keys
        (server_name, key_id, private_key, public_key, created_at, expires_at, is_active)
        VALUES (?, ?, ?, ?, ?, ?, ?);
    )";
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        exec("ROLLBACK;");
        return false;
    }
    
    sqlite3_bind_text(stmt, 1, key.server_name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, key.key_id.c_str(), -1, SQLITE_STATIC);
    if (key.private_key) {
        sqlite3_bind_text(stmt, 3, key.private_key->c_str(), -1, SQLITE_STATIC);
    } else {
        sqlite3_bind_null(stmt, 3);
    }
    sqlite3_bind_text(stmt, 4, key.public_key.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 5, TimeUtils::to_unix_millis(key.created_at));
    if (key.expires_at) {
        sqlite3_bind_int64(stmt, 6, TimeUtils::to_unix_millis(*key.expires_at));
    } else {
        sqlite3_bind_null(stmt, 6);
    }
    sqlite3_bind_int(stmt, 7, key.is_active ? 1 : 0);
    
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        LOG_ERROR("Failed to store signing key {} for {}: {}", key.key_id, key.server_name, sqlite3_errmsg(db_));
        exec("ROLLBACK;");
        return false;
    }
    
    return exec("COMMIT;");
}

size_t SqliteKeyCacheStore::prune_expired(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_) {
        return 0;
    }
    
    const char* delete_sql = "DELETE FROM remote_server_keys WHERE expires_at <= ?;";
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, delete_sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    
    sqlite3_bind_int64(stmt, 1, TimeUtils::to_unix_millis(now));
    int result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        return 0;
    }
    return static_cast<size_t>(sqlite3_changes(db_));
}

}
