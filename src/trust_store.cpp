/**
 * @file trust_store.cpp
 * @brief Implementation of the SQLite trust store
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanconnect/trust_store.hpp"
#include "lanconnect/utilities.hpp"
#include <sqlite3.h>
#include <stdexcept>

namespace lanconnect {

namespace {

TrustRecord read_record(sqlite3_stmt* stmt) {
    TrustRecord record;
    record.peer_id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    record.display_name = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
    if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) {
        record.credential = std::string(reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2)));
    }
    record.paired_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
    return record;
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

TrustStore::TrustStore(const std::string& database_path)
    : database_path_(database_path)
    , db_connection_(nullptr)
{
    sqlite3* db = nullptr;
    int rc = sqlite3_open(database_path_.c_str(), &db);

    if (rc != SQLITE_OK) {
        if (db) {
            sqlite3_close(db);
        }
        throw std::runtime_error("Failed to open trust store database: " + database_path_);
    }

    db_connection_ = static_cast<void*>(db);

    if (!initialize_database()) {
        sqlite3_close(db);
        db_connection_ = nullptr;
        throw std::runtime_error("Failed to initialize trust store schema");
    }

    utilities::log_debug("TrustStore: Opened " + database_path_);
}

TrustStore::~TrustStore() {
    if (db_connection_) {
        sqlite3* db = static_cast<sqlite3*>(db_connection_);
        sqlite3_close(db);
        db_connection_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

bool TrustStore::initialize_database() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    // Durable before return: WAL with a full sync on every commit
    const char* schema = R"(
        PRAGMA journal_mode = WAL;
        PRAGMA synchronous = FULL;
        CREATE TABLE IF NOT EXISTS trusted_peers (
            peer_id TEXT PRIMARY KEY NOT NULL,
            display_name TEXT NOT NULL,
            credential TEXT,
            paired_at INTEGER NOT NULL
        );
    )";

    int rc = sqlite3_exec(db, schema, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            utilities::log_error(std::string("TrustStore: Schema error: ") + error_msg);
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<TrustRecord> TrustStore::load_all() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::vector<TrustRecord> records;
    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT peer_id, display_name, credential, paired_at
        FROM trusted_peers
        ORDER BY paired_at ASC, peer_id ASC
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        utilities::log_error(std::string("TrustStore: load_all failed: ") + sqlite3_errmsg(db));
        return records;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        records.push_back(read_record(stmt));
    }

    sqlite3_finalize(stmt);
    return records;
}

std::optional<TrustRecord> TrustStore::get(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        SELECT peer_id, display_name, credential, paired_at
        FROM trusted_peers
        WHERE peer_id = ?
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return std::nullopt;
    }

    sqlite3_bind_text(stmt, 1, peer_id.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<TrustRecord> record;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        record = read_record(stmt);
    }

    sqlite3_finalize(stmt);
    return record;
}

bool TrustStore::is_trusted(const std::string& peer_id) const {
    return get(peer_id).has_value();
}

size_t TrustStore::count() const {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db, "SELECT COUNT(*) FROM trusted_peers", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t total = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        total = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return total;
}

// ============================================================================
// Writes
// ============================================================================

bool TrustStore::upsert(const TrustRecord& record) {
    if (record.peer_id.empty()) {
        utilities::log_warn("TrustStore: Refusing record with empty peer_id");
        return false;
    }

    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    const char* sql = R"(
        INSERT OR REPLACE INTO trusted_peers
        (peer_id, display_name, credential, paired_at)
        VALUES (?, ?, ?, ?)
    )";

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        utilities::log_error(std::string("TrustStore: upsert prepare failed: ") + sqlite3_errmsg(db));
        return false;
    }

    sqlite3_bind_text(stmt, 1, record.peer_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, record.display_name.c_str(), -1, SQLITE_TRANSIENT);
    if (record.credential) {
        sqlite3_bind_text(stmt, 3, record.credential->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, 3);
    }
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(record.paired_at));

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        utilities::log_error("TrustStore: upsert of " + record.peer_id + " failed: " + sqlite3_errmsg(db));
        return false;
    }

    utilities::log_info("TrustStore: Stored trust record for " + record.peer_id);
    return true;
}

bool TrustStore::remove(const std::string& peer_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM trusted_peers WHERE peer_id = ?", -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    sqlite3_bind_text(stmt, 1, peer_id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        utilities::log_error("TrustStore: remove of " + peer_id + " failed: " + sqlite3_errmsg(db));
        return false;
    }

    bool removed = sqlite3_changes(db) > 0;
    if (removed) {
        utilities::log_info("TrustStore: Removed trust record for " + peer_id);
    }
    return removed;
}

bool TrustStore::clear_all() {
    std::lock_guard<std::mutex> lock(db_mutex_);

    sqlite3* db = static_cast<sqlite3*>(db_connection_);
    char* error_msg = nullptr;

    int rc = sqlite3_exec(db, "DELETE FROM trusted_peers", nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        if (error_msg) {
            utilities::log_error(std::string("TrustStore: clear_all failed: ") + error_msg);
            sqlite3_free(error_msg);
        }
        return false;
    }

    utilities::log_info("TrustStore: Cleared all trust records");
    return true;
}

} // namespace lanconnect
