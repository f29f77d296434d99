/**
 * @file trust_store.hpp
 * @brief Durable store of paired peers
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * SQLite-backed table with one row per paired peer. Every write is
 * committed with synchronous=FULL before the call returns; all calls are
 * serialized by one mutex.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <cstdint>

namespace lanconnect {

/**
 * @brief Durable proof that a peer completed pairing
 */
struct TrustRecord {
    std::string peer_id;                    ///< Unique within the store
    std::string display_name;               ///< Last known name
    std::optional<std::string> credential;  ///< Absent when pairing used no proof
    uint64_t paired_at = 0;                 ///< Unix timestamp

    bool operator==(const TrustRecord& other) const {
        return peer_id == other.peer_id && display_name == other.display_name &&
               credential == other.credential && paired_at == other.paired_at;
    }
};

/**
 * @brief TrustStore - Persistence of TrustRecords
 *
 * Thread-safe. Opened once per engine and shared by the pairing
 * coordinator and session manager.
 */
class TrustStore {
public:
    /**
     * @brief Open (or create) the store
     * @param database_path Path to SQLite database file
     * @throws std::runtime_error if the database cannot be opened or initialized
     */
    explicit TrustStore(const std::string& database_path);

    ~TrustStore();

    // Disable copy and move
    TrustStore(const TrustStore&) = delete;
    TrustStore& operator=(const TrustStore&) = delete;
    TrustStore(TrustStore&&) = delete;
    TrustStore& operator=(TrustStore&&) = delete;

    /**
     * @brief All records, ordered by pairing time
     */
    std::vector<TrustRecord> load_all() const;

    /**
     * @brief Insert or replace the record for record.peer_id
     * @return true once durably written, false otherwise
     */
    bool upsert(const TrustRecord& record);

    /**
     * @brief Remove a record
     * @return true if a record existed and was removed
     */
    bool remove(const std::string& peer_id);

    bool is_trusted(const std::string& peer_id) const;

    std::optional<TrustRecord> get(const std::string& peer_id) const;

    /**
     * @brief Remove every record
     * @return true if successful, false otherwise
     */
    bool clear_all();

    size_t count() const;

    const std::string& database_path() const { return database_path_; }

private:
    std::string database_path_;

    /// SQLite database connection
    void* db_connection_;

    /// Mutex serializing all database access
    mutable std::mutex db_mutex_;

    bool initialize_database();
};

} // namespace lanconnect
