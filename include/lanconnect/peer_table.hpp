/**
 * @file peer_table.hpp
 * @brief Peer records, discovery advertisements and the visible-peer table
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The table itself performs no I/O and no locking; PeerDiscovery feeds it
 * sightings and turns its results into discovery events.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <cstdint>

namespace lanconnect {

/**
 * @brief Peer category (presentation hint only)
 */
enum class DeviceKind {
    DESKTOP,
    LAPTOP,
    MOBILE,
    TABLET
};

std::string device_kind_to_string(DeviceKind kind);

/**
 * @brief Parse "Desktop", "Laptop", "Mobile"/"Phone" or "Tablet" (case-insensitive)
 * @return DeviceKind or std::nullopt if unrecognized
 */
std::optional<DeviceKind> device_kind_from_string(const std::string& name);

/**
 * @brief A peer currently visible on the network
 */
struct PeerRecord {
    std::string peer_id;
    std::string display_name;
    DeviceKind kind = DeviceKind::DESKTOP;
    std::string address;                                ///< From the advertisement's source
    uint16_t port = 0;                                  ///< Session port
    std::vector<std::string> capabilities;
    std::chrono::steady_clock::time_point first_seen;
    std::chrono::steady_clock::time_point last_seen;

    /**
     * @brief True if both records describe the same advertised state
     *
     * Sighting times are not compared.
     */
    bool same_advertisement(const PeerRecord& other) const;
};

// ============================================================================
// Advertisement Datagram
// ============================================================================

enum class AdvertisementType {
    ANNOUNCE,       ///< Peer is present (periodic or in answer to a query)
    WITHDRAW,       ///< Peer stopped advertising
    QUERY           ///< Browser asks advertisers to announce now
};

/**
 * @brief Discovery datagram carried as one JSON object
 */
struct Advertisement {
    AdvertisementType type = AdvertisementType::ANNOUNCE;
    std::string service;
    int version = 0;
    std::string peer_id;
    std::string display_name;
    std::string device_type;
    uint16_t port = 0;
    std::vector<std::string> capabilities;

    /**
     * @brief Announcement describing a local record
     */
    static Advertisement announce(const PeerRecord& self);

    std::string to_json() const;

    /**
     * @brief Parse a datagram
     * @return Advertisement or std::nullopt if malformed
     */
    static std::optional<Advertisement> from_json(const std::string& json_str);

    /**
     * @brief Build the PeerRecord an announcement describes
     * @param sender_address Source address of the datagram
     * @return PeerRecord or std::nullopt if the fields are invalid
     */
    std::optional<PeerRecord> to_peer_record(const std::string& sender_address) const;
};

// ============================================================================
// Peer Table
// ============================================================================

enum class DiscoveryEventType {
    PEER_APPEARED,
    PEER_UPDATED,
    PEER_DISAPPEARED
};

/**
 * @brief Discovery event; record is populated for APPEARED and UPDATED
 */
struct DiscoveryEvent {
    DiscoveryEventType type = DiscoveryEventType::PEER_APPEARED;
    PeerRecord record;
    std::string peer_id;
};

/**
 * @brief PeerTable - Visible peers keyed by peer_id
 *
 * Not thread-safe; the owner serializes access.
 */
class PeerTable {
public:
    /**
     * @brief Record a sighting
     *
     * The first sighting yields PEER_APPEARED; later sightings within the
     * timeout window are coalesced into PEER_UPDATED with first_seen kept.
     */
    DiscoveryEvent apply(PeerRecord sighting, std::chrono::steady_clock::time_point now);

    /**
     * @brief Remove a peer after an explicit withdrawal
     * @return PEER_DISAPPEARED or std::nullopt if the peer was not visible
     */
    std::optional<DiscoveryEvent> withdraw(const std::string& peer_id);

    /**
     * @brief Remove peers whose last sighting is older than timeout
     * @return One PEER_DISAPPEARED per removed peer
     */
    std::vector<DiscoveryEvent> expire(
        std::chrono::steady_clock::time_point now,
        std::chrono::milliseconds timeout
    );

    std::optional<PeerRecord> get(const std::string& peer_id) const;
    std::vector<PeerRecord> all() const;
    size_t size() const { return peers_.size(); }
    void clear() { peers_.clear(); }

private:
    std::map<std::string, PeerRecord> peers_;
};

} // namespace lanconnect
