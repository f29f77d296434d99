/**
 * @file peer_discovery.hpp
 * @brief UDP multicast advertisement and browsing of LANConnect peers
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Provides local network discovery:
 * - Periodic and query-driven announcements of the local peer
 * - Best-effort withdrawal when advertising stops
 * - Peer table with coalesced updates and timeout expiry
 * - Events delivered in arrival order on one strand
 */

#pragma once

#include "lanconnect/peer_table.hpp"
#include "lanconnect/engine_config.hpp"
#include "lanconnect/engine_errors.hpp"
#include <asio.hpp>
#include <array>
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include <optional>

namespace lanconnect {

/**
 * @brief Callback for discovery events
 */
using DiscoveryEventCallback = std::function<void(const DiscoveryEvent& event)>;

/**
 * @brief PeerDiscovery - Multicast advertisement and browsing
 *
 * Advertising and browsing share one UDP socket bound to the discovery
 * port; the socket is open while either is active.
 */
class PeerDiscovery {
public:
    /**
     * @brief Construct PeerDiscovery
     * @param io_context ASIO I/O context for async operations
     * @param config Engine configuration (ports, group, intervals)
     */
    PeerDiscovery(asio::io_context& io_context, const config::EngineConfig& config);

    /**
     * @brief Destructor - stops advertising and browsing
     */
    ~PeerDiscovery();

    // Disable copy and move
    PeerDiscovery(const PeerDiscovery&) = delete;
    PeerDiscovery& operator=(const PeerDiscovery&) = delete;
    PeerDiscovery(PeerDiscovery&&) = delete;
    PeerDiscovery& operator=(PeerDiscovery&&) = delete;

    // ========================================================================
    // Advertising
    // ========================================================================

    /**
     * @brief Begin announcing the local peer
     *
     * Idempotent; calling while advertising replaces the advertised record
     * and announces it at once.
     *
     * @param self Local record (address is ignored, receivers use the source)
     * @return Success or NETWORK_UNAVAILABLE
     */
    Status start_advertising(const PeerRecord& self);

    /**
     * @brief Withdraw the announcement (best effort)
     */
    void stop_advertising();

    bool is_advertising() const;

    /**
     * @brief Record the local peer without announcing it
     *
     * Datagrams carrying this id are dropped as our own echo.
     */
    void set_local_record(const PeerRecord& self);

    // ========================================================================
    // Browsing
    // ========================================================================

    /**
     * @brief Register the event callback and start browsing
     *
     * Sends a query so advertisers answer without waiting for their next
     * periodic announcement. Restartable after stop_browsing().
     *
     * @param callback Receives PEER_APPEARED / PEER_UPDATED / PEER_DISAPPEARED
     * @return Success or NETWORK_UNAVAILABLE
     */
    Status start_browsing(DiscoveryEventCallback callback);

    /**
     * @brief Stop browsing and forget visible peers
     */
    void stop_browsing();

    bool is_browsing() const;

    /**
     * @brief Register the event callback without touching the network
     */
    void set_event_callback(DiscoveryEventCallback callback);

    /**
     * @brief Process one datagram as if received from sender_address
     *
     * Used by the receive loop; also lets peers be injected where
     * multicast is unavailable.
     */
    void ingest_datagram(const std::string& data, const std::string& sender_address);

    /**
     * @brief Emit PEER_DISAPPEARED for peers not seen within the discovery timeout
     * @return Number of peers removed
     */
    size_t expire_stale_peers();

    // ========================================================================
    // Peer Queries
    // ========================================================================

    /**
     * @brief Most recent record for a visible peer
     * @return PeerRecord or std::nullopt if not visible
     */
    std::optional<PeerRecord> get_peer(const std::string& peer_id) const;

    std::vector<PeerRecord> get_all_peers() const;

    size_t get_peer_count() const;

    // ========================================================================
    // Statistics
    // ========================================================================

    uint64_t get_datagrams_sent() const;
    uint64_t get_datagrams_received() const;
    uint64_t get_datagrams_dropped() const;

private:
    // ========================================================================
    // Private Methods
    // ========================================================================

    /**
     * @brief Open, bind and join the group if not already open
     * @return Success or NETWORK_UNAVAILABLE
     */
    Status ensure_socket();

    /**
     * @brief Close the socket once neither advertising nor browsing
     */
    void release_socket_if_idle();

    void start_receive();
    void handle_receive(const asio::error_code& error, size_t bytes_transferred);

    bool send_datagram(const std::string& data);
    bool send_announce();

    void schedule_announce();
    void schedule_sweep();

    void dispatch(const std::vector<DiscoveryEvent>& events);

    // ========================================================================
    // Member Variables
    // ========================================================================

    asio::strand<asio::io_context::executor_type> strand_;
    config::EngineConfig config_;

    /// UDP socket shared by advertising and browsing
    asio::ip::udp::socket socket_;

    /// Multicast destination
    asio::ip::udp::endpoint group_endpoint_;

    asio::steady_timer announce_timer_;
    asio::steady_timer sweep_timer_;

    std::array<char, config::MAX_DATAGRAM_SIZE> recv_buffer_;
    asio::ip::udp::endpoint sender_endpoint_;

    /// Guards socket_, timers and the flags below
    mutable std::mutex io_mutex_;
    bool advertising_;
    bool browsing_;
    PeerRecord self_;

    /// Visible peers
    PeerTable table_;
    mutable std::mutex table_mutex_;

    DiscoveryEventCallback event_callback_;
    mutable std::mutex callback_mutex_;

    std::atomic<uint64_t> datagrams_sent_;
    std::atomic<uint64_t> datagrams_received_;
    std::atomic<uint64_t> datagrams_dropped_;
};

} // namespace lanconnect
