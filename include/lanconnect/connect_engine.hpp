/**
 * @file connect_engine.hpp
 * @brief LANConnect engine - integrates discovery, pairing and sessions
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * ConnectEngine coordinates all subsystems:
 * - Local device identity (persisted id, display name, capabilities)
 * - Peer advertisement and browsing
 * - Pairing handshake and the trust store
 * - Sessions with paired peers and message routing
 */

#pragma once

#include "lanconnect/engine_config.hpp"
#include "lanconnect/engine_errors.hpp"
#include "lanconnect/envelope.hpp"
#include "lanconnect/pairing_coordinator.hpp"
#include "lanconnect/peer_discovery.hpp"
#include "lanconnect/peer_table.hpp"
#include "lanconnect/session_manager.hpp"
#include "lanconnect/trust_store.hpp"

#include <asio.hpp>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lanconnect {

/**
 * @brief Capability tags of every feature plugin
 */
std::vector<std::string> plugin_capabilities();

/**
 * @brief ConnectEngine - Collaborator-facing API of LANConnect
 *
 * Handlers and callbacks may be registered before or after start(); they
 * run on I/O threads and must not block.
 */
class ConnectEngine {
public:
    /**
     * @brief Construct engine with configuration
     * @param config Engine configuration
     */
    explicit ConnectEngine(config::EngineConfig config = config::EngineConfig());

    /**
     * @brief Destructor - graceful shutdown
     */
    ~ConnectEngine();

    // Disable copy and move
    ConnectEngine(const ConnectEngine&) = delete;
    ConnectEngine& operator=(const ConnectEngine&) = delete;
    ConnectEngine(ConnectEngine&&) = delete;
    ConnectEngine& operator=(ConnectEngine&&) = delete;

    // ========================================================================
    // Lifecycle Management
    // ========================================================================

    /**
     * @brief Start all subsystems
     *
     * Discovery failing for lack of a network is logged and tolerated;
     * peers then arrive once the network is back and discovery restarts.
     *
     * @return true if started successfully, false otherwise
     */
    bool start();

    /**
     * @brief Say farewell to every peer and stop
     */
    void stop();

    /**
     * @brief Block until stop() is called from another thread
     */
    void run();

    bool is_running() const;

    /**
     * @brief Local peer as advertised (address left empty)
     */
    PeerRecord local_record() const;

    std::string get_device_id() const;

    uint16_t get_session_port() const;

    // ========================================================================
    // Discovery
    // ========================================================================

    /**
     * @brief Observe discovery events
     * @param callback PEER_APPEARED / PEER_UPDATED / PEER_DISAPPEARED
     */
    void discover(DiscoveryEventCallback callback);

    /**
     * @brief Restart advertising and browsing (e.g. after a network change)
     * @return Success or NETWORK_UNAVAILABLE
     */
    Status restart_discovery();

    std::vector<PeerRecord> get_peers() const;

    std::optional<PeerRecord> get_peer(const std::string& peer_id) const;

    /**
     * @brief Discovery engine (nullptr before start)
     */
    PeerDiscovery* discovery();

    // ========================================================================
    // Pairing
    // ========================================================================

    /**
     * @brief Pair with a visible peer and wait for the outcome
     *
     * Blocks the calling thread for up to pairing_timeout + connect_timeout.
     * Do not call it from an engine callback or handler: those run on the
     * I/O threads, and with worker_threads == 1 the attempt cannot progress
     * until the wait gives up with PAIRING_TIMED_OUT. Use pair_async there.
     *
     * @param peer_id Peer from get_peers()
     * @param proof Code shown on the peer, if any
     * @return TrustRecord, UNKNOWN_PEER, PAIRING_REJECTED, PAIRING_TIMED_OUT,
     *         PAIRING_ALREADY_IN_PROGRESS or STORAGE_ERROR
     */
    Result<TrustRecord> pair(const std::string& peer_id, std::optional<std::string> proof = std::nullopt);

    /**
     * @brief Pair without blocking
     * @return Success if the attempt started; the outcome goes to completion
     */
    Status pair_async(const std::string& peer_id, std::optional<std::string> proof, PairingCompletion completion);

    bool is_pairing(const std::string& peer_id) const;

    std::string pairing_code() const;

    /**
     * @brief Decide on inbound requests instead of the built-in policy
     */
    void set_pairing_request_callback(PairingRequestCallback callback);

    Status respond_to_pairing(const std::string& peer_id, const PairingDecision& decision);

    /**
     * @brief Peers whose pairing requests await respond_to_pairing()
     */
    std::vector<std::string> pending_pairing_requests() const;

    // ========================================================================
    // Sessions
    // ========================================================================

    /**
     * @brief Open a session with a paired, visible peer
     * @return Success, NOT_PAIRED or UNKNOWN_PEER
     */
    Status connect(const std::string& peer_id);

    void disconnect(const std::string& peer_id);

    /**
     * @brief Send an envelope on the peer's session
     * @return Success, NOT_CONNECTED or PAYLOAD_TOO_LARGE
     */
    Status send(const std::string& peer_id, const Envelope& envelope);

    void register_handler(EnvelopeKind kind, MessageHandler handler);

    SessionState session_state(const std::string& peer_id) const;

    std::vector<std::string> connected_peers() const;

    void set_session_state_callback(SessionStateCallback callback);

    void set_unhandled_message_callback(UnhandledMessageCallback callback);

    // ========================================================================
    // Trust Management
    // ========================================================================

    std::vector<TrustRecord> list_trusted() const;

    /**
     * @brief Remove the peer's trust record and close its session
     * @return true if a record existed
     */
    bool forget(const std::string& peer_id);

    /**
     * @brief Remove every trust record and close every session
     * @return true if successful, false otherwise
     */
    bool forget_all();

private:
    // ========================================================================
    // Private Methods - Initialization
    // ========================================================================

    /**
     * @brief Create the data directory and open the trust store
     * @return true if successful, false otherwise
     */
    bool initialize_data_directory();

    /**
     * @brief Resolve device id, display name, type and capabilities
     * @return true if successful, false otherwise
     */
    bool initialize_identity();

    /**
     * @brief Create the io_context, subsystems and their wiring
     * @return true if successful, false otherwise
     */
    bool initialize_subsystems();

    /**
     * @brief Start advertising and browsing
     */
    Status start_discovery();

    // ========================================================================
    // Private Methods - Event Handlers
    // ========================================================================

    void handle_discovery_event(const DiscoveryEvent& event);

    void handle_pairing_handoff(const std::string& peer_id, std::shared_ptr<Connection> connection, bool initiator);

    // ========================================================================
    // Member Variables
    // ========================================================================

    config::EngineConfig config_;
    std::filesystem::path data_dir_;

    /// Local identity
    DeviceInfo local_info_;
    std::atomic<uint16_t> session_port_;

    /// Running flag
    std::atomic<bool> running_;
    std::mutex run_mutex_;
    std::condition_variable run_cv_;

    /// Recreated on every start so no handler outlives its subsystem
    std::unique_ptr<asio::io_context> io_context_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::vector<std::thread> worker_threads_;

    std::unique_ptr<TrustStore> trust_store_;
    std::unique_ptr<PeerDiscovery> discovery_;
    std::unique_ptr<PairingCoordinator> pairing_;
    std::unique_ptr<SessionManager> sessions_;

    /// Registrations kept across restarts
    std::map<EnvelopeKind, MessageHandler> handlers_;
    DiscoveryEventCallback discovery_callback_;
    PairingRequestCallback pairing_request_callback_;
    SessionStateCallback state_callback_;
    UnhandledMessageCallback unhandled_callback_;
    mutable std::mutex callback_mutex_;
};

} // namespace lanconnect
