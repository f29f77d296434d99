/**
 * @file session_manager.hpp
 * @brief Lifecycle of live sessions with paired peers
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Per peer: Disconnected -> Connecting -> Connected -> {Disconnected | Reconnecting -> Connecting}
 *
 * The manager owns the TCP listener. The first frame on an accepted stream
 * decides its fate: a pairing request goes to the pairing coordinator, a
 * device-info from a trusted peer becomes a session, anything else is closed.
 */

#pragma once

#include "lanconnect/connection.hpp"
#include "lanconnect/engine_config.hpp"
#include "lanconnect/engine_errors.hpp"
#include "lanconnect/envelope.hpp"
#include "lanconnect/peer_table.hpp"
#include "lanconnect/trust_store.hpp"
#include <asio.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanconnect {

/**
 * @brief Observable state of a peer's session
 */
enum class SessionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    RECONNECTING
};

std::string session_state_to_string(SessionState state);

/**
 * @brief Handler for inbound envelopes of one kind
 */
using MessageHandler = std::function<void(const std::string& peer_id, const Envelope& envelope)>;

/**
 * @brief Observer for envelopes no handler claimed (including UNKNOWN)
 */
using UnhandledMessageCallback = std::function<void(const std::string& peer_id, const Envelope& envelope)>;

using SessionStateCallback = std::function<void(const std::string& peer_id, SessionState state)>;

/**
 * @brief Most recent discovery record for a peer, used for reconnects
 */
using PeerLookup = std::function<std::optional<PeerRecord>(const std::string& peer_id)>;

/**
 * @brief Receives streams whose first frame is a pairing request
 */
using InboundPairingCallback = std::function<void(std::shared_ptr<Connection> connection,
                                                  const PairingRequest& request)>;

/**
 * @brief SessionManager - Owns every live connection to paired peers
 *
 * Thread-safe. Callbacks run on I/O threads and must not block.
 */
class SessionManager {
public:
    /**
     * @brief Construct SessionManager
     * @param io_context ASIO I/O context
     * @param config Engine configuration (timeouts, backoff, frame cap)
     * @param trust_store Trust store consulted before every session
     * @param local_info Identity sent as the first frame of outbound sessions
     */
    SessionManager(
        asio::io_context& io_context,
        const config::EngineConfig& config,
        TrustStore& trust_store,
        DeviceInfo local_info
    );

    ~SessionManager();

    // Disable copy and move
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;
    SessionManager(SessionManager&&) = delete;
    SessionManager& operator=(SessionManager&&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Bind the session listener and start accepting
     * @return true if successful, false otherwise
     */
    bool start_listening();

    /**
     * @brief Actual listening port (resolves an ephemeral port)
     */
    uint16_t listening_port() const;

    /**
     * @brief Close the listener and every session (with farewell)
     */
    void stop();

    // ========================================================================
    // Collaborators
    // ========================================================================

    void set_peer_lookup(PeerLookup lookup);
    void set_inbound_pairing_callback(InboundPairingCallback callback);
    void set_state_callback(SessionStateCallback callback);
    void set_unhandled_callback(UnhandledMessageCallback callback);

    /**
     * @brief Register the handler for one envelope kind (replaces any previous)
     *
     * PING and PONG are answered internally and never reach handlers.
     */
    void register_handler(EnvelopeKind kind, MessageHandler handler);

    // ========================================================================
    // Session Operations
    // ========================================================================

    /**
     * @brief Open a session to a trusted peer
     *
     * Returns once the attempt is under way; the state moves to CONNECTED
     * after the transport is open and the device-info frame is flushed.
     *
     * @return Success, NOT_PAIRED (no transport opened) or INVALID_ARGUMENT
     */
    Status connect(const PeerRecord& peer);

    /**
     * @brief Take over an open stream from a completed pairing
     * @param peer_id Newly trusted peer
     * @param connection Open connection
     * @param outbound true if this side opened the stream
     * @return Success or NOT_PAIRED
     */
    Status adopt(const std::string& peer_id, std::shared_ptr<Connection> connection, bool outbound);

    /**
     * @brief Send a farewell (best effort) and close; always succeeds
     */
    void disconnect(const std::string& peer_id);

    /**
     * @brief Queue an envelope on the peer's session
     * @return Success, NOT_CONNECTED or PAYLOAD_TOO_LARGE
     */
    Status send(const std::string& peer_id, const Envelope& envelope);

    SessionState session_state(const std::string& peer_id) const;

    std::vector<std::string> connected_peers() const;

    /**
     * @brief React to discovery: PEER_APPEARED for a trusted peer without
     *        a live session starts a connect (or retries a reconnect now)
     */
    void on_discovery_event(const DiscoveryEvent& event);

private:
    struct Session {
        std::string peer_id;
        SessionState state = SessionState::DISCONNECTED;
        std::shared_ptr<Connection> connection;
        std::unique_ptr<asio::steady_timer> timer;  ///< Health tick or backoff
        uint64_t generation = 0;                     ///< Stale callbacks carry an older value
        int reconnect_attempts = 0;
        bool outbound = true;
        std::string address;
        uint16_t port = 0;
    };

    struct PendingInbound {
        std::shared_ptr<Connection> connection;
        std::unique_ptr<asio::steady_timer> deadline;
    };

    struct StateChange {
        std::string peer_id;
        SessionState state;
    };

    using StateChanges = std::vector<StateChange>;

    // Accepting
    void start_accept();
    void handle_accept(const asio::error_code& error, asio::ip::tcp::socket socket);
    void handle_first_frame(uint64_t connection_id, const Envelope& envelope);
    void drop_pending(uint64_t connection_id);
    void adopt_inbound(std::shared_ptr<Connection> connection, const DeviceInfo& info);

    // Session internals; *_locked expect sessions_mutex_ held
    std::shared_ptr<Session> find_locked(const std::string& peer_id) const;
    void begin_attempt_locked(const std::shared_ptr<Session>& session, StateChanges& changes);
    void attach_locked(const std::shared_ptr<Session>& session,
                       std::shared_ptr<Connection> connection,
                       bool send_device_info,
                       StateChanges& changes);
    void mark_connected_locked(const std::shared_ptr<Session>& session, StateChanges& changes);
    void schedule_reconnect_locked(const std::shared_ptr<Session>& session, StateChanges& changes);
    void schedule_health_check_locked(const std::shared_ptr<Session>& session);
    void set_state_locked(const std::shared_ptr<Session>& session, SessionState state, StateChanges& changes);
    void remove_locked(const std::shared_ptr<Session>& session, StateChanges& changes);
    bool should_yield_inbound_locked(const std::shared_ptr<Session>& session) const;

    // Event handlers
    void handle_connect_result(const std::string& peer_id, uint64_t generation,
                               std::shared_ptr<Connection> connection, const Status& status);
    void handle_envelope(const std::string& peer_id, uint64_t generation, const Envelope& envelope);
    void handle_transport_lost(const std::string& peer_id, uint64_t generation, const EngineError& reason);
    void handle_health_check(const std::string& peer_id, uint64_t generation);
    void handle_retry(const std::string& peer_id, uint64_t generation);
    void handle_device_info(const std::string& peer_id, const DeviceInfo& info);

    void dispatch(const std::string& peer_id, const Envelope& envelope);
    void notify(const StateChanges& changes);

    // ========================================================================
    // Member Variables
    // ========================================================================

    asio::io_context& io_context_;
    config::EngineConfig config_;
    TrustStore& trust_store_;
    DeviceInfo local_info_;

    asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> accepting_;
    std::atomic<uint16_t> listening_port_;

    /// peer_id -> session
    std::map<std::string, std::shared_ptr<Session>> sessions_;
    std::map<uint64_t, PendingInbound> pending_inbound_;
    mutable std::mutex sessions_mutex_;
    std::atomic<uint64_t> next_generation_;

    std::map<EnvelopeKind, MessageHandler> handlers_;
    mutable std::mutex handlers_mutex_;

    PeerLookup peer_lookup_;
    InboundPairingCallback inbound_pairing_callback_;
    SessionStateCallback state_callback_;
    UnhandledMessageCallback unhandled_callback_;
    mutable std::mutex callback_mutex_;
};

} // namespace lanconnect
