/**
 * @file session_manager.cpp
 * @brief Implementation of the session lifecycle, routing and reconnection
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanconnect/session_manager.hpp"
#include "lanconnect/utilities.hpp"
#include <algorithm>

namespace lanconnect {

using namespace lanconnect::utilities;

std::string session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::DISCONNECTED: return "Disconnected";
        case SessionState::CONNECTING: return "Connecting";
        case SessionState::CONNECTED: return "Connected";
        case SessionState::RECONNECTING: return "Reconnecting";
    }
    return "Disconnected";
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

SessionManager::SessionManager(
    asio::io_context& io_context,
    const config::EngineConfig& config,
    TrustStore& trust_store,
    DeviceInfo local_info
)
    : io_context_(io_context)
    , config_(config)
    , trust_store_(trust_store)
    , local_info_(std::move(local_info))
    , acceptor_(io_context)
    , accepting_(false)
    , listening_port_(0)
    , next_generation_(1)
{
}

SessionManager::~SessionManager() {
    stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool SessionManager::start_listening() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);

    if (accepting_) {
        return true;
    }

    try {
        asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config_.bind_address), config_.session_port);

        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        listening_port_ = acceptor_.local_endpoint().port();
        accepting_ = true;
        start_accept();

        log_info("SessionManager: Listening on " + config_.bind_address + ":" +
                 std::to_string(listening_port_.load()));
        return true;

    } catch (const std::exception& e) {
        asio::error_code ignored;
        acceptor_.close(ignored);
        log_error("SessionManager: Failed to listen on port " + std::to_string(config_.session_port) +
                  ": " + e.what());
        return false;
    }
}

uint16_t SessionManager::listening_port() const {
    return listening_port_.load();
}

void SessionManager::stop() {
    StateChanges changes;
    std::vector<std::shared_ptr<Connection>> pending;

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        if (accepting_.exchange(false)) {
            asio::error_code ignored;
            acceptor_.close(ignored);
        }

        for (auto& [id, entry] : pending_inbound_) {
            entry.deadline->cancel();
            pending.push_back(entry.connection);
        }
        pending_inbound_.clear();

        std::vector<std::shared_ptr<Session>> sessions;
        for (const auto& [peer_id, session] : sessions_) {
            sessions.push_back(session);
        }

        for (const auto& session : sessions) {
            if (session->connection) {
                if (session->state == SessionState::CONNECTED) {
                    // Farewell is best effort
                    Status status = session->connection->send(Envelope::disconnect());
                    if (!status) {
                        log_debug("SessionManager: No farewell for " + session->peer_id + ": " +
                                  status.error().message);
                    }
                    session->connection->close_after_flush(config::FAREWELL_LINGER);
                } else {
                    session->connection->close();
                }
            }
            remove_locked(session, changes);
        }
    }

    for (const auto& connection : pending) {
        connection->close();
    }

    notify(changes);
}

// ============================================================================
// Collaborators
// ============================================================================

void SessionManager::set_peer_lookup(PeerLookup lookup) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    peer_lookup_ = std::move(lookup);
}

void SessionManager::set_inbound_pairing_callback(InboundPairingCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    inbound_pairing_callback_ = std::move(callback);
}

void SessionManager::set_state_callback(SessionStateCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    state_callback_ = std::move(callback);
}

void SessionManager::set_unhandled_callback(UnhandledMessageCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    unhandled_callback_ = std::move(callback);
}

void SessionManager::register_handler(EnvelopeKind kind, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[kind] = std::move(handler);
}

// ============================================================================
// Session Operations
// ============================================================================

Status SessionManager::connect(const PeerRecord& peer) {
    if (!config::validate_identifier(peer.peer_id)) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT, "Invalid peer id '" + peer.peer_id + "'");
    }

    if (!trust_store_.is_trusted(peer.peer_id)) {
        log_warn("SessionManager: Refusing to connect to unpaired peer " + peer.peer_id);
        return Status::failure(ErrorCode::NOT_PAIRED, "Peer " + peer.peer_id + " is not paired");
    }

    if (peer.address.empty() || peer.port == 0) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT, "Peer " + peer.peer_id + " has no endpoint");
    }

    StateChanges changes;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        auto session = find_locked(peer.peer_id);
        if (session && (session->state == SessionState::CONNECTED ||
                        session->state == SessionState::CONNECTING)) {
            return Status::success();
        }

        if (!session) {
            session = std::make_shared<Session>();
            session->peer_id = peer.peer_id;
            session->timer = std::make_unique<asio::steady_timer>(io_context_);
            sessions_[peer.peer_id] = session;
        }

        session->address = peer.address;
        session->port = peer.port;
        session->timer->cancel();
        begin_attempt_locked(session, changes);
    }

    notify(changes);
    return Status::success();
}

Status SessionManager::adopt(const std::string& peer_id, std::shared_ptr<Connection> connection, bool outbound) {
    if (!trust_store_.is_trusted(peer_id)) {
        return Status::failure(ErrorCode::NOT_PAIRED, "Peer " + peer_id + " is not paired");
    }

    if (!connection || !connection->is_open()) {
        return Status::failure(ErrorCode::NOT_CONNECTED, "Pairing stream with " + peer_id + " is closed");
    }

    StateChanges changes;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        auto session = find_locked(peer_id);
        if (!session) {
            session = std::make_shared<Session>();
            session->peer_id = peer_id;
            session->timer = std::make_unique<asio::steady_timer>(io_context_);
            sessions_[peer_id] = session;
        } else {
            session->timer->cancel();
            if (session->connection && session->connection != connection) {
                session->connection->close();
            }
        }

        session->outbound = outbound;
        session->reconnect_attempts = 0;
        session->address = connection->remote_address();
        if (outbound) {
            session->port = connection->remote_port();
        }

        attach_locked(session, connection, false, changes);
    }

    log_info("SessionManager: Adopted paired stream with " + peer_id);
    notify(changes);
    return Status::success();
}

void SessionManager::disconnect(const std::string& peer_id) {
    StateChanges changes;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        auto session = find_locked(peer_id);
        if (!session) {
            return;
        }

        if (session->connection) {
            log_debug("SessionManager: Session with " + peer_id + " carried " +
                      std::to_string(session->connection->frames_received()) + " frame(s) in, " +
                      std::to_string(session->connection->frames_sent()) + " out");

            if (session->state == SessionState::CONNECTED) {
                Status status = session->connection->send(Envelope::disconnect());
                if (!status) {
                    log_debug("SessionManager: No farewell for " + peer_id + ": " + status.error().message);
                }
                session->connection->close_after_flush(config::FAREWELL_LINGER);
            } else {
                session->connection->close();
            }
        }

        remove_locked(session, changes);
    }

    log_info("SessionManager: Disconnected from " + peer_id);
    notify(changes);
}

Status SessionManager::send(const std::string& peer_id, const Envelope& envelope) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        auto session = find_locked(peer_id);
        if (!session || session->state != SessionState::CONNECTED || !session->connection) {
            return Status::failure(ErrorCode::NOT_CONNECTED, "No live session with " + peer_id);
        }
        connection = session->connection;
    }

    Status status = connection->send(envelope);
    if (!status && status.code() == ErrorCode::PAYLOAD_TOO_LARGE) {
        log_warn("SessionManager: Not sending to " + peer_id + ": " + status.error().message);
    }
    return status;
}

SessionState SessionManager::session_state(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);

    auto session = find_locked(peer_id);
    return session ? session->state : SessionState::DISCONNECTED;
}

std::vector<std::string> SessionManager::connected_peers() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);

    std::vector<std::string> peers;
    for (const auto& [peer_id, session] : sessions_) {
        if (session->state == SessionState::CONNECTED) {
            peers.push_back(peer_id);
        }
    }
    return peers;
}

void SessionManager::on_discovery_event(const DiscoveryEvent& event) {
    if (event.type != DiscoveryEventType::PEER_APPEARED) {
        return;
    }

    const PeerRecord& peer = event.record;
    if (!trust_store_.is_trusted(peer.peer_id)) {
        return;
    }

    SessionState state = session_state(peer.peer_id);
    if (state == SessionState::CONNECTED || state == SessionState::CONNECTING) {
        return;
    }

    log_info("SessionManager: Trusted peer " + peer.peer_id + " appeared, connecting");
    Status status = connect(peer);
    if (!status) {
        log_warn("SessionManager: Auto-connect to " + peer.peer_id + " failed: " + status.error().message);
    }
}

// ============================================================================
// Accepting
// ============================================================================

void SessionManager::start_accept() {
    acceptor_.async_accept([this](const asio::error_code& error, asio::ip::tcp::socket socket) {
        handle_accept(error, std::move(socket));
    });
}

void SessionManager::handle_accept(const asio::error_code& error, asio::ip::tcp::socket socket) {
    if (error) {
        if (error != asio::error::operation_aborted && accepting_) {
            log_warn("SessionManager: Accept failed: " + error.message());
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            if (accepting_) {
                start_accept();
            }
        }
        return;
    }

    auto connection = Connection::adopt(io_context_, std::move(socket), config_.max_frame_size);
    uint64_t id = connection->id();

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        PendingInbound pending;
        pending.connection = connection;
        pending.deadline = std::make_unique<asio::steady_timer>(io_context_);
        pending.deadline->expires_after(config_.connect_timeout);
        pending.deadline->async_wait([this, id](const asio::error_code& wait_error) {
            if (wait_error) {
                return;
            }
            log_warn("SessionManager: Inbound stream sent no first frame, closing");
            drop_pending(id);
        });
        pending_inbound_[id] = std::move(pending);

        if (accepting_) {
            start_accept();
        }
    }

    log_debug("SessionManager: Accepted stream from " + connection->remote_address());

    connection->start(
        [this, id](const Envelope& envelope) { handle_first_frame(id, envelope); },
        [this, id](const EngineError&) { drop_pending(id); }
    );
}

void SessionManager::drop_pending(uint64_t connection_id) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        auto it = pending_inbound_.find(connection_id);
        if (it == pending_inbound_.end()) {
            return;
        }
        connection = it->second.connection;
        it->second.deadline->cancel();
        pending_inbound_.erase(it);
    }

    connection->close();
}

void SessionManager::handle_first_frame(uint64_t connection_id, const Envelope& envelope) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        auto it = pending_inbound_.find(connection_id);
        if (it == pending_inbound_.end()) {
            return;
        }
        connection = it->second.connection;
        it->second.deadline->cancel();
        pending_inbound_.erase(it);
    }

    switch (envelope.kind) {
        case EnvelopeKind::PAIRING_REQUEST: {
            InboundPairingCallback callback;
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                callback = inbound_pairing_callback_;
            }

            if (!callback) {
                log_warn("SessionManager: Pairing request from " + connection->remote_address() +
                         " but no pairing coordinator");
                Status status = connection->send(
                    Envelope::pairing_rejected(local_info_.id, std::string("Pairing is not available")));
                if (!status) {
                    log_debug("SessionManager: Rejection not sent: " + status.error().message);
                }
                connection->close_after_flush(config::FAREWELL_LINGER);
                return;
            }

            try {
                callback(connection, *envelope.get<PairingRequest>());
            } catch (const std::exception& e) {
                log_error("SessionManager: Pairing callback threw: " + std::string(e.what()));
                connection->close();
            }
            return;
        }

        case EnvelopeKind::DEVICE_INFO: {
            const auto* info = envelope.get<DeviceInfo>();
            if (!config::validate_identifier(info->id) || !trust_store_.is_trusted(info->id)) {
                log_warn("SessionManager: Closing session attempt from unpaired peer '" + info->id +
                         "' at " + connection->remote_address());
                connection->close();
                return;
            }
            adopt_inbound(connection, *info);
            return;
        }

        default:
            log_warn("SessionManager: Unexpected first frame " + EnvelopeCodec::kind_to_tag(envelope.kind) +
                     " from " + connection->remote_address() + ", closing");
            connection->close();
            return;
    }
}

void SessionManager::adopt_inbound(std::shared_ptr<Connection> connection, const DeviceInfo& info) {
    StateChanges changes;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        auto session = find_locked(info.id);
        if (session && should_yield_inbound_locked(session)) {
            log_debug("SessionManager: Keeping own stream to " + info.id + ", closing duplicate inbound");
            connection->close();
            return;
        }

        if (!session) {
            session = std::make_shared<Session>();
            session->peer_id = info.id;
            session->timer = std::make_unique<asio::steady_timer>(io_context_);
            sessions_[info.id] = session;
        } else {
            session->timer->cancel();
            if (session->connection && session->connection != connection) {
                session->connection->close();
            }
        }

        session->outbound = false;
        session->reconnect_attempts = 0;
        session->address = connection->remote_address();

        attach_locked(session, connection, false, changes);
    }

    log_info("SessionManager: Accepted session from " + info.id + " (" + info.name + ")");
    notify(changes);
    handle_device_info(info.id, info);
}

// ============================================================================
// Session Internals
// ============================================================================

std::shared_ptr<SessionManager::Session> SessionManager::find_locked(const std::string& peer_id) const {
    auto it = sessions_.find(peer_id);
    if (it != sessions_.end()) {
        return it->second;
    }
    return nullptr;
}

bool SessionManager::should_yield_inbound_locked(const std::shared_ptr<Session>& session) const {
    // Simultaneous connects: the stream opened by the lower id wins on both sides
    bool live = session->state == SessionState::CONNECTED || session->state == SessionState::CONNECTING;
    return live && session->outbound && local_info_.id < session->peer_id;
}

void SessionManager::begin_attempt_locked(const std::shared_ptr<Session>& session, StateChanges& changes) {
    session->generation = next_generation_++;
    session->outbound = true;
    set_state_locked(session, SessionState::CONNECTING, changes);

    std::string peer_id = session->peer_id;
    uint64_t generation = session->generation;

    log_info("SessionManager: Connecting to " + peer_id + " at " + session->address + ":" +
             std::to_string(session->port));

    session->connection = Connection::connect(
        io_context_,
        session->address,
        session->port,
        config_.connect_timeout,
        config_.max_frame_size,
        [this, peer_id, generation](std::shared_ptr<Connection> connection, const Status& status) {
            handle_connect_result(peer_id, generation, std::move(connection), status);
        }
    );
}

void SessionManager::attach_locked(
    const std::shared_ptr<Session>& session,
    std::shared_ptr<Connection> connection,
    bool send_device_info,
    StateChanges& changes
) {
    session->generation = next_generation_++;
    session->connection = connection;

    std::string peer_id = session->peer_id;
    uint64_t generation = session->generation;

    connection->start(
        [this, peer_id, generation](const Envelope& envelope) {
            handle_envelope(peer_id, generation, envelope);
        },
        [this, peer_id, generation](const EngineError& reason) {
            handle_transport_lost(peer_id, generation, reason);
        }
    );

    if (!send_device_info) {
        mark_connected_locked(session, changes);
        return;
    }

    // Connected only once the first frame is on the wire
    Status status = connection->send(
        Envelope::device_info(local_info_),
        [this, peer_id, generation](bool written) {
            if (!written) {
                return;
            }

            StateChanges flushed_changes;
            {
                std::lock_guard<std::mutex> lock(sessions_mutex_);
                auto current = find_locked(peer_id);
                if (!current || current->generation != generation ||
                    current->state != SessionState::CONNECTING) {
                    return;
                }
                mark_connected_locked(current, flushed_changes);
            }
            notify(flushed_changes);
        }
    );

    if (!status) {
        log_warn("SessionManager: Could not send device info to " + peer_id + ": " + status.error().message);
        connection->close();
        schedule_reconnect_locked(session, changes);
    }
}

void SessionManager::mark_connected_locked(const std::shared_ptr<Session>& session, StateChanges& changes) {
    session->reconnect_attempts = 0;
    set_state_locked(session, SessionState::CONNECTED, changes);
    schedule_health_check_locked(session);
}

void SessionManager::schedule_health_check_locked(const std::shared_ptr<Session>& session) {
    auto tick = std::min(config_.keepalive_interval, config_.idle_timeout) / 4;
    tick = std::max(tick, std::chrono::milliseconds(10));

    std::string peer_id = session->peer_id;
    uint64_t generation = session->generation;

    session->timer->expires_after(tick);
    session->timer->async_wait([this, peer_id, generation](const asio::error_code& error) {
        if (error) {
            return;
        }
        handle_health_check(peer_id, generation);
    });
}

void SessionManager::schedule_reconnect_locked(const std::shared_ptr<Session>& session, StateChanges& changes) {
    session->timer->cancel();
    session->connection.reset();
    session->generation = next_generation_++;

    if (session->reconnect_attempts >= config_.max_reconnect_attempts) {
        log_warn("SessionManager: Giving up on " + session->peer_id + " after " +
                 std::to_string(session->reconnect_attempts) + " reconnect attempt(s)");
        remove_locked(session, changes);
        return;
    }

    auto delay = config_.reconnect_initial_delay;
    for (int i = 0; i < session->reconnect_attempts && delay < config_.reconnect_max_delay; ++i) {
        delay *= 2;
    }
    delay = std::min(delay, config_.reconnect_max_delay);

    session->reconnect_attempts++;
    set_state_locked(session, SessionState::RECONNECTING, changes);

    log_info("SessionManager: Reconnecting to " + session->peer_id + " in " +
             std::to_string(delay.count()) + "ms (attempt " +
             std::to_string(session->reconnect_attempts) + "/" +
             std::to_string(config_.max_reconnect_attempts) + ")");

    std::string peer_id = session->peer_id;
    uint64_t generation = session->generation;

    session->timer->expires_after(delay);
    session->timer->async_wait([this, peer_id, generation](const asio::error_code& error) {
        if (error) {
            return;
        }
        handle_retry(peer_id, generation);
    });
}

void SessionManager::set_state_locked(
    const std::shared_ptr<Session>& session,
    SessionState state,
    StateChanges& changes
) {
    if (session->state == state) {
        return;
    }

    log_debug("SessionManager: " + session->peer_id + " " + session_state_to_string(session->state) +
              " -> " + session_state_to_string(state));

    session->state = state;
    changes.push_back(StateChange{session->peer_id, state});
}

void SessionManager::remove_locked(const std::shared_ptr<Session>& session, StateChanges& changes) {
    session->timer->cancel();
    session->generation = next_generation_++;
    session->connection.reset();
    set_state_locked(session, SessionState::DISCONNECTED, changes);

    auto it = sessions_.find(session->peer_id);
    if (it != sessions_.end() && it->second == session) {
        sessions_.erase(it);
    }
}

// ============================================================================
// Event Handlers
// ============================================================================

void SessionManager::handle_connect_result(
    const std::string& peer_id,
    uint64_t generation,
    std::shared_ptr<Connection> connection,
    const Status& status
) {
    StateChanges changes;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        auto session = find_locked(peer_id);
        if (!session || session->generation != generation || session->state != SessionState::CONNECTING) {
            // Superseded (disconnect, inbound stream or newer attempt)
            if (status) {
                connection->close();
            }
            return;
        }

        if (!status) {
            log_warn("SessionManager: Connect to " + peer_id + " failed: " + status.error().message);
            schedule_reconnect_locked(session, changes);
        } else {
            attach_locked(session, connection, true, changes);
        }
    }

    notify(changes);
}

void SessionManager::handle_envelope(const std::string& peer_id, uint64_t generation, const Envelope& envelope) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        auto session = find_locked(peer_id);
        if (!session || session->generation != generation) {
            return;
        }
        connection = session->connection;
    }

    switch (envelope.kind) {
        case EnvelopeKind::PING: {
            if (connection) {
                Status status = connection->send(Envelope::pong());
                if (!status) {
                    log_debug("SessionManager: Pong to " + peer_id + " not sent: " + status.error().message);
                }
            }
            return;
        }

        case EnvelopeKind::PONG:
            return;

        case EnvelopeKind::DISCONNECT: {
            StateChanges changes;
            {
                std::lock_guard<std::mutex> lock(sessions_mutex_);

                auto session = find_locked(peer_id);
                if (!session || session->generation != generation) {
                    return;
                }
                if (session->connection) {
                    session->connection->close();
                }
                remove_locked(session, changes);
            }

            log_info("SessionManager: " + peer_id + " closed the session");
            notify(changes);
            return;
        }

        case EnvelopeKind::DEVICE_INFO:
            handle_device_info(peer_id, *envelope.get<DeviceInfo>());
            return;

        default:
            dispatch(peer_id, envelope);
            return;
    }
}

void SessionManager::handle_transport_lost(const std::string& peer_id, uint64_t generation, const EngineError& reason) {
    StateChanges changes;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        auto session = find_locked(peer_id);
        if (!session || session->generation != generation) {
            return;
        }

        log_warn("SessionManager: Session with " + peer_id + " lost: " + reason.message);
        schedule_reconnect_locked(session, changes);
    }

    notify(changes);
}

void SessionManager::handle_health_check(const std::string& peer_id, uint64_t generation) {
    StateChanges changes;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        auto session = find_locked(peer_id);
        if (!session || session->generation != generation ||
            session->state != SessionState::CONNECTED || !session->connection) {
            return;
        }

        auto now = std::chrono::steady_clock::now();
        auto connection = session->connection;

        if (now - connection->last_inbound() > config_.idle_timeout) {
            log_warn("SessionManager: Session with " + peer_id + " idle for more than " +
                     std::to_string(config_.idle_timeout.count()) + "ms");
            connection->close();
            schedule_reconnect_locked(session, changes);
        } else {
            if (now - connection->last_outbound() >= config_.keepalive_interval) {
                Status status = connection->send(Envelope::ping());
                if (!status) {
                    log_debug("SessionManager: Keepalive to " + peer_id + " not sent: " + status.error().message);
                }
            }
            schedule_health_check_locked(session);
        }
    }

    notify(changes);
}

void SessionManager::handle_retry(const std::string& peer_id, uint64_t generation) {
    PeerLookup lookup;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        lookup = peer_lookup_;
    }

    std::optional<PeerRecord> latest;
    if (lookup) {
        latest = lookup(peer_id);
    }
    bool trusted = trust_store_.is_trusted(peer_id);

    StateChanges changes;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);

        auto session = find_locked(peer_id);
        if (!session || session->generation != generation || session->state != SessionState::RECONNECTING) {
            return;
        }

        if (!trusted) {
            log_info("SessionManager: " + peer_id + " was unpaired, not reconnecting");
            remove_locked(session, changes);
        } else {
            if (latest) {
                session->address = latest->address;
                session->port = latest->port;
            }

            if (session->address.empty() || session->port == 0) {
                log_debug("SessionManager: No endpoint known for " + peer_id + " yet");
                schedule_reconnect_locked(session, changes);
            } else {
                begin_attempt_locked(session, changes);
            }
        }
    }

    notify(changes);
}

void SessionManager::handle_device_info(const std::string& peer_id, const DeviceInfo& info) {
    if (info.id != peer_id) {
        log_warn("SessionManager: Ignoring device info for '" + info.id + "' on session with " + peer_id);
        return;
    }

    auto record = trust_store_.get(peer_id);
    if (record && record->display_name != info.name && config::validate_display_name(info.name)) {
        record->display_name = info.name;
        if (!trust_store_.upsert(*record)) {
            log_warn("SessionManager: Could not update display name of " + peer_id);
        }
    }

    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(EnvelopeKind::DEVICE_INFO);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (handler) {
        try {
            handler(peer_id, Envelope::device_info(info));
        } catch (const std::exception& e) {
            log_error("SessionManager: DeviceInfo handler threw: " + std::string(e.what()));
        }
    }
}

void SessionManager::dispatch(const std::string& peer_id, const Envelope& envelope) {
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(envelope.kind);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (handler) {
        try {
            handler(peer_id, envelope);
        } catch (const std::exception& e) {
            log_error("SessionManager: Handler for " + EnvelopeCodec::kind_to_tag(envelope.kind) +
                      " threw: " + e.what());
        }
        return;
    }

    std::string tag = envelope.kind == EnvelopeKind::UNKNOWN
        ? envelope.get<UnknownMessage>()->tag
        : EnvelopeCodec::kind_to_tag(envelope.kind);
    log_debug("SessionManager: No handler for " + tag + " from " + peer_id);

    UnhandledMessageCallback unhandled;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        unhandled = unhandled_callback_;
    }

    if (unhandled) {
        try {
            unhandled(peer_id, envelope);
        } catch (const std::exception& e) {
            log_error("SessionManager: Unhandled-message observer threw: " + std::string(e.what()));
        }
    }
}

void SessionManager::notify(const StateChanges& changes) {
    if (changes.empty()) {
        return;
    }

    SessionStateCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = state_callback_;
    }

    if (!callback) {
        return;
    }

    for (const auto& change : changes) {
        try {
            callback(change.peer_id, change.state);
        } catch (const std::exception& e) {
            log_error("SessionManager: State callback threw: " + std::string(e.what()));
        }
    }
}

} // namespace lanconnect
