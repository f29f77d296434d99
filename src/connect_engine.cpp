/**
 * @file connect_engine.cpp
 * @brief Implementation of the LANConnect engine
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanconnect/connect_engine.hpp"
#include "lanconnect/pairing_crypto.hpp"
#include "lanconnect/utilities.hpp"

#include <future>

namespace lanconnect {

using namespace lanconnect::utilities;

std::vector<std::string> plugin_capabilities() {
    return {
        "ClipboardSync",
        "FileTransfer",
        "InputShare",
        "NotificationSync",
        "BatteryStatus",
        "MediaControl",
        "RemoteCommands",
        "TouchpadMode",
        "SlideControl"
    };
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

ConnectEngine::ConnectEngine(config::EngineConfig config)
    : config_(std::move(config))
    , session_port_(0)
    , running_(false)
{
    log_info("ConnectEngine: Initializing");
}

ConnectEngine::~ConnectEngine() {
    if (running_) {
        log_warn("ConnectEngine: Destructor called while still running, forcing stop");
        stop();
    }

    // Subsystems hold references into the io_context
    sessions_.reset();
    pairing_.reset();
    discovery_.reset();
    io_context_.reset();
}

// ============================================================================
// Lifecycle Management
// ============================================================================

bool ConnectEngine::start() {
    if (running_) {
        log_warn("ConnectEngine: Already running");
        return false;
    }

    log_info("ConnectEngine: Starting...");

    try {
        if (!PairingCrypto::initialize()) {
            log_error("ConnectEngine: Failed to initialize libsodium");
            return false;
        }

        if (!initialize_data_directory()) {
            log_error("ConnectEngine: Failed to initialize data directory");
            return false;
        }

        if (!initialize_identity()) {
            log_error("ConnectEngine: Failed to initialize identity");
            return false;
        }

        if (!initialize_subsystems()) {
            log_error("ConnectEngine: Failed to initialize subsystems");
            return false;
        }

        if (!sessions_->start_listening()) {
            log_error("ConnectEngine: Failed to start session listener");
            return false;
        }
        session_port_ = sessions_->listening_port();

        work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(
            io_context_->get_executor()
        );

        size_t num_threads = config_.worker_threads == 0 ? 1 : config_.worker_threads;

        log_info("ConnectEngine: Starting " + std::to_string(num_threads) + " worker threads");
        for (size_t i = 0; i < num_threads; ++i) {
            worker_threads_.emplace_back([this]() {
                try {
                    io_context_->run();
                } catch (const std::exception& e) {
                    log_error("ConnectEngine: Worker thread exception: " + std::string(e.what()));
                }
            });
        }

        running_ = true;

        Status discovery_status = start_discovery();
        if (!discovery_status) {
            log_warn("ConnectEngine: Discovery unavailable (" + discovery_status.error().message +
                     "), call restart_discovery() once the network is back");
        }

        log_info("ConnectEngine: Started as " + local_info_.id + " (" + local_info_.name +
                 ") on port " + std::to_string(session_port_.load()));
        return true;

    } catch (const std::exception& e) {
        log_error("ConnectEngine: Exception during start: " + std::string(e.what()));
        return false;
    }
}

void ConnectEngine::stop() {
    if (!running_) {
        log_warn("ConnectEngine: Not running");
        return;
    }

    log_info("ConnectEngine: Stopping...");

    {
        std::lock_guard<std::mutex> lock(run_mutex_);
        running_ = false;
    }
    run_cv_.notify_all();

    try {
        if (discovery_) {
            discovery_->stop_advertising();
            discovery_->stop_browsing();
        }

        if (pairing_) {
            pairing_->stop();
        }

        if (sessions_) {
            sessions_->stop();
        }

        // Let farewell frames drain before stopping the workers
        work_guard_.reset();
        auto deadline = std::chrono::steady_clock::now() + config::FAREWELL_LINGER * 2;
        while (!io_context_->stopped() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        io_context_->stop();

        for (auto& thread : worker_threads_) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        worker_threads_.clear();

        log_info("ConnectEngine: Stopped");

    } catch (const std::exception& e) {
        log_error("ConnectEngine: Exception during stop: " + std::string(e.what()));
    }
}

void ConnectEngine::run() {
    if (!running_) {
        log_error("ConnectEngine: Cannot run - not started");
        return;
    }

    log_info("ConnectEngine: Entering main event loop (Ctrl+C to stop)");

    std::unique_lock<std::mutex> lock(run_mutex_);
    while (running_) {
        if (run_cv_.wait_for(lock, std::chrono::seconds(30), [this]() { return !running_; })) {
            break;
        }

        lock.unlock();
        try {
            size_t removed = discovery_->expire_stale_peers();
            if (removed > 0) {
                log_info("ConnectEngine: Removed " + std::to_string(removed) + " stale peers");
            }
        } catch (const std::exception& e) {
            log_error("ConnectEngine: Exception in main loop: " + std::string(e.what()));
        }
        lock.lock();
    }

    log_info("ConnectEngine: Exited main event loop");
}

bool ConnectEngine::is_running() const {
    return running_;
}

PeerRecord ConnectEngine::local_record() const {
    PeerRecord record;
    record.peer_id = local_info_.id;
    record.display_name = local_info_.name;
    record.kind = device_kind_from_string(local_info_.device_type).value_or(DeviceKind::DESKTOP);
    record.port = session_port_;
    record.capabilities = local_info_.capabilities;
    record.first_seen = std::chrono::steady_clock::now();
    record.last_seen = record.first_seen;
    return record;
}

std::string ConnectEngine::get_device_id() const {
    return local_info_.id;
}

uint16_t ConnectEngine::get_session_port() const {
    return session_port_;
}

// ============================================================================
// Discovery
// ============================================================================

void ConnectEngine::discover(DiscoveryEventCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    discovery_callback_ = std::move(callback);
}

Status ConnectEngine::restart_discovery() {
    if (!running_) {
        return Status::failure(ErrorCode::NOT_CONNECTED, "Engine is not running");
    }

    discovery_->stop_advertising();
    discovery_->stop_browsing();
    return start_discovery();
}

std::vector<PeerRecord> ConnectEngine::get_peers() const {
    if (!discovery_) {
        return {};
    }
    return discovery_->get_all_peers();
}

std::optional<PeerRecord> ConnectEngine::get_peer(const std::string& peer_id) const {
    if (!discovery_) {
        return std::nullopt;
    }
    return discovery_->get_peer(peer_id);
}

PeerDiscovery* ConnectEngine::discovery() {
    return discovery_.get();
}

// ============================================================================
// Pairing
// ============================================================================

Result<TrustRecord> ConnectEngine::pair(const std::string& peer_id, std::optional<std::string> proof) {
    auto promise = std::make_shared<std::promise<Result<TrustRecord>>>();
    auto future = promise->get_future();

    Status started = pair_async(peer_id, std::move(proof), [promise](const Result<TrustRecord>& result) {
        promise->set_value(result);
    });

    if (!started) {
        return Result<TrustRecord>::failure(started.error());
    }

    // The coordinator resolves every attempt; this only guards a stalled io_context
    auto limit = config_.pairing_timeout + config_.connect_timeout;
    if (future.wait_for(limit) != std::future_status::ready) {
        log_error("ConnectEngine: Pairing with " + peer_id + " did not resolve");
        return Result<TrustRecord>::failure(ErrorCode::PAIRING_TIMED_OUT, "Pairing did not resolve");
    }

    return future.get();
}

Status ConnectEngine::pair_async(
    const std::string& peer_id,
    std::optional<std::string> proof,
    PairingCompletion completion
) {
    if (!running_) {
        return Status::failure(ErrorCode::NOT_CONNECTED, "Engine is not running");
    }

    auto peer = discovery_->get_peer(peer_id);
    if (!peer) {
        log_warn("ConnectEngine: Cannot pair with unknown peer " + peer_id);
        return Status::failure(ErrorCode::UNKNOWN_PEER, "Peer " + peer_id + " is not visible");
    }

    return pairing_->initiate_pairing(*peer, std::move(proof), std::move(completion));
}

bool ConnectEngine::is_pairing(const std::string& peer_id) const {
    if (!pairing_) {
        return false;
    }
    return pairing_->is_pairing(peer_id);
}

std::string ConnectEngine::pairing_code() const {
    if (!pairing_) {
        return "";
    }
    return pairing_->pairing_code();
}

void ConnectEngine::set_pairing_request_callback(PairingRequestCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    pairing_request_callback_ = callback;
    if (pairing_) {
        pairing_->set_request_callback(std::move(callback));
    }
}

Status ConnectEngine::respond_to_pairing(const std::string& peer_id, const PairingDecision& decision) {
    if (!running_) {
        return Status::failure(ErrorCode::NOT_CONNECTED, "Engine is not running");
    }
    return pairing_->respond_to_pairing(peer_id, decision);
}

std::vector<std::string> ConnectEngine::pending_pairing_requests() const {
    if (!pairing_) {
        return {};
    }
    return pairing_->pending_requests();
}

// ============================================================================
// Sessions
// ============================================================================

Status ConnectEngine::connect(const std::string& peer_id) {
    if (!running_) {
        return Status::failure(ErrorCode::NOT_CONNECTED, "Engine is not running");
    }

    if (!trust_store_->is_trusted(peer_id)) {
        log_warn("ConnectEngine: Peer " + peer_id + " is not paired");
        return Status::failure(ErrorCode::NOT_PAIRED, "Peer " + peer_id + " is not paired");
    }

    auto peer = discovery_->get_peer(peer_id);
    if (!peer) {
        log_warn("ConnectEngine: Paired peer " + peer_id + " is not visible");
        return Status::failure(ErrorCode::UNKNOWN_PEER, "Peer " + peer_id + " is not visible");
    }

    return sessions_->connect(*peer);
}

void ConnectEngine::disconnect(const std::string& peer_id) {
    if (sessions_) {
        sessions_->disconnect(peer_id);
    }
}

Status ConnectEngine::send(const std::string& peer_id, const Envelope& envelope) {
    if (!running_) {
        return Status::failure(ErrorCode::NOT_CONNECTED, "Engine is not running");
    }
    return sessions_->send(peer_id, envelope);
}

void ConnectEngine::register_handler(EnvelopeKind kind, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    handlers_[kind] = handler;
    if (sessions_) {
        sessions_->register_handler(kind, std::move(handler));
    }
}

SessionState ConnectEngine::session_state(const std::string& peer_id) const {
    if (!sessions_) {
        return SessionState::DISCONNECTED;
    }
    return sessions_->session_state(peer_id);
}

std::vector<std::string> ConnectEngine::connected_peers() const {
    if (!sessions_) {
        return {};
    }
    return sessions_->connected_peers();
}

void ConnectEngine::set_session_state_callback(SessionStateCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    state_callback_ = std::move(callback);
}

void ConnectEngine::set_unhandled_message_callback(UnhandledMessageCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    unhandled_callback_ = std::move(callback);
}

// ============================================================================
// Trust Management
// ============================================================================

std::vector<TrustRecord> ConnectEngine::list_trusted() const {
    if (!trust_store_) {
        return {};
    }
    return trust_store_->load_all();
}

bool ConnectEngine::forget(const std::string& peer_id) {
    if (!trust_store_) {
        return false;
    }

    bool removed = trust_store_->remove(peer_id);
    disconnect(peer_id);

    if (removed) {
        log_info("ConnectEngine: Forgot " + peer_id);
    }
    return removed;
}

bool ConnectEngine::forget_all() {
    if (!trust_store_) {
        return false;
    }

    auto records = trust_store_->load_all();
    if (!trust_store_->clear_all()) {
        log_error("ConnectEngine: Failed to clear trust store");
        return false;
    }

    for (const auto& record : records) {
        disconnect(record.peer_id);
    }

    log_info("ConnectEngine: Forgot " + std::to_string(records.size()) + " peer(s)");
    return true;
}

// ============================================================================
// Private Methods - Initialization
// ============================================================================

bool ConnectEngine::initialize_data_directory() {
    try {
        data_dir_ = config_.data_directory.empty()
            ? config::get_data_directory()
            : std::filesystem::path(config_.data_directory);

        std::filesystem::create_directories(data_dir_);
        auto db_path = config::get_database_directory(data_dir_) / "trust.db";

        if (!trust_store_ || trust_store_->database_path() != db_path.string()) {
            trust_store_ = std::make_unique<TrustStore>(db_path.string());
        }

        log_info("ConnectEngine: Data directory: " + data_dir_.string());
        return true;

    } catch (const std::exception& e) {
        log_error("ConnectEngine: Failed to initialize data directory: " + std::string(e.what()));
        return false;
    }
}

bool ConnectEngine::initialize_identity() {
    if (!config_.device_id.empty()) {
        if (!config::validate_identifier(config_.device_id)) {
            log_error("ConnectEngine: Invalid device id '" + config_.device_id + "'");
            return false;
        }
        local_info_.id = config_.device_id;
    } else {
        auto id_path = (data_dir_ / "device_id").string();
        auto stored = read_file(id_path);
        std::string id = stored ? trim_string(*stored) : "";

        if (!config::validate_identifier(id)) {
            id = generate_uuid();
            if (!write_file(id_path, id + "\n")) {
                log_warn("ConnectEngine: Could not persist device id to " + id_path);
            }
            log_info("ConnectEngine: Generated device id " + id);
        }
        local_info_.id = id;
    }

    std::string name = config_.display_name.empty() ? get_hostname() : config_.display_name;
    if (!config::validate_display_name(name)) {
        name = "LANConnect-" + local_info_.id.substr(0, 8);
    }
    local_info_.name = name;

    auto kind = device_kind_from_string(config_.device_type);
    if (!kind) {
        log_warn("ConnectEngine: Unknown device type '" + config_.device_type + "', using Desktop");
    }
    local_info_.device_type = device_kind_to_string(kind.value_or(DeviceKind::DESKTOP));

    local_info_.capabilities = config_.capabilities.empty() ? plugin_capabilities() : config_.capabilities;
    return true;
}

bool ConnectEngine::initialize_subsystems() {
    try {
        // Previous run's subsystems go before their io_context
        sessions_.reset();
        pairing_.reset();
        discovery_.reset();
        io_context_ = std::make_unique<asio::io_context>();

        discovery_ = std::make_unique<PeerDiscovery>(*io_context_, config_);
        pairing_ = std::make_unique<PairingCoordinator>(*io_context_, config_, *trust_store_, local_info_);
        sessions_ = std::make_unique<SessionManager>(*io_context_, config_, *trust_store_, local_info_);

        sessions_->set_peer_lookup([this](const std::string& peer_id) {
            return discovery_->get_peer(peer_id);
        });

        sessions_->set_inbound_pairing_callback(
            [this](std::shared_ptr<Connection> connection, const PairingRequest& request) {
                pairing_->handle_incoming_request(std::move(connection), request);
            });

        sessions_->set_state_callback([this](const std::string& peer_id, SessionState state) {
            SessionStateCallback callback;
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                callback = state_callback_;
            }
            if (callback) {
                callback(peer_id, state);
            }
        });

        sessions_->set_unhandled_callback([this](const std::string& peer_id, const Envelope& envelope) {
            UnhandledMessageCallback callback;
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                callback = unhandled_callback_;
            }
            if (callback) {
                callback(peer_id, envelope);
            }
        });

        pairing_->set_session_handoff(
            [this](const std::string& peer_id, std::shared_ptr<Connection> connection, bool initiator) {
                handle_pairing_handoff(peer_id, std::move(connection), initiator);
            });

        std::lock_guard<std::mutex> lock(callback_mutex_);
        for (const auto& [kind, handler] : handlers_) {
            sessions_->register_handler(kind, handler);
        }
        if (pairing_request_callback_) {
            pairing_->set_request_callback(pairing_request_callback_);
        }

        return true;

    } catch (const std::exception& e) {
        log_error("ConnectEngine: Failed to create subsystems: " + std::string(e.what()));
        return false;
    }
}

Status ConnectEngine::start_discovery() {
    DiscoveryEventCallback callback = [this](const DiscoveryEvent& event) {
        handle_discovery_event(event);
    };

    discovery_->set_local_record(local_record());

    if (!config_.discovery_enabled) {
        log_info("ConnectEngine: Network discovery disabled");
        discovery_->set_event_callback(std::move(callback));
        return Status::success();
    }

    Status status = discovery_->start_browsing(std::move(callback));
    if (!status) {
        return status;
    }

    return discovery_->start_advertising(local_record());
}

// ============================================================================
// Private Methods - Event Handlers
// ============================================================================

void ConnectEngine::handle_discovery_event(const DiscoveryEvent& event) {
    sessions_->on_discovery_event(event);

    DiscoveryEventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = discovery_callback_;
    }

    if (!callback) {
        return;
    }

    try {
        callback(event);
    } catch (const std::exception& e) {
        log_error("ConnectEngine: Discovery callback threw: " + std::string(e.what()));
    }
}

void ConnectEngine::handle_pairing_handoff(
    const std::string& peer_id,
    std::shared_ptr<Connection> connection,
    bool initiator
) {
    Status status = sessions_->adopt(peer_id, connection, initiator);
    if (!status) {
        log_warn("ConnectEngine: Could not adopt paired stream with " + peer_id + ": " +
                 status.error().message);
        connection->close();
    }
}

} // namespace lanconnect
