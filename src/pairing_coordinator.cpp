/**
 * @file pairing_coordinator.cpp
 * @brief Implementation of the pairing handshake
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanconnect/pairing_coordinator.hpp"
#include "lanconnect/pairing_crypto.hpp"
#include "lanconnect/utilities.hpp"
#include <algorithm>

namespace lanconnect {

using namespace lanconnect::utilities;

namespace {

void complete(const PairingCompletion& completion, const Result<TrustRecord>& result) {
    if (!completion) {
        return;
    }
    try {
        completion(result);
    } catch (const std::exception& e) {
        log_error("Pairing: Completion callback threw: " + std::string(e.what()));
    }
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

PairingCoordinator::PairingCoordinator(
    asio::io_context& io_context,
    const config::EngineConfig& config,
    TrustStore& trust_store,
    DeviceInfo local_info
)
    : io_context_(io_context)
    , config_(config)
    , trust_store_(trust_store)
    , local_info_(std::move(local_info))
    , next_attempt_id_(1)
{
    if (!PairingCrypto::initialize()) {
        throw std::runtime_error("Pairing: Failed to initialize libsodium");
    }
    pairing_code_ = PairingCrypto::generate_pairing_code(config::PAIRING_CODE_DIGITS);
}

PairingCoordinator::~PairingCoordinator() {
    stop();
}

// ============================================================================
// Initiator
// ============================================================================

Status PairingCoordinator::initiate_pairing(
    const PeerRecord& peer,
    std::optional<std::string> proof,
    PairingCompletion completion
) {
    if (!config::validate_identifier(peer.peer_id)) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT, "Invalid peer id '" + peer.peer_id + "'");
    }

    if (peer.peer_id == local_info_.id) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT, "Cannot pair with ourselves");
    }

    if (peer.address.empty() || peer.port == 0) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT, "Peer " + peer.peer_id + " has no endpoint");
    }

    std::lock_guard<std::mutex> lock(pairing_mutex_);

    if (attempts_.count(peer.peer_id) > 0) {
        log_warn("Pairing: Attempt with " + peer.peer_id + " already in progress");
        return Status::failure(ErrorCode::PAIRING_ALREADY_IN_PROGRESS,
                               "Pairing with " + peer.peer_id + " is already in progress");
    }

    uint64_t attempt_id = next_attempt_id_++;
    std::string peer_id = peer.peer_id;

    Attempt& attempt = attempts_[peer_id];
    attempt.id = attempt_id;
    attempt.peer = peer;
    attempt.proof = std::move(proof);
    attempt.completion = std::move(completion);
    attempt.timer = std::make_unique<asio::steady_timer>(io_context_);

    attempt.timer->expires_after(config_.pairing_timeout);
    attempt.timer->async_wait([this, peer_id, attempt_id](const asio::error_code& error) {
        if (error) {
            return;
        }
        log_warn("Pairing: No answer from " + peer_id + " within " +
                 std::to_string(config_.pairing_timeout.count()) + "ms");
        finish(peer_id, attempt_id, Result<TrustRecord>::failure(
            ErrorCode::PAIRING_TIMED_OUT, "No answer from " + peer_id));
    });

    attempt.connection = Connection::connect(
        io_context_,
        peer.address,
        peer.port,
        std::min(config_.connect_timeout, config_.pairing_timeout),
        config_.max_frame_size,
        [this, peer_id, attempt_id](std::shared_ptr<Connection> connection, const Status& status) {
            handle_connected(peer_id, attempt_id, std::move(connection), status);
        }
    );

    log_info("Pairing: Requesting pairing with " + peer_id + " at " + peer.address + ":" +
             std::to_string(peer.port) + (attempt.proof ? " (with code)" : ""));
    return Status::success();
}

bool PairingCoordinator::is_pairing(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(pairing_mutex_);
    return attempts_.count(peer_id) > 0;
}

void PairingCoordinator::handle_connected(
    const std::string& peer_id,
    uint64_t attempt_id,
    std::shared_ptr<Connection> connection,
    const Status& status
) {
    if (!status) {
        finish(peer_id, attempt_id, Result<TrustRecord>::failure(
            ErrorCode::PAIRING_TIMED_OUT, "Could not reach " + peer_id + ": " + status.error().message));
        return;
    }

    PairingRequest request;
    {
        std::lock_guard<std::mutex> lock(pairing_mutex_);

        auto it = attempts_.find(peer_id);
        if (it == attempts_.end() || it->second.id != attempt_id) {
            connection->close();
            return;
        }

        request.id = local_info_.id;
        request.name = local_info_.name;
        request.device_type = local_info_.device_type;
        request.capabilities = local_info_.capabilities;
        request.proof = it->second.proof;
    }

    connection->start(
        [this, peer_id, attempt_id](const Envelope& envelope) {
            handle_answer(peer_id, attempt_id, envelope);
        },
        [this, peer_id, attempt_id](const EngineError& reason) {
            finish(peer_id, attempt_id, Result<TrustRecord>::failure(
                ErrorCode::PAIRING_TIMED_OUT, peer_id + " closed the stream: " + reason.message));
        }
    );

    Status sent = connection->send(Envelope::pairing_request(std::move(request)));
    if (!sent) {
        finish(peer_id, attempt_id, Result<TrustRecord>::failure(
            ErrorCode::PAIRING_TIMED_OUT, "Could not send pairing request: " + sent.error().message));
        return;
    }

    log_debug("Pairing: Request sent to " + peer_id);
}

void PairingCoordinator::handle_answer(const std::string& peer_id, uint64_t attempt_id, const Envelope& envelope) {
    switch (envelope.kind) {
        case EnvelopeKind::PAIRING_ACCEPTED:
            handle_accepted(peer_id, attempt_id, *envelope.get<PairingResponse>());
            return;

        case EnvelopeKind::PAIRING_REJECTED: {
            const auto* response = envelope.get<PairingResponse>();
            std::string reason = response->reason.value_or("rejected");
            log_info("Pairing: " + peer_id + " rejected pairing: " + reason);
            finish(peer_id, attempt_id, Result<TrustRecord>::failure(ErrorCode::PAIRING_REJECTED, reason));
            return;
        }

        default:
            log_debug("Pairing: Ignoring " + EnvelopeCodec::kind_to_tag(envelope.kind) +
                      " from " + peer_id + " while waiting for an answer");
            return;
    }
}

void PairingCoordinator::handle_accepted(
    const std::string& peer_id,
    uint64_t attempt_id,
    const PairingResponse& response
) {
    Attempt attempt;
    {
        std::lock_guard<std::mutex> lock(pairing_mutex_);

        auto it = attempts_.find(peer_id);
        if (it == attempts_.end() || it->second.id != attempt_id) {
            return;
        }

        attempt = std::move(it->second);
        attempts_.erase(it);
    }
    attempt.timer->cancel();

    if (!response.peer_id.empty() && response.peer_id != peer_id) {
        log_warn("Pairing: Answer from '" + response.peer_id + "' on stream to " + peer_id);
        attempt.connection->close();
        complete(attempt.completion, Result<TrustRecord>::failure(
            ErrorCode::PAIRING_REJECTED, "Peer answered as '" + response.peer_id + "'"));
        return;
    }

    TrustRecord record;
    record.peer_id = peer_id;
    record.display_name = attempt.peer.display_name;
    record.paired_at = current_unix_time();
    if (attempt.proof) {
        record.credential = PairingCrypto::derive_credential(local_info_.id, peer_id, *attempt.proof);
    }

    if (!trust_store_.upsert(record)) {
        log_error("Pairing: Could not persist trust record for " + peer_id);
        attempt.connection->close();
        complete(attempt.completion, Result<TrustRecord>::failure(
            ErrorCode::STORAGE_ERROR, "Could not store trust record for " + peer_id));
        return;
    }

    log_info("Pairing: Paired with " + peer_id + " (" + record.display_name + ")");

    SessionHandoff handoff;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        handoff = handoff_;
    }

    if (handoff) {
        try {
            handoff(peer_id, attempt.connection, true);
        } catch (const std::exception& e) {
            log_error("Pairing: Session handoff threw: " + std::string(e.what()));
            attempt.connection->close();
        }
    } else {
        attempt.connection->close();
    }

    complete(attempt.completion, Result<TrustRecord>::success(record));
}

void PairingCoordinator::finish(const std::string& peer_id, uint64_t attempt_id, const Result<TrustRecord>& result) {
    Attempt attempt;
    {
        std::lock_guard<std::mutex> lock(pairing_mutex_);

        auto it = attempts_.find(peer_id);
        if (it == attempts_.end() || it->second.id != attempt_id) {
            return;
        }

        attempt = std::move(it->second);
        attempts_.erase(it);
    }

    attempt.timer->cancel();
    if (attempt.connection) {
        attempt.connection->close();
    }

    if (!result) {
        log_info("Pairing: Attempt with " + peer_id + " ended: " +
                 error_code_to_string(result.error().code) + " (" + result.error().message + ")");
    }

    complete(attempt.completion, result);
}

// ============================================================================
// Responder
// ============================================================================

void PairingCoordinator::handle_incoming_request(std::shared_ptr<Connection> connection, const PairingRequest& request) {
    if (!config::validate_identifier(request.id) || !config::validate_display_name(request.name)) {
        log_warn("Pairing: Malformed request from " + connection->remote_address());
        reject(connection, "Malformed pairing request");
        return;
    }

    if (request.id == local_info_.id) {
        log_warn("Pairing: Request carries our own id, rejecting");
        reject(connection, "Identifier collision");
        return;
    }

    log_info("Pairing: Request from " + request.id + " (" + request.name + ") at " +
             connection->remote_address() + (request.proof ? " with code" : " without code"));

    PairingRequestCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = request_callback_;
    }

    if (!callback) {
        // The default policy accepts a request with a proof only on a code match
        apply_decision(connection, request, default_decision(request), request.proof.has_value());
        return;
    }

    std::shared_ptr<Connection> superseded;
    {
        std::lock_guard<std::mutex> lock(pairing_mutex_);

        auto existing = pending_.find(request.id);
        if (existing != pending_.end()) {
            existing->second.deadline->cancel();
            superseded = existing->second.connection;
            pending_.erase(existing);
        }

        std::string peer_id = request.id;
        uint64_t connection_id = connection->id();

        PendingRequest& pending = pending_[peer_id];
        pending.request = request;
        pending.connection = connection;
        pending.deadline = std::make_unique<asio::steady_timer>(io_context_);
        pending.deadline->expires_after(config_.pairing_timeout);
        pending.deadline->async_wait([this, peer_id](const asio::error_code& error) {
            if (error) {
                return;
            }
            log_warn("Pairing: No decision for " + peer_id + " in time, rejecting");
            Status status = respond_to_pairing(peer_id, PairingDecision::reject("Pairing request timed out"));
            if (!status) {
                log_debug("Pairing: " + status.error().message);
            }
        });

        connection->start(
            [peer_id](const Envelope& envelope) {
                log_debug("Pairing: Ignoring " + EnvelopeCodec::kind_to_tag(envelope.kind) +
                          " from " + peer_id + " awaiting decision");
            },
            [this, peer_id, connection_id](const EngineError&) {
                drop_pending(peer_id, connection_id);
            }
        );
    }

    if (superseded) {
        log_debug("Pairing: Newer request from " + request.id + " replaces the waiting one");
        superseded->close();
    }

    try {
        callback(request, connection->remote_address());
    } catch (const std::exception& e) {
        log_error("Pairing: Request callback threw: " + std::string(e.what()));
    }
}

Status PairingCoordinator::respond_to_pairing(const std::string& peer_id, const PairingDecision& decision) {
    PendingRequest pending;
    {
        std::lock_guard<std::mutex> lock(pairing_mutex_);

        auto it = pending_.find(peer_id);
        if (it == pending_.end()) {
            return Status::failure(ErrorCode::UNKNOWN_PEER, "No pairing request from " + peer_id);
        }

        pending = std::move(it->second);
        pending_.erase(it);
    }

    pending.deadline->cancel();

    if (!pending.connection->is_open()) {
        return Status::failure(ErrorCode::NOT_CONNECTED, peer_id + " closed the pairing stream");
    }

    apply_decision(pending.connection, pending.request, decision, false);
    return Status::success();
}

std::vector<std::string> PairingCoordinator::pending_requests() const {
    std::lock_guard<std::mutex> lock(pairing_mutex_);

    std::vector<std::string> ids;
    for (const auto& [peer_id, pending] : pending_) {
        ids.push_back(peer_id);
    }
    return ids;
}

void PairingCoordinator::set_request_callback(PairingRequestCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    request_callback_ = std::move(callback);
}

void PairingCoordinator::set_session_handoff(SessionHandoff handoff) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    handoff_ = std::move(handoff);
}

PairingDecision PairingCoordinator::default_decision(const PairingRequest& request) const {
    if (request.proof) {
        if (verify_proof(*request.proof)) {
            return PairingDecision::accept();
        }
        return PairingDecision::reject("Incorrect pairing code");
    }

    if (config_.auto_accept_pairing) {
        return PairingDecision::accept();
    }

    return PairingDecision::reject("Pairing code required");
}

void PairingCoordinator::apply_decision(
    std::shared_ptr<Connection> connection,
    const PairingRequest& request,
    const PairingDecision& decision,
    bool proof_required
) {
    if (!decision.accepted) {
        log_info("Pairing: Rejecting " + request.id + ": " + decision.reason.value_or("rejected"));
        reject(connection, decision.reason.value_or("rejected"));
        return;
    }

    bool code_matched = request.proof && consume_proof(*request.proof);
    if (proof_required && !code_matched) {
        log_info("Pairing: Rejecting " + request.id + ": code already used");
        reject(connection, "Incorrect pairing code");
        return;
    }

    TrustRecord record;
    record.peer_id = request.id;
    record.display_name = request.name;
    record.paired_at = current_unix_time();
    if (request.proof) {
        record.credential = PairingCrypto::derive_credential(local_info_.id, request.id, *request.proof);
    }

    // Trust must be durable before the initiator may open a session
    if (!trust_store_.upsert(record)) {
        log_error("Pairing: Could not persist trust record for " + request.id);
        reject(connection, "Could not store trust record");
        return;
    }

    Status sent = connection->send(Envelope::pairing_accepted(local_info_.id));
    if (!sent) {
        log_warn("Pairing: Could not answer " + request.id + ": " + sent.error().message);
        connection->close();
        return;
    }

    log_info("Pairing: Paired with " + request.id + " (" + request.name + ")");

    SessionHandoff handoff;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        handoff = handoff_;
    }

    if (!handoff) {
        connection->close_after_flush(config::FAREWELL_LINGER);
        return;
    }

    try {
        handoff(request.id, connection, false);
    } catch (const std::exception& e) {
        log_error("Pairing: Session handoff threw: " + std::string(e.what()));
        connection->close();
    }
}

void PairingCoordinator::reject(std::shared_ptr<Connection> connection, const std::string& reason) {
    Status sent = connection->send(Envelope::pairing_rejected(local_info_.id, reason));
    if (!sent) {
        log_debug("Pairing: Rejection not sent: " + sent.error().message);
    }
    connection->close_after_flush(config::FAREWELL_LINGER);
}

void PairingCoordinator::drop_pending(const std::string& peer_id, uint64_t connection_id) {
    std::lock_guard<std::mutex> lock(pairing_mutex_);

    auto it = pending_.find(peer_id);
    if (it == pending_.end() || it->second.connection->id() != connection_id) {
        return;
    }

    log_info("Pairing: " + peer_id + " withdrew its pairing request");
    it->second.deadline->cancel();
    pending_.erase(it);
}

// ============================================================================
// Pairing Code
// ============================================================================

std::string PairingCoordinator::pairing_code() const {
    std::lock_guard<std::mutex> lock(code_mutex_);
    return pairing_code_;
}

bool PairingCoordinator::verify_proof(const std::string& proof) const {
    std::lock_guard<std::mutex> lock(code_mutex_);
    return PairingCrypto::constant_time_equals(trim_string(proof), pairing_code_);
}

bool PairingCoordinator::consume_proof(const std::string& proof) {
    std::lock_guard<std::mutex> lock(code_mutex_);
    if (!PairingCrypto::constant_time_equals(trim_string(proof), pairing_code_)) {
        return false;
    }
    std::string used = pairing_code_;
    do {
        pairing_code_ = PairingCrypto::generate_pairing_code(config::PAIRING_CODE_DIGITS);
    } while (pairing_code_ == used);
    log_debug("Pairing: Pairing code rotated");
    return true;
}

// ============================================================================
// Lifecycle
// ============================================================================

void PairingCoordinator::stop() {
    std::map<std::string, Attempt> attempts;
    std::map<std::string, PendingRequest> pending;
    {
        std::lock_guard<std::mutex> lock(pairing_mutex_);
        attempts.swap(attempts_);
        pending.swap(pending_);
    }

    for (auto& [peer_id, request] : pending) {
        request.deadline->cancel();
        request.connection->close();
    }

    for (auto& [peer_id, attempt] : attempts) {
        attempt.timer->cancel();
        if (attempt.connection) {
            attempt.connection->close();
        }
        complete(attempt.completion, Result<TrustRecord>::failure(
            ErrorCode::PAIRING_TIMED_OUT, "Pairing with " + peer_id + " cancelled"));
    }
}

} // namespace lanconnect
