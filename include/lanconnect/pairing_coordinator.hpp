/**
 * @file pairing_coordinator.hpp
 * @brief One-shot pairing handshake that turns a discovered peer into a trusted one
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Initiator: Idle -> RequestSent -> {Accepted | Rejected | TimedOut}
 *
 * The responder writes the trust record before answering PairingAccepted,
 * so the initiator can never hold a session the responder does not trust.
 * On acceptance both sides hand the open stream to the session manager.
 */

#pragma once

#include "lanconnect/connection.hpp"
#include "lanconnect/engine_config.hpp"
#include "lanconnect/engine_errors.hpp"
#include "lanconnect/envelope.hpp"
#include "lanconnect/peer_table.hpp"
#include "lanconnect/trust_store.hpp"
#include <asio.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanconnect {

/**
 * @brief Responder's answer to a pairing request
 */
struct PairingDecision {
    bool accepted = false;
    std::optional<std::string> reason;      ///< Sent to the initiator on rejection

    static PairingDecision accept() {
        return PairingDecision{true, std::nullopt};
    }

    static PairingDecision reject(std::string reason) {
        return PairingDecision{false, std::move(reason)};
    }
};

/**
 * @brief Outcome of an initiated pairing, invoked exactly once
 */
using PairingCompletion = std::function<void(const Result<TrustRecord>& result)>;

/**
 * @brief Notification of an inbound pairing request awaiting respond_to_pairing()
 */
using PairingRequestCallback = std::function<void(const PairingRequest& request,
                                                  const std::string& address)>;

/**
 * @brief Receives the open stream after a successful pairing
 */
using SessionHandoff = std::function<void(const std::string& peer_id,
                                          std::shared_ptr<Connection> connection,
                                          bool initiator)>;

/**
 * @brief PairingCoordinator - Both sides of the pairing handshake
 *
 * Thread-safe. At most one initiated attempt per peer is in flight.
 */
class PairingCoordinator {
public:
    /**
     * @brief Construct PairingCoordinator
     * @param io_context ASIO I/O context
     * @param config Engine configuration (timeouts, auto-accept policy)
     * @param trust_store Store receiving the new trust records
     * @param local_info Identity presented in requests and answers
     */
    PairingCoordinator(
        asio::io_context& io_context,
        const config::EngineConfig& config,
        TrustStore& trust_store,
        DeviceInfo local_info
    );

    ~PairingCoordinator();

    // Disable copy and move
    PairingCoordinator(const PairingCoordinator&) = delete;
    PairingCoordinator& operator=(const PairingCoordinator&) = delete;
    PairingCoordinator(PairingCoordinator&&) = delete;
    PairingCoordinator& operator=(PairingCoordinator&&) = delete;

    // ========================================================================
    // Initiator
    // ========================================================================

    /**
     * @brief Open a stream to the peer and request pairing
     *
     * Envelopes other than PairingAccepted/PairingRejected are ignored while
     * waiting. Completion reports the TrustRecord, PAIRING_REJECTED (with
     * the peer's reason), PAIRING_TIMED_OUT or STORAGE_ERROR.
     *
     * @param peer Discovered peer
     * @param proof Pairing code read off the peer's screen, if any
     * @param completion Invoked once on an I/O thread
     * @return Success if the attempt started, PAIRING_ALREADY_IN_PROGRESS or INVALID_ARGUMENT
     */
    Status initiate_pairing(
        const PeerRecord& peer,
        std::optional<std::string> proof,
        PairingCompletion completion
    );

    /**
     * @brief True while an initiated attempt for peer_id is pending
     */
    bool is_pairing(const std::string& peer_id) const;

    // ========================================================================
    // Responder
    // ========================================================================

    /**
     * @brief Entry point for streams whose first frame was a pairing request
     */
    void handle_incoming_request(std::shared_ptr<Connection> connection, const PairingRequest& request);

    /**
     * @brief Answer a request previously reported through the request callback
     * @return Success or UNKNOWN_PEER if no request from peer_id is waiting
     */
    Status respond_to_pairing(const std::string& peer_id, const PairingDecision& decision);

    /**
     * @brief Ids of requests waiting for respond_to_pairing()
     */
    std::vector<std::string> pending_requests() const;

    /**
     * @brief Register the collaborator deciding on requests
     *
     * Without a callback the built-in policy applies: accept a proof that
     * matches the current code, accept proofless requests only when
     * auto_accept_pairing is set, reject everything else.
     */
    void set_request_callback(PairingRequestCallback callback);

    void set_session_handoff(SessionHandoff handoff);

    // ========================================================================
    // Pairing Code
    // ========================================================================

    /**
     * @brief Code the user reads off this device and enters on the initiator
     */
    std::string pairing_code() const;

    /**
     * @brief Constant-time comparison against the current code
     */
    bool verify_proof(const std::string& proof) const;

    /**
     * @brief Match the proof and rotate the code in one step
     *
     * Each code admits one pairing: of several requests carrying the same
     * code, only the first to get here matches.
     *
     * @return true if the proof matched and the code was replaced
     */
    bool consume_proof(const std::string& proof);

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Resolve every pending attempt as PAIRING_TIMED_OUT and drop waiting requests
     */
    void stop();

private:
    struct Attempt {
        uint64_t id = 0;
        PeerRecord peer;
        std::optional<std::string> proof;
        std::shared_ptr<Connection> connection;
        std::unique_ptr<asio::steady_timer> timer;
        PairingCompletion completion;
    };

    struct PendingRequest {
        PairingRequest request;
        std::shared_ptr<Connection> connection;
        std::unique_ptr<asio::steady_timer> deadline;
    };

    // Initiator
    void handle_connected(const std::string& peer_id, uint64_t attempt_id,
                          std::shared_ptr<Connection> connection, const Status& status);
    void handle_answer(const std::string& peer_id, uint64_t attempt_id, const Envelope& envelope);
    void handle_accepted(const std::string& peer_id, uint64_t attempt_id, const PairingResponse& response);
    void finish(const std::string& peer_id, uint64_t attempt_id, const Result<TrustRecord>& result);

    // Responder
    PairingDecision default_decision(const PairingRequest& request) const;
    void apply_decision(std::shared_ptr<Connection> connection,
                        const PairingRequest& request,
                        const PairingDecision& decision,
                        bool proof_required);
    void reject(std::shared_ptr<Connection> connection, const std::string& reason);
    void drop_pending(const std::string& peer_id, uint64_t connection_id);

    // ========================================================================
    // Member Variables
    // ========================================================================

    asio::io_context& io_context_;
    config::EngineConfig config_;
    TrustStore& trust_store_;
    DeviceInfo local_info_;

    /// peer_id -> initiated attempt
    std::map<std::string, Attempt> attempts_;
    uint64_t next_attempt_id_;

    /// peer_id -> request awaiting a collaborator decision
    std::map<std::string, PendingRequest> pending_;

    mutable std::mutex pairing_mutex_;

    std::string pairing_code_;
    mutable std::mutex code_mutex_;

    PairingRequestCallback request_callback_;
    SessionHandoff handoff_;
    mutable std::mutex callback_mutex_;
};

} // namespace lanconnect
