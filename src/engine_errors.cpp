/**
 * @file engine_errors.cpp
 * @brief Error code names
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "lanconnect/engine_errors.hpp"

namespace lanconnect {

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NETWORK_UNAVAILABLE: return "NetworkUnavailable";
        case ErrorCode::PAIRING_REJECTED: return "PairingRejected";
        case ErrorCode::PAIRING_TIMED_OUT: return "PairingTimedOut";
        case ErrorCode::PAIRING_ALREADY_IN_PROGRESS: return "PairingAlreadyInProgress";
        case ErrorCode::NOT_PAIRED: return "NotPaired";
        case ErrorCode::NOT_CONNECTED: return "NotConnected";
        case ErrorCode::DECODE_ERROR: return "DecodeError";
        case ErrorCode::PAYLOAD_TOO_LARGE: return "PayloadTooLarge";
        case ErrorCode::TRANSPORT_LOST: return "TransportLost";
        case ErrorCode::UNKNOWN_PEER: return "UnknownPeer";
        case ErrorCode::STORAGE_ERROR: return "StorageError";
        case ErrorCode::INVALID_ARGUMENT: return "InvalidArgument";
        default: return "Unknown";
    }
}

} // namespace lanconnect
