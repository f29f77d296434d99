/**
 * @file engine_errors.hpp
 * @brief Error taxonomy and result types for LANConnect operations
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>
#include <stdexcept>

namespace lanconnect {

/**
 * @brief Error codes surfaced to collaborators
 */
enum class ErrorCode {
    NETWORK_UNAVAILABLE,            ///< No usable local interface (retry with backoff)
    PAIRING_REJECTED,               ///< Peer declined the pairing request
    PAIRING_TIMED_OUT,              ///< No pairing answer within the timeout
    PAIRING_ALREADY_IN_PROGRESS,    ///< A pairing attempt for this peer is pending
    NOT_PAIRED,                     ///< Peer has no trust record
    NOT_CONNECTED,                  ///< No live session for the peer
    DECODE_ERROR,                   ///< Frame is not a valid envelope
    PAYLOAD_TOO_LARGE,              ///< Encoded frame exceeds the frame cap
    TRANSPORT_LOST,                 ///< Connection closed or went idle
    UNKNOWN_PEER,                   ///< Peer id not known to discovery
    STORAGE_ERROR,                  ///< Trust store could not complete a write
    INVALID_ARGUMENT                ///< Malformed identifier or argument
};

/**
 * @brief Convert ErrorCode to its canonical name
 */
std::string error_code_to_string(ErrorCode code);

/**
 * @brief Error value carried by Result and Status
 */
struct EngineError {
    ErrorCode code;
    std::string message;    ///< Human-readable detail (peer-supplied reason for rejections)

    bool operator==(const EngineError& other) const {
        return code == other.code && message == other.message;
    }
};

/**
 * @brief Value or error
 */
template <typename T>
class Result {
public:
    static Result success(T value) {
        Result result;
        result.value_ = std::move(value);
        return result;
    }

    static Result failure(ErrorCode code, std::string message = "") {
        Result result;
        result.error_ = EngineError{code, std::move(message)};
        return result;
    }

    static Result failure(EngineError error) {
        Result result;
        result.error_ = std::move(error);
        return result;
    }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const {
        if (!value_) {
            throw std::logic_error("Result has no value: " + error_->message);
        }
        return *value_;
    }

    T& value() {
        if (!value_) {
            throw std::logic_error("Result has no value: " + error_->message);
        }
        return *value_;
    }

    const EngineError& error() const {
        if (!error_) {
            throw std::logic_error("Result has no error");
        }
        return *error_;
    }

private:
    Result() = default;

    std::optional<T> value_;
    std::optional<EngineError> error_;
};

/**
 * @brief Success or error for operations without a value
 */
class Status {
public:
    Status() = default;

    static Status success() { return Status(); }

    static Status failure(ErrorCode code, std::string message = "") {
        Status status;
        status.error_ = EngineError{code, std::move(message)};
        return status;
    }

    static Status failure(EngineError error) {
        Status status;
        status.error_ = std::move(error);
        return status;
    }

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const EngineError& error() const {
        if (!error_) {
            throw std::logic_error("Status has no error");
        }
        return *error_;
    }

    ErrorCode code() const { return error().code; }

private:
    std::optional<EngineError> error_;
};

} // namespace lanconnect
