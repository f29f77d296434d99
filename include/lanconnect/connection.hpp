/**
 * @file connection.hpp
 * @brief Framed TCP connection carrying newline-delimited envelopes
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * All socket work runs on a per-connection strand:
 * - One outstanding read feeding a FrameAssembler
 * - A FIFO write queue drained by a single writer
 * - Remote close or I/O error reported once through the closed callback
 */

#pragma once

#include "lanconnect/envelope.hpp"
#include "lanconnect/engine_errors.hpp"
#include <asio.hpp>
#include <array>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace lanconnect {

class Connection;

/**
 * @brief Callback for each decoded inbound envelope (runs on the connection strand)
 */
using EnvelopeCallback = std::function<void(const Envelope& envelope)>;

/**
 * @brief Callback when the peer closes or the transport fails
 *
 * Not invoked for a local close().
 */
using ClosedCallback = std::function<void(const EngineError& reason)>;

/**
 * @brief Callback when an outbound connect attempt completes
 */
using ConnectCallback = std::function<void(std::shared_ptr<Connection> connection, const Status& status)>;

/**
 * @brief Callback once a queued envelope was written (true) or dropped (false)
 */
using WriteCallback = std::function<void(bool written)>;

/**
 * @brief Connection - One TCP stream of envelopes
 *
 * Always held by std::shared_ptr; pending operations keep it alive.
 */
class Connection : public std::enable_shared_from_this<Connection> {
public:
    /**
     * @brief Open an outbound connection
     * @param io_context ASIO I/O context
     * @param address IPv4/IPv6 literal
     * @param port TCP port
     * @param timeout Connect timeout
     * @param max_frame_size Frame cap for both directions
     * @param callback Invoked once with the outcome
     * @return Connection (not yet open)
     */
    static std::shared_ptr<Connection> connect(
        asio::io_context& io_context,
        const std::string& address,
        uint16_t port,
        std::chrono::milliseconds timeout,
        size_t max_frame_size,
        ConnectCallback callback
    );

    /**
     * @brief Wrap an accepted socket
     */
    static std::shared_ptr<Connection> adopt(
        asio::io_context& io_context,
        asio::ip::tcp::socket socket,
        size_t max_frame_size
    );

    ~Connection();

    // Disable copy and move
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) = delete;
    Connection& operator=(Connection&&) = delete;

    /**
     * @brief Install callbacks and begin reading
     *
     * Safe to call again to hand the stream to a new owner; frames not yet
     * dispatched go to the new callbacks.
     */
    void start(EnvelopeCallback on_envelope, ClosedCallback on_closed);

    /**
     * @brief Encode and enqueue an envelope
     * @param envelope Envelope to send
     * @param on_written Optional completion for this envelope
     * @return Success, NOT_CONNECTED, PAYLOAD_TOO_LARGE or INVALID_ARGUMENT
     */
    Status send(const Envelope& envelope, WriteCallback on_written = nullptr);

    /**
     * @brief Close immediately, dropping queued writes
     */
    void close();

    /**
     * @brief Close once queued writes are flushed, or after linger elapses
     */
    void close_after_flush(std::chrono::milliseconds linger);

    bool is_open() const;

    uint64_t id() const { return id_; }
    std::string remote_address() const;
    uint16_t remote_port() const;

    std::chrono::steady_clock::time_point last_inbound() const;
    std::chrono::steady_clock::time_point last_outbound() const;

    uint64_t frames_received() const { return frames_received_.load(); }
    uint64_t frames_sent() const { return frames_sent_.load(); }

private:
    struct PendingWrite {
        std::string frame;
        WriteCallback on_written;
    };

    Connection(asio::io_context& io_context, size_t max_frame_size);

    void do_connect(const std::string& address, uint16_t port,
                    std::chrono::milliseconds timeout, ConnectCallback callback);
    void start_read();
    void handle_read(const asio::error_code& error, size_t bytes_transferred);
    void do_write();
    void deliver_closed_once(ErrorCode code, const std::string& message);
    void close_impl();
    void touch_inbound();
    void touch_outbound();

    static std::atomic<uint64_t> next_id_;

    asio::io_context& io_context_;
    asio::ip::tcp::socket socket_;
    asio::strand<asio::io_context::executor_type> strand_;
    asio::steady_timer timer_;

    const uint64_t id_;
    std::string remote_address_;
    uint16_t remote_port_;

    std::atomic<bool> open_;
    bool reading_;
    bool writing_;
    bool closing_;
    bool connect_done_;
    bool closed_delivered_;
    std::optional<EngineError> closed_reason_;

    FrameAssembler assembler_;
    size_t max_frame_size_;
    std::array<char, 16384> read_buffer_;
    std::deque<PendingWrite> write_queue_;

    EnvelopeCallback on_envelope_;
    ClosedCallback on_closed_;

    std::atomic<std::chrono::steady_clock::rep> last_inbound_;
    std::atomic<std::chrono::steady_clock::rep> last_outbound_;
    std::atomic<uint64_t> frames_received_;
    std::atomic<uint64_t> frames_sent_;
};

} // namespace lanconnect
