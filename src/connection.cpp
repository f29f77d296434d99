/**
 * @file connection.cpp
 * @brief Implementation of the framed TCP connection
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanconnect/connection.hpp"
#include "lanconnect/utilities.hpp"
#include <iterator>
#include <vector>

namespace lanconnect {

std::atomic<uint64_t> Connection::next_id_{1};

namespace {

void invoke_connect_callback(
    const ConnectCallback& callback,
    std::shared_ptr<Connection> connection,
    const Status& status
) {
    if (!callback) {
        return;
    }
    try {
        callback(std::move(connection), status);
    } catch (const std::exception& e) {
        utilities::log_error("Connection: Connect callback threw: " + std::string(e.what()));
    }
}

void invoke_write_callback(const WriteCallback& callback, bool written) {
    if (!callback) {
        return;
    }
    try {
        callback(written);
    } catch (const std::exception& e) {
        utilities::log_error("Connection: Write callback threw: " + std::string(e.what()));
    }
}

std::chrono::steady_clock::rep now_ticks() {
    return std::chrono::steady_clock::now().time_since_epoch().count();
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Connection::Connection(asio::io_context& io_context, size_t max_frame_size)
    : io_context_(io_context)
    , socket_(io_context)
    , strand_(io_context.get_executor())
    , timer_(io_context)
    , id_(next_id_++)
    , remote_port_(0)
    , open_(false)
    , reading_(false)
    , writing_(false)
    , closing_(false)
    , connect_done_(false)
    , closed_delivered_(false)
    , assembler_(max_frame_size)
    , max_frame_size_(max_frame_size)
    , read_buffer_{}
    , last_inbound_(now_ticks())
    , last_outbound_(now_ticks())
    , frames_received_(0)
    , frames_sent_(0)
{
}

Connection::~Connection() = default;

std::shared_ptr<Connection> Connection::connect(
    asio::io_context& io_context,
    const std::string& address,
    uint16_t port,
    std::chrono::milliseconds timeout,
    size_t max_frame_size,
    ConnectCallback callback
) {
    auto connection = std::shared_ptr<Connection>(new Connection(io_context, max_frame_size));
    connection->remote_address_ = address;
    connection->remote_port_ = port;

    // Run on the strand so shared_from_this() is valid inside do_connect
    asio::post(connection->strand_, [connection, address, port, timeout, callback]() {
        connection->do_connect(address, port, timeout, callback);
    });

    return connection;
}

std::shared_ptr<Connection> Connection::adopt(
    asio::io_context& io_context,
    asio::ip::tcp::socket socket,
    size_t max_frame_size
) {
    auto connection = std::shared_ptr<Connection>(new Connection(io_context, max_frame_size));
    connection->socket_ = std::move(socket);
    connection->open_ = true;
    connection->connect_done_ = true;

    asio::error_code ec;
    auto endpoint = connection->socket_.remote_endpoint(ec);
    if (!ec) {
        connection->remote_address_ = endpoint.address().to_string();
        connection->remote_port_ = endpoint.port();
    }

    connection->socket_.set_option(asio::ip::tcp::no_delay(true), ec);
    return connection;
}

void Connection::do_connect(
    const std::string& address,
    uint16_t port,
    std::chrono::milliseconds timeout,
    ConnectCallback callback
) {
    auto self = shared_from_this();

    asio::error_code ec;
    asio::ip::address ip = asio::ip::make_address(address, ec);
    if (ec) {
        connect_done_ = true;
        invoke_connect_callback(callback, self,
            Status::failure(ErrorCode::INVALID_ARGUMENT, "Invalid address '" + address + "'"));
        return;
    }

    timer_.expires_after(timeout);
    timer_.async_wait(asio::bind_executor(strand_, [this, self, callback](const asio::error_code& error) {
        if (error == asio::error::operation_aborted || connect_done_) {
            return;
        }

        connect_done_ = true;
        asio::error_code ignored;
        socket_.close(ignored);

        utilities::log_warn("Connection: Connect to " + remote_address_ + ":" +
                            std::to_string(remote_port_) + " timed out");
        invoke_connect_callback(callback, self,
            Status::failure(ErrorCode::TRANSPORT_LOST, "Connect timed out"));
    }));

    socket_.async_connect(
        asio::ip::tcp::endpoint(ip, port),
        asio::bind_executor(strand_, [this, self, callback](const asio::error_code& error) {
            if (connect_done_) {
                return;
            }

            connect_done_ = true;
            timer_.cancel();

            if (error) {
                asio::error_code ignored;
                socket_.close(ignored);
                utilities::log_debug("Connection: Connect to " + remote_address_ + ":" +
                                     std::to_string(remote_port_) + " failed: " + error.message());
                invoke_connect_callback(callback, self,
                    Status::failure(ErrorCode::TRANSPORT_LOST, error.message()));
                return;
            }

            open_ = true;
            asio::error_code opt_ec;
            socket_.set_option(asio::ip::tcp::no_delay(true), opt_ec);
            touch_inbound();
            touch_outbound();

            invoke_connect_callback(callback, self, Status::success());
        })
    );
}

// ============================================================================
// Reading
// ============================================================================

void Connection::start(EnvelopeCallback on_envelope, ClosedCallback on_closed) {
    auto self = shared_from_this();

    asio::dispatch(strand_, [this, self, on_envelope, on_closed]() {
        on_envelope_ = on_envelope;
        on_closed_ = on_closed;

        if (!open_) {
            // Closed before the new owner arrived; tell it once
            if (closed_reason_ && on_closed_) {
                auto callback = std::move(on_closed_);
                on_closed_ = nullptr;
                EngineError reason = *closed_reason_;
                asio::post(io_context_, [callback, reason]() {
                    try {
                        callback(reason);
                    } catch (const std::exception& e) {
                        utilities::log_error("Connection: Closed callback threw: " + std::string(e.what()));
                    }
                });
            }
            return;
        }

        if (!reading_) {
            reading_ = true;
            start_read();
        }
    });
}

void Connection::start_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(read_buffer_),
        asio::bind_executor(strand_, [this, self](const asio::error_code& error, size_t bytes_transferred) {
            handle_read(error, bytes_transferred);
        })
    );
}

void Connection::handle_read(const asio::error_code& error, size_t bytes_transferred) {
    if (!open_) {
        return;
    }

    if (error) {
        if (error == asio::error::eof) {
            deliver_closed_once(ErrorCode::TRANSPORT_LOST, "Peer closed the connection");
        } else if (error != asio::error::operation_aborted) {
            deliver_closed_once(ErrorCode::TRANSPORT_LOST, "Read failed: " + error.message());
        }
        close_impl();
        return;
    }

    touch_inbound();
    assembler_.append(read_buffer_.data(), bytes_transferred);

    while (open_) {
        auto frame = assembler_.next_frame();
        if (!frame) {
            break;
        }

        frames_received_++;

        auto decoded = EnvelopeCodec::decode(*frame);
        if (!decoded) {
            utilities::log_warn("Connection: Dropping undecodable frame from " + remote_address_ +
                                ": " + decoded.error().message);
            continue;
        }

        // Copy: the callback may hand the connection to a new owner
        EnvelopeCallback callback = on_envelope_;
        if (!callback) {
            continue;
        }

        try {
            callback(decoded.value());
        } catch (const std::exception& e) {
            utilities::log_error("Connection: Envelope callback threw: " + std::string(e.what()));
        }
    }

    size_t oversized = assembler_.take_oversized_count();
    if (oversized > 0) {
        utilities::log_warn("Connection: Dropped " + std::to_string(oversized) +
                            " oversized frame(s) from " + remote_address_);
    }

    if (open_) {
        start_read();
    }
}

// ============================================================================
// Writing
// ============================================================================

Status Connection::send(const Envelope& envelope, WriteCallback on_written) {
    if (!open_) {
        return Status::failure(ErrorCode::NOT_CONNECTED, "Connection is closed");
    }

    auto encoded = EnvelopeCodec::encode(envelope, max_frame_size_);
    if (!encoded) {
        return Status::failure(encoded.error());
    }

    auto pending = std::make_shared<PendingWrite>();
    pending->frame = std::move(encoded.value());
    pending->on_written = std::move(on_written);

    auto self = shared_from_this();
    asio::post(strand_, [this, self, pending]() {
        if (!open_ || closing_) {
            invoke_write_callback(pending->on_written, false);
            return;
        }

        write_queue_.push_back(std::move(*pending));

        if (!writing_) {
            writing_ = true;
            do_write();
        }
    });

    return Status::success();
}

void Connection::do_write() {
    if (write_queue_.empty()) {
        writing_ = false;
        if (closing_) {
            close_impl();
        }
        return;
    }

    auto self = shared_from_this();

    // deque::push_back keeps references to existing elements valid
    asio::async_write(
        socket_,
        asio::buffer(write_queue_.front().frame),
        asio::bind_executor(strand_, [this, self](const asio::error_code& error, size_t) {
            if (!open_) {
                return;
            }

            if (error) {
                deliver_closed_once(ErrorCode::TRANSPORT_LOST, "Write failed: " + error.message());
                close_impl();
                return;
            }

            PendingWrite done = std::move(write_queue_.front());
            write_queue_.pop_front();

            touch_outbound();
            frames_sent_++;
            invoke_write_callback(done.on_written, true);

            do_write();
        })
    );
}

// ============================================================================
// Closing
// ============================================================================

void Connection::close() {
    auto self = shared_from_this();
    asio::post(strand_, [self]() {
        self->close_impl();
    });
}

void Connection::close_after_flush(std::chrono::milliseconds linger) {
    auto self = shared_from_this();
    asio::post(strand_, [this, self, linger]() {
        if (!open_) {
            return;
        }

        closing_ = true;
        if (!writing_) {
            close_impl();
            return;
        }

        timer_.expires_after(linger);
        timer_.async_wait(asio::bind_executor(strand_, [this, self](const asio::error_code& error) {
            if (error) {
                return;
            }
            close_impl();
        }));
    });
}

void Connection::deliver_closed_once(ErrorCode code, const std::string& message) {
    if (closed_delivered_) {
        return;
    }
    closed_delivered_ = true;
    closed_reason_ = EngineError{code, message};

    utilities::log_debug("Connection: " + remote_address_ + ":" + std::to_string(remote_port_) +
                         " lost: " + message);

    ClosedCallback callback = std::move(on_closed_);
    on_closed_ = nullptr;
    if (!callback) {
        return;
    }

    // Post to the io_context, not the strand, so the owner can close or
    // replace this connection from inside the callback
    EngineError reason = *closed_reason_;
    asio::post(io_context_, [callback, reason]() {
        try {
            callback(reason);
        } catch (const std::exception& e) {
            utilities::log_error("Connection: Closed callback threw: " + std::string(e.what()));
        }
    });
}

void Connection::close_impl() {
    timer_.cancel();

    asio::error_code ignored;
    if (!open_.exchange(false)) {
        // Still connecting: closing the socket aborts the attempt
        socket_.close(ignored);
        return;
    }

    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);

    std::vector<WriteCallback> dropped;
    for (auto& pending : write_queue_) {
        dropped.push_back(std::move(pending.on_written));
        pending.on_written = nullptr;
    }

    // The aborted async_write still references the front frame
    if (writing_ && !write_queue_.empty()) {
        write_queue_.erase(std::next(write_queue_.begin()), write_queue_.end());
    } else {
        write_queue_.clear();
    }
    writing_ = false;

    for (const auto& callback : dropped) {
        invoke_write_callback(callback, false);
    }

    on_envelope_ = nullptr;
    on_closed_ = nullptr;
}

// ============================================================================
// Accessors
// ============================================================================

bool Connection::is_open() const {
    return open_.load();
}

std::string Connection::remote_address() const {
    return remote_address_;
}

uint16_t Connection::remote_port() const {
    return remote_port_;
}

std::chrono::steady_clock::time_point Connection::last_inbound() const {
    return std::chrono::steady_clock::time_point(std::chrono::steady_clock::duration(last_inbound_.load()));
}

std::chrono::steady_clock::time_point Connection::last_outbound() const {
    return std::chrono::steady_clock::time_point(std::chrono::steady_clock::duration(last_outbound_.load()));
}

void Connection::touch_inbound() {
    last_inbound_.store(now_ticks());
}

void Connection::touch_outbound() {
    last_outbound_.store(now_ticks());
}

} // namespace lanconnect
