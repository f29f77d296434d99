/**
 * @file peer_discovery.cpp
 * @brief Implementation of UDP multicast peer discovery
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanconnect/peer_discovery.hpp"
#include "lanconnect/utilities.hpp"
#include <algorithm>

namespace lanconnect {

// ============================================================================
// Constructor / Destructor
// ============================================================================

PeerDiscovery::PeerDiscovery(asio::io_context& io_context, const config::EngineConfig& config)
    : strand_(io_context.get_executor())
    , config_(config)
    , socket_(io_context)
    , announce_timer_(io_context)
    , sweep_timer_(io_context)
    , advertising_(false)
    , browsing_(false)
    , datagrams_sent_(0)
    , datagrams_received_(0)
    , datagrams_dropped_(0)
{
}

PeerDiscovery::~PeerDiscovery() {
    stop_advertising();
    stop_browsing();
}

// ============================================================================
// Advertising
// ============================================================================

Status PeerDiscovery::start_advertising(const PeerRecord& self) {
    std::lock_guard<std::mutex> lock(io_mutex_);

    Status status = ensure_socket();
    if (!status) {
        return status;
    }

    bool was_advertising = advertising_;
    self_ = self;
    advertising_ = true;

    if (!send_announce()) {
        if (!was_advertising) {
            advertising_ = false;
            release_socket_if_idle();
        }
        return Status::failure(ErrorCode::NETWORK_UNAVAILABLE,
            "Cannot send announcement to " + config_.multicast_group);
    }

    if (!was_advertising) {
        schedule_announce();
        utilities::log_info("Discovery: Advertising " + self_.peer_id + " (" + self_.display_name +
                            ") on port " + std::to_string(self_.port));
    } else {
        utilities::log_debug("Discovery: Updated advertised record for " + self_.peer_id);
    }

    return Status::success();
}

void PeerDiscovery::stop_advertising() {
    std::lock_guard<std::mutex> lock(io_mutex_);

    if (!advertising_) {
        return;
    }

    Advertisement withdraw;
    withdraw.type = AdvertisementType::WITHDRAW;
    withdraw.service = config::SERVICE_NAME;
    withdraw.version = config::PROTOCOL_VERSION;
    withdraw.peer_id = self_.peer_id;

    // Best effort: peers that miss it expire us after the discovery timeout
    send_datagram(withdraw.to_json());

    advertising_ = false;
    announce_timer_.cancel();
    release_socket_if_idle();

    utilities::log_info("Discovery: Stopped advertising");
}

bool PeerDiscovery::is_advertising() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return advertising_;
}

void PeerDiscovery::set_local_record(const PeerRecord& self) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    self_ = self;
}

// ============================================================================
// Browsing
// ============================================================================

Status PeerDiscovery::start_browsing(DiscoveryEventCallback callback) {
    set_event_callback(std::move(callback));

    std::lock_guard<std::mutex> lock(io_mutex_);

    if (browsing_) {
        return Status::success();
    }

    Status status = ensure_socket();
    if (!status) {
        return status;
    }

    browsing_ = true;

    Advertisement query;
    query.type = AdvertisementType::QUERY;
    query.service = config::SERVICE_NAME;
    query.version = config::PROTOCOL_VERSION;
    query.peer_id = self_.peer_id;

    if (!send_datagram(query.to_json())) {
        browsing_ = false;
        release_socket_if_idle();
        return Status::failure(ErrorCode::NETWORK_UNAVAILABLE,
            "Cannot send query to " + config_.multicast_group);
    }

    schedule_sweep();
    utilities::log_info("Discovery: Browsing on " + config_.multicast_group + ":" +
                        std::to_string(config_.discovery_port));
    return Status::success();
}

void PeerDiscovery::stop_browsing() {
    {
        std::lock_guard<std::mutex> lock(io_mutex_);

        if (!browsing_) {
            return;
        }

        browsing_ = false;
        sweep_timer_.cancel();
        release_socket_if_idle();
    }

    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        table_.clear();
    }

    utilities::log_info("Discovery: Stopped browsing");
}

bool PeerDiscovery::is_browsing() const {
    std::lock_guard<std::mutex> lock(io_mutex_);
    return browsing_;
}

void PeerDiscovery::set_event_callback(DiscoveryEventCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    event_callback_ = std::move(callback);
}

// ============================================================================
// Datagram Processing
// ============================================================================

void PeerDiscovery::ingest_datagram(const std::string& data, const std::string& sender_address) {
    datagrams_received_++;

    auto ad = Advertisement::from_json(data);
    if (!ad) {
        datagrams_dropped_++;
        utilities::log_warn("Discovery: Dropping malformed datagram from " + sender_address);
        return;
    }

    if (ad->service != config::SERVICE_NAME || ad->version < 1) {
        datagrams_dropped_++;
        utilities::log_debug("Discovery: Dropping datagram for service '" + ad->service +
                             "' v" + std::to_string(ad->version) + " from " + sender_address);
        return;
    }

    bool advertising = false;
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (!self_.peer_id.empty() && ad->peer_id == self_.peer_id) {
            datagrams_dropped_++;
            return;
        }
        advertising = advertising_;
    }

    switch (ad->type) {
        case AdvertisementType::QUERY: {
            if (advertising) {
                std::lock_guard<std::mutex> lock(io_mutex_);
                utilities::log_debug("Discovery: Answering query from " + sender_address);
                send_announce();
            }
            break;
        }

        case AdvertisementType::ANNOUNCE: {
            auto record = ad->to_peer_record(sender_address);
            if (!record) {
                datagrams_dropped_++;
                utilities::log_warn("Discovery: Dropping invalid announcement from " + sender_address);
                return;
            }

            DiscoveryEvent event;
            bool changed = true;
            {
                std::lock_guard<std::mutex> lock(table_mutex_);
                auto previous = table_.get(record->peer_id);
                if (previous) {
                    changed = !previous->same_advertisement(*record);
                }
                event = table_.apply(*record, std::chrono::steady_clock::now());
            }

            if (event.type == DiscoveryEventType::PEER_APPEARED) {
                utilities::log_info("Discovery: Peer appeared " + record->peer_id + " at " +
                                    record->address + ":" + std::to_string(record->port));
            } else if (changed) {
                utilities::log_info("Discovery: Peer updated " + record->peer_id + " at " +
                                    record->address + ":" + std::to_string(record->port));
            }

            dispatch({event});
            break;
        }

        case AdvertisementType::WITHDRAW: {
            std::optional<DiscoveryEvent> event;
            {
                std::lock_guard<std::mutex> lock(table_mutex_);
                event = table_.withdraw(ad->peer_id);
            }

            if (event) {
                utilities::log_info("Discovery: Peer withdrew " + ad->peer_id);
                dispatch({*event});
            }
            break;
        }
    }
}

size_t PeerDiscovery::expire_stale_peers() {
    std::vector<DiscoveryEvent> events;
    {
        std::lock_guard<std::mutex> lock(table_mutex_);
        events = table_.expire(std::chrono::steady_clock::now(), config_.discovery_timeout);
    }

    for (const auto& event : events) {
        utilities::log_info("Discovery: Peer timed out " + event.peer_id);
    }

    dispatch(events);
    return events.size();
}

void PeerDiscovery::dispatch(const std::vector<DiscoveryEvent>& events) {
    if (events.empty()) {
        return;
    }

    DiscoveryEventCallback callback;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = event_callback_;
    }

    if (!callback) {
        return;
    }

    for (const auto& event : events) {
        try {
            callback(event);
        } catch (const std::exception& e) {
            utilities::log_error("Discovery: Event callback threw: " + std::string(e.what()));
        }
    }
}

// ============================================================================
// Peer Queries
// ============================================================================

std::optional<PeerRecord> PeerDiscovery::get_peer(const std::string& peer_id) const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return table_.get(peer_id);
}

std::vector<PeerRecord> PeerDiscovery::get_all_peers() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return table_.all();
}

size_t PeerDiscovery::get_peer_count() const {
    std::lock_guard<std::mutex> lock(table_mutex_);
    return table_.size();
}

// ============================================================================
// Statistics
// ============================================================================

uint64_t PeerDiscovery::get_datagrams_sent() const {
    return datagrams_sent_.load();
}

uint64_t PeerDiscovery::get_datagrams_received() const {
    return datagrams_received_.load();
}

uint64_t PeerDiscovery::get_datagrams_dropped() const {
    return datagrams_dropped_.load();
}

// ============================================================================
// Private Methods - Network Operations
// ============================================================================

Status PeerDiscovery::ensure_socket() {
    if (socket_.is_open()) {
        return Status::success();
    }

    try {
        asio::ip::address group = asio::ip::make_address(config_.multicast_group);

        if (group.is_multicast() && utilities::get_local_ip_addresses().empty()) {
            return Status::failure(ErrorCode::NETWORK_UNAVAILABLE, "No active local network interface");
        }

        socket_.open(asio::ip::udp::v4());
        socket_.set_option(asio::socket_base::reuse_address(true));
        socket_.bind(asio::ip::udp::endpoint(asio::ip::udp::v4(), config_.discovery_port));

        if (group.is_multicast()) {
            socket_.set_option(asio::ip::multicast::join_group(group.to_v4()));
            socket_.set_option(asio::ip::multicast::enable_loopback(true));
        } else {
            socket_.set_option(asio::socket_base::broadcast(true));
        }

        group_endpoint_ = asio::ip::udp::endpoint(group, config_.discovery_port);

    } catch (const std::exception& e) {
        asio::error_code ignored;
        socket_.close(ignored);
        utilities::log_error("Discovery: Failed to open socket: " + std::string(e.what()));
        return Status::failure(ErrorCode::NETWORK_UNAVAILABLE, e.what());
    }

    start_receive();
    return Status::success();
}

void PeerDiscovery::release_socket_if_idle() {
    if (advertising_ || browsing_ || !socket_.is_open()) {
        return;
    }

    asio::error_code ec;
    socket_.close(ec);
    if (ec) {
        utilities::log_warn("Discovery: Error closing socket: " + ec.message());
    }
}

void PeerDiscovery::start_receive() {
    socket_.async_receive_from(
        asio::buffer(recv_buffer_),
        sender_endpoint_,
        asio::bind_executor(strand_, [this](const asio::error_code& error, size_t bytes_transferred) {
            handle_receive(error, bytes_transferred);
        })
    );
}

void PeerDiscovery::handle_receive(const asio::error_code& error, size_t bytes_transferred) {
    if (error == asio::error::operation_aborted) {
        return;
    }

    if (error) {
        utilities::log_error("Discovery: Receive error: " + error.message());
    } else {
        std::string data(recv_buffer_.data(), bytes_transferred);
        std::string sender = sender_endpoint_.address().to_string();

        bool browsing = false;
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            browsing = browsing_;
        }

        try {
            // An advertiser that is not browsing only answers queries
            auto ad = Advertisement::from_json(data);
            if (browsing || (ad && ad->type == AdvertisementType::QUERY)) {
                ingest_datagram(data, sender);
            }
        } catch (const std::exception& e) {
            utilities::log_error("Discovery: Error processing datagram: " + std::string(e.what()));
        }
    }

    std::lock_guard<std::mutex> lock(io_mutex_);
    if (socket_.is_open()) {
        start_receive();
    }
}

bool PeerDiscovery::send_datagram(const std::string& data) {
    if (!socket_.is_open()) {
        return false;
    }

    asio::error_code ec;
    socket_.send_to(asio::buffer(data), group_endpoint_, 0, ec);
    if (ec) {
        utilities::log_warn("Discovery: Send to " + group_endpoint_.address().to_string() +
                            " failed: " + ec.message());
        return false;
    }

    datagrams_sent_++;
    return true;
}

bool PeerDiscovery::send_announce() {
    return send_datagram(Advertisement::announce(self_).to_json());
}

void PeerDiscovery::schedule_announce() {
    announce_timer_.expires_after(config_.announce_interval);
    announce_timer_.async_wait(asio::bind_executor(strand_, [this](const asio::error_code& error) {
        if (error) {
            return;
        }

        std::lock_guard<std::mutex> lock(io_mutex_);
        if (!advertising_) {
            return;
        }

        send_announce();
        schedule_announce();
    }));
}

void PeerDiscovery::schedule_sweep() {
    auto interval = std::max(config_.discovery_timeout / 4, std::chrono::milliseconds(20));

    sweep_timer_.expires_after(interval);
    sweep_timer_.async_wait(asio::bind_executor(strand_, [this](const asio::error_code& error) {
        if (error) {
            return;
        }

        expire_stale_peers();

        std::lock_guard<std::mutex> lock(io_mutex_);
        if (browsing_) {
            schedule_sweep();
        }
    }));
}

} // namespace lanconnect
