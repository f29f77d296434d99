/**
 * @file test_session_manager.cpp
 * @brief Integration tests for sessions between paired engines
 *
 * Tests session functionality including:
 * - Routing of envelopes to registered handlers, in order
 * - Keepalive, idle detection and reconnection
 * - Farewell handling and trust-gated connects
 * - Bounded retries and resumption on re-advertisement
 */

#include <gtest/gtest.h>
#include "lanconnect/connect_engine.hpp"
#include "lanconnect/trust_store.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace lanconnect;
namespace fs = std::filesystem;

namespace {

template <typename Predicate>
bool wait_until(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return predicate();
}

/**
 * @brief Thread-safe record of state transitions seen by a callback
 */
class StateLog {
public:
    void record(const std::string& peer_id, SessionState state) {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.emplace_back(peer_id, state);
    }

    bool contains(const std::string& peer_id, SessionState state) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, seen] : entries_) {
            if (id == peer_id && seen == state) {
                return true;
            }
        }
        return false;
    }

    size_t count(const std::string& peer_id, SessionState state) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t n = 0;
        for (const auto& [id, seen] : entries_) {
            if (id == peer_id && seen == state) {
                n++;
            }
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<std::string, SessionState>> entries_;
};

/**
 * @brief Accepts TCP streams, records the first line and never answers
 *
 * With hang_up set, the first stream is closed once its first line arrives.
 */
class SilentPeer {
public:
    explicit SilentPeer(bool hang_up = false)
        : acceptor_(io_context_, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
        , port_(acceptor_.local_endpoint().port())
        , hang_up_(hang_up)
    {
        accept();
        thread_ = std::thread([this]() { io_context_.run(); });
    }

    ~SilentPeer() {
        io_context_.stop();
        thread_.join();
    }

    uint16_t port() const { return port_; }

    std::string first_line() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return first_line_;
    }

    size_t accepted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sockets_.size();
    }

private:
    void accept() {
        acceptor_.async_accept([this](const asio::error_code& error, asio::ip::tcp::socket socket) {
            if (error) {
                return;
            }

            auto stream = std::make_shared<asio::ip::tcp::socket>(std::move(socket));
            bool first = false;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                sockets_.push_back(stream);
                first = sockets_.size() == 1;
            }

            if (first) {
                read_first_line(stream);
            }
            accept();
        });
    }

    void read_first_line(std::shared_ptr<asio::ip::tcp::socket> stream) {
        asio::async_read_until(*stream, asio::dynamic_buffer(read_buffer_), '\n',
            [this, stream](const asio::error_code& error, size_t length) {
                if (error || length == 0) {
                    return;
                }
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    first_line_ = read_buffer_.substr(0, length - 1);
                }
                if (hang_up_) {
                    asio::error_code close_error;
                    stream->shutdown(asio::ip::tcp::socket::shutdown_both, close_error);
                    stream->close(close_error);
                }
            });
    }

    asio::io_context io_context_;
    asio::ip::tcp::acceptor acceptor_;
    uint16_t port_;
    bool hang_up_;
    std::string read_buffer_;

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<asio::ip::tcp::socket>> sockets_;
    std::string first_line_;

    std::thread thread_;
};

} // namespace

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "lanconnect_session_test";
        fs::remove_all(test_dir_);
        fs::create_directories(test_dir_);

        config_a_ = make_config("device-a", "Laptop A");
        config_b_ = make_config("device-b", "Phone B");
        config_b_.auto_accept_pairing = true;
    }

    void TearDown() override {
        engine_a_.reset();
        engine_b_.reset();

        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    config::EngineConfig make_config(const std::string& id, const std::string& name) {
        config::EngineConfig config;
        config.device_id = id;
        config.display_name = name;
        config.data_directory = (test_dir_ / id).string();
        config.session_port = 0;
        config.discovery_enabled = false;
        config.bind_address = "127.0.0.1";
        config.connect_timeout = std::chrono::milliseconds(1000);
        config.pairing_timeout = std::chrono::milliseconds(2000);
        config.reconnect_initial_delay = std::chrono::milliseconds(100);
        config.reconnect_max_delay = std::chrono::milliseconds(400);
        return config;
    }

    void start_engine_a() {
        engine_a_ = std::make_unique<ConnectEngine>(config_a_);
        engine_a_->set_session_state_callback([this](const std::string& peer_id, SessionState state) {
            states_a_.record(peer_id, state);
        });
        ASSERT_TRUE(engine_a_->start());
    }

    void start_engine_b() {
        engine_b_ = std::make_unique<ConnectEngine>(config_b_);
        engine_b_->set_session_state_callback([this](const std::string& peer_id, SessionState state) {
            states_b_.record(peer_id, state);
        });
        ASSERT_TRUE(engine_b_->start());
    }

    // Starts both engines and pairs A with B; both end CONNECTED
    void start_paired() {
        start_engine_a();
        start_engine_b();
        introduce(*engine_a_, *engine_b_);
        introduce(*engine_b_, *engine_a_);

        auto result = engine_a_->pair("device-b");
        ASSERT_TRUE(result.ok()) << result.error().message;
        ASSERT_TRUE(wait_until([this]() {
            return engine_a_->session_state("device-b") == SessionState::CONNECTED &&
                   engine_b_->session_state("device-a") == SessionState::CONNECTED;
        }));
    }

    // Stands in for the multicast announcement of `other`
    static void introduce(ConnectEngine& engine, ConnectEngine& other) {
        engine.discovery()->ingest_datagram(Advertisement::announce(other.local_record()).to_json(), "127.0.0.1");
    }

    static void withdraw(ConnectEngine& engine, const std::string& peer_id) {
        Advertisement ad;
        ad.type = AdvertisementType::WITHDRAW;
        ad.service = config::SERVICE_NAME;
        ad.version = config::PROTOCOL_VERSION;
        ad.peer_id = peer_id;
        engine.discovery()->ingest_datagram(ad.to_json(), "127.0.0.1");
    }

    fs::path test_dir_;
    config::EngineConfig config_a_;
    config::EngineConfig config_b_;
    std::unique_ptr<ConnectEngine> engine_a_;
    std::unique_ptr<ConnectEngine> engine_b_;
    StateLog states_a_;
    StateLog states_b_;
};

// ============================================================================
// Message Routing
// ============================================================================

TEST_F(SessionTest, ClipboardDeliveredToHandler) {
    std::mutex mutex;
    std::vector<std::pair<std::string, std::string>> received;

    start_paired();
    engine_b_->register_handler(EnvelopeKind::CLIPBOARD_SYNC, [&](const std::string& peer_id, const Envelope& envelope) {
        std::lock_guard<std::mutex> lock(mutex);
        received.emplace_back(peer_id, envelope.get<ClipboardSync>()->content);
    });

    ASSERT_TRUE(engine_a_->send("device-b", Envelope::clipboard_sync("copied text")).ok());

    ASSERT_TRUE(wait_until([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return !received.empty();
    }));

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(received[0].first, "device-a");
    EXPECT_EQ(received[0].second, "copied text");
}

TEST_F(SessionTest, HandlerRegisteredBeforeStartIsKept) {
    std::atomic<int> battery_reports{0};

    engine_a_ = std::make_unique<ConnectEngine>(config_a_);
    engine_a_->register_handler(EnvelopeKind::BATTERY_STATUS, [&](const std::string&, const Envelope& envelope) {
        if (envelope.get<BatteryStatus>()->charge == 42) {
            battery_reports++;
        }
    });
    ASSERT_TRUE(engine_a_->start());

    start_engine_b();
    introduce(*engine_a_, *engine_b_);
    introduce(*engine_b_, *engine_a_);
    ASSERT_TRUE(engine_a_->pair("device-b").ok());
    ASSERT_TRUE(wait_until([this]() {
        return engine_b_->session_state("device-a") == SessionState::CONNECTED;
    }));

    BatteryStatus status;
    status.charge = 42;
    status.is_charging = true;
    ASSERT_TRUE(engine_b_->send("device-a", Envelope::battery_status(status)).ok());

    EXPECT_TRUE(wait_until([&]() { return battery_reports.load() == 1; }));
}

TEST_F(SessionTest, FramesArriveInSendOrder) {
    constexpr int kMessages = 200;
    std::mutex mutex;
    std::vector<std::string> received;

    start_paired();
    engine_b_->register_handler(EnvelopeKind::CLIPBOARD_SYNC, [&](const std::string&, const Envelope& envelope) {
        std::lock_guard<std::mutex> lock(mutex);
        received.push_back(envelope.get<ClipboardSync>()->content);
    });

    for (int i = 0; i < kMessages; ++i) {
        ASSERT_TRUE(engine_a_->send("device-b", Envelope::clipboard_sync("message-" + std::to_string(i))).ok());
    }

    ASSERT_TRUE(wait_until([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return received.size() == static_cast<size_t>(kMessages);
    }));

    std::lock_guard<std::mutex> lock(mutex);
    for (int i = 0; i < kMessages; ++i) {
        ASSERT_EQ(received[i], "message-" + std::to_string(i));
    }
}

TEST_F(SessionTest, UnhandledMessagesReachObserver) {
    std::mutex mutex;
    std::vector<EnvelopeKind> unhandled;

    start_paired();
    engine_b_->set_unhandled_message_callback([&](const std::string& peer_id, const Envelope& envelope) {
        EXPECT_EQ(peer_id, "device-a");
        std::lock_guard<std::mutex> lock(mutex);
        unhandled.push_back(envelope.kind);
    });

    ASSERT_TRUE(engine_a_->send("device-b", Envelope::media_control("Pause")).ok());

    ASSERT_TRUE(wait_until([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return !unhandled.empty();
    }));

    std::lock_guard<std::mutex> lock(mutex);
    EXPECT_EQ(unhandled[0], EnvelopeKind::MEDIA_CONTROL);
    EXPECT_EQ(engine_b_->session_state("device-a"), SessionState::CONNECTED);
}

TEST_F(SessionTest, ThrowingHandlerKeepsSession) {
    std::atomic<int> calls{0};

    start_paired();
    engine_b_->register_handler(EnvelopeKind::NOTIFICATION, [&](const std::string&, const Envelope&) {
        calls++;
        throw std::runtime_error("handler failure");
    });

    Notification first;
    first.title = "One";
    first.body = "first";
    Notification second;
    second.title = "Two";
    second.body = "second";

    ASSERT_TRUE(engine_a_->send("device-b", Envelope::notification(first)).ok());
    ASSERT_TRUE(engine_a_->send("device-b", Envelope::notification(second)).ok());

    EXPECT_TRUE(wait_until([&]() { return calls.load() == 2; }));
    EXPECT_EQ(engine_b_->session_state("device-a"), SessionState::CONNECTED);
}

// ============================================================================
// Send Errors
// ============================================================================

TEST_F(SessionTest, OversizedPayloadRejectedWithoutClosing) {
    config_a_.max_frame_size = 4096;
    start_paired();

    Status status = engine_a_->send("device-b", Envelope::clipboard_sync(std::string(10000, 'x')));

    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.code(), ErrorCode::PAYLOAD_TOO_LARGE);
    EXPECT_EQ(engine_a_->session_state("device-b"), SessionState::CONNECTED);
    EXPECT_TRUE(engine_a_->send("device-b", Envelope::clipboard_sync("small")).ok());
}

TEST_F(SessionTest, SendWithoutSession) {
    start_engine_a();

    Status status = engine_a_->send("device-b", Envelope::ping());

    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.code(), ErrorCode::NOT_CONNECTED);
}

TEST_F(SessionTest, ConnectRequiresPairing) {
    start_engine_a();
    start_engine_b();
    introduce(*engine_a_, *engine_b_);

    Status status = engine_a_->connect("device-b");

    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.code(), ErrorCode::NOT_PAIRED);
    EXPECT_EQ(engine_a_->session_state("device-b"), SessionState::DISCONNECTED);
}

TEST_F(SessionTest, UntrustedAppearanceDoesNotConnect) {
    start_engine_a();
    start_engine_b();
    introduce(*engine_a_, *engine_b_);

    std::this_thread::sleep_for(std::chrono::milliseconds(200));

    EXPECT_EQ(engine_a_->session_state("device-b"), SessionState::DISCONNECTED);
    EXPECT_TRUE(engine_a_->connected_peers().empty());
}

// ============================================================================
// Keepalive and Idle Detection
// ============================================================================

TEST_F(SessionTest, KeepaliveHoldsQuietSession) {
    config_a_.keepalive_interval = std::chrono::milliseconds(100);
    config_a_.idle_timeout = std::chrono::milliseconds(600);
    config_b_.keepalive_interval = std::chrono::milliseconds(100);
    config_b_.idle_timeout = std::chrono::milliseconds(600);
    start_paired();

    std::this_thread::sleep_for(std::chrono::milliseconds(1500));

    EXPECT_EQ(engine_a_->session_state("device-b"), SessionState::CONNECTED);
    EXPECT_EQ(engine_b_->session_state("device-a"), SessionState::CONNECTED);
    EXPECT_FALSE(states_a_.contains("device-b", SessionState::RECONNECTING));
}

TEST_F(SessionTest, SilentPeerDetectedAsIdle) {
    SilentPeer silent;

    // Trust is seeded directly in A's store
    fs::create_directories(config_a_.data_directory);
    {
        TrustStore store((config::get_database_directory(config_a_.data_directory) / "trust.db").string());
        TrustRecord record;
        record.peer_id = "silent-peer";
        record.display_name = "Silent";
        record.paired_at = 1700000000;
        ASSERT_TRUE(store.upsert(record));
    }

    config_a_.keepalive_interval = std::chrono::milliseconds(100);
    config_a_.idle_timeout = std::chrono::milliseconds(400);
    config_a_.reconnect_initial_delay = std::chrono::milliseconds(1000);
    start_engine_a();

    PeerRecord peer;
    peer.peer_id = "silent-peer";
    peer.display_name = "Silent";
    peer.port = silent.port();
    engine_a_->discovery()->ingest_datagram(Advertisement::announce(peer).to_json(), "127.0.0.1");

    ASSERT_TRUE(wait_until([this]() { return states_a_.contains("silent-peer", SessionState::CONNECTED); }));

    // The first frame on a trusted session identifies us
    ASSERT_TRUE(wait_until([&silent]() { return !silent.first_line().empty(); }));
    auto decoded = EnvelopeCodec::decode(silent.first_line());
    ASSERT_TRUE(decoded.ok());
    ASSERT_EQ(decoded.value().kind, EnvelopeKind::DEVICE_INFO);
    EXPECT_EQ(decoded.value().get<DeviceInfo>()->id, "device-a");

    EXPECT_TRUE(wait_until([this]() {
        return states_a_.contains("silent-peer", SessionState::RECONNECTING);
    }, std::chrono::milliseconds(2000)));
}

// ============================================================================
// Disconnect and Reconnect
// ============================================================================

TEST_F(SessionTest, RemoteDisconnectIsClean) {
    start_paired();

    engine_a_->disconnect("device-b");
    EXPECT_EQ(engine_a_->session_state("device-b"), SessionState::DISCONNECTED);

    ASSERT_TRUE(wait_until([this]() {
        return engine_b_->session_state("device-a") == SessionState::DISCONNECTED;
    }));

    // A farewell is not a failure, so neither side retries
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    EXPECT_EQ(engine_a_->session_state("device-b"), SessionState::DISCONNECTED);
    EXPECT_EQ(engine_b_->session_state("device-a"), SessionState::DISCONNECTED);
    EXPECT_FALSE(states_b_.contains("device-a", SessionState::RECONNECTING));
}

TEST_F(SessionTest, ExplicitReconnectAfterDisconnect) {
    start_paired();

    engine_a_->disconnect("device-b");
    ASSERT_TRUE(wait_until([this]() {
        return engine_b_->session_state("device-a") == SessionState::DISCONNECTED;
    }));

    ASSERT_TRUE(engine_a_->connect("device-b").ok());

    EXPECT_TRUE(wait_until([this]() {
        return engine_a_->session_state("device-b") == SessionState::CONNECTED &&
               engine_b_->session_state("device-a") == SessionState::CONNECTED;
    }));
}

TEST_F(SessionTest, TrustedPeerReappearsAfterRestart) {
    start_paired();

    engine_b_->stop();
    withdraw(*engine_a_, "device-b");
    ASSERT_TRUE(wait_until([this]() {
        return engine_a_->session_state("device-b") == SessionState::DISCONNECTED;
    }));

    ASSERT_TRUE(engine_b_->start());
    introduce(*engine_a_, *engine_b_);

    EXPECT_TRUE(wait_until([this]() {
        return engine_a_->session_state("device-b") == SessionState::CONNECTED &&
               engine_b_->session_state("device-a") == SessionState::CONNECTED;
    }));
    EXPECT_GE(states_a_.count("device-b", SessionState::CONNECTED), 2u);
}

TEST_F(SessionTest, LostStreamIsRetried) {
    SilentPeer silent;

    fs::create_directories(config_a_.data_directory);
    {
        TrustStore store((config::get_database_directory(config_a_.data_directory) / "trust.db").string());
        TrustRecord record;
        record.peer_id = "silent-peer";
        record.display_name = "Silent";
        record.paired_at = 1700000000;
        ASSERT_TRUE(store.upsert(record));
    }

    config_a_.keepalive_interval = std::chrono::milliseconds(50);
    config_a_.idle_timeout = std::chrono::milliseconds(200);
    start_engine_a();

    PeerRecord peer;
    peer.peer_id = "silent-peer";
    peer.display_name = "Silent";
    peer.port = silent.port();
    engine_a_->discovery()->ingest_datagram(Advertisement::announce(peer).to_json(), "127.0.0.1");

    // Each idle timeout leads to a fresh stream
    EXPECT_TRUE(wait_until([&silent]() { return silent.accepted() >= 2; }, std::chrono::milliseconds(3000)));
}

TEST_F(SessionTest, RetriesStopAfterLimitUntilPeerReappears) {
    fs::create_directories(config_a_.data_directory);
    {
        TrustStore store((config::get_database_directory(config_a_.data_directory) / "trust.db").string());
        TrustRecord record;
        record.peer_id = "absent-peer";
        record.display_name = "Absent";
        record.paired_at = 1700000000;
        ASSERT_TRUE(store.upsert(record));
    }

    config_a_.max_reconnect_attempts = 2;
    start_engine_a();

    // Nothing listens on port 1, so every attempt is refused
    PeerRecord peer;
    peer.peer_id = "absent-peer";
    peer.display_name = "Absent";
    peer.port = 1;
    engine_a_->discovery()->ingest_datagram(Advertisement::announce(peer).to_json(), "127.0.0.1");

    ASSERT_TRUE(wait_until([this]() {
        return states_a_.contains("absent-peer", SessionState::DISCONNECTED);
    }));

    // Settled: no timer is left to try again
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    EXPECT_EQ(engine_a_->session_state("absent-peer"), SessionState::DISCONNECTED);
    EXPECT_EQ(states_a_.count("absent-peer", SessionState::CONNECTING), 3u);
    EXPECT_EQ(states_a_.count("absent-peer", SessionState::RECONNECTING), 2u);

    // A fresh appearance starts over, this time at a reachable endpoint
    SilentPeer silent;
    withdraw(*engine_a_, "absent-peer");
    peer.port = silent.port();
    engine_a_->discovery()->ingest_datagram(Advertisement::announce(peer).to_json(), "127.0.0.1");

    EXPECT_TRUE(wait_until([this]() {
        return engine_a_->session_state("absent-peer") == SessionState::CONNECTED;
    }));
    EXPECT_EQ(silent.accepted(), 1u);
}

TEST_F(SessionTest, ReconnectingSessionResumesWhenPeerReadvertises) {
    // Long enough that only the new advertisement can bring the session back in time
    config_a_.reconnect_initial_delay = std::chrono::milliseconds(5000);
    config_a_.reconnect_max_delay = std::chrono::milliseconds(5000);
    start_paired();

    engine_a_->disconnect("device-b");
    ASSERT_TRUE(wait_until([this]() {
        return engine_b_->session_state("device-a") == SessionState::DISCONNECTED;
    }));

    // B shows up at a stale endpoint first
    withdraw(*engine_a_, "device-b");
    PeerRecord stale = engine_b_->local_record();
    stale.port = 1;
    engine_a_->discovery()->ingest_datagram(Advertisement::announce(stale).to_json(), "127.0.0.1");

    ASSERT_TRUE(wait_until([this]() {
        return engine_a_->session_state("device-b") == SessionState::RECONNECTING;
    }));

    withdraw(*engine_a_, "device-b");
    introduce(*engine_a_, *engine_b_);

    EXPECT_TRUE(wait_until([this]() {
        return engine_a_->session_state("device-b") == SessionState::CONNECTED &&
               engine_b_->session_state("device-a") == SessionState::CONNECTED;
    }, std::chrono::milliseconds(2000)));
}

TEST_F(SessionTest, PairingStreamClosedByPeerFails) {
    SilentPeer hang_up(true);

    config_a_.pairing_timeout = std::chrono::milliseconds(5000);
    start_engine_a();

    PeerRecord peer;
    peer.peer_id = "hang-up-peer";
    peer.display_name = "Hang Up";
    peer.port = hang_up.port();
    engine_a_->discovery()->ingest_datagram(Advertisement::announce(peer).to_json(), "127.0.0.1");

    auto started = std::chrono::steady_clock::now();
    auto result = engine_a_->pair("hang-up-peer", std::string("123456"));
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::PAIRING_TIMED_OUT);
    EXPECT_NE(result.error().message.find("closed the stream"), std::string::npos);
    EXPECT_LT(elapsed, std::chrono::milliseconds(3000));

    // The request reached the peer before it hung up
    auto decoded = EnvelopeCodec::decode(hang_up.first_line());
    ASSERT_TRUE(decoded.ok());
    EXPECT_EQ(decoded.value().kind, EnvelopeKind::PAIRING_REQUEST);
    EXPECT_FALSE(engine_a_->is_pairing("hang-up-peer"));
    EXPECT_TRUE(engine_a_->list_trusted().empty());
}

TEST_F(SessionTest, ForgetClosesSession) {
    start_paired();

    EXPECT_TRUE(engine_a_->forget("device-b"));

    EXPECT_EQ(engine_a_->session_state("device-b"), SessionState::DISCONNECTED);
    EXPECT_TRUE(wait_until([this]() {
        return engine_b_->session_state("device-a") == SessionState::DISCONNECTED;
    }));
    EXPECT_EQ(engine_a_->connect("device-b").code(), ErrorCode::NOT_PAIRED);
}

TEST_F(SessionTest, ConnectedPeersListed) {
    start_paired();

    EXPECT_EQ(engine_a_->connected_peers(), std::vector<std::string>{"device-b"});
    EXPECT_EQ(engine_b_->connected_peers(), std::vector<std::string>{"device-a"});
    EXPECT_TRUE(states_a_.contains("device-b", SessionState::CONNECTED));
}

TEST_F(SessionTest, SessionStateNames) {
    EXPECT_EQ(session_state_to_string(SessionState::DISCONNECTED), "Disconnected");
    EXPECT_EQ(session_state_to_string(SessionState::CONNECTING), "Connecting");
    EXPECT_EQ(session_state_to_string(SessionState::CONNECTED), "Connected");
    EXPECT_EQ(session_state_to_string(SessionState::RECONNECTING), "Reconnecting");
}
