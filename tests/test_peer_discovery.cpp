/**
 * @file test_peer_discovery.cpp
 * @brief Unit tests for advertisements, the peer table and PeerDiscovery
 *
 * Tests discovery functionality including:
 * - Advertisement parsing and validation
 * - Peer table coalescing and expiry
 * - Datagram filtering (own echo, foreign service, malformed)
 * - Multicast round trip where the network allows it
 */

#include <gtest/gtest.h>
#include "lanconnect/peer_discovery.hpp"
#include <nlohmann/json.hpp>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace lanconnect;
using json = nlohmann::json;

namespace {

PeerRecord make_self(const std::string& id, uint16_t port = 1716) {
    PeerRecord record;
    record.peer_id = id;
    record.display_name = "Device " + id;
    record.kind = DeviceKind::LAPTOP;
    record.port = port;
    record.capabilities = {"ClipboardSync", "FileTransfer"};
    return record;
}

} // namespace

class PeerDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.device_id = "local-device";
        config_.discovery_timeout = std::chrono::milliseconds(50);
        config_.discovery_enabled = false;

        discovery_ = std::make_unique<PeerDiscovery>(io_context_, config_);
        discovery_->set_local_record(make_self("local-device"));
        discovery_->set_event_callback([this](const DiscoveryEvent& event) {
            events_.push_back(event);
        });
    }

    void TearDown() override {
        discovery_.reset();
    }

    void ingest(const PeerRecord& record, const std::string& sender = "192.168.1.20") {
        discovery_->ingest_datagram(Advertisement::announce(record).to_json(), sender);
    }

    asio::io_context io_context_;
    config::EngineConfig config_;
    std::unique_ptr<PeerDiscovery> discovery_;
    std::vector<DiscoveryEvent> events_;
};

// ============================================================================
// Device Kind Tests
// ============================================================================

TEST(DeviceKindTest, NamesRoundTrip) {
    EXPECT_EQ(device_kind_to_string(DeviceKind::MOBILE), "Mobile");
    EXPECT_EQ(device_kind_from_string("Tablet"), DeviceKind::TABLET);
    EXPECT_EQ(device_kind_from_string("LAPTOP"), DeviceKind::LAPTOP);
    EXPECT_EQ(device_kind_from_string("phone"), DeviceKind::MOBILE);
    EXPECT_FALSE(device_kind_from_string("Toaster").has_value());
}

// ============================================================================
// Advertisement Tests
// ============================================================================

TEST(AdvertisementTest, AnnounceCarriesRecord) {
    Advertisement ad = Advertisement::announce(make_self("phone-1", 40000));
    json j = json::parse(ad.to_json());

    EXPECT_EQ(j["service"], "lanconnect");
    EXPECT_EQ(j["version"], config::PROTOCOL_VERSION);
    EXPECT_EQ(j["type"], "announce");
    EXPECT_EQ(j["id"], "phone-1");
    EXPECT_EQ(j["name"], "Device phone-1");
    EXPECT_EQ(j["device_type"], "Laptop");
    EXPECT_EQ(j["port"], 40000);
    EXPECT_EQ(j["capabilities"].size(), 2u);
}

TEST(AdvertisementTest, ParseAndConvert) {
    auto ad = Advertisement::from_json(Advertisement::announce(make_self("phone-1", 40000)).to_json());
    ASSERT_TRUE(ad.has_value());

    auto record = ad->to_peer_record("10.0.0.7");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->peer_id, "phone-1");
    EXPECT_EQ(record->address, "10.0.0.7");
    EXPECT_EQ(record->port, 40000);
    EXPECT_EQ(record->kind, DeviceKind::LAPTOP);
}

TEST(AdvertisementTest, UnknownDeviceTypeFallsBack) {
    json j = json::parse(Advertisement::announce(make_self("tv")).to_json());
    j["device_type"] = "Television";

    auto ad = Advertisement::from_json(j.dump());
    ASSERT_TRUE(ad.has_value());
    EXPECT_EQ(ad->to_peer_record("10.0.0.8")->kind, DeviceKind::DESKTOP);
}

TEST(AdvertisementTest, RejectsInvalidFields) {
    EXPECT_FALSE(Advertisement::from_json("not json").has_value());
    EXPECT_FALSE(Advertisement::from_json("[]").has_value());
    EXPECT_FALSE(Advertisement::from_json(R"({"type":"shout","service":"lanconnect","version":1,"id":"a"})").has_value());
    EXPECT_FALSE(Advertisement::from_json(R"({"type":"announce","service":"lanconnect","version":1,"id":"a"})").has_value());

    PeerRecord bad_id = make_self("has space");
    EXPECT_FALSE(Advertisement::announce(bad_id).to_peer_record("10.0.0.1").has_value());

    PeerRecord no_port = make_self("phone", 0);
    EXPECT_FALSE(Advertisement::announce(no_port).to_peer_record("10.0.0.1").has_value());

    EXPECT_FALSE(Advertisement::announce(make_self("phone")).to_peer_record("").has_value());
}

TEST(AdvertisementTest, RejectsOutOfRangeNumbers) {
    json base = json::parse(Advertisement::announce(make_self("phone", 40000)).to_json());

    std::vector<json> bad_ports{json(70000), json(-1), json(4000.5), json("4000")};
    for (const auto& port : bad_ports) {
        SCOPED_TRACE(port.dump());
        json j = base;
        j["port"] = port;
        EXPECT_FALSE(Advertisement::from_json(j.dump()).has_value());
    }

    json j = base;
    j["version"] = 1.5;
    EXPECT_FALSE(Advertisement::from_json(j.dump()).has_value());

    j = base;
    j["port"] = 65535;
    auto ad = Advertisement::from_json(j.dump());
    ASSERT_TRUE(ad.has_value());
    EXPECT_EQ(ad->port, 65535);
}

TEST(AdvertisementTest, WithdrawCarriesOnlyIdentity) {
    Advertisement withdraw;
    withdraw.type = AdvertisementType::WITHDRAW;
    withdraw.service = config::SERVICE_NAME;
    withdraw.version = config::PROTOCOL_VERSION;
    withdraw.peer_id = "phone";

    json j = json::parse(withdraw.to_json());
    EXPECT_EQ(j["type"], "withdraw");
    EXPECT_FALSE(j.contains("port"));
    EXPECT_FALSE(withdraw.to_peer_record("10.0.0.1").has_value());
}

// ============================================================================
// Peer Table Tests
// ============================================================================

TEST(PeerTableTest, AppearThenUpdateKeepsFirstSeen) {
    PeerTable table;
    auto t0 = std::chrono::steady_clock::now();
    auto t1 = t0 + std::chrono::seconds(2);

    PeerRecord record = make_self("phone");
    record.address = "10.0.0.2";

    auto first = table.apply(record, t0);
    EXPECT_EQ(first.type, DiscoveryEventType::PEER_APPEARED);

    record.port = 1800;
    auto second = table.apply(record, t1);
    EXPECT_EQ(second.type, DiscoveryEventType::PEER_UPDATED);

    auto stored = table.get("phone");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->port, 1800);
    EXPECT_EQ(stored->first_seen, t0);
    EXPECT_EQ(stored->last_seen, t1);
    EXPECT_EQ(table.size(), 1u);
}

TEST(PeerTableTest, WithdrawUnknownIsSilent) {
    PeerTable table;
    table.apply(make_self("phone"), std::chrono::steady_clock::now());

    EXPECT_FALSE(table.withdraw("tablet").has_value());

    auto event = table.withdraw("phone");
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->type, DiscoveryEventType::PEER_DISAPPEARED);
    EXPECT_EQ(event->peer_id, "phone");
    EXPECT_EQ(table.size(), 0u);
}

TEST(PeerTableTest, ExpireOnlyStalePeers) {
    PeerTable table;
    auto now = std::chrono::steady_clock::now();

    table.apply(make_self("old"), now - std::chrono::seconds(20));
    table.apply(make_self("fresh"), now - std::chrono::seconds(1));

    auto events = table.expire(now, std::chrono::seconds(15));

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].peer_id, "old");
    EXPECT_TRUE(table.get("fresh").has_value());
    EXPECT_FALSE(table.get("old").has_value());
}

// ============================================================================
// Datagram Ingest Tests
// ============================================================================

TEST_F(PeerDiscoveryTest, AnnouncementAddsPeer) {
    ingest(make_self("phone"));

    ASSERT_EQ(events_.size(), 1u);
    EXPECT_EQ(events_[0].type, DiscoveryEventType::PEER_APPEARED);
    EXPECT_EQ(events_[0].record.address, "192.168.1.20");

    auto peer = discovery_->get_peer("phone");
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->display_name, "Device phone");
    EXPECT_EQ(discovery_->get_peer_count(), 1u);
    EXPECT_EQ(discovery_->get_datagrams_received(), 1u);
}

TEST_F(PeerDiscoveryTest, RepeatedAnnouncementIsUpdate) {
    ingest(make_self("phone"));
    ingest(make_self("phone"), "192.168.1.21");

    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[1].type, DiscoveryEventType::PEER_UPDATED);
    EXPECT_EQ(discovery_->get_peer("phone")->address, "192.168.1.21");
    EXPECT_EQ(discovery_->get_peer_count(), 1u);
}

TEST_F(PeerDiscoveryTest, OwnAnnouncementDropped) {
    ingest(make_self("local-device"));

    EXPECT_TRUE(events_.empty());
    EXPECT_EQ(discovery_->get_peer_count(), 0u);
    EXPECT_EQ(discovery_->get_datagrams_dropped(), 1u);
}

TEST_F(PeerDiscoveryTest, ForeignServiceDropped) {
    json j = json::parse(Advertisement::announce(make_self("printer")).to_json());
    j["service"] = "other-protocol";

    discovery_->ingest_datagram(j.dump(), "192.168.1.30");

    EXPECT_TRUE(events_.empty());
    EXPECT_EQ(discovery_->get_datagrams_dropped(), 1u);
}

TEST_F(PeerDiscoveryTest, MalformedDatagramCounted) {
    discovery_->ingest_datagram("\x01\x02garbage", "192.168.1.31");
    discovery_->ingest_datagram(R"({"service":"lanconnect"})", "192.168.1.31");

    EXPECT_TRUE(events_.empty());
    EXPECT_EQ(discovery_->get_datagrams_received(), 2u);
    EXPECT_EQ(discovery_->get_datagrams_dropped(), 2u);
}

TEST_F(PeerDiscoveryTest, InvalidAnnouncementDropped) {
    ingest(make_self("bad/id"));

    EXPECT_TRUE(events_.empty());
    EXPECT_EQ(discovery_->get_datagrams_dropped(), 1u);
}

TEST_F(PeerDiscoveryTest, WithdrawRemovesPeer) {
    ingest(make_self("phone"));

    Advertisement withdraw;
    withdraw.type = AdvertisementType::WITHDRAW;
    withdraw.service = config::SERVICE_NAME;
    withdraw.version = config::PROTOCOL_VERSION;
    withdraw.peer_id = "phone";
    discovery_->ingest_datagram(withdraw.to_json(), "192.168.1.20");

    ASSERT_EQ(events_.size(), 2u);
    EXPECT_EQ(events_[1].type, DiscoveryEventType::PEER_DISAPPEARED);
    EXPECT_EQ(events_[1].peer_id, "phone");
    EXPECT_FALSE(discovery_->get_peer("phone").has_value());

    // A second withdrawal for an absent peer emits nothing
    discovery_->ingest_datagram(withdraw.to_json(), "192.168.1.20");
    EXPECT_EQ(events_.size(), 2u);
}

TEST_F(PeerDiscoveryTest, StalePeersExpire) {
    ingest(make_self("phone"));
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    ingest(make_self("tablet"));

    EXPECT_EQ(discovery_->expire_stale_peers(), 1u);

    EXPECT_FALSE(discovery_->get_peer("phone").has_value());
    EXPECT_TRUE(discovery_->get_peer("tablet").has_value());
    EXPECT_EQ(events_.back().type, DiscoveryEventType::PEER_DISAPPEARED);
    EXPECT_EQ(events_.back().peer_id, "phone");
}

TEST_F(PeerDiscoveryTest, CallbackExceptionContained) {
    discovery_->set_event_callback([](const DiscoveryEvent&) {
        throw std::runtime_error("listener failure");
    });

    EXPECT_NO_THROW(ingest(make_self("phone")));
    EXPECT_TRUE(discovery_->get_peer("phone").has_value());
}

// ============================================================================
// Multicast Tests
// ============================================================================

TEST(PeerDiscoveryNetworkTest, AdvertiserSeenByBrowser) {
    config::EngineConfig config;
    config.discovery_port = static_cast<uint16_t>(42000 + (getpid() % 2000));
    config.announce_interval = std::chrono::milliseconds(100);

    asio::io_context io_context;
    PeerDiscovery advertiser(io_context, config);
    PeerDiscovery browser(io_context, config);

    std::mutex mutex;
    std::condition_variable cv;
    bool seen = false;

    browser.set_local_record(make_self("browser"));
    Status browse_status = browser.start_browsing([&](const DiscoveryEvent& event) {
        if (event.type == DiscoveryEventType::PEER_APPEARED && event.peer_id == "advertiser") {
            std::lock_guard<std::mutex> lock(mutex);
            seen = true;
            cv.notify_all();
        }
    });
    if (!browse_status && browse_status.code() == ErrorCode::NETWORK_UNAVAILABLE) {
        GTEST_SKIP() << "Multicast unavailable: " << browse_status.error().message;
    }
    ASSERT_TRUE(browse_status.ok());

    Status advertise_status = advertiser.start_advertising(make_self("advertiser", 41000));
    if (!advertise_status && advertise_status.code() == ErrorCode::NETWORK_UNAVAILABLE) {
        browser.stop_browsing();
        GTEST_SKIP() << "Multicast unavailable: " << advertise_status.error().message;
    }
    ASSERT_TRUE(advertise_status.ok());
    EXPECT_TRUE(browser.is_browsing());
    EXPECT_TRUE(advertiser.is_advertising());

    auto guard = asio::make_work_guard(io_context);
    std::thread io_thread([&io_context]() { io_context.run(); });

    bool observed = false;
    {
        std::unique_lock<std::mutex> lock(mutex);
        observed = cv.wait_for(lock, std::chrono::seconds(3), [&]() { return seen; });
    }

    advertiser.stop_advertising();
    browser.stop_browsing();
    EXPECT_FALSE(advertiser.is_advertising());
    EXPECT_FALSE(browser.is_browsing());
    guard.reset();
    io_context.stop();
    io_thread.join();

    if (!observed) {
        GTEST_SKIP() << "Multicast loopback not delivered on this host";
    }

    EXPECT_TRUE(observed);
    EXPECT_GE(advertiser.get_datagrams_sent(), 1u);
}
