/**
 * @file peer_table.cpp
 * @brief Implementation of peer records, advertisements and the peer table
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanconnect/peer_table.hpp"
#include "lanconnect/engine_config.hpp"
#include "lanconnect/json_numbers.hpp"
#include "lanconnect/utilities.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace lanconnect {

namespace {

const char* advertisement_type_to_string(AdvertisementType type) {
    switch (type) {
        case AdvertisementType::ANNOUNCE: return "announce";
        case AdvertisementType::WITHDRAW: return "withdraw";
        case AdvertisementType::QUERY: return "query";
    }
    return "announce";
}

std::optional<AdvertisementType> advertisement_type_from_string(const std::string& text) {
    if (text == "announce") return AdvertisementType::ANNOUNCE;
    if (text == "withdraw") return AdvertisementType::WITHDRAW;
    if (text == "query") return AdvertisementType::QUERY;
    return std::nullopt;
}

} // namespace

// ============================================================================
// Device Kind
// ============================================================================

std::string device_kind_to_string(DeviceKind kind) {
    switch (kind) {
        case DeviceKind::DESKTOP: return "Desktop";
        case DeviceKind::LAPTOP: return "Laptop";
        case DeviceKind::MOBILE: return "Mobile";
        case DeviceKind::TABLET: return "Tablet";
    }
    return "Desktop";
}

std::optional<DeviceKind> device_kind_from_string(const std::string& name) {
    std::string lower = utilities::to_lowercase(name);
    if (lower == "desktop") return DeviceKind::DESKTOP;
    if (lower == "laptop") return DeviceKind::LAPTOP;
    if (lower == "mobile" || lower == "phone") return DeviceKind::MOBILE;
    if (lower == "tablet") return DeviceKind::TABLET;
    return std::nullopt;
}

bool PeerRecord::same_advertisement(const PeerRecord& other) const {
    return peer_id == other.peer_id && display_name == other.display_name &&
           kind == other.kind && address == other.address && port == other.port &&
           capabilities == other.capabilities;
}

// ============================================================================
// Advertisement
// ============================================================================

Advertisement Advertisement::announce(const PeerRecord& self) {
    Advertisement ad;
    ad.type = AdvertisementType::ANNOUNCE;
    ad.service = config::SERVICE_NAME;
    ad.version = config::PROTOCOL_VERSION;
    ad.peer_id = self.peer_id;
    ad.display_name = self.display_name;
    ad.device_type = device_kind_to_string(self.kind);
    ad.port = self.port;
    ad.capabilities = self.capabilities;
    return ad;
}

std::string Advertisement::to_json() const {
    json j;
    j["service"] = service;
    j["version"] = version;
    j["type"] = advertisement_type_to_string(type);
    j["id"] = peer_id;

    if (type == AdvertisementType::ANNOUNCE) {
        j["name"] = display_name;
        j["device_type"] = device_type;
        j["port"] = port;
        j["capabilities"] = capabilities;
    }

    return j.dump();
}

std::optional<Advertisement> Advertisement::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);
        if (!j.is_object()) {
            return std::nullopt;
        }

        auto type = advertisement_type_from_string(j.at("type").get<std::string>());
        if (!type) {
            return std::nullopt;
        }

        Advertisement ad;
        ad.type = *type;
        ad.service = j.at("service").get<std::string>();
        ad.version = json_integer<int>(j.at("version"), "version");
        ad.peer_id = j.at("id").get<std::string>();

        if (ad.type == AdvertisementType::ANNOUNCE) {
            ad.display_name = j.at("name").get<std::string>();
            ad.device_type = j.value("device_type", std::string("Desktop"));
            ad.port = json_integer<uint16_t>(j.at("port"), "port");
            ad.capabilities = j.value("capabilities", std::vector<std::string>{});
        }

        return ad;

    } catch (const json::exception&) {
        return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    }
}

std::optional<PeerRecord> Advertisement::to_peer_record(const std::string& sender_address) const {
    if (type != AdvertisementType::ANNOUNCE) {
        return std::nullopt;
    }
    if (!config::validate_identifier(peer_id) || !config::validate_display_name(display_name)) {
        return std::nullopt;
    }
    if (port == 0 || sender_address.empty()) {
        return std::nullopt;
    }

    PeerRecord record;
    record.peer_id = peer_id;
    record.display_name = display_name;
    // Unrecognized kinds from newer peers fall back to Desktop
    record.kind = device_kind_from_string(device_type).value_or(DeviceKind::DESKTOP);
    record.address = sender_address;
    record.port = port;
    record.capabilities = capabilities;
    return record;
}

// ============================================================================
// Peer Table
// ============================================================================

DiscoveryEvent PeerTable::apply(PeerRecord sighting, std::chrono::steady_clock::time_point now) {
    sighting.last_seen = now;

    auto it = peers_.find(sighting.peer_id);
    if (it == peers_.end()) {
        sighting.first_seen = now;
        peers_[sighting.peer_id] = sighting;
        return DiscoveryEvent{DiscoveryEventType::PEER_APPEARED, sighting, sighting.peer_id};
    }

    sighting.first_seen = it->second.first_seen;
    it->second = sighting;
    return DiscoveryEvent{DiscoveryEventType::PEER_UPDATED, sighting, sighting.peer_id};
}

std::optional<DiscoveryEvent> PeerTable::withdraw(const std::string& peer_id) {
    auto it = peers_.find(peer_id);
    if (it == peers_.end()) {
        return std::nullopt;
    }

    peers_.erase(it);
    return DiscoveryEvent{DiscoveryEventType::PEER_DISAPPEARED, PeerRecord{}, peer_id};
}

std::vector<DiscoveryEvent> PeerTable::expire(
    std::chrono::steady_clock::time_point now,
    std::chrono::milliseconds timeout
) {
    std::vector<DiscoveryEvent> events;

    for (auto it = peers_.begin(); it != peers_.end(); ) {
        if (now - it->second.last_seen > timeout) {
            events.push_back(DiscoveryEvent{DiscoveryEventType::PEER_DISAPPEARED, PeerRecord{}, it->first});
            it = peers_.erase(it);
        } else {
            ++it;
        }
    }

    return events;
}

std::optional<PeerRecord> PeerTable::get(const std::string& peer_id) const {
    auto it = peers_.find(peer_id);
    if (it != peers_.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::vector<PeerRecord> PeerTable::all() const {
    std::vector<PeerRecord> result;
    result.reserve(peers_.size());

    for (const auto& [peer_id, record] : peers_) {
        result.push_back(record);
    }

    return result;
}

} // namespace lanconnect
