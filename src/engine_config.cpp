/**
 * @file engine_config.cpp
 * @brief Configuration loading, directories and validation
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanconnect/engine_config.hpp"
#include "lanconnect/utilities.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>

using json = nlohmann::json;

namespace lanconnect {
namespace config {

namespace {

void read_duration(const json& j, const char* key, std::chrono::milliseconds& target) {
    if (j.contains(key) && j[key].is_number_integer()) {
        target = std::chrono::milliseconds(j[key].get<int64_t>());
    }
}

template <typename T>
void read_value(const json& j, const char* key, T& target) {
    if (j.contains(key) && !j[key].is_null()) {
        target = j[key].get<T>();
    }
}

std::optional<uint16_t> parse_port(const std::string& text) {
    try {
        int value = std::stoi(text);
        if (value < 0 || value > 65535) {
            return std::nullopt;
        }
        return static_cast<uint16_t>(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

// ============================================================================
// Runtime Configuration
// ============================================================================

std::optional<EngineConfig> load_engine_config(const std::string& path) {
    auto content = utilities::read_file(path);
    if (!content) {
        utilities::log_error("Config: Cannot read " + path);
        return std::nullopt;
    }

    try {
        json j = json::parse(*content);
        if (!j.is_object()) {
            utilities::log_error("Config: Top level of " + path + " is not an object");
            return std::nullopt;
        }

        EngineConfig config;
        read_value(j, "device_id", config.device_id);
        read_value(j, "display_name", config.display_name);
        read_value(j, "device_type", config.device_type);
        read_value(j, "capabilities", config.capabilities);
        read_value(j, "data_directory", config.data_directory);
        read_value(j, "log_file", config.log_file);
        read_value(j, "log_level", config.log_level);
        read_value(j, "bind_address", config.bind_address);
        read_value(j, "session_port", config.session_port);
        read_value(j, "discovery_port", config.discovery_port);
        read_value(j, "multicast_group", config.multicast_group);
        read_value(j, "discovery_enabled", config.discovery_enabled);
        read_duration(j, "announce_interval_ms", config.announce_interval);
        read_duration(j, "discovery_timeout_ms", config.discovery_timeout);
        read_duration(j, "connect_timeout_ms", config.connect_timeout);
        read_duration(j, "pairing_timeout_ms", config.pairing_timeout);
        read_duration(j, "idle_timeout_ms", config.idle_timeout);
        read_duration(j, "keepalive_interval_ms", config.keepalive_interval);
        read_duration(j, "reconnect_initial_delay_ms", config.reconnect_initial_delay);
        read_duration(j, "reconnect_max_delay_ms", config.reconnect_max_delay);
        read_value(j, "max_reconnect_attempts", config.max_reconnect_attempts);
        read_value(j, "max_frame_size", config.max_frame_size);
        read_value(j, "auto_accept_pairing", config.auto_accept_pairing);
        read_value(j, "worker_threads", config.worker_threads);

        if (config.worker_threads == 0) {
            config.worker_threads = 1;
        }

        return config;

    } catch (const json::exception& e) {
        utilities::log_error("Config: Invalid JSON in " + path + ": " + e.what());
        return std::nullopt;
    }
}

void apply_environment_overrides(EngineConfig& config) {
    std::string data_dir = utilities::get_env("LANCONNECT_DATA_DIR");
    if (!data_dir.empty()) {
        config.data_directory = data_dir;
    }

    std::string session_port = utilities::get_env("LANCONNECT_SESSION_PORT");
    if (!session_port.empty()) {
        auto port = parse_port(session_port);
        if (port) {
            config.session_port = *port;
        } else {
            utilities::log_warn("Config: Ignoring invalid LANCONNECT_SESSION_PORT: " + session_port);
        }
    }

    std::string discovery_port = utilities::get_env("LANCONNECT_DISCOVERY_PORT");
    if (!discovery_port.empty()) {
        auto port = parse_port(discovery_port);
        if (port) {
            config.discovery_port = *port;
        } else {
            utilities::log_warn("Config: Ignoring invalid LANCONNECT_DISCOVERY_PORT: " + discovery_port);
        }
    }

    std::string log_level = utilities::get_env("LANCONNECT_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log_level = log_level;
    }
}

// ============================================================================
// Directories
// ============================================================================

std::filesystem::path get_data_directory() {
    std::string env_data_dir = utilities::get_env("LANCONNECT_DATA_DIR");
    std::filesystem::path data_dir;

    if (!env_data_dir.empty()) {
        data_dir = env_data_dir;
    } else {
        std::string home = utilities::get_env("HOME");
        data_dir = home.empty()
            ? std::filesystem::temp_directory_path() / "lanconnect"
            : std::filesystem::path(home) / ".config" / "lanconnect";
    }

    if (!std::filesystem::exists(data_dir)) {
        std::filesystem::create_directories(data_dir);
    }

    return data_dir;
}

std::filesystem::path get_database_directory(const std::filesystem::path& data_dir) {
    std::filesystem::path db_dir = data_dir / "db";

    if (!std::filesystem::exists(db_dir)) {
        std::filesystem::create_directories(db_dir);
    }

    return db_dir;
}

std::filesystem::path get_log_directory(const std::filesystem::path& data_dir) {
    std::filesystem::path log_dir = data_dir / "logs";

    if (!std::filesystem::exists(log_dir)) {
        std::filesystem::create_directories(log_dir);
    }

    return log_dir;
}

// ============================================================================
// Validation
// ============================================================================

bool validate_identifier(const std::string& identifier, size_t max_length) {
    if (identifier.empty() || identifier.length() > max_length) {
        return false;
    }

    for (char c : identifier) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-' && c != '.' && c != ':') {
            return false;
        }
    }

    return true;
}

bool validate_display_name(const std::string& name) {
    if (name.empty() || name.length() > MAX_DISPLAY_NAME_LENGTH) {
        return false;
    }

    return std::none_of(name.begin(), name.end(), [](char c) {
        return std::iscntrl(static_cast<unsigned char>(c)) != 0;
    });
}

} // namespace config
} // namespace lanconnect
