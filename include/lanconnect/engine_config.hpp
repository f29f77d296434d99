/**
 * @file engine_config.hpp
 * @brief Protocol constants and runtime configuration for LANConnect
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#pragma once

#include <cstdint>
#include <chrono>
#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace lanconnect {
namespace config {

// ============================================================================
// Protocol Limits
// ============================================================================

/// Protocol version carried in discovery advertisements
constexpr int PROTOCOL_VERSION = 1;

/// Service tag carried in discovery advertisements
constexpr const char* SERVICE_NAME = "lanconnect";

/// Maximum encoded envelope size (64MB), excluding the newline
constexpr size_t MAX_FRAME_SIZE = 64 * 1024 * 1024;

/// Maximum discovery datagram size (to avoid fragmentation)
constexpr size_t MAX_DATAGRAM_SIZE = 8192;

/// Maximum identifier length (peer ID)
constexpr size_t MAX_IDENTIFIER_LENGTH = 128;

/// Maximum display name length
constexpr size_t MAX_DISPLAY_NAME_LENGTH = 256;

/// Pairing code length in digits
constexpr size_t PAIRING_CODE_DIGITS = 6;

// ============================================================================
// Network Configuration
// ============================================================================

/// TCP session port
constexpr uint16_t DEFAULT_SESSION_PORT = 1716;

/// UDP discovery port
constexpr uint16_t DEFAULT_DISCOVERY_PORT = 1717;

/// Administratively scoped multicast group for advertisements
constexpr const char* DEFAULT_MULTICAST_GROUP = "239.255.17.16";

// ============================================================================
// Timeouts
// ============================================================================

/// Interval between periodic advertisements
constexpr auto ANNOUNCE_INTERVAL = std::chrono::seconds(2);

/// A peer not re-advertised within this window has disappeared
constexpr auto DISCOVERY_TIMEOUT = std::chrono::seconds(10);

/// TCP connection establishment timeout
constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(10);

/// Pairing answer timeout
constexpr auto PAIRING_TIMEOUT = std::chrono::seconds(10);

/// No inbound frame for this long means the session is lost
constexpr auto IDLE_TIMEOUT = std::chrono::seconds(60);

/// Send a ping when nothing was written for this long
constexpr auto KEEPALIVE_INTERVAL = std::chrono::seconds(20);

/// First reconnect delay
constexpr auto RECONNECT_INITIAL_DELAY = std::chrono::seconds(1);

/// Reconnect delay cap
constexpr auto RECONNECT_MAX_DELAY = std::chrono::seconds(60);

/// Reconnect attempts before settling at Disconnected
constexpr int MAX_RECONNECT_ATTEMPTS = 8;

/// How long a closing stream may take to flush its farewell frame
constexpr auto FAREWELL_LINGER = std::chrono::milliseconds(500);

// ============================================================================
// Runtime Configuration
// ============================================================================

/**
 * @brief Engine configuration, initialized from the constants above
 */
struct EngineConfig {
    std::string device_id;                          ///< Empty to use the persisted generated id
    std::string display_name;                       ///< Empty to use the hostname
    std::string device_type = "Desktop";
    std::vector<std::string> capabilities;          ///< Empty to advertise every plugin tag

    std::string data_directory;                     ///< Empty to use get_data_directory()
    std::string log_file;                           ///< Empty for console only
    std::string log_level = "info";

    std::string bind_address = "0.0.0.0";
    uint16_t session_port = DEFAULT_SESSION_PORT;   ///< 0 picks an ephemeral port
    uint16_t discovery_port = DEFAULT_DISCOVERY_PORT;
    std::string multicast_group = DEFAULT_MULTICAST_GROUP;
    bool discovery_enabled = true;                  ///< false: peers only arrive through ingest

    std::chrono::milliseconds announce_interval = ANNOUNCE_INTERVAL;
    std::chrono::milliseconds discovery_timeout = DISCOVERY_TIMEOUT;
    std::chrono::milliseconds connect_timeout = CONNECT_TIMEOUT;
    std::chrono::milliseconds pairing_timeout = PAIRING_TIMEOUT;
    std::chrono::milliseconds idle_timeout = IDLE_TIMEOUT;
    std::chrono::milliseconds keepalive_interval = KEEPALIVE_INTERVAL;
    std::chrono::milliseconds reconnect_initial_delay = RECONNECT_INITIAL_DELAY;
    std::chrono::milliseconds reconnect_max_delay = RECONNECT_MAX_DELAY;
    int max_reconnect_attempts = MAX_RECONNECT_ATTEMPTS;

    size_t max_frame_size = MAX_FRAME_SIZE;
    bool auto_accept_pairing = false;               ///< Accept requests carrying no proof
    size_t worker_threads = 2;
};

/**
 * @brief Load configuration from a JSON file
 *
 * Unknown keys are ignored, missing keys keep their defaults. Durations are
 * given in milliseconds with an "_ms" suffix (e.g. "idle_timeout_ms").
 *
 * @param path Path to JSON file
 * @return EngineConfig or std::nullopt if unreadable or malformed
 */
std::optional<EngineConfig> load_engine_config(const std::string& path);

/**
 * @brief Apply LANCONNECT_* environment overrides
 * @param config Configuration to update in place
 */
void apply_environment_overrides(EngineConfig& config);

// ============================================================================
// Directories
// ============================================================================

/**
 * @brief Get LANConnect data directory from environment or use default
 * @return Filesystem path to data directory
 */
std::filesystem::path get_data_directory();

/**
 * @brief Get database directory below a data directory
 */
std::filesystem::path get_database_directory(const std::filesystem::path& data_dir);

/**
 * @brief Get log directory below a data directory
 */
std::filesystem::path get_log_directory(const std::filesystem::path& data_dir);

// ============================================================================
// Validation
// ============================================================================

/**
 * @brief Validate identifier (alphanumeric plus '.', '_', ':' and '-')
 * @param identifier String to validate
 * @param max_length Maximum allowed length
 * @return true if valid, false otherwise
 */
bool validate_identifier(const std::string& identifier, size_t max_length = MAX_IDENTIFIER_LENGTH);

/**
 * @brief Validate display name (non-empty, bounded, no control characters)
 */
bool validate_display_name(const std::string& name);

} // namespace config
} // namespace lanconnect
