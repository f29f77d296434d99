/**
 * @file test_engine_config.cpp
 * @brief Unit tests for configuration loading, overrides and validation
 */

#include <gtest/gtest.h>
#include "lanconnect/engine_config.hpp"
#include "lanconnect/engine_errors.hpp"
#include "lanconnect/utilities.hpp"
#include <cstdlib>
#include <filesystem>

using namespace lanconnect;
using namespace lanconnect::config;
namespace fs = std::filesystem;

class EngineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() / "lanconnect_config_test";
        fs::create_directories(test_dir_);
        config_path_ = (test_dir_ / "engine.json").string();

        unsetenv("LANCONNECT_DATA_DIR");
        unsetenv("LANCONNECT_SESSION_PORT");
        unsetenv("LANCONNECT_DISCOVERY_PORT");
        unsetenv("LANCONNECT_LOG_LEVEL");
    }

    void TearDown() override {
        unsetenv("LANCONNECT_DATA_DIR");
        unsetenv("LANCONNECT_SESSION_PORT");
        unsetenv("LANCONNECT_DISCOVERY_PORT");
        unsetenv("LANCONNECT_LOG_LEVEL");

        if (fs::exists(test_dir_)) {
            fs::remove_all(test_dir_);
        }
    }

    fs::path test_dir_;
    std::string config_path_;
};

// ============================================================================
// Defaults
// ============================================================================

TEST_F(EngineConfigTest, DefaultsMatchConstants) {
    EngineConfig config;

    EXPECT_EQ(config.session_port, 1716);
    EXPECT_EQ(config.discovery_port, DEFAULT_DISCOVERY_PORT);
    EXPECT_EQ(config.multicast_group, "239.255.17.16");
    EXPECT_EQ(config.max_frame_size, 64u * 1024 * 1024);
    EXPECT_EQ(config.connect_timeout, std::chrono::seconds(10));
    EXPECT_EQ(config.pairing_timeout, std::chrono::seconds(10));
    EXPECT_EQ(config.reconnect_initial_delay, std::chrono::seconds(1));
    EXPECT_EQ(config.reconnect_max_delay, std::chrono::seconds(60));
    EXPECT_TRUE(config.discovery_enabled);
    EXPECT_FALSE(config.auto_accept_pairing);
}

// ============================================================================
// JSON Loading
// ============================================================================

TEST_F(EngineConfigTest, LoadOverridesOnlyGivenKeys) {
    ASSERT_TRUE(utilities::write_file(config_path_, R"({
        "display_name": "Study PC",
        "session_port": 0,
        "idle_timeout_ms": 1500,
        "auto_accept_pairing": true,
        "capabilities": ["ClipboardSync"],
        "some_future_key": {"ignored": true}
    })"));

    auto config = load_engine_config(config_path_);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->display_name, "Study PC");
    EXPECT_EQ(config->session_port, 0);
    EXPECT_EQ(config->idle_timeout, std::chrono::milliseconds(1500));
    EXPECT_TRUE(config->auto_accept_pairing);
    EXPECT_EQ(config->capabilities, std::vector<std::string>{"ClipboardSync"});
    EXPECT_EQ(config->discovery_port, DEFAULT_DISCOVERY_PORT);
    EXPECT_EQ(config->keepalive_interval, KEEPALIVE_INTERVAL);
}

TEST_F(EngineConfigTest, LoadMissingFileFails) {
    EXPECT_FALSE(load_engine_config((test_dir_ / "missing.json").string()).has_value());
}

TEST_F(EngineConfigTest, LoadMalformedFileFails) {
    ASSERT_TRUE(utilities::write_file(config_path_, "{ not json"));
    EXPECT_FALSE(load_engine_config(config_path_).has_value());

    ASSERT_TRUE(utilities::write_file(config_path_, "[1, 2]"));
    EXPECT_FALSE(load_engine_config(config_path_).has_value());

    ASSERT_TRUE(utilities::write_file(config_path_, R"({"session_port": "high"})"));
    EXPECT_FALSE(load_engine_config(config_path_).has_value());
}

TEST_F(EngineConfigTest, ZeroWorkerThreadsBecomesOne) {
    ASSERT_TRUE(utilities::write_file(config_path_, R"({"worker_threads": 0})"));

    auto config = load_engine_config(config_path_);

    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->worker_threads, 1u);
}

// ============================================================================
// Environment Overrides
// ============================================================================

TEST_F(EngineConfigTest, EnvironmentOverrides) {
    setenv("LANCONNECT_DATA_DIR", test_dir_.c_str(), 1);
    setenv("LANCONNECT_SESSION_PORT", "42000", 1);
    setenv("LANCONNECT_DISCOVERY_PORT", "42001", 1);
    setenv("LANCONNECT_LOG_LEVEL", "debug", 1);

    EngineConfig config;
    apply_environment_overrides(config);

    EXPECT_EQ(config.data_directory, test_dir_.string());
    EXPECT_EQ(config.session_port, 42000);
    EXPECT_EQ(config.discovery_port, 42001);
    EXPECT_EQ(config.log_level, "debug");
}

TEST_F(EngineConfigTest, InvalidPortOverrideIgnored) {
    setenv("LANCONNECT_SESSION_PORT", "70000", 1);
    setenv("LANCONNECT_DISCOVERY_PORT", "port", 1);

    EngineConfig config;
    apply_environment_overrides(config);

    EXPECT_EQ(config.session_port, DEFAULT_SESSION_PORT);
    EXPECT_EQ(config.discovery_port, DEFAULT_DISCOVERY_PORT);
}

TEST_F(EngineConfigTest, DataDirectoryFromEnvironment) {
    fs::path data_dir = test_dir_ / "data";
    setenv("LANCONNECT_DATA_DIR", data_dir.c_str(), 1);

    EXPECT_EQ(get_data_directory(), data_dir);
    EXPECT_TRUE(fs::exists(data_dir));
    EXPECT_EQ(get_database_directory(data_dir), data_dir / "db");
    EXPECT_TRUE(fs::exists(data_dir / "db"));
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(EngineConfigTest, ValidIdentifiers) {
    EXPECT_TRUE(validate_identifier("device-1"));
    EXPECT_TRUE(validate_identifier("6f1c2a3e-0b4d-4c55-9e77-123456789abc"));
    EXPECT_TRUE(validate_identifier("host.local:1716"));
    EXPECT_TRUE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH, 'a')));
}

TEST_F(EngineConfigTest, InvalidIdentifiers) {
    EXPECT_FALSE(validate_identifier(""));
    EXPECT_FALSE(validate_identifier("has space"));
    EXPECT_FALSE(validate_identifier("../etc/passwd"));
    EXPECT_FALSE(validate_identifier("semi;colon"));
    EXPECT_FALSE(validate_identifier(std::string(MAX_IDENTIFIER_LENGTH + 1, 'a')));
}

TEST_F(EngineConfigTest, DisplayNames) {
    EXPECT_TRUE(validate_display_name("Alice's Phone"));
    EXPECT_TRUE(validate_display_name("Bureau \xC3\xA9t\xC3\xA9"));
    EXPECT_FALSE(validate_display_name(""));
    EXPECT_FALSE(validate_display_name("line\nbreak"));
    EXPECT_FALSE(validate_display_name(std::string(MAX_DISPLAY_NAME_LENGTH + 1, 'n')));
}

// ============================================================================
// Error Names
// ============================================================================

TEST_F(EngineConfigTest, ErrorCodeNames) {
    EXPECT_EQ(error_code_to_string(ErrorCode::PAIRING_TIMED_OUT), "PairingTimedOut");
    EXPECT_EQ(error_code_to_string(ErrorCode::NOT_PAIRED), "NotPaired");
    EXPECT_EQ(error_code_to_string(ErrorCode::PAYLOAD_TOO_LARGE), "PayloadTooLarge");
}

TEST_F(EngineConfigTest, ResultAndStatus) {
    auto ok = Result<int>::success(7);
    EXPECT_TRUE(ok.ok());
    EXPECT_EQ(ok.value(), 7);
    EXPECT_THROW(ok.error(), std::logic_error);

    auto failed = Result<int>::failure(ErrorCode::UNKNOWN_PEER, "gone");
    EXPECT_FALSE(failed.ok());
    EXPECT_EQ(failed.error().code, ErrorCode::UNKNOWN_PEER);
    EXPECT_THROW(failed.value(), std::logic_error);

    EXPECT_TRUE(Status::success().ok());
    EXPECT_EQ(Status::failure(ErrorCode::NOT_CONNECTED).code(), ErrorCode::NOT_CONNECTED);
}
