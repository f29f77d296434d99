/**
 * @file lanconnect_daemon.cpp
 * @brief Example CLI application using ConnectEngine
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates basic ConnectEngine usage:
 * - Start the engine and show the pairing code
 * - List discovered peers
 * - Pair, connect and disconnect
 * - Send clipboard text and pings
 */

#include "lanconnect/connect_engine.hpp"
#include "lanconnect/utilities.hpp"
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace lanconnect;
using namespace lanconnect::utilities;

static std::atomic<bool> g_shutdown(false);

// Only async-signal-safe work here; the command loop notices the flag
void signal_handler(int) {
    g_shutdown = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [config.json]\n\n";
    std::cout << "Environment:\n";
    std::cout << "  LANCONNECT_DATA_DIR        Data directory (trust store, device id)\n";
    std::cout << "  LANCONNECT_SESSION_PORT    TCP session port (default 1716)\n";
    std::cout << "  LANCONNECT_DISCOVERY_PORT  UDP discovery port (default 1717)\n";
    std::cout << "  LANCONNECT_LOG_LEVEL       debug | info | warn | error\n\n";
}

void print_help() {
    std::cout << "\nCommands:\n";
    std::cout << "  help                  Show this help menu\n";
    std::cout << "  code                  Show the pairing code of this device\n";
    std::cout << "  peers                 List discovered peers\n";
    std::cout << "  trusted               List paired peers\n";
    std::cout << "  requests              List pairing requests awaiting a decision\n";
    std::cout << "  rescan                Restart network discovery\n";
    std::cout << "  pair <peer> [code]    Pair with a peer\n";
    std::cout << "  accept <peer>         Accept a waiting pairing request\n";
    std::cout << "  reject <peer>         Reject a waiting pairing request\n";
    std::cout << "  connect <peer>        Open a session\n";
    std::cout << "  disconnect <peer>     Close a session\n";
    std::cout << "  clip <peer> <text>    Send clipboard text\n";
    std::cout << "  ping <peer>           Send a ping\n";
    std::cout << "  forget <peer>         Remove a paired peer\n";
    std::cout << "  forget-all            Remove every paired peer\n";
    std::cout << "  quit / exit           Shutdown\n\n";
}

void list_peers(ConnectEngine& engine) {
    auto peers = engine.get_peers();

    if (peers.empty()) {
        std::cout << "No peers discovered yet.\n";
        return;
    }

    for (const auto& peer : peers) {
        std::cout << "  " << std::left << std::setw(38) << peer.peer_id
                  << std::setw(24) << peer.display_name
                  << std::setw(10) << device_kind_to_string(peer.kind)
                  << peer.address << ":" << peer.port
                  << "  [" << session_state_to_string(engine.session_state(peer.peer_id)) << "]\n";
    }
}

void list_trusted(ConnectEngine& engine) {
    auto records = engine.list_trusted();

    if (records.empty()) {
        std::cout << "No paired peers.\n";
        return;
    }

    for (const auto& record : records) {
        std::cout << "  " << std::left << std::setw(38) << record.peer_id
                  << std::setw(24) << record.display_name
                  << format_timestamp(record.paired_at)
                  << (record.credential ? "  (code)" : "") << "\n";
    }
}

void report(const std::string& action, const Status& status) {
    if (status) {
        std::cout << "[OK] " << action << "\n";
    } else {
        std::cout << "[FAIL] " << action << ": " << error_code_to_string(status.code())
                  << " - " << status.error().message << "\n";
    }
}

bool handle_command(ConnectEngine& engine, const std::string& command_line) {
    if (command_line.empty()) {
        return true;
    }

    std::istringstream iss(command_line);
    std::string cmd;
    std::string peer_id;
    iss >> cmd >> peer_id;

    bool needs_peer = cmd == "pair" || cmd == "accept" || cmd == "reject" || cmd == "connect" ||
                      cmd == "disconnect" || cmd == "clip" || cmd == "ping" || cmd == "forget";
    if (needs_peer && peer_id.empty()) {
        std::cout << "Usage: " << cmd << " <peer_id>\n";
        return true;
    }

    if (cmd == "help" || cmd == "h" || cmd == "?") {
        print_help();
    }
    else if (cmd == "code") {
        std::cout << "Pairing code: " << engine.pairing_code() << "\n";
    }
    else if (cmd == "peers") {
        list_peers(engine);
    }
    else if (cmd == "trusted") {
        list_trusted(engine);
    }
    else if (cmd == "requests") {
        auto requests = engine.pending_pairing_requests();
        if (requests.empty()) {
            std::cout << "No pairing requests waiting.\n";
        }
        for (const auto& id : requests) {
            std::cout << "  " << id << "\n";
        }
    }
    else if (cmd == "rescan") {
        report("Restart discovery", engine.restart_discovery());
    }
    else if (cmd == "pair") {
        std::string code;
        iss >> code;

        std::cout << "Pairing with " << peer_id << "...\n";
        auto result = engine.pair(peer_id, code.empty() ? std::nullopt : std::optional<std::string>(code));
        if (result) {
            std::cout << "[OK] Paired with " << result.value().display_name << "\n";
        } else {
            std::cout << "[FAIL] " << error_code_to_string(result.error().code)
                      << " - " << result.error().message << "\n";
        }
    }
    else if (cmd == "accept") {
        report("Accept " + peer_id, engine.respond_to_pairing(peer_id, PairingDecision::accept()));
    }
    else if (cmd == "reject") {
        report("Reject " + peer_id, engine.respond_to_pairing(peer_id, PairingDecision::reject("declined by user")));
    }
    else if (cmd == "connect") {
        report("Connect " + peer_id, engine.connect(peer_id));
    }
    else if (cmd == "disconnect") {
        engine.disconnect(peer_id);
        std::cout << "[OK] Disconnected from " << peer_id << "\n";
    }
    else if (cmd == "clip") {
        std::string text;
        std::getline(iss, text);
        text = trim_string(text);
        report("Clipboard to " + peer_id, engine.send(peer_id, Envelope::clipboard_sync(text)));
    }
    else if (cmd == "ping") {
        report("Ping " + peer_id, engine.send(peer_id, Envelope::ping()));
    }
    else if (cmd == "forget") {
        if (engine.forget(peer_id)) {
            std::cout << "[OK] Forgot " << peer_id << "\n";
        } else {
            std::cout << "[FAIL] " << peer_id << " was not paired\n";
        }
    }
    else if (cmd == "forget-all") {
        if (engine.forget_all()) {
            std::cout << "[OK] Forgot all paired peers\n";
        } else {
            std::cout << "[FAIL] Could not clear the trust store\n";
        }
    }
    else if (cmd == "quit" || cmd == "exit") {
        return false;
    }
    else {
        std::cout << "Unknown command: " << cmd << "\n";
        std::cout << "Type 'help' for available commands\n";
    }

    return true;
}

int main(int argc, char* argv[]) {
    if (argc > 2 || (argc == 2 && (std::string(argv[1]) == "-h" || std::string(argv[1]) == "--help"))) {
        print_usage(argv[0]);
        return argc > 2 ? 1 : 0;
    }

    config::EngineConfig engine_config;
    if (argc == 2) {
        auto loaded = config::load_engine_config(argv[1]);
        if (!loaded) {
            std::cerr << "Could not load configuration from " << argv[1] << "\n";
            return 1;
        }
        engine_config = *loaded;
    }
    config::apply_environment_overrides(engine_config);

    if (engine_config.log_file.empty()) {
        std::filesystem::path data_dir = engine_config.data_directory.empty()
            ? config::get_data_directory()
            : std::filesystem::path(engine_config.data_directory);
        engine_config.log_file = (config::get_log_directory(data_dir) / "lanconnect.log").string();
    }

    initialize_logging(engine_config.log_file,
                       parse_log_level(engine_config.log_level).value_or(LogLevel::INFO));

    std::cout << "\nLANConnect daemon\n";
    std::cout << "Copyright © 2025 Fortified Solutions Inc.\n\n";

    try {
        ConnectEngine engine(engine_config);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        engine.discover([](const DiscoveryEvent& event) {
            if (event.type == DiscoveryEventType::PEER_APPEARED) {
                std::cout << "\n>>> Found " << event.record.display_name << " (" << event.record.peer_id
                          << ") at " << event.record.address << "\n> ";
            } else if (event.type == DiscoveryEventType::PEER_DISAPPEARED) {
                std::cout << "\n>>> Lost " << event.peer_id << "\n> ";
            }
            std::cout.flush();
        });

        engine.set_pairing_request_callback([](const PairingRequest& request, const std::string& address) {
            std::cout << "\n>>> Pairing request from " << request.name << " (" << request.id << ") at "
                      << address << (request.proof ? " with code" : "")
                      << " - 'accept " << request.id << "' or 'reject " << request.id << "'\n> ";
            std::cout.flush();
        });

        engine.set_session_state_callback([](const std::string& peer_id, SessionState state) {
            std::cout << "\n>>> " << peer_id << ": " << session_state_to_string(state) << "\n> ";
            std::cout.flush();
        });

        engine.register_handler(EnvelopeKind::CLIPBOARD_SYNC, [](const std::string& peer_id, const Envelope& envelope) {
            std::cout << "\n>>> Clipboard from " << peer_id << ": " << envelope.get<ClipboardSync>()->content << "\n> ";
            std::cout.flush();
        });

        engine.set_unhandled_message_callback([](const std::string& peer_id, const Envelope& envelope) {
            std::cout << "\n>>> Unhandled " << EnvelopeCodec::kind_to_tag(envelope.kind)
                      << " from " << peer_id << "\n> ";
            std::cout.flush();
        });

        if (!engine.start()) {
            std::cerr << "Failed to start engine\n";
            return 1;
        }

        std::thread event_loop([&engine]() {
            engine.run();
        });

        std::cout << "Device id:    " << engine.get_device_id() << "\n";
        std::cout << "Session port: " << engine.get_session_port() << "\n";
        std::cout << "Pairing code: " << engine.pairing_code() << "\n";
        print_help();

        std::string line;
        while (!g_shutdown && std::cout << "> " && std::getline(std::cin, line)) {
            if (!handle_command(engine, line)) {
                break;
            }
        }

        std::cout << "\nShutting down...\n";
        engine.stop();

        if (event_loop.joinable()) {
            event_loop.join();
        }

    } catch (const std::exception& e) {
        log_critical("Daemon: Fatal error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
