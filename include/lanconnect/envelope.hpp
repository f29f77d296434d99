/**
 * @file envelope.hpp
 * @brief Message envelope types and newline-delimited JSON codec
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Every frame on a session stream is one JSON document followed by '\n'.
 * Variants are externally tagged: unit variants encode as a bare string
 * ("Ping"), all others as a single-key object ({"ClipboardSync": "text"}).
 * Unrecognized tags decode to an Unknown envelope carrying the raw frame.
 */

#pragma once

#include "lanconnect/engine_config.hpp"
#include "lanconnect/engine_errors.hpp"

#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>

namespace lanconnect {

/**
 * @brief Envelope kinds on the wire
 */
enum class EnvelopeKind {
    // Core
    PING,                    ///< Liveness probe, answered with PONG
    PONG,                    ///< Liveness answer
    DEVICE_INFO,             ///< First frame of a trusted session
    PAIRING_REQUEST,         ///< Initiator asks to pair
    PAIRING_ACCEPTED,        ///< Responder accepted (trust record written first)
    PAIRING_REJECTED,        ///< Responder declined
    DISCONNECT,              ///< Farewell before a clean close

    // Clipboard
    CLIPBOARD_SYNC,
    REQUEST_CLIPBOARD,

    // File transfer
    FILE_TRANSFER_REQUEST,
    FILE_TRANSFER_CHUNK,
    FILE_TRANSFER_END,
    FILE_TRANSFER_ERROR,

    // Input
    KEY_EVENT,
    MOUSE_EVENT,
    TOUCHPAD_EVENT,

    // Device integration
    NOTIFICATION,
    MEDIA_CONTROL,
    BATTERY_STATUS,
    REMOTE_COMMAND,
    SLIDE_CONTROL,

    UNKNOWN                  ///< Tag not recognized by this version
};

// ============================================================================
// Payloads
// ============================================================================

/**
 * @brief Identity a peer presents when opening a session
 */
struct DeviceInfo {
    std::string id;
    std::string name;
    std::string device_type;                ///< "Desktop", "Laptop", "Mobile", "Tablet"
    std::vector<std::string> capabilities;  ///< Plugin tags

    bool operator==(const DeviceInfo& other) const {
        return id == other.id && name == other.name &&
               device_type == other.device_type && capabilities == other.capabilities;
    }
};

/**
 * @brief Pairing request carrying the initiator's identity and optional proof
 */
struct PairingRequest {
    std::string id;
    std::string name;
    std::string device_type;
    std::vector<std::string> capabilities;
    std::optional<std::string> proof;       ///< User-entered pairing code

    bool operator==(const PairingRequest& other) const {
        return id == other.id && name == other.name && device_type == other.device_type &&
               capabilities == other.capabilities && proof == other.proof;
    }
};

/**
 * @brief Answer to a pairing request (accepted or rejected)
 */
struct PairingResponse {
    std::string peer_id;                    ///< Responder's id
    std::optional<std::string> reason;

    bool operator==(const PairingResponse& other) const {
        return peer_id == other.peer_id && reason == other.reason;
    }
};

struct ClipboardSync {
    std::string content;

    bool operator==(const ClipboardSync& other) const { return content == other.content; }
};

struct FileTransferRequest {
    std::string file_name;
    uint64_t file_size = 0;

    bool operator==(const FileTransferRequest& other) const {
        return file_name == other.file_name && file_size == other.file_size;
    }
};

struct FileTransferChunk {
    std::string file_name;
    std::vector<uint8_t> chunk;
    uint64_t offset = 0;

    bool operator==(const FileTransferChunk& other) const {
        return file_name == other.file_name && chunk == other.chunk && offset == other.offset;
    }
};

struct FileTransferEnd {
    std::string file_name;

    bool operator==(const FileTransferEnd& other) const { return file_name == other.file_name; }
};

struct FileTransferError {
    std::string file_name;
    std::string error;

    bool operator==(const FileTransferError& other) const {
        return file_name == other.file_name && error == other.error;
    }
};

enum class KeyAction {
    PRESS,
    RELEASE
};

struct KeyEvent {
    KeyAction action = KeyAction::PRESS;
    std::string code;                       ///< Key name, e.g. "A", "Key0", "Enter"

    bool operator==(const KeyEvent& other) const {
        return action == other.action && code == other.code;
    }
};

enum class MouseAction {
    MOVE,
    PRESS,
    RELEASE,
    SCROLL
};

struct MouseEvent {
    MouseAction action = MouseAction::MOVE;
    int32_t x = 0;
    int32_t y = 0;
    std::optional<std::string> button;      ///< "Left", "Right", "Middle"
    std::optional<double> scroll_delta;

    bool operator==(const MouseEvent& other) const {
        return action == other.action && x == other.x && y == other.y &&
               button == other.button && scroll_delta == other.scroll_delta;
    }
};

struct TouchpadEvent {
    int32_t x = 0;
    int32_t y = 0;
    int32_t dx = 0;
    int32_t dy = 0;
    int32_t scroll_delta_x = 0;
    int32_t scroll_delta_y = 0;
    bool is_left_click = false;
    bool is_right_click = false;

    bool operator==(const TouchpadEvent& other) const {
        return x == other.x && y == other.y && dx == other.dx && dy == other.dy &&
               scroll_delta_x == other.scroll_delta_x && scroll_delta_y == other.scroll_delta_y &&
               is_left_click == other.is_left_click && is_right_click == other.is_right_click;
    }
};

struct Notification {
    std::string title;
    std::string body;
    std::optional<std::string> app_name;

    bool operator==(const Notification& other) const {
        return title == other.title && body == other.body && app_name == other.app_name;
    }
};

struct MediaControl {
    std::string action;                     ///< "Play", "Pause", "Next", ...

    bool operator==(const MediaControl& other) const { return action == other.action; }
};

struct BatteryStatus {
    int charge = 0;                         ///< Percent, 0-100
    bool is_charging = false;

    bool operator==(const BatteryStatus& other) const {
        return charge == other.charge && is_charging == other.is_charging;
    }
};

struct RemoteCommand {
    std::string command;
    std::vector<std::string> args;

    bool operator==(const RemoteCommand& other) const {
        return command == other.command && args == other.args;
    }
};

struct SlideControl {
    std::string action;                     ///< "Next", "Previous", ...

    bool operator==(const SlideControl& other) const { return action == other.action; }
};

/**
 * @brief Frame whose tag this version does not know
 */
struct UnknownMessage {
    std::string tag;
    std::string raw;                        ///< Complete frame text without the newline

    bool operator==(const UnknownMessage& other) const {
        return tag == other.tag && raw == other.raw;
    }
};

using EnvelopePayload = std::variant<
    std::monostate,
    DeviceInfo,
    PairingRequest,
    PairingResponse,
    ClipboardSync,
    FileTransferRequest,
    FileTransferChunk,
    FileTransferEnd,
    FileTransferError,
    KeyEvent,
    MouseEvent,
    TouchpadEvent,
    Notification,
    MediaControl,
    BatteryStatus,
    RemoteCommand,
    SlideControl,
    UnknownMessage
>;

// ============================================================================
// Envelope
// ============================================================================

/**
 * @brief Tagged wire unit; the kind determines the payload alternative
 *
 * Construct through the named factories so kind and payload always agree.
 */
struct Envelope {
    EnvelopeKind kind = EnvelopeKind::PING;
    EnvelopePayload payload;

    static Envelope ping();
    static Envelope pong();
    static Envelope disconnect();
    static Envelope request_clipboard();
    static Envelope device_info(DeviceInfo info);
    static Envelope pairing_request(PairingRequest request);
    static Envelope pairing_accepted(std::string peer_id, std::optional<std::string> reason = std::nullopt);
    static Envelope pairing_rejected(std::string peer_id, std::optional<std::string> reason = std::nullopt);
    static Envelope clipboard_sync(std::string content);
    static Envelope file_transfer_request(FileTransferRequest request);
    static Envelope file_transfer_chunk(FileTransferChunk chunk);
    static Envelope file_transfer_end(std::string file_name);
    static Envelope file_transfer_error(std::string file_name, std::string error);
    static Envelope key_event(KeyEvent event);
    static Envelope mouse_event(MouseEvent event);
    static Envelope touchpad_event(TouchpadEvent event);
    static Envelope notification(Notification notification);
    static Envelope media_control(std::string action);
    static Envelope battery_status(BatteryStatus status);
    static Envelope remote_command(std::string command, std::vector<std::string> args = {});
    static Envelope slide_control(std::string action);
    static Envelope unknown(std::string tag, std::string raw);

    /**
     * @brief Payload as T, or nullptr if the payload holds another alternative
     */
    template <typename T>
    const T* get() const {
        return std::get_if<T>(&payload);
    }

    bool operator==(const Envelope& other) const {
        return kind == other.kind && payload == other.payload;
    }

    bool operator!=(const Envelope& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Codec
// ============================================================================

/**
 * @brief Stateless translation between envelopes and frames
 */
class EnvelopeCodec {
public:
    /**
     * @brief Encode envelope as one frame, newline included
     * @param envelope Envelope to encode
     * @param max_frame_size Cap on the serialized JSON size
     * @return Frame or PAYLOAD_TOO_LARGE
     */
    static Result<std::string> encode(
        const Envelope& envelope,
        size_t max_frame_size = config::MAX_FRAME_SIZE
    );

    /**
     * @brief Decode one frame (trailing "\n" or "\r\n" tolerated)
     * @param frame Frame text
     * @return Envelope (UNKNOWN for unrecognized tags) or DECODE_ERROR
     */
    static Result<Envelope> decode(const std::string& frame);

    /**
     * @brief Wire tag for a kind (e.g. "ClipboardSync")
     */
    static std::string kind_to_tag(EnvelopeKind kind);

    /**
     * @brief Kind for a wire tag
     * @return EnvelopeKind or std::nullopt if the tag is not recognized
     */
    static std::optional<EnvelopeKind> tag_to_kind(const std::string& tag);
};

/**
 * @brief Reassembles newline-delimited frames from arbitrarily split reads
 *
 * Frames longer than the cap are discarded up to their terminating newline
 * and counted; the stream stays usable afterwards.
 */
class FrameAssembler {
public:
    explicit FrameAssembler(size_t max_frame_size = config::MAX_FRAME_SIZE);

    /**
     * @brief Append received bytes
     */
    void append(const char* data, size_t size);

    /**
     * @brief Pop the next complete frame (without its newline)
     * @return Frame or std::nullopt if none is complete yet
     */
    std::optional<std::string> next_frame();

    /**
     * @brief Number of oversized frames dropped since the last call
     */
    size_t take_oversized_count();

    /**
     * @brief Bytes held for an incomplete frame
     */
    size_t buffered_bytes() const;

private:
    void enforce_limit();

    size_t max_frame_size_;
    std::string buffer_;
    bool discarding_;
    size_t oversized_count_;
};

} // namespace lanconnect
