/**
 * @file envelope.cpp
 * @brief Implementation of envelope factories, codec and frame assembly
 *
 * LANConnect - Local network device pairing and session engine
 * Copyright © 2025 Fortified Solutions Inc.
 *
 */

#include "lanconnect/envelope.hpp"
#include "lanconnect/json_numbers.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <stdexcept>

using json = nlohmann::json;

namespace lanconnect {

namespace {

// Key names from older peers, accepted on decode only
constexpr const char* LEGACY_PAIRING_WITH_KEY_TAG = "RequestPairingWithKey";

struct TagEntry {
    EnvelopeKind kind;
    const char* tag;
};

const TagEntry TAG_TABLE[] = {
    {EnvelopeKind::PING, "Ping"},
    {EnvelopeKind::PONG, "Pong"},
    {EnvelopeKind::DEVICE_INFO, "DeviceInfo"},
    {EnvelopeKind::PAIRING_REQUEST, "RequestPairing"},
    {EnvelopeKind::PAIRING_ACCEPTED, "PairingAccepted"},
    {EnvelopeKind::PAIRING_REJECTED, "PairingRejected"},
    {EnvelopeKind::DISCONNECT, "Disconnect"},
    {EnvelopeKind::CLIPBOARD_SYNC, "ClipboardSync"},
    {EnvelopeKind::REQUEST_CLIPBOARD, "RequestClipboard"},
    {EnvelopeKind::FILE_TRANSFER_REQUEST, "FileTransferRequest"},
    {EnvelopeKind::FILE_TRANSFER_CHUNK, "FileTransferChunk"},
    {EnvelopeKind::FILE_TRANSFER_END, "FileTransferEnd"},
    {EnvelopeKind::FILE_TRANSFER_ERROR, "FileTransferError"},
    {EnvelopeKind::KEY_EVENT, "KeyEvent"},
    {EnvelopeKind::MOUSE_EVENT, "MouseEvent"},
    {EnvelopeKind::TOUCHPAD_EVENT, "TouchpadEvent"},
    {EnvelopeKind::NOTIFICATION, "Notification"},
    {EnvelopeKind::MEDIA_CONTROL, "MediaControl"},
    {EnvelopeKind::BATTERY_STATUS, "BatteryStatus"},
    {EnvelopeKind::REMOTE_COMMAND, "RemoteCommand"},
    {EnvelopeKind::SLIDE_CONTROL, "SlideControl"},
};

bool is_unit_kind(EnvelopeKind kind) {
    return kind == EnvelopeKind::PING || kind == EnvelopeKind::PONG ||
           kind == EnvelopeKind::DISCONNECT || kind == EnvelopeKind::REQUEST_CLIPBOARD;
}

std::string key_action_to_string(KeyAction action) {
    return action == KeyAction::PRESS ? "Press" : "Release";
}

KeyAction key_action_from_string(const std::string& text) {
    if (text == "Press") return KeyAction::PRESS;
    if (text == "Release") return KeyAction::RELEASE;
    throw std::invalid_argument("unknown key action '" + text + "'");
}

std::string mouse_action_to_string(MouseAction action) {
    switch (action) {
        case MouseAction::MOVE: return "Move";
        case MouseAction::PRESS: return "Press";
        case MouseAction::RELEASE: return "Release";
        case MouseAction::SCROLL: return "Scroll";
    }
    return "Move";
}

MouseAction mouse_action_from_string(const std::string& text) {
    if (text == "Move") return MouseAction::MOVE;
    if (text == "Press") return MouseAction::PRESS;
    if (text == "Release") return MouseAction::RELEASE;
    if (text == "Scroll") return MouseAction::SCROLL;
    throw std::invalid_argument("unknown mouse action '" + text + "'");
}

json optional_to_json(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

template <typename T>
std::optional<T> optional_field(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

// ============================================================================
// Payload -> JSON
// ============================================================================

json payload_to_json(const Envelope& envelope) {
    switch (envelope.kind) {
        case EnvelopeKind::DEVICE_INFO: {
            const auto& info = std::get<DeviceInfo>(envelope.payload);
            return json{{"id", info.id}, {"name", info.name},
                        {"device_type", info.device_type}, {"capabilities", info.capabilities}};
        }
        case EnvelopeKind::PAIRING_REQUEST: {
            const auto& request = std::get<PairingRequest>(envelope.payload);
            json j{{"id", request.id}, {"name", request.name},
                   {"device_type", request.device_type}, {"capabilities", request.capabilities}};
            if (request.proof) {
                j["proof"] = *request.proof;
            }
            return j;
        }
        case EnvelopeKind::PAIRING_ACCEPTED:
        case EnvelopeKind::PAIRING_REJECTED: {
            const auto& response = std::get<PairingResponse>(envelope.payload);
            json j{{"peer_id", response.peer_id}};
            if (response.reason) {
                j["reason"] = *response.reason;
            }
            return j;
        }
        case EnvelopeKind::CLIPBOARD_SYNC:
            return json(std::get<ClipboardSync>(envelope.payload).content);
        case EnvelopeKind::FILE_TRANSFER_REQUEST: {
            const auto& request = std::get<FileTransferRequest>(envelope.payload);
            return json{{"file_name", request.file_name}, {"file_size", request.file_size}};
        }
        case EnvelopeKind::FILE_TRANSFER_CHUNK: {
            const auto& chunk = std::get<FileTransferChunk>(envelope.payload);
            return json{{"file_name", chunk.file_name}, {"chunk", chunk.chunk}, {"offset", chunk.offset}};
        }
        case EnvelopeKind::FILE_TRANSFER_END:
            return json{{"file_name", std::get<FileTransferEnd>(envelope.payload).file_name}};
        case EnvelopeKind::FILE_TRANSFER_ERROR: {
            const auto& error = std::get<FileTransferError>(envelope.payload);
            return json{{"file_name", error.file_name}, {"error", error.error}};
        }
        case EnvelopeKind::KEY_EVENT: {
            const auto& event = std::get<KeyEvent>(envelope.payload);
            return json{{"action", key_action_to_string(event.action)}, {"code", event.code}};
        }
        case EnvelopeKind::MOUSE_EVENT: {
            const auto& event = std::get<MouseEvent>(envelope.payload);
            // JSON has no NaN or infinity; nlohmann would write null
            if (event.scroll_delta && !std::isfinite(*event.scroll_delta)) {
                throw std::invalid_argument("scroll_delta is not a finite number");
            }
            return json{{"action", mouse_action_to_string(event.action)},
                        {"x", event.x}, {"y", event.y},
                        {"button", optional_to_json(event.button)},
                        {"scroll_delta", event.scroll_delta ? json(*event.scroll_delta) : json(nullptr)}};
        }
        case EnvelopeKind::TOUCHPAD_EVENT: {
            const auto& event = std::get<TouchpadEvent>(envelope.payload);
            return json{{"x", event.x}, {"y", event.y}, {"dx", event.dx}, {"dy", event.dy},
                        {"scroll_delta_x", event.scroll_delta_x},
                        {"scroll_delta_y", event.scroll_delta_y},
                        {"is_left_click", event.is_left_click},
                        {"is_right_click", event.is_right_click}};
        }
        case EnvelopeKind::NOTIFICATION: {
            const auto& notification = std::get<Notification>(envelope.payload);
            return json{{"title", notification.title}, {"body", notification.body},
                        {"app_name", optional_to_json(notification.app_name)}};
        }
        case EnvelopeKind::MEDIA_CONTROL:
            return json{{"action", std::get<MediaControl>(envelope.payload).action}};
        case EnvelopeKind::BATTERY_STATUS: {
            const auto& status = std::get<BatteryStatus>(envelope.payload);
            return json{{"charge", status.charge}, {"is_charging", status.is_charging}};
        }
        case EnvelopeKind::REMOTE_COMMAND: {
            const auto& command = std::get<RemoteCommand>(envelope.payload);
            return json{{"command", command.command}, {"args", command.args}};
        }
        case EnvelopeKind::SLIDE_CONTROL:
            return json{{"action", std::get<SlideControl>(envelope.payload).action}};
        default:
            throw std::logic_error("kind has no payload");
    }
}

// ============================================================================
// JSON -> Payload
// ============================================================================

Envelope payload_from_json(EnvelopeKind kind, const json& body) {
    switch (kind) {
        case EnvelopeKind::DEVICE_INFO: {
            DeviceInfo info;
            info.id = body.at("id").get<std::string>();
            info.name = body.at("name").get<std::string>();
            info.device_type = body.at("device_type").get<std::string>();
            info.capabilities = body.value("capabilities", std::vector<std::string>{});
            return Envelope::device_info(std::move(info));
        }
        case EnvelopeKind::PAIRING_REQUEST: {
            PairingRequest request;
            request.id = body.at("id").get<std::string>();
            request.name = body.at("name").get<std::string>();
            request.device_type = body.at("device_type").get<std::string>();
            request.capabilities = body.value("capabilities", std::vector<std::string>{});
            request.proof = optional_field<std::string>(body, "proof");
            if (!request.proof) {
                request.proof = optional_field<std::string>(body, "pairing_key");
            }
            return Envelope::pairing_request(std::move(request));
        }
        case EnvelopeKind::PAIRING_ACCEPTED:
        case EnvelopeKind::PAIRING_REJECTED: {
            std::string peer_id;
            std::optional<std::string> reason;
            if (body.is_string()) {
                peer_id = body.get<std::string>();
            } else {
                auto id = optional_field<std::string>(body, "peer_id");
                if (!id) {
                    id = optional_field<std::string>(body, "device_id");
                }
                if (!id) {
                    throw std::invalid_argument("pairing response without peer_id");
                }
                peer_id = *id;
                reason = optional_field<std::string>(body, "reason");
            }
            return kind == EnvelopeKind::PAIRING_ACCEPTED
                ? Envelope::pairing_accepted(std::move(peer_id), std::move(reason))
                : Envelope::pairing_rejected(std::move(peer_id), std::move(reason));
        }
        case EnvelopeKind::CLIPBOARD_SYNC:
            return Envelope::clipboard_sync(body.get<std::string>());
        case EnvelopeKind::FILE_TRANSFER_REQUEST: {
            FileTransferRequest request;
            request.file_name = body.at("file_name").get<std::string>();
            request.file_size = json_integer<uint64_t>(body.at("file_size"), "file_size");
            return Envelope::file_transfer_request(std::move(request));
        }
        case EnvelopeKind::FILE_TRANSFER_CHUNK: {
            FileTransferChunk chunk;
            chunk.file_name = body.at("file_name").get<std::string>();
            const json& bytes = body.at("chunk");
            if (!bytes.is_array()) {
                throw std::invalid_argument("chunk is not an array");
            }
            for (const auto& byte : bytes) {
                chunk.chunk.push_back(json_integer<uint8_t>(byte, "chunk byte"));
            }
            chunk.offset = json_integer<uint64_t>(body.at("offset"), "offset");
            return Envelope::file_transfer_chunk(std::move(chunk));
        }
        case EnvelopeKind::FILE_TRANSFER_END:
            return Envelope::file_transfer_end(body.at("file_name").get<std::string>());
        case EnvelopeKind::FILE_TRANSFER_ERROR:
            return Envelope::file_transfer_error(
                body.at("file_name").get<std::string>(),
                body.at("error").get<std::string>());
        case EnvelopeKind::KEY_EVENT: {
            KeyEvent event;
            event.action = key_action_from_string(body.at("action").get<std::string>());
            event.code = body.at("code").get<std::string>();
            return Envelope::key_event(std::move(event));
        }
        case EnvelopeKind::MOUSE_EVENT: {
            MouseEvent event;
            event.action = mouse_action_from_string(body.at("action").get<std::string>());
            event.x = json_integer<int32_t>(body.at("x"), "x");
            event.y = json_integer<int32_t>(body.at("y"), "y");
            event.button = optional_field<std::string>(body, "button");
            auto scroll = body.find("scroll_delta");
            if (scroll != body.end() && !scroll->is_null()) {
                if (!scroll->is_number()) {
                    throw std::invalid_argument("scroll_delta is not a number");
                }
                event.scroll_delta = scroll->get<double>();
            }
            return Envelope::mouse_event(std::move(event));
        }
        case EnvelopeKind::TOUCHPAD_EVENT: {
            TouchpadEvent event;
            event.x = json_integer<int32_t>(body.at("x"), "x");
            event.y = json_integer<int32_t>(body.at("y"), "y");
            event.dx = json_integer<int32_t>(body.at("dx"), "dx");
            event.dy = json_integer<int32_t>(body.at("dy"), "dy");
            event.scroll_delta_x = json_integer_or<int32_t>(body, "scroll_delta_x", 0);
            event.scroll_delta_y = json_integer_or<int32_t>(body, "scroll_delta_y", 0);
            event.is_left_click = body.value("is_left_click", false);
            event.is_right_click = body.value("is_right_click", false);
            return Envelope::touchpad_event(event);
        }
        case EnvelopeKind::NOTIFICATION: {
            Notification notification;
            notification.title = body.at("title").get<std::string>();
            notification.body = body.at("body").get<std::string>();
            notification.app_name = optional_field<std::string>(body, "app_name");
            return Envelope::notification(std::move(notification));
        }
        case EnvelopeKind::MEDIA_CONTROL:
            return Envelope::media_control(body.at("action").get<std::string>());
        case EnvelopeKind::BATTERY_STATUS: {
            const json& charge_value = body.at("charge");
            if (!charge_value.is_number()) {
                throw std::invalid_argument("battery charge is not a number");
            }
            double charge = charge_value.get<double>();
            if (charge < 0.0 || charge > 100.0) {
                throw std::invalid_argument("battery charge out of range");
            }
            BatteryStatus status;
            status.charge = static_cast<int>(std::lround(charge));
            status.is_charging = body.at("is_charging").get<bool>();
            return Envelope::battery_status(status);
        }
        case EnvelopeKind::REMOTE_COMMAND:
            return Envelope::remote_command(
                body.at("command").get<std::string>(),
                body.value("args", std::vector<std::string>{}));
        case EnvelopeKind::SLIDE_CONTROL:
            // Older peers send the action as a bare string
            if (body.is_string()) {
                return Envelope::slide_control(body.get<std::string>());
            }
            return Envelope::slide_control(body.at("action").get<std::string>());
        default:
            throw std::logic_error("kind has no payload");
    }
}

Envelope make_unit(EnvelopeKind kind) {
    Envelope envelope;
    envelope.kind = kind;
    envelope.payload = std::monostate{};
    return envelope;
}

template <typename T>
Envelope make(EnvelopeKind kind, T payload) {
    Envelope envelope;
    envelope.kind = kind;
    envelope.payload = std::move(payload);
    return envelope;
}

} // namespace

// ============================================================================
// Envelope Factories
// ============================================================================

Envelope Envelope::ping() { return make_unit(EnvelopeKind::PING); }
Envelope Envelope::pong() { return make_unit(EnvelopeKind::PONG); }
Envelope Envelope::disconnect() { return make_unit(EnvelopeKind::DISCONNECT); }
Envelope Envelope::request_clipboard() { return make_unit(EnvelopeKind::REQUEST_CLIPBOARD); }

Envelope Envelope::device_info(DeviceInfo info) {
    return make(EnvelopeKind::DEVICE_INFO, std::move(info));
}

Envelope Envelope::pairing_request(PairingRequest request) {
    return make(EnvelopeKind::PAIRING_REQUEST, std::move(request));
}

Envelope Envelope::pairing_accepted(std::string peer_id, std::optional<std::string> reason) {
    return make(EnvelopeKind::PAIRING_ACCEPTED, PairingResponse{std::move(peer_id), std::move(reason)});
}

Envelope Envelope::pairing_rejected(std::string peer_id, std::optional<std::string> reason) {
    return make(EnvelopeKind::PAIRING_REJECTED, PairingResponse{std::move(peer_id), std::move(reason)});
}

Envelope Envelope::clipboard_sync(std::string content) {
    return make(EnvelopeKind::CLIPBOARD_SYNC, ClipboardSync{std::move(content)});
}

Envelope Envelope::file_transfer_request(FileTransferRequest request) {
    return make(EnvelopeKind::FILE_TRANSFER_REQUEST, std::move(request));
}

Envelope Envelope::file_transfer_chunk(FileTransferChunk chunk) {
    return make(EnvelopeKind::FILE_TRANSFER_CHUNK, std::move(chunk));
}

Envelope Envelope::file_transfer_end(std::string file_name) {
    return make(EnvelopeKind::FILE_TRANSFER_END, FileTransferEnd{std::move(file_name)});
}

Envelope Envelope::file_transfer_error(std::string file_name, std::string error) {
    return make(EnvelopeKind::FILE_TRANSFER_ERROR, FileTransferError{std::move(file_name), std::move(error)});
}

Envelope Envelope::key_event(KeyEvent event) {
    return make(EnvelopeKind::KEY_EVENT, std::move(event));
}

Envelope Envelope::mouse_event(MouseEvent event) {
    return make(EnvelopeKind::MOUSE_EVENT, std::move(event));
}

Envelope Envelope::touchpad_event(TouchpadEvent event) {
    return make(EnvelopeKind::TOUCHPAD_EVENT, event);
}

Envelope Envelope::notification(Notification notification) {
    return make(EnvelopeKind::NOTIFICATION, std::move(notification));
}

Envelope Envelope::media_control(std::string action) {
    return make(EnvelopeKind::MEDIA_CONTROL, MediaControl{std::move(action)});
}

Envelope Envelope::battery_status(BatteryStatus status) {
    return make(EnvelopeKind::BATTERY_STATUS, status);
}

Envelope Envelope::remote_command(std::string command, std::vector<std::string> args) {
    return make(EnvelopeKind::REMOTE_COMMAND, RemoteCommand{std::move(command), std::move(args)});
}

Envelope Envelope::slide_control(std::string action) {
    return make(EnvelopeKind::SLIDE_CONTROL, SlideControl{std::move(action)});
}

Envelope Envelope::unknown(std::string tag, std::string raw) {
    return make(EnvelopeKind::UNKNOWN, UnknownMessage{std::move(tag), std::move(raw)});
}

// ============================================================================
// Tag Conversion
// ============================================================================

std::string EnvelopeCodec::kind_to_tag(EnvelopeKind kind) {
    for (const auto& entry : TAG_TABLE) {
        if (entry.kind == kind) {
            return entry.tag;
        }
    }
    return "Unknown";
}

std::optional<EnvelopeKind> EnvelopeCodec::tag_to_kind(const std::string& tag) {
    for (const auto& entry : TAG_TABLE) {
        if (tag == entry.tag) {
            return entry.kind;
        }
    }
    if (tag == LEGACY_PAIRING_WITH_KEY_TAG) {
        return EnvelopeKind::PAIRING_REQUEST;
    }
    return std::nullopt;
}

// ============================================================================
// Encode / Decode
// ============================================================================

Result<std::string> EnvelopeCodec::encode(const Envelope& envelope, size_t max_frame_size) {
    std::string frame;

    try {
        if (envelope.kind == EnvelopeKind::UNKNOWN) {
            const auto* unknown = envelope.get<UnknownMessage>();
            if (!unknown) {
                return Result<std::string>::failure(ErrorCode::INVALID_ARGUMENT, "unknown envelope without raw frame");
            }
            frame = unknown->raw;
        } else if (is_unit_kind(envelope.kind)) {
            frame = json(kind_to_tag(envelope.kind)).dump();
        } else {
            json j;
            j[kind_to_tag(envelope.kind)] = payload_to_json(envelope);
            frame = j.dump();
        }
    } catch (const std::bad_variant_access&) {
        return Result<std::string>::failure(ErrorCode::INVALID_ARGUMENT,
            "payload does not match kind " + kind_to_tag(envelope.kind));
    } catch (const json::exception& e) {
        return Result<std::string>::failure(ErrorCode::INVALID_ARGUMENT, e.what());
    } catch (const std::invalid_argument& e) {
        return Result<std::string>::failure(ErrorCode::INVALID_ARGUMENT, e.what());
    }

    if (frame.size() > max_frame_size) {
        return Result<std::string>::failure(ErrorCode::PAYLOAD_TOO_LARGE,
            kind_to_tag(envelope.kind) + " frame is " + std::to_string(frame.size()) +
            " bytes, limit " + std::to_string(max_frame_size));
    }

    frame.push_back('\n');
    return Result<std::string>::success(std::move(frame));
}

Result<Envelope> EnvelopeCodec::decode(const std::string& frame) {
    std::string text = frame;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }

    try {
        json j = json::parse(text);

        std::string tag;
        const json* body = nullptr;

        if (j.is_string()) {
            tag = j.get<std::string>();
        } else if (j.is_object() && j.size() == 1) {
            tag = j.begin().key();
            body = &j.begin().value();
        } else {
            return Result<Envelope>::failure(ErrorCode::DECODE_ERROR,
                "frame is neither a tag string nor a single-key object");
        }

        auto kind = tag_to_kind(tag);
        if (!kind) {
            return Result<Envelope>::success(Envelope::unknown(tag, text));
        }

        if (is_unit_kind(*kind)) {
            if (body && !body->is_null()) {
                return Result<Envelope>::failure(ErrorCode::DECODE_ERROR, tag + " carries no payload");
            }
            return Result<Envelope>::success(make_unit(*kind));
        }

        if (!body) {
            return Result<Envelope>::failure(ErrorCode::DECODE_ERROR, tag + " requires a payload");
        }

        return Result<Envelope>::success(payload_from_json(*kind, *body));

    } catch (const json::exception& e) {
        return Result<Envelope>::failure(ErrorCode::DECODE_ERROR, e.what());
    } catch (const std::invalid_argument& e) {
        return Result<Envelope>::failure(ErrorCode::DECODE_ERROR, e.what());
    }
}

// ============================================================================
// FrameAssembler
// ============================================================================

FrameAssembler::FrameAssembler(size_t max_frame_size)
    : max_frame_size_(max_frame_size)
    , discarding_(false)
    , oversized_count_(0)
{
}

void FrameAssembler::append(const char* data, size_t size) {
    if (size == 0) {
        return;
    }

    if (discarding_) {
        const char* end = data + size;
        const char* newline = std::find(data, end, '\n');
        if (newline == end) {
            return;
        }
        discarding_ = false;
        buffer_.append(newline + 1, end);
    } else {
        buffer_.append(data, size);
    }

    enforce_limit();
}

void FrameAssembler::enforce_limit() {
    while (true) {
        size_t newline = buffer_.find('\n');

        if (newline == std::string::npos) {
            if (buffer_.size() > max_frame_size_) {
                buffer_.clear();
                discarding_ = true;
                oversized_count_++;
            }
            return;
        }

        if (newline <= max_frame_size_) {
            return;
        }

        buffer_.erase(0, newline + 1);
        oversized_count_++;
    }
}

std::optional<std::string> FrameAssembler::next_frame() {
    while (true) {
        size_t newline = buffer_.find('\n');
        if (newline == std::string::npos) {
            return std::nullopt;
        }

        std::string frame = buffer_.substr(0, newline);
        buffer_.erase(0, newline + 1);

        if (!frame.empty() && frame.back() == '\r') {
            frame.pop_back();
        }
        if (frame.empty()) {
            continue;
        }

        // A completed frame may be oversized when it was appended in one piece
        if (frame.size() > max_frame_size_) {
            oversized_count_++;
            continue;
        }
        return frame;
    }
}

size_t FrameAssembler::take_oversized_count() {
    size_t count = oversized_count_;
    oversized_count_ = 0;
    return count;
}

size_t FrameAssembler::buffered_bytes() const {
    return buffer_.size();
}

} // namespace lanconnect
