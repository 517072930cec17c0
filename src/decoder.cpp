#include "decoder.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "util.hpp"

namespace pbrelay {

const char* event_type_name(EventType type) {
    switch (type) {
        case EventType::Sealed:      return "sealed";
        case EventType::Push:        return "push";
        case EventType::Mirror:      return "mirror";
        case EventType::Dismiss:     return "dismiss";
        case EventType::DeviceState: return "device";
    }
    return "unknown";
}

const char* push_type_name(PushType type) {
    switch (type) {
        case PushType::Note: return "note";
        case PushType::Link: return "link";
        case PushType::File: return "file";
    }
    return "note";
}

// Ephemeral ids arrive as strings, numbers or null depending on the client.
static std::string field_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return {};
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<int64_t>());
    if (it->is_number()) return it->dump();
    if (it->is_boolean()) return it->get<bool>() ? "true" : "false";
    return {};
}

static std::string require_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        throw MalformedFrame(std::string("missing field '") + key + "'");
    std::string v = field_string(j, key);
    if (v.empty() && !it->is_string())
        throw MalformedFrame(std::string("field '") + key + "' has unexpected type");
    return v;
}

std::string make_notification_key(const std::string& source_device,
                                  const std::string& package_name,
                                  const std::string& notification_tag,
                                  const std::string& notification_id) {
    return source_device + "|" + package_name + "|" + notification_tag + "|" + notification_id;
}

static std::string key_from(const nlohmann::json& eph) {
    return make_notification_key(field_string(eph, "source_device_iden"),
                                 require_string(eph, "package_name"),
                                 field_string(eph, "notification_tag"),
                                 require_string(eph, "notification_id"));
}

// Populate `frame` from an unencrypted ephemeral object.
static void decode_ephemeral(const nlohmann::json& eph, DecodedFrame& frame) {
    if (!eph.is_object()) throw MalformedFrame("push payload is not an object");

    StreamEvent& ev = frame.event;
    ev.source_device_id = field_string(eph, "source_device_iden");

    std::string type = field_string(eph, "type");
    if (type == "mirror") {
        ev.type = EventType::Mirror;
        ev.mirror.notification_key = key_from(eph);
        ev.mirror.app_package = field_string(eph, "package_name");
        ev.mirror.app_name = field_string(eph, "application_name");
        if (ev.mirror.app_name.empty()) ev.mirror.app_name = ev.mirror.app_package;
        ev.mirror.title = field_string(eph, "title");
        ev.mirror.body = field_string(eph, "body");
        ev.mirror.dismissible = eph.value("dismissible", true);

        std::string icon = field_string(eph, "icon");
        if (!icon.empty()) {
            try {
                ev.mirror.icon_bytes = base64_decode(icon);
            } catch (const std::invalid_argument&) {
                ev.mirror.icon_bytes.clear(); // render without the icon
            }
        }

        ev.event_id = "mirror:" + fnv1a_hex({ev.source_device_id,
                                             ev.mirror.notification_key,
                                             ev.mirror.title,
                                             ev.mirror.body});
        frame.kind = FrameKind::Event;
    } else if (type == "dismissal") {
        ev.type = EventType::Dismiss;
        ev.dismiss.notification_key = key_from(eph);
        ev.event_id = "dismiss:" + fnv1a_hex({ev.dismiss.notification_key});
        frame.kind = FrameKind::Event;
    } else if (type.empty()) {
        throw MalformedFrame("push payload without type");
    } else {
        // clip, sms_changed and others are not relayed
        frame.kind = FrameKind::Ignored;
    }
}

bool is_heartbeat(const std::string& raw) {
    if (raw.find("nop") == std::string::npos) return false;
    try {
        auto j = nlohmann::json::parse(raw);
        return j.is_object() && j.value("type", std::string{}) == "nop";
    } catch (const nlohmann::json::exception&) {
        return false;
    }
}

// Field accessors such as value() throw type_error on mistyped input.
template <typename F>
static auto guard_json(F&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (const nlohmann::json::exception& e) {
        throw MalformedFrame(std::string("unexpected field type: ") + e.what());
    }
}

static DecodedFrame decode_frame(const std::string& raw, double received_at) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(raw);
    } catch (const nlohmann::json::exception& e) {
        throw MalformedFrame(std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) throw MalformedFrame("frame is not a JSON object");

    DecodedFrame frame;
    frame.event.timestamp = received_at;

    std::string type = require_string(j, "type");
    if (type == "nop") {
        frame.kind = FrameKind::Heartbeat;
        return frame;
    }

    if (type == "tickle") {
        frame.tickle_subtype = require_string(j, "subtype");
        if (frame.tickle_subtype == "device") {
            frame.kind = FrameKind::Event;
            frame.event.type = EventType::DeviceState;
            frame.event.device.subtype = frame.tickle_subtype;
            frame.event.event_id = "device:" + fnv1a_hex({std::to_string(received_at)});
        } else {
            frame.kind = FrameKind::Tickle;
        }
        return frame;
    }

    if (type == "push") {
        auto it = j.find("push");
        if (it == j.end() || !it->is_object()) throw MalformedFrame("push frame without payload");
        const auto& eph = *it;

        if (eph.value("encrypted", false)) {
            std::string ciphertext = require_string(eph, "ciphertext");
            frame.kind = FrameKind::Event;
            frame.event.type = EventType::Sealed;
            frame.event.encrypted = true;
            try {
                frame.event.payload = base64_decode(ciphertext);
            } catch (const std::invalid_argument& e) {
                throw MalformedFrame(std::string("ciphertext: ") + e.what());
            }
            return frame;
        }

        decode_ephemeral(eph, frame);
        return frame;
    }

    // Unknown top-level frame types are tolerated
    frame.kind = FrameKind::Ignored;
    return frame;
}

DecodedFrame decode(const std::string& raw, double received_at) {
    return guard_json([&] { return decode_frame(raw, received_at); });
}

static DecodedFrame decode_push_record(const nlohmann::json& push, double received_at) {
    if (!push.is_object()) throw MalformedFrame("push record is not an object");

    DecodedFrame frame;
    StreamEvent& ev = frame.event;
    ev.timestamp = received_at;

    std::string iden = require_string(push, "iden");
    std::string type = require_string(push, "type");

    if (!push.value("active", true) || push.value("dismissed", false)) {
        frame.kind = FrameKind::Ignored;
        return frame;
    }

    if (push.contains("modified") && push["modified"].is_number())
        ev.timestamp = push["modified"].get<double>();
    else if (push.contains("created") && push["created"].is_number())
        ev.timestamp = push["created"].get<double>();

    ev.type = EventType::Push;
    ev.event_id = "push:" + iden;
    ev.source_device_id = field_string(push, "source_device_iden");
    ev.encrypted = false;

    if (type == "note") {
        ev.push.push_type = PushType::Note;
    } else if (type == "link") {
        ev.push.push_type = PushType::Link;
        ev.push.url = field_string(push, "url");
    } else if (type == "file") {
        ev.push.push_type = PushType::File;
        ev.push.file_name = field_string(push, "file_name");
        ev.push.url = field_string(push, "file_url");
    } else {
        frame.kind = FrameKind::Ignored;
        return frame;
    }

    ev.push.title = field_string(push, "title");
    ev.push.body = field_string(push, "body");
    ev.push.channel_or_chat_id = field_string(push, "channel_iden");
    if (ev.push.channel_or_chat_id.empty())
        ev.push.channel_or_chat_id = field_string(push, "target_device_iden");

    frame.kind = FrameKind::Event;
    return frame;
}

DecodedFrame decode_push_object(const nlohmann::json& push, double received_at) {
    return guard_json([&] { return decode_push_record(push, received_at); });
}

FrameKind open_sealed(StreamEvent& event, const std::string& plaintext) {
    secure_clear(event.payload);

    nlohmann::json eph;
    try {
        eph = nlohmann::json::parse(plaintext);
    } catch (const nlohmann::json::exception& e) {
        throw MalformedFrame(std::string("decrypted payload is not JSON: ") + e.what());
    }

    DecodedFrame frame;
    frame.event.timestamp = event.timestamp;
    frame.event.encrypted = true;
    guard_json([&] { decode_ephemeral(eph, frame); });
    event = std::move(frame.event);
    return frame.kind;
}

} // namespace pbrelay
