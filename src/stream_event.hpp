#pragma once
#include <string>
#include <cstdint>

namespace pbrelay {

// Tag-based variant: `type` selects which of the per-type structs is populated.
// Sealed events carry ciphertext in `payload` until the Crypto Unit opens them.
enum class EventType { Sealed, Push, Mirror, Dismiss, DeviceState };

enum class PushType { Note, Link, File };

struct PushFields {
    std::string title;
    std::string body;
    std::string channel_or_chat_id;
    PushType push_type = PushType::Note;
    std::string url;
    std::string file_name;
};

struct MirrorFields {
    std::string app_package;
    std::string app_name;
    std::string title;
    std::string body;
    std::string notification_key;
    std::string icon_bytes; // decoded JPEG, empty if none
    bool dismissible = true;
};

struct DismissFields {
    std::string notification_key;
};

struct DeviceStateFields {
    std::string subtype;
};

struct StreamEvent {
    EventType type = EventType::Sealed;
    std::string event_id;
    std::string source_device_id;
    double timestamp = 0.0;
    bool encrypted = false;
    std::string payload;

    PushFields push;
    MirrorFields mirror;
    DismissFields dismiss;
    DeviceStateFields device;
};

// Frames that are not events still need handling by the session or engine.
enum class FrameKind { Heartbeat, Tickle, Event, Ignored };

struct DecodedFrame {
    FrameKind kind = FrameKind::Ignored;
    std::string tickle_subtype;
    StreamEvent event;
};

const char* event_type_name(EventType type);
const char* push_type_name(PushType type);

} // namespace pbrelay
