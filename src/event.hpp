#pragma once
#include "session.hpp"
#include <string>
#include <cstdint>

namespace pbrelay {

// Tag-based event dispatch without RTTI or dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* SessionStateChanged   = "SessionStateChanged";
    constexpr const char* NotificationRendered  = "NotificationRendered";
    constexpr const char* NotificationDismissed = "NotificationDismissed";
    constexpr const char* EventDropped          = "EventDropped";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct SessionStateChangedEvent : Event {
    static constexpr const char* TAG = event_tags::SessionStateChanged;
    SessionState from = SessionState::Disconnected;
    SessionState to = SessionState::Disconnected;
    uint32_t attempt = 0; // backoff attempt count at the transition

    SessionStateChangedEvent() { type_tag = TAG; }
};

struct NotificationRenderedEvent : Event {
    static constexpr const char* TAG = event_tags::NotificationRendered;
    std::string event_id;
    std::string render_key; // push event id or mirror notification key
    uint32_t notification_id = 0;
    bool updated = false;   // replaced an existing notification in place

    NotificationRenderedEvent() { type_tag = TAG; }
};

struct NotificationDismissedEvent : Event {
    static constexpr const char* TAG = event_tags::NotificationDismissed;
    std::string notification_key;
    uint32_t notification_id = 0;

    NotificationDismissedEvent() { type_tag = TAG; }
};

// Reasons an inbound frame or event did not reach the sink
namespace drop_reasons {
    constexpr const char* Malformed  = "malformed";
    constexpr const char* Decryption = "decryption";
    constexpr const char* Duplicate  = "duplicate";
    constexpr const char* SinkFailed = "sink";
} // namespace drop_reasons

struct EventDroppedEvent : Event {
    static constexpr const char* TAG = event_tags::EventDropped;
    std::string event_id; // empty when the frame never decoded
    const char* reason = drop_reasons::Malformed;
    std::string detail;

    EventDroppedEvent() { type_tag = TAG; }
};

} // namespace pbrelay
