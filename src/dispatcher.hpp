#pragma once
#include "config.hpp"
#include "dedup_store.hpp"
#include "sink.hpp"
#include "stream_event.hpp"
#include <string>

namespace pbrelay {

class EventBus;      // forward declaration
class PushbulletApi; // forward declaration

enum class DispatchResult { Created, Updated, Dismissed, Duplicate, Ignored, SinkFailed };

const char* dispatch_result_name(DispatchResult result);

// Turns decoded events into idempotent create/update/dismiss calls on a sink.
// Every event id is rendered at most once while its notification is showing;
// a mirror that shares a notification key with an earlier one replaces it in
// place, and dismissing or replacing a mirror lets its content be shown again.
class NotificationDispatcher {
public:
    // `api` resolves device nicknames for untitled pushes; may be null.
    NotificationDispatcher(DedupStore& store, NotificationSink& sink,
                           const SinkConfig& config, PushbulletApi* api = nullptr);

    DispatchResult dispatch(const StreamEvent& event);

    void set_event_bus(EventBus* bus) { event_bus_ = bus; }

    Notification render_push(const StreamEvent& event);
    Notification render_mirror(const StreamEvent& event);

private:
    DispatchResult dispatch_rendered(const StreamEvent& event, const std::string& render_key,
                                     const Notification& notification, bool allow_update);
    DispatchResult dispatch_dismiss(const StreamEvent& event);
    std::string cache_icon(const StreamEvent& event) const;
    std::string device_title(const std::string& device_iden);
    void report_drop(const StreamEvent& event, const char* reason, const std::string& detail);

    DedupStore& store_;
    NotificationSink& sink_;
    SinkConfig config_;
    PushbulletApi* api_;
    EventBus* event_bus_ = nullptr;
};

} // namespace pbrelay
