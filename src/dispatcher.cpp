#include "dispatcher.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "pushbullet_api.hpp"
#include "util.hpp"
#include <cctype>
#include <iostream>

namespace pbrelay {

const char* dispatch_result_name(DispatchResult result) {
    switch (result) {
        case DispatchResult::Created:    return "created";
        case DispatchResult::Updated:    return "updated";
        case DispatchResult::Dismissed:  return "dismissed";
        case DispatchResult::Duplicate:  return "duplicate";
        case DispatchResult::Ignored:    return "ignored";
        case DispatchResult::SinkFailed: return "sink-failed";
    }
    return "unknown";
}

NotificationDispatcher::NotificationDispatcher(DedupStore& store, NotificationSink& sink,
                                               const SinkConfig& config, PushbulletApi* api)
    : store_(store), sink_(sink), config_(config), api_(api)
{}

void NotificationDispatcher::report_drop(const StreamEvent& event, const char* reason,
                                         const std::string& detail) {
    if (!event_bus_) return;
    EventDroppedEvent ev;
    ev.event_id = event.event_id;
    ev.reason = reason;
    ev.detail = detail;
    event_bus_->publish(ev);
}

// ── Rendering ───────────────────────────────────────────────────

std::string NotificationDispatcher::device_title(const std::string& device_iden) {
    if (!api_ || device_iden.empty()) return config_.app_name;
    try {
        return api_->device_nickname(device_iden);
    } catch (const ApiError& e) {
        if (verbose()) std::cerr << "[relay] No device name: " << e.what() << "\n";
        return config_.app_name;
    }
}

Notification NotificationDispatcher::render_push(const StreamEvent& event) {
    const PushFields& p = event.push;

    Notification n;
    n.app_name = config_.app_name;
    n.icon = config_.app_icon;
    n.expire_timeout_ms = config_.expire_timeout_ms;
    n.title = trim(p.title);
    n.body = trim(p.body);

    if (n.body.empty()) {
        if (p.push_type == PushType::Link) n.body = trim(p.url);
        else if (p.push_type == PushType::File) n.body = trim(p.file_name);
    }
    if (n.title.empty()) {
        if (p.push_type == PushType::File && !p.file_name.empty() && n.body != trim(p.file_name))
            n.title = trim(p.file_name);
        else
            n.title = device_title(event.source_device_id);
    }
    return n;
}

Notification NotificationDispatcher::render_mirror(const StreamEvent& event) {
    const MirrorFields& m = event.mirror;

    Notification n;
    n.app_name = config_.app_name;
    n.expire_timeout_ms = config_.expire_timeout_ms;
    n.title = trim("[" + m.app_name + "] " + trim(m.title));
    n.body = trim(m.body);
    n.icon = cache_icon(event);
    if (n.icon.empty()) n.icon = config_.app_icon;
    n.persistent = !m.dismissible;
    return n;
}

// Mirror icons are written once per package and handed to the sink by path.
std::string NotificationDispatcher::cache_icon(const StreamEvent& event) const {
    const MirrorFields& m = event.mirror;
    if (m.icon_bytes.empty() || config_.icon_cache_dir.empty()) return {};

    std::string name;
    for (char c : m.app_package) {
        bool safe = std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
        name += safe ? c : '_';
    }
    if (name.empty() || name[0] == '.') name = fnv1a_hex({m.app_package});

    std::string path = expand_home(config_.icon_cache_dir) + "/" + name + ".jpg";
    if (!atomic_write_file(path, m.icon_bytes)) {
        std::cerr << "[relay] Could not write icon " << path << "\n";
        return {};
    }
    return path;
}

// ── Dispatch ────────────────────────────────────────────────────

DispatchResult NotificationDispatcher::dispatch_rendered(const StreamEvent& event,
                                                         const std::string& render_key,
                                                         const Notification& notification,
                                                         bool allow_update) {
    if (notification.title.empty() && notification.body.empty()) {
        if (verbose()) std::cerr << "[relay] Nothing to show for " << event.event_id << "\n";
        return DispatchResult::Ignored;
    }

    std::optional<uint32_t> existing;
    std::string replaced_event;
    if (allow_update) {
        existing = store_.lookup_rendered(render_key);
        if (existing) replaced_event = store_.rendered_event(render_key);
    }
    uint32_t id = 0;
    try {
        if (existing) {
            id = sink_.update(*existing, notification);
        } else {
            id = sink_.create(notification);
        }
    } catch (const SinkUnavailable& e) {
        std::cerr << "[relay] Sink " << sink_.sink_name() << " unavailable: " << e.what() << "\n";
        report_drop(event, drop_reasons::SinkFailed, e.what());
        return DispatchResult::SinkFailed;
    }
    store_.record_rendered(render_key, id, event.event_id);
    // The replaced content may come back later and must show again
    if (!replaced_event.empty() && replaced_event != event.event_id) {
        store_.forget(replaced_event);
    }

    if (event_bus_) {
        NotificationRenderedEvent ev;
        ev.event_id = event.event_id;
        ev.render_key = render_key;
        ev.notification_id = id;
        ev.updated = existing.has_value();
        event_bus_->publish(ev);
    }
    return existing ? DispatchResult::Updated : DispatchResult::Created;
}

DispatchResult NotificationDispatcher::dispatch_dismiss(const StreamEvent& event) {
    const std::string& key = event.dismiss.notification_key;
    auto id = store_.lookup_rendered(key);
    if (!id) {
        if (verbose()) std::cerr << "[relay] Dismissal for unknown notification\n";
        return DispatchResult::Ignored;
    }

    try {
        sink_.dismiss(*id);
    } catch (const SinkUnavailable& e) {
        std::cerr << "[relay] Sink " << sink_.sink_name() << " unavailable: " << e.what() << "\n";
        report_drop(event, drop_reasons::SinkFailed, e.what());
        return DispatchResult::SinkFailed;
    }
    std::string shown_event = store_.rendered_event(key);
    store_.remove_rendered(key);
    // A re-post of the same content after dismissal is a new notification
    if (!shown_event.empty()) store_.forget(shown_event);

    if (event_bus_) {
        NotificationDismissedEvent ev;
        ev.notification_key = key;
        ev.notification_id = *id;
        event_bus_->publish(ev);
    }
    return DispatchResult::Dismissed;
}

DispatchResult NotificationDispatcher::dispatch(const StreamEvent& event) {
    switch (event.type) {
        case EventType::Dismiss:
            // Idempotent through the rendered map; no admission needed.
            return dispatch_dismiss(event);

        case EventType::DeviceState:
            if (api_) api_->invalidate_devices();
            return DispatchResult::Ignored;

        case EventType::Sealed:
            std::cerr << "[relay] Dropping sealed event without a key\n";
            return DispatchResult::Ignored;

        case EventType::Push:
        case EventType::Mirror:
            break;
    }

    if (!store_.admit(event.event_id)) {
        if (verbose()) std::cerr << "[relay] Duplicate " << event.event_id << "\n";
        report_drop(event, drop_reasons::Duplicate, "already rendered");
        return DispatchResult::Duplicate;
    }

    if (event.type == EventType::Push) {
        return dispatch_rendered(event, event.event_id, render_push(event), false);
    }
    return dispatch_rendered(event, event.mirror.notification_key, render_mirror(event), true);
}

} // namespace pbrelay
