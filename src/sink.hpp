#pragma once
#include <cstdint>
#include <string>

namespace pbrelay {

struct Notification {
    std::string app_name;
    std::string title;
    std::string body;
    std::string icon;             // file path or icon theme name, may be empty
    int32_t expire_timeout_ms = -1; // -1 = server default
    bool persistent = false;        // stays until dismissed explicitly
};

// Abstract base class for the local notification surface.
// Failures are reported by throwing SinkUnavailable.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual std::string sink_name() const = 0;

    // Return a sink-assigned id usable with update() and dismiss()
    virtual uint32_t create(const Notification& notification) = 0;

    // Replace the contents of a notification shown earlier. Returns the id
    // now showing it, which differs when the server had already closed the old one.
    virtual uint32_t update(uint32_t notification_id, const Notification& notification) = 0;

    virtual void dismiss(uint32_t notification_id) = 0;

    // Cheap availability check; default assumes available
    virtual bool health_check() { return true; }
};

} // namespace pbrelay
