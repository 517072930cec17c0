#pragma once
#include "../sink.hpp"
#include <mutex>

struct DBusConnection;

namespace pbrelay {

// org.freedesktop.Notifications client over the session bus (libdbus-1).
// The bus connection is opened lazily and reopened after a disconnect.
class DbusSink : public NotificationSink {
public:
    static constexpr int kCallTimeoutMs = 5000;

    DbusSink() = default;
    ~DbusSink() override;

    DbusSink(const DbusSink&) = delete;
    DbusSink& operator=(const DbusSink&) = delete;

    std::string sink_name() const override { return "dbus"; }
    uint32_t create(const Notification& notification) override;
    uint32_t update(uint32_t notification_id, const Notification& notification) override;
    void dismiss(uint32_t notification_id) override;
    bool health_check() override;

private:
    DBusConnection* connection();
    void drop_connection();
    uint32_t notify(uint32_t replaces_id, const Notification& notification);

    std::mutex mutex_;
    DBusConnection* conn_ = nullptr;
};

} // namespace pbrelay
