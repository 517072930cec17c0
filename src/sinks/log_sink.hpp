#pragma once
#include "../sink.hpp"
#include <iosfwd>
#include <mutex>

namespace pbrelay {

// Writes notifications to a stream instead of a desktop bus.
// Useful on headless hosts and when no D-Bus session is available.
class LogSink : public NotificationSink {
public:
    LogSink();
    explicit LogSink(std::ostream& out);

    std::string sink_name() const override { return "log"; }
    uint32_t create(const Notification& notification) override;
    uint32_t update(uint32_t notification_id, const Notification& notification) override;
    void dismiss(uint32_t notification_id) override;

private:
    std::ostream& out_;
    std::mutex mutex_;
    uint32_t next_id_ = 1;
};

} // namespace pbrelay
