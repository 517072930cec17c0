#include "log_sink.hpp"
#include "../plugin.hpp"
#include <iostream>

static pbrelay::SinkRegistrar reg_log("log",
    [](const pbrelay::Config&) -> std::unique_ptr<pbrelay::NotificationSink> {
        return std::make_unique<pbrelay::LogSink>();
    });

namespace pbrelay {

LogSink::LogSink() : out_(std::cerr) {}

LogSink::LogSink(std::ostream& out) : out_(out) {}

uint32_t LogSink::create(const Notification& notification) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t id = next_id_++;
    out_ << "[notify] #" << id << (notification.persistent ? " (persistent) " : " ")
         << notification.title << ": " << notification.body << "\n";
    return id;
}

uint32_t LogSink::update(uint32_t notification_id, const Notification& notification) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[notify] #" << notification_id << " (updated) " << notification.title
         << ": " << notification.body << "\n";
    return notification_id;
}

void LogSink::dismiss(uint32_t notification_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "[notify] #" << notification_id << " dismissed\n";
}

} // namespace pbrelay
