#pragma once
#include "sink.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace pbrelay {

using SinkFactory = std::function<std::unique_ptr<NotificationSink>(const Config& config)>;

// Central registry for self-registering notification sinks.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    void register_sink(const std::string& name, SinkFactory factory);

    std::unique_ptr<NotificationSink> create_sink(const std::string& name,
                                                  const Config& config) const;

    std::vector<std::string> sink_names() const;
    bool has_sink(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, SinkFactory> sinks_;
};

// Self-registrar helper (used at file scope in each sink .cpp)
struct SinkRegistrar {
    SinkRegistrar(const std::string& name, SinkFactory factory) {
        PluginRegistry::instance().register_sink(name, std::move(factory));
    }
};

} // namespace pbrelay
