#include "plugin.hpp"
#include <stdexcept>
#include <algorithm>

namespace pbrelay {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_sink(const std::string& name, SinkFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_[name] = std::move(factory);
}

std::unique_ptr<NotificationSink> PluginRegistry::create_sink(const std::string& name,
                                                              const Config& config) const {
    SinkFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sinks_.find(name);
        if (it == sinks_.end()) {
            throw std::invalid_argument("Unknown notification sink: " + name);
        }
        factory = it->second;
    }
    return factory(config);
}

std::vector<std::string> PluginRegistry::sink_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(sinks_.size());
    for (const auto& [name, _] : sinks_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool PluginRegistry::has_sink(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.count(name) > 0;
}

} // namespace pbrelay
