#pragma once
#include <string>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

namespace pbrelay {

struct AccountConfig {
    std::string access_token;        // never logged
    std::string encryption_password; // empty = E2E disabled; never logged
    std::string user_iden;           // key salt; fetched from the API when empty
};

// The service sends a nop every 30s; a shorter staleness window would
// drop healthy connections.
constexpr uint32_t kMinHeartbeatTimeoutMs = 35000;

struct StreamConfig {
    std::string url = "wss://stream.pushbullet.com/websocket/";
    uint32_t heartbeat_timeout_ms = 90000; // service sends nop every 30s
    uint32_t connect_timeout_s = 15;
    uint32_t backoff_base_ms = 1000;
    uint32_t backoff_max_ms = 60000;
    double backoff_jitter = 0.25;          // fraction, clamped to [0, 1]
};

struct ApiConfig {
    std::string base_url = "https://api.pushbullet.com";
    uint32_t timeout_s = 15;
    uint32_t backfill_limit = 10;
};

struct DedupConfig {
    uint32_t max_entries = 1024;
    uint32_t retention_seconds = 86400; // 0 = count cap only
};

struct SinkConfig {
#ifdef PBRELAY_HAS_DBUS_SINK
    std::string backend = "dbus";
#else
    std::string backend = "log";
#endif
    std::string app_name = "Pushbullet";
    std::string app_icon;
    int32_t expire_timeout_ms = 5000;
    std::string icon_cache_dir = "~/.cache/pbrelay/icons";
};

struct Config {
    bool debug = false;
    AccountConfig account;
    StreamConfig stream;
    ApiConfig api;
    DedupConfig dedup;
    SinkConfig sink;

    // Load from ~/.pbrelay/config.json, legacy ~/.config/pbns files, env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config document over the defaults (no file or env access)
    static Config from_json(const nlohmann::json& j);

    bool encryption_enabled() const { return !account.encryption_password.empty(); }
};

// Path of the JSON config file (~ expanded)
std::string config_path();

// Read-modify-write the config file atomically.
bool modify_config_json(const std::function<void(nlohmann::json&)>& modifier);

} // namespace pbrelay
