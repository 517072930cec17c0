#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace pbrelay {

static const char* kConfigPath = "~/.pbrelay/config.json";
static const char* kLegacyApiKeyPath = "~/.config/pbns/apikey";
static const char* kLegacyPasswordPath = "~/.config/pbns/password";

std::string config_path() {
    return expand_home(kConfigPath);
}

nlohmann::json Config::defaults_json() {
    SinkConfig sink;
    return {
        {"debug", false},
        {"account", {
            {"access_token", ""},
            {"encryption_password", ""},
            {"user_iden", ""}
        }},
        {"stream", {
            {"url", "wss://stream.pushbullet.com/websocket/"},
            {"heartbeat_timeout_ms", 90000},
            {"connect_timeout_s", 15},
            {"backoff_base_ms", 1000},
            {"backoff_max_ms", 60000},
            {"backoff_jitter", 0.25}
        }},
        {"api", {
            {"base_url", "https://api.pushbullet.com"},
            {"timeout_s", 15},
            {"backfill_limit", 10}
        }},
        {"dedup", {
            {"max_entries", 1024},
            {"retention_seconds", 86400}
        }},
        {"sink", {
            {"backend", sink.backend},
            {"app_name", "Pushbullet"},
            {"app_icon", ""},
            {"expire_timeout_ms", 5000},
            {"icon_cache_dir", "~/.cache/pbrelay/icons"}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string()) out = obj[key].get<std::string>();
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_integer()) return;
    int64_t v = obj[key].get<int64_t>();
    if (v >= 0 && v <= static_cast<int64_t>(UINT32_MAX)) out = static_cast<uint32_t>(v);
}

// Raise a value below its floor, with a warning naming the key.
static void clamp_min(const char* key, uint32_t floor, uint32_t& value) {
    if (value >= floor) return;
    std::cerr << "[config] " << key << " = " << value << " is too low, using " << floor << "\n";
    value = floor;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("debug") && j["debug"].is_boolean())
        cfg.debug = j["debug"].get<bool>();

    if (j.contains("account") && j["account"].is_object()) {
        const auto& a = j["account"];
        read_string(a, "access_token", cfg.account.access_token);
        read_string(a, "encryption_password", cfg.account.encryption_password);
        read_string(a, "user_iden", cfg.account.user_iden);
    }

    if (j.contains("stream") && j["stream"].is_object()) {
        const auto& s = j["stream"];
        read_string(s, "url", cfg.stream.url);
        read_u32(s, "heartbeat_timeout_ms", cfg.stream.heartbeat_timeout_ms);
        read_u32(s, "connect_timeout_s", cfg.stream.connect_timeout_s);
        read_u32(s, "backoff_base_ms", cfg.stream.backoff_base_ms);
        read_u32(s, "backoff_max_ms", cfg.stream.backoff_max_ms);
        if (s.contains("backoff_jitter") && s["backoff_jitter"].is_number())
            cfg.stream.backoff_jitter = s["backoff_jitter"].get<double>();
        clamp_min("stream.heartbeat_timeout_ms", kMinHeartbeatTimeoutMs,
                  cfg.stream.heartbeat_timeout_ms);
        clamp_min("stream.connect_timeout_s", 1, cfg.stream.connect_timeout_s);
    }

    if (j.contains("api") && j["api"].is_object()) {
        const auto& a = j["api"];
        read_string(a, "base_url", cfg.api.base_url);
        read_u32(a, "timeout_s", cfg.api.timeout_s);
        read_u32(a, "backfill_limit", cfg.api.backfill_limit);
        clamp_min("api.timeout_s", 1, cfg.api.timeout_s);
        clamp_min("api.backfill_limit", 1, cfg.api.backfill_limit);
    }

    if (j.contains("dedup") && j["dedup"].is_object()) {
        const auto& d = j["dedup"];
        read_u32(d, "max_entries", cfg.dedup.max_entries);
        read_u32(d, "retention_seconds", cfg.dedup.retention_seconds);
    }

    if (j.contains("sink") && j["sink"].is_object()) {
        const auto& s = j["sink"];
        read_string(s, "backend", cfg.sink.backend);
        read_string(s, "app_name", cfg.sink.app_name);
        read_string(s, "app_icon", cfg.sink.app_icon);
        read_string(s, "icon_cache_dir", cfg.sink.icon_cache_dir);
        if (s.contains("expire_timeout_ms") && s["expire_timeout_ms"].is_number_integer())
            cfg.sink.expire_timeout_ms = s["expire_timeout_ms"].get<int32_t>();
    }

    return cfg;
}

Config Config::load() {
    std::string path = config_path();
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: " << path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Warning: ignoring malformed " << path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << path << "\n";
    }

    Config cfg = from_json(j);

    // Credential files used by earlier releases
    if (cfg.account.access_token.empty())
        cfg.account.access_token = read_trimmed_file(expand_home(kLegacyApiKeyPath));
    if (cfg.account.encryption_password.empty())
        cfg.account.encryption_password = read_trimmed_file(expand_home(kLegacyPasswordPath));

    // Environment variables always override config file
    if (const char* v = std::getenv("PUSHBULLET_ACCESS_TOKEN"))
        cfg.account.access_token = v;
    if (const char* v = std::getenv("PUSHBULLET_ENCRYPTION_PASSWORD"))
        cfg.account.encryption_password = v;
    if (const char* v = std::getenv("PBRELAY_SINK"))
        cfg.sink.backend = v;

    if (cfg.account.encryption_password.empty()) {
        std::cerr << "[config] Warning: no encryption password configured; encrypted "
                  << "notifications will be dropped. Set account.encryption_password in "
                  << path << " to enable end-to-end encryption.\n";
    }

    return cfg;
}

bool modify_config_json(const std::function<void(nlohmann::json&)>& modifier) {
    std::string path = config_path();
    nlohmann::json j = Config::defaults_json();

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            j = merge_defaults(nlohmann::json::parse(file), Config::defaults_json());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Refusing to rewrite malformed " << path
                      << ": " << e.what() << "\n";
            return false;
        }
    }

    modifier(j);
    return atomic_write_file(path, j.dump(4) + "\n");
}

} // namespace pbrelay
