#pragma once
#include "http.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace pbrelay {

// One page of push history; `cursor` names the next page, empty on the last.
struct PushPage {
    std::vector<nlohmann::json> pushes;
    std::string cursor;
};

// Minimal Pushbullet REST v2 client.
// Throws AuthError on 401/403 and ApiError for everything else that fails.
class PushbulletApi {
public:
    PushbulletApi(HttpClient& http, std::string access_token,
                  std::string base_url = "https://api.pushbullet.com",
                  long timeout_s = 15);

    // GET /v2/users/me -> iden (the E2E key salt)
    std::string fetch_user_iden();

    // GET /v2/pushes: active pushes modified after the given time, newest first
    PushPage fetch_pushes(double modified_after, uint32_t limit,
                          const std::string& cursor = {});

    // Device nickname from GET /v2/devices, cached until invalidate_devices().
    // Throws ApiError(NotFound) for a device the account does not list.
    std::string device_nickname(const std::string& device_iden);

    void invalidate_devices();

private:
    nlohmann::json get_json(const std::string& path);

    HttpClient& http_;
    std::string access_token_; // never logged
    std::string base_url_;
    long timeout_s_;

    std::mutex devices_mutex_;
    bool devices_loaded_ = false;
    std::unordered_map<std::string, std::string> nicknames_;
};

} // namespace pbrelay
