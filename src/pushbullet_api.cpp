#include "pushbullet_api.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <cctype>
#include <cstdio>
#include <iostream>

using json = nlohmann::json;

namespace pbrelay {

PushbulletApi::PushbulletApi(HttpClient& http, std::string access_token,
                             std::string base_url, long timeout_s)
    : http_(http), access_token_(std::move(access_token)),
      base_url_(base_url.empty() ? "https://api.pushbullet.com" : std::move(base_url)),
      timeout_s_(timeout_s)
{
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

json PushbulletApi::get_json(const std::string& path) {
    std::vector<Header> headers = {
        {"Access-Token", access_token_},
        {"Accept", "application/json"},
    };
    auto response = http_.get(base_url_ + path, headers, timeout_s_);

    if (response.status_code == 401 || response.status_code == 403) {
        throw AuthError("Pushbullet API rejected the access token (HTTP " +
                        std::to_string(response.status_code) + ")");
    }
    if (response.status_code == 0) {
        throw ApiError(ApiError::Kind::Unavailable, "request to " + base_url_ + " failed");
    }
    if (response.status_code == 404) {
        throw ApiError(ApiError::Kind::NotFound, path + " not found");
    }
    if (response.status_code < 200 || response.status_code >= 300) {
        throw ApiError(ApiError::Kind::Unavailable,
                       "API error (status " + std::to_string(response.status_code) + ")");
    }

    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw ApiError(ApiError::Kind::Unavailable,
                       std::string("invalid API response: ") + e.what());
    }
}

std::string PushbulletApi::fetch_user_iden() {
    json user = get_json("/v2/users/me");
    if (!user.contains("iden") || !user["iden"].is_string() ||
        user["iden"].get<std::string>().empty()) {
        throw ApiError(ApiError::Kind::Unavailable, "user record has no iden");
    }
    return user["iden"].get<std::string>();
}

static std::string url_encode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

PushPage PushbulletApi::fetch_pushes(double modified_after, uint32_t limit,
                                     const std::string& cursor) {
    char after[64];
    std::snprintf(after, sizeof(after), "%.6f", modified_after);

    std::string path = "/v2/pushes?modified_after=" + std::string(after) +
                       "&active=true&limit=" + std::to_string(limit);
    if (!cursor.empty()) path += "&cursor=" + url_encode(cursor);
    json body = get_json(path);

    PushPage page;
    if (body.contains("pushes") && body["pushes"].is_array()) {
        for (auto& p : body["pushes"]) {
            if (p.is_object()) page.pushes.push_back(std::move(p));
        }
    }
    auto next = body.find("cursor");
    if (next != body.end() && next->is_string()) page.cursor = next->get<std::string>();

    if (verbose()) {
        std::cerr << "[api] " << page.pushes.size() << " push(es) modified after " << after
                  << (page.cursor.empty() ? "" : ", more pages") << "\n";
    }
    return page;
}

std::string PushbulletApi::device_nickname(const std::string& device_iden) {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    if (!devices_loaded_) {
        json page = get_json("/v2/devices");
        nicknames_.clear();
        try {
            if (page.contains("devices") && page["devices"].is_array()) {
                for (const auto& d : page["devices"]) {
                    if (!d.is_object()) continue;
                    std::string iden = d.value("iden", "");
                    std::string nickname = d.value("nickname", "");
                    if (nickname.empty()) nickname = d.value("model", "");
                    if (!iden.empty()) nicknames_[iden] = nickname;
                }
            }
        } catch (const json::type_error& e) {
            nicknames_.clear();
            throw ApiError(ApiError::Kind::Unavailable,
                           std::string("invalid device list: ") + e.what());
        }
        devices_loaded_ = true;
    }

    auto it = nicknames_.find(device_iden);
    if (it == nicknames_.end() || it->second.empty()) {
        throw ApiError(ApiError::Kind::NotFound, "unknown device " + device_iden);
    }
    return it->second;
}

void PushbulletApi::invalidate_devices() {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    devices_loaded_ = false;
    nicknames_.clear();
}

} // namespace pbrelay
