/***
    This file is part of zeroconnect
    Copyright (C) 2024-2025  Johannes Pohl

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <http://www.gnu.org/licenses/>.
***/

#pragma once

// local headers
#include "common/connect_exception.hpp"

// 3rd party headers
#include <nlohmann/json.hpp>

// standard headers
#include <optional>
#include <string>
#include <vector>


using json = nlohmann::json;

namespace zeroconf
{

/// Zeroconf status codes, as carried in the "status" field
namespace status
{
static constexpr int ok = 101;
static constexpr int bad_request = 102;
static constexpr int unknown = 103;
static constexpr int not_implemented = 104;
static constexpr int login_failed = 202;
static constexpr int invalid_public_key = 203;
static constexpr int missing_action = 301;
static constexpr int invalid_action = 302;
static constexpr int invalid_arguments = 303;
static constexpr int spotify_error = 402;
/// Placeholder for devices whose getInfo failed during discovery
static constexpr int get_info_error = 9999;
} // namespace status

/// @return numeric status for a status text like "ERROR-LOGIN-FAILED", or nullopt if unknown
std::optional<int> statusFromString(const std::string& status_string);

/// @return the canonical status text of @p status
std::string statusToString(int status);


/// Result of a Zeroconf action
struct ZeroconfResponse
{
    /// numeric status, normalized from number or string
    int status{0};
    /// status text
    std::string status_string;
    /// Spotify error code
    int spotify_error{0};
    /// where the response came from (e.g. "http", "getInfoResponse")
    std::string response_source;
    /// transport status (HTTP status code, 0 for non HTTP sources)
    unsigned http_status{0};

    /// @return true for status 101
    bool isSuccess() const
    {
        return status == status::ok;
    }

    /// @return the device status as carried by exceptions
    DeviceStatus deviceStatus() const
    {
        return {status, status_string, spotify_error};
    }

    /// Parse the common status fields of @p j
    /// @param http_status transport status, used when the body carries no status
    static ZeroconfResponse fromJson(const json& j, unsigned http_status = 200);
};


/// Alias (e.g. a speaker group member) reported by getInfo
struct DeviceAlias
{
    std::string id;
    bool is_group{false};
    std::string name;
};


/// DRM and media format capabilities reported by getInfo
struct DrmMediaFormat
{
    int drm{0};
    int formats{0};
};


/// Result of the getInfo action, immutable snapshot of a device
struct DeviceInfo : public ZeroconfResponse
{
    std::string account_req;
    std::string active_user;
    std::string availability;
    std::string brand_display_name;
    std::string client_id;
    std::string device_id;
    std::string device_type;
    std::string group_status;
    std::string library_version;
    std::string model_display_name;
    int product_id{0};
    /// base64 encoded DH public key of the device
    std::string public_key;
    std::string remote_name;
    std::string resolver_version;
    std::string scope;
    int supported_capabilities{0};
    std::string token_type;
    std::string version;
    std::string voice_support;
    std::vector<DeviceAlias> aliases;
    std::vector<DrmMediaFormat> drm_media_formats;

    /// @return true if the device is a Sonos device
    bool isSonos() const;

    /// @return true if the device runs librespot (stored credentials required)
    bool isLibrespot() const;

    /// @return true if the device reports an invalid key while its Spotify component is not loaded
    bool isNotLoaded() const;

    /// @return true if the device accepts an access token instead of a login blob
    bool usesAccessToken() const;

    /// @return true if the access token request requires a TOTP
    bool requiresTotp() const;

    /// @return getInfo response as json
    json toJson() const;

    /// Parse a getInfo body
    static DeviceInfo fromJson(const json& j, unsigned http_status = 200);
};


/// Public key reported by devices that can not handle a login right now ("INVALID")
static constexpr auto invalid_public_key = "SU5WQUxJRA==";

} // namespace zeroconf
