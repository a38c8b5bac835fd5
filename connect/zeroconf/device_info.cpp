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

// prototype/interface header file
#include "device_info.hpp"

// local headers
#include "common/utils/string_utils.hpp"

// standard headers
#include <cctype>
#include <cstdint>
#include <limits>
#include <map>


namespace zeroconf
{

namespace
{

const std::map<int, std::string>& statusNames()
{
    static const std::map<int, std::string> names{{status::ok, "OK"},
                                                  {status::bad_request, "ERROR-BAD-REQUEST"},
                                                  {status::unknown, "ERROR-UNKNOWN"},
                                                  {status::not_implemented, "ERROR-NOT-IMPLEMENTED"},
                                                  {status::login_failed, "ERROR-LOGIN-FAILED"},
                                                  {status::invalid_public_key, "ERROR-INVALID-PUBLICKEY"},
                                                  {status::missing_action, "ERROR-MISSING-ACTION"},
                                                  {status::invalid_action, "ERROR-INVALID-ACTION"},
                                                  {status::invalid_arguments, "ERROR-INVALID-ARGUMENTS"},
                                                  {status::spotify_error, "ERROR-SPOTIFY-ERROR"}};
    return names;
}


bool isNumber(const std::string& s)
{
    if (s.empty() || (s.size() > 9))
        return false;
    for (char c : s)
        if (std::isdigit(static_cast<unsigned char>(c)) == 0)
            return false;
    return true;
}


/// @return string value of @p key, numbers and bools are converted
std::string getString(const json& j, const char* key)
{
    auto iter = j.find(key);
    if ((iter == j.end()) || iter->is_null())
        return "";
    if (iter->is_string())
        return iter->get<std::string>();
    if (iter->is_number_integer())
        return std::to_string(iter->get<int64_t>());
    if (iter->is_boolean())
        return iter->get<bool>() ? "true" : "false";
    return iter->dump();
}


/// @return int value of @p key, numeric strings are converted, nullopt for floats and values out of range
std::optional<int> getInt(const json& j, const char* key)
{
    auto iter = j.find(key);
    if ((iter == j.end()) || iter->is_null())
        return std::nullopt;
    if (iter->is_number_unsigned())
    {
        auto value = iter->get<uint64_t>();
        if (value <= static_cast<uint64_t>(std::numeric_limits<int>::max()))
            return static_cast<int>(value);
        return std::nullopt;
    }
    if (iter->is_number_integer())
    {
        auto value = iter->get<int64_t>();
        if ((value >= std::numeric_limits<int>::min()) && (value <= std::numeric_limits<int>::max()))
            return static_cast<int>(value);
        return std::nullopt;
    }
    if (iter->is_string())
    {
        std::string value = utils::string::trim_copy(iter->get<std::string>());
        // at most 9 digits, always fits
        if (isNumber(value))
            return std::stoi(value);
    }
    return std::nullopt;
}

} // namespace


std::optional<int> statusFromString(const std::string& status_string)
{
    std::string upper = utils::string::toupper_copy(utils::string::trim_copy(status_string));
    if (upper == "ERROR-OK")
        return status::ok;
    for (const auto& [code, name] : statusNames())
        if (name == upper)
            return code;
    return std::nullopt;
}


std::string statusToString(int status)
{
    auto iter = statusNames().find(status);
    if (iter != statusNames().end())
        return iter->second;
    return "ERROR-" + std::to_string(status);
}


ZeroconfResponse ZeroconfResponse::fromJson(const json& j, unsigned http_status)
{
    if (!j.is_object())
        throw ConnectException(ConnectErrc::protocol_error, "Zeroconf response is not a json object");

    ZeroconfResponse response;
    response.http_status = http_status;
    response.response_source = getString(j, "responseSource");
    response.status_string = getString(j, "statusString");
    response.spotify_error = getInt(j, "spotifyError").value_or(0);

    // "status" may be a number, a numeric string or a status text
    if (auto status = getInt(j, "status"); status.has_value())
    {
        response.status = *status;
    }
    else if (auto text = getString(j, "status"); !text.empty())
    {
        auto status_code = statusFromString(text);
        if (!status_code.has_value())
            throw ConnectException(ConnectErrc::protocol_error, "Unknown zeroconf status: '" + text + "'");
        response.status = *status_code;
        if (response.status_string.empty())
            response.status_string = text;
    }
    else if (auto status_code = statusFromString(response.status_string); status_code.has_value())
    {
        response.status = *status_code;
    }
    else if ((http_status >= 200) && (http_status < 300))
    {
        response.status = status::ok;
    }
    else
    {
        throw ConnectException(ConnectErrc::protocol_error, "Zeroconf response without status, HTTP status " + std::to_string(http_status));
    }

    if (response.status_string.empty())
        response.status_string = statusToString(response.status);
    return response;
}


bool DeviceInfo::isSonos() const
{
    return utils::string::tolower_copy(brand_display_name) == "sonos";
}


bool DeviceInfo::isLibrespot() const
{
    return model_display_name == "librespot";
}


bool DeviceInfo::isNotLoaded() const
{
    return (public_key == invalid_public_key) && (availability == "NOT-LOADED");
}


bool DeviceInfo::usesAccessToken() const
{
    return (token_type == "accesstoken") || (token_type == "authorization_code");
}


bool DeviceInfo::requiresTotp() const
{
    return token_type == "accesstoken";
}


json DeviceInfo::toJson() const
{
    json j;
    j["status"] = status;
    j["statusString"] = status_string;
    j["spotifyError"] = spotify_error;
    j["responseSource"] = response_source;
    j["accountReq"] = account_req;
    j["activeUser"] = active_user;
    j["availability"] = availability;
    j["brandDisplayName"] = brand_display_name;
    j["clientID"] = client_id;
    j["deviceID"] = device_id;
    j["deviceType"] = device_type;
    j["groupStatus"] = group_status;
    j["libraryVersion"] = library_version;
    j["modelDisplayName"] = model_display_name;
    j["productID"] = product_id;
    j["publicKey"] = public_key;
    j["remoteName"] = remote_name;
    j["resolverVersion"] = resolver_version;
    j["scope"] = scope;
    j["supported_capabilities"] = supported_capabilities;
    j["tokenType"] = token_type;
    j["version"] = version;
    j["voiceSupport"] = voice_support;
    j["aliases"] = json::array();
    for (const auto& alias : aliases)
        j["aliases"].push_back({{"id", alias.id}, {"isGroup", alias.is_group}, {"name", alias.name}});
    j["supported_drm_media_formats"] = json::array();
    for (const auto& format : drm_media_formats)
        j["supported_drm_media_formats"].push_back({{"drm", format.drm}, {"formats", format.formats}});
    return j;
}


DeviceInfo DeviceInfo::fromJson(const json& j, unsigned http_status)
{
    DeviceInfo info;
    static_cast<ZeroconfResponse&>(info) = ZeroconfResponse::fromJson(j, http_status);
    info.account_req = getString(j, "accountReq");
    info.active_user = getString(j, "activeUser");
    info.availability = getString(j, "availability");
    info.brand_display_name = getString(j, "brandDisplayName");
    info.client_id = getString(j, "clientID");
    info.device_id = getString(j, "deviceID");
    info.device_type = getString(j, "deviceType");
    info.group_status = getString(j, "groupStatus");
    info.library_version = getString(j, "libraryVersion");
    info.model_display_name = getString(j, "modelDisplayName");
    info.product_id = getInt(j, "productID").value_or(0);
    info.public_key = getString(j, "publicKey");
    info.remote_name = getString(j, "remoteName");
    info.resolver_version = getString(j, "resolverVersion");
    info.scope = getString(j, "scope");
    info.supported_capabilities = getInt(j, "supported_capabilities").value_or(0);
    info.token_type = getString(j, "tokenType");
    info.version = getString(j, "version");
    info.voice_support = getString(j, "voiceSupport");

    if (auto aliases = j.find("aliases"); (aliases != j.end()) && aliases->is_array())
    {
        for (const auto& item : *aliases)
        {
            if (!item.is_object())
                continue;
            DeviceAlias alias;
            alias.id = getString(item, "id");
            alias.name = getString(item, "name");
            alias.is_group = (getString(item, "isGroup") == "true");
            info.aliases.push_back(std::move(alias));
        }
    }

    if (auto formats = j.find("supported_drm_media_formats"); (formats != j.end()) && formats->is_array())
    {
        for (const auto& item : *formats)
        {
            if (!item.is_object())
                continue;
            info.drm_media_formats.push_back({getInt(item, "drm").value_or(0), getInt(item, "formats").value_or(0)});
        }
    }

    // cast receivers report "empty" instead of omitting the key
    if (info.public_key == "empty")
        info.public_key.clear();

    return info;
}

} // namespace zeroconf
