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
#include "connect/zeroconf/device_info.hpp"
#include "connect/zeroconf/device_zeroconf_client.hpp"

// standard headers
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>


namespace directory
{

/// Device id of devices whose getInfo failed
static constexpr auto get_info_error_id = "getInfoError";

/// Address placeholder of devices only known to the backend
static constexpr auto dynamic_host = "127.0.0.1";
static constexpr auto dynamic_cpath = "/zc";
static constexpr auto dynamic_version = "1.0";


/// How a device became known
enum class DeviceOrigin
{
    /// mDNS discovery on the local network
    static_discovery,
    /// reported by the backend's player list
    dynamic
};

std::string to_string(DeviceOrigin origin);


/// Device as reported by the backend's player API
struct PlayerDevice
{
    std::string id;
    std::string name;
    std::string type;
    bool is_active{false};
};


/// Merged directory entry
struct SpotifyConnectDevice
{
    /// directory key: discovery instance key, or the device id for dynamic devices
    std::string key;
    std::string device_id;
    /// display name
    std::string name;
    std::vector<std::string> aliases;
    /// mDNS instance name, empty for dynamic devices
    std::string discovery_name;
    std::string host;
    uint16_t port{0};
    std::string cpath{"/"};
    std::string version;
    DeviceOrigin origin{DeviceOrigin::static_discovery};
    bool is_cast{false};
    bool is_active{false};
    bool is_in_player_list{false};
    bool is_reachable{true};
    std::chrono::system_clock::time_point last_refreshed;
    /// last getInfo result
    std::optional<zeroconf::DeviceInfo> info;

    /// @return the Zeroconf endpoint
    zeroconf::Endpoint endpoint() const;

    /// @return true if @p id_or_name matches the id, name, an alias or the discovery name (case insensitive)
    bool matches(const std::string& id_or_name) const;

    bool isDynamic() const
    {
        return origin == DeviceOrigin::dynamic;
    }

    /// @return json representation, as printed by the CLI
    json toJson() const;
};

} // namespace directory
