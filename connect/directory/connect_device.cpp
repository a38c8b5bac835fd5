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
#include "connect_device.hpp"

// local headers
#include "common/utils/string_utils.hpp"


namespace directory
{

std::string to_string(DeviceOrigin origin)
{
    return (origin == DeviceOrigin::dynamic) ? "dynamic" : "static";
}


zeroconf::Endpoint SpotifyConnectDevice::endpoint() const
{
    return {host, port, cpath, version};
}


bool SpotifyConnectDevice::matches(const std::string& id_or_name) const
{
    using utils::string::iequals;
    if (iequals(device_id, id_or_name) || iequals(name, id_or_name))
        return true;
    if (!discovery_name.empty() && iequals(discovery_name, id_or_name))
        return true;
    for (const auto& alias : aliases)
    {
        if (iequals(alias, id_or_name))
            return true;
    }
    return false;
}


json SpotifyConnectDevice::toJson() const
{
    json j;
    j["key"] = key;
    j["id"] = device_id;
    j["name"] = name;
    j["aliases"] = aliases;
    j["discoveryName"] = discovery_name;
    j["host"] = host;
    j["port"] = port;
    j["cpath"] = cpath;
    j["version"] = version;
    j["origin"] = to_string(origin);
    j["isCast"] = is_cast;
    j["isActive"] = is_active;
    j["isInPlayerList"] = is_in_player_list;
    j["isReachable"] = is_reachable;
    j["lastRefreshed"] = std::chrono::duration_cast<std::chrono::seconds>(last_refreshed.time_since_epoch()).count();
    if (info.has_value())
        j["info"] = info->toJson();
    return j;
}

} // namespace directory
