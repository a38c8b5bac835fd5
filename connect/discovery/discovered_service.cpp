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
#include "discovered_service.hpp"

// local headers
#include "common/utils/string_utils.hpp"

// standard headers
#include <algorithm>
#include <cctype>


namespace discovery
{

bool CaseInsensitiveLess::operator()(const std::string& lhs, const std::string& rhs) const
{
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
                                        [](unsigned char a, unsigned char b) { return std::tolower(a) < std::tolower(b); });
}


std::string DiscoveredService::makeKey(const std::string& name)
{
    return utils::string::tolower_copy(name);
}


std::string DiscoveredService::txtValue(const std::string& key, const std::string& def) const
{
    auto iter = txt.find(key);
    if (iter == txt.end())
        return def;
    return iter->second;
}


std::string DiscoveredService::address() const
{
    if (addresses.empty())
        return "";
    return addresses.front();
}


std::string DiscoveredService::deviceName() const
{
    return name.substr(0, name.find('.'));
}


std::string DiscoveredService::cpath() const
{
    std::string cpath = txtValue("CPath", "/");
    if (cpath.empty())
        return "/";
    if (cpath.front() != '/')
        cpath.insert(0, "/");
    return cpath;
}


std::string DiscoveredService::version() const
{
    return txtValue("VERSION");
}


bool DiscoveredService::isCast() const
{
    return service_type.find("_googlecast") != std::string::npos;
}


std::string DiscoveredService::friendlyName() const
{
    std::string fn = txtValue("fn");
    if (isCast() && !fn.empty())
        return fn;
    return deviceName();
}


bool DiscoveredService::merge(const ServiceAnnouncement& announcement, Clock::time_point now)
{
    bool changed = false;
    if (name != announcement.name)
    {
        name = announcement.name;
        changed = true;
    }
    if (!announcement.address.empty() && (std::find(addresses.begin(), addresses.end(), announcement.address) == addresses.end()))
    {
        addresses.push_back(announcement.address);
        changed = true;
    }
    if ((port != announcement.port) || (host_name != announcement.host_name) || (txt != announcement.txt))
    {
        port = announcement.port;
        host_name = announcement.host_name;
        txt = announcement.txt;
        changed = true;
    }
    service_type = announcement.service_type;
    last_seen = now;
    return changed;
}

} // namespace discovery
