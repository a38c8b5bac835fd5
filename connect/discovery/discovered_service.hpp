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

// standard headers
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>


namespace discovery
{

/// Case insensitive ordering of TXT keys
struct CaseInsensitiveLess
{
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

/// TXT record, keys are case insensitive
using TxtRecord = std::map<std::string, std::string, CaseInsensitiveLess>;

using Clock = std::chrono::steady_clock;


/// One resolved announcement, as reported by the mDNS browser
struct ServiceAnnouncement
{
    /// service instance name, e.g. "Kitchen"
    std::string name;
    /// service type, e.g. "_spotify-connect._tcp"
    std::string service_type;
    std::string host_name;
    /// IP address of this announcement
    std::string address;
    uint16_t port{0};
    TxtRecord txt;
};


/// A service instance, merged from all its announcements
struct DiscoveredService
{
    /// lowercase instance name, stable across updates
    std::string key;
    /// instance name as announced
    std::string name;
    std::string service_type;
    std::string host_name;
    /// all addresses the instance was announced with, in receipt order
    std::vector<std::string> addresses;
    uint16_t port{0};
    TxtRecord txt;
    Clock::time_point last_seen;

    /// @return key for the instance @p name
    static std::string makeKey(const std::string& name);

    /// @return TXT value of @p key, or @p def
    std::string txtValue(const std::string& key, const std::string& def = "") const;

    /// @return the first address
    std::string address() const;

    /// @return the instance name up to the first '.'
    std::string deviceName() const;

    /// @return the Zeroconf path ("CPath"), "/" if not announced
    std::string cpath() const;

    /// @return the Zeroconf protocol version ("VERSION"), empty if not announced
    std::string version() const;

    /// @return true for Google Cast receivers
    bool isCast() const;

    /// @return cast friendly name ("fn"), or the device name
    std::string friendlyName() const;

    /// Merge @p announcement into this instance
    /// @return true if anything but the last seen time changed
    bool merge(const ServiceAnnouncement& announcement, Clock::time_point now);
};

} // namespace discovery
