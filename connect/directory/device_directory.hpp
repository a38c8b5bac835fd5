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
#include "connect/directory/connect_device.hpp"
#include "connect/discovery/discovered_service.hpp"
#include "connect/discovery/service_discovery_listener.hpp"

// standard headers
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>


namespace directory
{

enum class DirectoryEvent
{
    device_added,
    device_updated,
    device_removed
};

std::string to_string(DirectoryEvent event);


/// Registry of Spotify Connect devices
///
/// Merges devices found by mDNS discovery ("static") with the devices of the
/// backend's player list ("dynamic"). All access is guarded by one recursive
/// mutex, readers get copies. No network I/O is done while the mutex is held.
/// At most one device is active at any time.
class DeviceDirectory
{
public:
    using EventHandler = std::function<void(DirectoryEvent event, const SpotifyConnectDevice& device)>;
    /// Fetches the device info of a statically discovered device
    using InfoFetcher = std::function<zeroconf::DeviceInfo(const zeroconf::Endpoint& endpoint)>;
    using Now = std::function<std::chrono::system_clock::time_point()>;

    /// c'tor
    /// @param fetcher getInfo for refreshStatic, may be null (no device info is fetched)
    explicit DeviceDirectory(InfoFetcher fetcher = nullptr);

    /// Add a change handler, called after the lock is released
    void addHandler(EventHandler handler);

    /// Apply a discovery event, without network I/O
    void onServiceEvent(discovery::ServiceEvent event, const discovery::DiscoveredService& service);

    /// Re-read the discovery snapshot @p services
    /// getInfo is fetched for every Spotify Connect service, devices not in @p services are dropped
    void refreshStatic(const std::vector<discovery::DiscoveredService>& services);

    /// Re-read the discovery snapshot @p services, taken at @p snapshot_time
    /// Devices announced after @p snapshot_time are kept, even if missing in @p services
    void refreshStatic(const std::vector<discovery::DiscoveredService>& services, std::chrono::system_clock::time_point snapshot_time);

    /// Reconcile the backend's player list
    /// Adds dynamic-only devices, removes dynamic devices no longer reported
    /// and moves the active flag to @p active_device_id
    void mergeDynamic(const std::vector<PlayerDevice>& devices, const std::optional<std::string>& active_device_id);

    /// @return copy of all devices, sorted by name (case insensitive)
    std::vector<SpotifyConnectDevice> devices() const;

    std::optional<SpotifyConnectDevice> getByKey(const std::string& key) const;

    /// @return device whose id, name, alias or discovery name matches @p name (case insensitive)
    std::optional<SpotifyConnectDevice> getByName(const std::string& name) const;

    std::optional<SpotifyConnectDevice> getActive() const;

    /// Resolve @p id_or_name, "*" or "" select the active device
    /// @throw ConnectException (device_not_found)
    SpotifyConnectDevice resolve(const std::string& id_or_name) const;

    /// Mark @p key active, all other devices inactive
    void setActive(const std::string& key);

    /// Mark @p key inactive
    void clearActive(const std::string& key);

    /// Store the result of a successful getInfo for @p key
    void updateInfo(const std::string& key, const zeroconf::DeviceInfo& info);

    /// Flag @p key as unreachable, the device is kept
    void markUnreachable(const std::string& key);

    /// Serialize activations of one device
    /// @return the acquired lock
    /// @throw ConnectException (device_busy) if the lock is not available within @p timeout
    std::unique_lock<std::timed_mutex> lockDevice(const std::string& key, std::chrono::milliseconds timeout);

    size_t size() const;

    std::chrono::system_clock::time_point now() const
    {
        return now_();
    }

    void setNow(Now now)
    {
        now_ = std::move(now);
    }

private:
    using Events = std::vector<std::pair<DirectoryEvent, SpotifyConnectDevice>>;

    void notify(const Events& events);
    /// insert or update a static device, caller holds the lock
    void upsertStatic(const discovery::DiscoveredService& service, const std::optional<zeroconf::DeviceInfo>& info, Events& events);
    /// remove or demote a static device, caller holds the lock
    void removeStatic(const std::string& key, Events& events);
    /// move the active flag, caller holds the lock
    void activate(const std::optional<std::string>& key, Events& events);
    SpotifyConnectDevice* findById(const std::string& device_id);

    mutable std::recursive_mutex mutex_;
    std::map<std::string, SpotifyConnectDevice> devices_;
    std::map<std::string, std::unique_ptr<std::timed_mutex>> activation_locks_;
    std::vector<EventHandler> handlers_;
    InfoFetcher fetcher_;
    Now now_;
};

} // namespace directory
