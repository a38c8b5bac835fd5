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
#include "device_directory.hpp"

// local headers
#include "common/connect_exception.hpp"
#include "common/utils/string_utils.hpp"
#include "connect/crypto/crypto_utils.hpp"

// 3rd party headers
#include <aixlog.hpp>

// standard headers
#include <algorithm>
#include <set>


static constexpr auto LOG_TAG = "Directory";


namespace directory
{

std::string to_string(DirectoryEvent event)
{
    switch (event)
    {
        case DirectoryEvent::device_added:
            return "DeviceAdded";
        case DirectoryEvent::device_updated:
            return "DeviceUpdated";
        case DirectoryEvent::device_removed:
            return "DeviceRemoved";
    }
    return "Unknown";
}


DeviceDirectory::DeviceDirectory(InfoFetcher fetcher) : fetcher_(std::move(fetcher)), now_([] { return std::chrono::system_clock::now(); })
{
}


void DeviceDirectory::addHandler(EventHandler handler)
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}


void DeviceDirectory::notify(const Events& events)
{
    if (events.empty())
        return;

    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        handlers = handlers_;
    }
    for (const auto& [event, device] : events)
    {
        LOG(DEBUG, LOG_TAG) << to_string(event) << ": '" << device.name << "', key: " << device.key << ", id: " << device.device_id
                            << ", active: " << device.is_active << "\n";
        for (const auto& handler : handlers)
            handler(event, device);
    }
}


SpotifyConnectDevice* DeviceDirectory::findById(const std::string& device_id)
{
    if (device_id.empty())
        return nullptr;
    for (auto& [key, device] : devices_)
    {
        if (device.device_id == device_id)
            return &device;
    }
    return nullptr;
}


void DeviceDirectory::upsertStatic(const discovery::DiscoveredService& service, const std::optional<zeroconf::DeviceInfo>& info, Events& events)
{
    auto existing = devices_.find(service.key);
    if (service.isCast() && (existing != devices_.end()) && !existing->second.is_cast && !existing->second.isDynamic())
    {
        LOG(DEBUG, LOG_TAG) << "Ignoring cast announcement of '" << service.name << "', known as Spotify Connect device\n";
        return;
    }

    bool is_new = (existing == devices_.end());
    SpotifyConnectDevice device = is_new ? SpotifyConnectDevice{} : existing->second;
    device.key = service.key;
    device.origin = DeviceOrigin::static_discovery;
    device.discovery_name = service.name;
    device.host = service.address();
    device.port = service.port;
    device.cpath = service.cpath();
    device.version = service.version();
    device.is_cast = service.isCast();
    device.last_refreshed = now_();

    if (info.has_value())
    {
        device.info = *info;
        if (info->status == zeroconf::status::get_info_error)
        {
            device.is_reachable = false;
            if (device.device_id.empty())
                device.device_id = get_info_error_id;
        }
        else
        {
            device.is_reachable = true;
            if (!info->device_id.empty())
                device.device_id = info->device_id;
            if (!info->remote_name.empty())
                device.name = info->remote_name;
            device.aliases.clear();
            for (const auto& alias : info->aliases)
                device.aliases.push_back(alias.name);
        }
    }

    if (device.device_id.empty() && device.is_cast)
        device.device_id = crypto::toHex(crypto::md5(crypto::toBytes(service.friendlyName())));
    if (device.name.empty())
        device.name = service.friendlyName();

    // the static entry replaces a dynamic entry of the same device and inherits its flags
    if (!device.device_id.empty() && (device.device_id != get_info_error_id))
    {
        for (auto iter = devices_.begin(); iter != devices_.end(); ++iter)
        {
            if ((iter->first != device.key) && iter->second.isDynamic() && (iter->second.device_id == device.device_id))
            {
                LOG(DEBUG, LOG_TAG) << "Discovered device '" << device.name << "' replaces dynamic entry " << iter->first << "\n";
                device.is_active = device.is_active || iter->second.is_active;
                device.is_in_player_list = device.is_in_player_list || iter->second.is_in_player_list;
                events.emplace_back(DirectoryEvent::device_removed, iter->second);
                devices_.erase(iter);
                break;
            }
        }
    }

    devices_[device.key] = device;
    events.emplace_back(is_new ? DirectoryEvent::device_added : DirectoryEvent::device_updated, device);
}


void DeviceDirectory::removeStatic(const std::string& key, Events& events)
{
    auto iter = devices_.find(key);
    if ((iter == devices_.end()) || iter->second.isDynamic())
        return;

    SpotifyConnectDevice device = iter->second;
    devices_.erase(iter);
    events.emplace_back(DirectoryEvent::device_removed, device);

    // still known to the backend: keep it as dynamic device
    if (device.is_in_player_list && !device.device_id.empty() && (device.device_id != get_info_error_id))
    {
        device.key = device.device_id;
        device.origin = DeviceOrigin::dynamic;
        device.discovery_name.clear();
        device.host = dynamic_host;
        device.port = 0;
        device.cpath = dynamic_cpath;
        device.version = dynamic_version;
        device.is_cast = false;
        devices_[device.key] = device;
        events.emplace_back(DirectoryEvent::device_added, device);
    }
}


void DeviceDirectory::activate(const std::optional<std::string>& key, Events& events)
{
    // clear first, then set: never two active devices
    for (auto& [device_key, device] : devices_)
    {
        if (device.is_active && (!key.has_value() || (device_key != *key)))
        {
            device.is_active = false;
            events.emplace_back(DirectoryEvent::device_updated, device);
        }
    }
    if (!key.has_value())
        return;
    auto iter = devices_.find(*key);
    if ((iter != devices_.end()) && !iter->second.is_active)
    {
        iter->second.is_active = true;
        events.emplace_back(DirectoryEvent::device_updated, iter->second);
    }
}


void DeviceDirectory::onServiceEvent(discovery::ServiceEvent event, const discovery::DiscoveredService& service)
{
    Events events;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (event == discovery::ServiceEvent::removed)
        {
            // a Spotify Connect and a cast announcement may share a key, only the owner removes the entry
            auto iter = devices_.find(service.key);
            if ((iter != devices_.end()) && (iter->second.is_cast != service.isCast()))
                LOG(DEBUG, LOG_TAG) << "Ignoring removal of '" << service.name << "', the entry belongs to another service type\n";
            else
                removeStatic(service.key, events);
        }
        else
            upsertStatic(service, std::nullopt, events);
    }
    notify(events);
}


void DeviceDirectory::refreshStatic(const std::vector<discovery::DiscoveredService>& services)
{
    refreshStatic(services, now_());
}


void DeviceDirectory::refreshStatic(const std::vector<discovery::DiscoveredService>& services, std::chrono::system_clock::time_point snapshot_time)
{
    // network I/O without the lock
    std::vector<std::pair<discovery::DiscoveredService, std::optional<zeroconf::DeviceInfo>>> results;
    for (const auto& service : services)
    {
        std::optional<zeroconf::DeviceInfo> info;
        if (fetcher_ && !service.isCast())
        {
            try
            {
                info = fetcher_(zeroconf::Endpoint{service.address(), service.port, service.cpath(), service.version()});
            }
            catch (const ConnectException& e)
            {
                LOG(WARNING, LOG_TAG) << "getInfo of '" << service.name << "' failed: " << e.what() << "\n";
                zeroconf::DeviceInfo placeholder;
                placeholder.status = zeroconf::status::get_info_error;
                placeholder.status_string = e.what();
                placeholder.device_id = get_info_error_id;
                placeholder.remote_name = service.friendlyName();
                info = placeholder;
            }
        }
        results.emplace_back(service, std::move(info));
    }

    Events events;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        std::set<std::string> keys;
        for (const auto& [service, info] : results)
        {
            upsertStatic(service, info, events);
            keys.insert(service.key);
        }

        std::vector<std::string> stale;
        for (const auto& [key, device] : devices_)
        {
            // announced after the snapshot was taken
            if (device.last_refreshed > snapshot_time)
                continue;
            if (!device.isDynamic() && (keys.count(key) == 0))
                stale.push_back(key);
        }
        for (const auto& key : stale)
            removeStatic(key, events);
    }
    notify(events);
}


void DeviceDirectory::mergeDynamic(const std::vector<PlayerDevice>& devices, const std::optional<std::string>& active_device_id)
{
    Events events;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto now = now_();
        std::set<std::string> reported;
        for (const auto& player : devices)
        {
            if (player.id.empty() || (reported.count(player.id) != 0))
                continue;
            reported.insert(player.id);

            SpotifyConnectDevice* device = findById(player.id);
            if (device == nullptr)
            {
                SpotifyConnectDevice entry;
                entry.key = player.id;
                entry.device_id = player.id;
                entry.name = player.name;
                entry.origin = DeviceOrigin::dynamic;
                entry.host = dynamic_host;
                entry.port = 0;
                entry.cpath = dynamic_cpath;
                entry.version = dynamic_version;
                entry.is_in_player_list = true;
                entry.last_refreshed = now;
                devices_[entry.key] = entry;
                events.emplace_back(DirectoryEvent::device_added, entry);
                continue;
            }

            bool changed = !device->is_in_player_list;
            device->is_in_player_list = true;
            if (device->isDynamic() && !player.name.empty() && (device->name != player.name))
            {
                device->name = player.name;
                changed = true;
            }
            device->last_refreshed = now;
            if (changed)
                events.emplace_back(DirectoryEvent::device_updated, *device);
        }

        // drop what the backend no longer reports
        for (auto iter = devices_.begin(); iter != devices_.end();)
        {
            SpotifyConnectDevice& device = iter->second;
            if (!device.is_in_player_list || (reported.count(device.device_id) != 0))
            {
                ++iter;
                continue;
            }
            if (device.isDynamic())
            {
                events.emplace_back(DirectoryEvent::device_removed, device);
                iter = devices_.erase(iter);
            }
            else
            {
                device.is_in_player_list = false;
                events.emplace_back(DirectoryEvent::device_updated, device);
                ++iter;
            }
        }

        std::optional<std::string> active_key;
        if (active_device_id.has_value())
        {
            if (const auto* device = findById(*active_device_id); device != nullptr)
                active_key = device->key;
        }
        activate(active_key, events);
    }
    notify(events);
}


std::vector<SpotifyConnectDevice> DeviceDirectory::devices() const
{
    std::vector<SpotifyConnectDevice> result;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        result.reserve(devices_.size());
        for (const auto& [key, device] : devices_)
            result.push_back(device);
    }
    std::stable_sort(result.begin(), result.end(), [](const SpotifyConnectDevice& lhs, const SpotifyConnectDevice& rhs)
    { return utils::string::tolower_copy(lhs.name) < utils::string::tolower_copy(rhs.name); });
    return result;
}


std::optional<SpotifyConnectDevice> DeviceDirectory::getByKey(const std::string& key) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto iter = devices_.find(key);
    if (iter == devices_.end())
        return std::nullopt;
    return iter->second;
}


std::optional<SpotifyConnectDevice> DeviceDirectory::getByName(const std::string& name) const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto& [key, device] : devices_)
    {
        if (device.matches(name))
            return device;
    }
    return std::nullopt;
}


std::optional<SpotifyConnectDevice> DeviceDirectory::getActive() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto& [key, device] : devices_)
    {
        if (device.is_active)
            return device;
    }
    return std::nullopt;
}


SpotifyConnectDevice DeviceDirectory::resolve(const std::string& id_or_name) const
{
    std::string query = utils::string::trim_copy(id_or_name);
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (query.empty() || (query == "*"))
    {
        if (auto active = getActive(); active.has_value())
            return *active;
        throw ConnectException(ConnectErrc::device_not_found, "No active device");
    }

    if (auto device = getByKey(query); device.has_value())
        return *device;
    if (auto device = getByKey(discovery::DiscoveredService::makeKey(query)); device.has_value())
        return *device;
    for (const auto& [key, device] : devices_)
    {
        if (device.device_id == query)
            return device;
    }
    if (auto device = getByName(query); device.has_value())
        return *device;
    throw ConnectException(ConnectErrc::device_not_found, "Device not found: '" + query + "'");
}


void DeviceDirectory::setActive(const std::string& key)
{
    Events events;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        if (devices_.count(key) == 0)
            throw ConnectException(ConnectErrc::device_not_found, "Device not found: '" + key + "'");
        activate(key, events);
    }
    notify(events);
}


void DeviceDirectory::clearActive(const std::string& key)
{
    Events events;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto iter = devices_.find(key);
        if ((iter != devices_.end()) && iter->second.is_active)
        {
            iter->second.is_active = false;
            events.emplace_back(DirectoryEvent::device_updated, iter->second);
        }
    }
    notify(events);
}


void DeviceDirectory::updateInfo(const std::string& key, const zeroconf::DeviceInfo& info)
{
    Events events;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto iter = devices_.find(key);
        if (iter == devices_.end())
            return;
        SpotifyConnectDevice& device = iter->second;
        device.info = info;
        device.is_reachable = true;
        device.last_refreshed = now_();
        if (!info.device_id.empty())
            device.device_id = info.device_id;
        if (!info.remote_name.empty())
            device.name = info.remote_name;
        SpotifyConnectDevice updated = device;

        for (auto dyn = devices_.begin(); dyn != devices_.end(); ++dyn)
        {
            if ((dyn->first != key) && dyn->second.isDynamic() && (dyn->second.device_id == updated.device_id))
            {
                updated.is_active = updated.is_active || dyn->second.is_active;
                updated.is_in_player_list = updated.is_in_player_list || dyn->second.is_in_player_list;
                events.emplace_back(DirectoryEvent::device_removed, dyn->second);
                devices_.erase(dyn);
                break;
            }
        }
        devices_[key] = updated;
        events.emplace_back(DirectoryEvent::device_updated, updated);
    }
    notify(events);
}


void DeviceDirectory::markUnreachable(const std::string& key)
{
    Events events;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto iter = devices_.find(key);
        if ((iter == devices_.end()) || !iter->second.is_reachable)
            return;
        LOG(INFO, LOG_TAG) << "Device '" << iter->second.name << "' is unreachable\n";
        iter->second.is_reachable = false;
        events.emplace_back(DirectoryEvent::device_updated, iter->second);
    }
    notify(events);
}


std::unique_lock<std::timed_mutex> DeviceDirectory::lockDevice(const std::string& key, std::chrono::milliseconds timeout)
{
    std::timed_mutex* mutex = nullptr;
    {
        std::lock_guard<std::recursive_mutex> lock(mutex_);
        auto& entry = activation_locks_[key];
        if (!entry)
            entry = std::make_unique<std::timed_mutex>();
        mutex = entry.get();
    }

    std::unique_lock<std::timed_mutex> lock(*mutex, std::defer_lock);
    if (!lock.try_lock_for(timeout))
        throw ConnectException(ConnectErrc::device_busy, "Device '" + key + "' is busy with another activation");
    return lock;
}


size_t DeviceDirectory::size() const
{
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return devices_.size();
}

} // namespace directory
