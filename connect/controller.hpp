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
#include "connect/cast/cast_channel.hpp"
#include "connect/connect_settings.hpp"
#include "connect/directory/device_directory.hpp"
#include "connect/directory/player_device_source.hpp"
#include "connect/discovery/service_browser.hpp"
#include "connect/discovery/service_discovery_listener.hpp"
#include "connect/zeroconf/access_token_provider.hpp"
#include "connect/zeroconf/credentials.hpp"
#include "connect/zeroconf/device_zeroconf_client.hpp"
#include "connect/zeroconf/http_transport.hpp"

// 3rd party headers
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

// standard headers
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>


/// Facade of the Spotify Connect controller
///
/// Owns the discovery listeners (Spotify Connect and, optionally, Google Cast)
/// and the device directory, and runs activations against the devices.
/// Static devices are refreshed and the backend's player list is pulled
/// periodically on a dedicated worker, so slow devices never block browsing.
class ConnectController
{
public:
    using CastChannelFactory = std::function<std::unique_ptr<cast::CastChannel>()>;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /// c'tor
    /// @param settings the controller settings
    /// @param transport HTTP transport for the Zeroconf API
    /// @param connect_browser browser for the Spotify Connect service type
    /// @param cast_browser browser for the cast service type, may be null
    ConnectController(ConnectSettings settings, zeroconf::HttpTransport& transport, discovery::ServiceBrowser& connect_browser,
                      discovery::ServiceBrowser* cast_browser = nullptr);
    ~ConnectController();

    void setPlayerDeviceSource(directory::PlayerDeviceSource* source)
    {
        player_source_ = source;
    }

    void setAccessTokenProvider(zeroconf::AccessTokenProvider* provider)
    {
        token_provider_ = provider;
    }

    void setCastChannelFactory(CastChannelFactory factory)
    {
        cast_channel_factory_ = std::move(factory);
    }

    /// Replace the wait used by discover and by the Zeroconf clients, used by tests
    void setSleeper(Sleeper sleeper)
    {
        sleeper_ = std::move(sleeper);
    }

    /// Start browsing and the periodic refresh
    /// @throw ConnectException (discovery_failed)
    void start();

    /// Stop the refresh and browsing, waits for a running refresh to finish
    void stop();

    /// Browse for the discovery timeout, then refresh all devices
    /// @return the known devices
    std::vector<directory::SpotifyConnectDevice> discover();

    /// Refresh static devices and pull the player list once
    void refresh();

    /// @return copy of the known devices
    std::vector<directory::SpotifyConnectDevice> listDevices() const;

    std::optional<directory::SpotifyConnectDevice> getActiveDevice() const;

    /// @return the getInfo response of @p id_or_name
    zeroconf::DeviceInfo getInfo(const std::string& id_or_name);

    /// Log in @p credentials on @p id_or_name ("*" or "" = the active device)
    /// @return the device info the activation was based on
    /// @throw ConnectException
    zeroconf::DeviceInfo activate(const std::string& id_or_name, const zeroconf::Credentials& credentials);

    /// Log out the user of @p id_or_name
    void deactivate(const std::string& id_or_name);

    /// Reconcile the backend's player list
    void updatePlayerDevices(const std::vector<directory::PlayerDevice>& devices, const std::optional<std::string>& active_device_id);

    directory::DeviceDirectory& directory()
    {
        return directory_;
    }

private:
    /// @return all discovered services of both listeners
    std::vector<discovery::DiscoveredService> discoveredServices() const;
    /// @return the Zeroconf client of @p device, to be used with the device lock held
    /// A client is kept per device, so a pending rediscovery survives until the next action.
    std::shared_ptr<zeroconf::DeviceZeroconfClient> clientFor(const directory::SpotifyConnectDevice& device);
    zeroconf::DeviceInfo activateCast(const directory::SpotifyConnectDevice& device);
    void scheduleRefresh();

    ConnectSettings settings_;
    zeroconf::HttpTransport& transport_;
    discovery::ServiceDiscoveryListener connect_listener_;
    std::unique_ptr<discovery::ServiceDiscoveryListener> cast_listener_;
    directory::DeviceDirectory directory_;
    directory::PlayerDeviceSource* player_source_;
    zeroconf::AccessTokenProvider* token_provider_;
    CastChannelFactory cast_channel_factory_;
    Sleeper sleeper_;
    /// Zeroconf clients by device key
    std::map<std::string, std::shared_ptr<zeroconf::DeviceZeroconfClient>> clients_;
    std::mutex clients_mutex_;

    boost::asio::io_context refresh_ioc_;
    boost::asio::steady_timer refresh_timer_;
    std::thread refresh_thread_;
    std::atomic<bool> running_;
};
