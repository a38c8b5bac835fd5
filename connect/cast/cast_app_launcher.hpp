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
#include "connect/zeroconf/device_info.hpp"

// standard headers
#include <chrono>
#include <functional>
#include <string>


namespace cast
{

/// Spotify receiver app id
static constexpr auto spotify_app_id = "CC32E753";


/// Launches the Spotify receiver app on a cast receiver and authenticates through it
///
/// Sequence: CONNECT to the platform receiver, LAUNCH the app, wait for the
/// RECEIVER_STATUS that lists it, CONNECT to the app's transport and send getInfo.
/// The app is ready once it answered with getInfoResponse.
/// Every failure before that point, including the timeout, is reported as
/// ConnectErrc::device_not_ready.
class CastAppLauncher
{
public:
    using Clock = std::chrono::steady_clock;
    using NowFunction = std::function<Clock::time_point()>;

    CastAppLauncher(CastChannel& channel, ConnectSettings::Cast settings);
    ~CastAppLauncher();

    /// Launch the app on @p host and wait until it is ready
    /// @param friendly_name the receiver's friendly name, sent as remoteName
    /// @param device_id the Spotify device id to announce
    /// @param is_group true for cast groups
    /// @return the app's getInfo response
    zeroconf::DeviceInfo launch(const std::string& host, const std::string& friendly_name, const std::string& device_id, bool is_group);

    /// Log in with @p access_token, requires a successful launch
    /// @throw ConnectException(authentication_rejected) on addUserError
    zeroconf::ZeroconfResponse addUser(const std::string& access_token);

    /// Close the channel
    void close();

    /// @return transport id of the launched app, empty if not launched
    const std::string& transportId() const
    {
        return transport_id_;
    }

    /// Replace the clock, used by tests
    void setNow(NowFunction now)
    {
        now_ = std::move(now);
    }

private:
    /// Send @p payload on @p name_space to @p destination
    void send(const std::string& name_space, const std::string& destination, const json& payload);
    /// @return next json message until @p deadline, answering heartbeats on the way
    std::optional<std::pair<ChannelMessage, json>> next(Clock::time_point deadline);
    /// @return a launch failure exception
    ConnectException notReady(const std::string& detail) const;

    CastChannel& channel_;
    ConnectSettings::Cast settings_;
    NowFunction now_;
    std::string host_;
    std::string transport_id_;
    int request_id_;
};

} // namespace cast
