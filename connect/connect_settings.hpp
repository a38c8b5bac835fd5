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
#include <string>


/// zeroconnect settings
struct ConnectSettings
{
    /// mDNS discovery settings
    struct Discovery
    {
        /// Spotify Connect service type
        std::string service_type{"_spotify-connect._tcp"};
        /// Google Cast service type
        std::string cast_service_type{"_googlecast._tcp"};
        /// browse for cast receivers as well
        bool cast_enabled{true};
        /// time to collect announcements for a one shot discovery
        std::chrono::milliseconds timeout{std::chrono::seconds(3)};
        /// drop services not seen for this time, 0 = rely on explicit removal
        std::chrono::seconds ttl{0};
        /// period of the background refresh
        std::chrono::seconds refresh_interval{30};
    };

    /// Connection retry policy
    struct Retry
    {
        /// number of attempts, including the first one
        size_t max_attempts{4};
        /// delay after the first refused attempt, doubled on every retry
        std::chrono::milliseconds initial_delay{250};
        /// upper bound of the delay
        std::chrono::milliseconds max_delay{2000};

        /// @return delay before attempt @p attempt + 1 (@p attempt is 1 based)
        std::chrono::milliseconds delay(size_t attempt) const
        {
            auto result = initial_delay;
            for (size_t n = 1; (n < attempt) && (result < max_delay); ++n)
                result *= 2;
            return (result > max_delay) ? max_delay : result;
        }
    };

    /// Zeroconf HTTP API settings
    struct Zeroconf
    {
        /// protocol version, used if the TXT record carries none
        std::string version{"2.7.1"};
        /// TCP connect timeout
        std::chrono::milliseconds connect_timeout{std::chrono::seconds(2)};
        /// total timeout of getInfo
        std::chrono::milliseconds info_timeout{std::chrono::seconds(4)};
        /// total timeout of addUser and resetUsers
        std::chrono::milliseconds action_timeout{std::chrono::seconds(10)};
        /// delay after a successful addUser or resetUsers
        std::chrono::milliseconds post_action_delay{500};
        /// getInfo poll interval while a device is "NOT-LOADED"
        std::chrono::milliseconds availability_poll_interval{250};
        /// max time to wait for a device to leave "NOT-LOADED"
        std::chrono::milliseconds availability_timeout{std::chrono::seconds(5)};
        /// name of this controller, sent as "deviceName" to devices that want it
        std::string origin_device_name{"zeroconnect"};
        /// retry policy for refused connections
        Retry retry;
    };

    /// Google Cast settings
    struct Cast
    {
        /// TLS port of the receiver
        uint16_t port{8009};
        /// max time for the Spotify receiver app to become ready
        std::chrono::milliseconds activation_timeout{std::chrono::seconds(15)};

        /// @return activation timeout clamped to [1s, 30s]
        std::chrono::milliseconds activationTimeout() const
        {
            if (activation_timeout < std::chrono::seconds(1))
                return std::chrono::seconds(1);
            if (activation_timeout > std::chrono::seconds(30))
                return std::chrono::seconds(30);
            return activation_timeout;
        }
    };

    /// User credentials
    struct Credentials
    {
        /// credential blob file (librespot "credentials.json" format)
        std::string blob_file;
        /// canonical user id
        std::string login_id;
        /// Spotify user name
        std::string username;
        /// Spotify password
        std::string password;
        /// access token for token based devices
        std::string access_token;
    };

    /// TOTP settings
    struct Totp
    {
        /// base32 encoded shared secret, empty = no TOTP
        std::string secret;
        /// time step [s]
        uint32_t step{30};
        /// number of digits
        uint32_t digits{6};
    };

    /// Log settings
    struct Logging
    {
        /// The log sink (null,system,stdout,stderr,file)
        std::string sink;
        /// Log filter
        std::string filter{"*:info"};
    };

    Discovery discovery;
    Zeroconf zeroconf;
    Cast cast;
    Credentials credentials;
    Totp totp;
    Logging logging;
};
