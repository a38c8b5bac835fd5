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
#include "common/error_code.hpp"

// standard headers
#include <exception>
#include <optional>
#include <string>


/// Status as reported by a device in a Zeroconf response
struct DeviceStatus
{
    /// numeric status (101 = OK)
    int status{0};
    /// status text, e.g. "ERROR-LOGIN-FAILED"
    std::string status_string;
    /// Spotify specific error code
    int spotify_error{0};
};


/// zeroconnect specific exceptions
class ConnectException : public std::exception
{
    zeroconnect::ErrorCode error_;
    std::optional<DeviceStatus> device_status_;
    std::string text_;

public:
    /// c'tor
    explicit ConnectException(zeroconnect::ErrorCode error) : error_(std::move(error)), text_(error_.detailed_message())
    {
    }

    /// c'tor
    ConnectException(ConnectErrc errc, const std::string& detail) : ConnectException(zeroconnect::ErrorCode(errc, detail))
    {
    }

    /// c'tor with the status reported by the device
    ConnectException(ConnectErrc errc, const std::string& detail, DeviceStatus device_status)
        : ConnectException(zeroconnect::ErrorCode(errc, detail))
    {
        text_ += " (status " + std::to_string(device_status.status) + " " + device_status.status_string + ", spotifyError " +
                 std::to_string(device_status.spotify_error) + ")";
        device_status_ = std::move(device_status);
    }

    /// d'tor
    ~ConnectException() override = default;

    /// @return error code
    const zeroconnect::ErrorCode& code() const noexcept
    {
        return error_;
    }

    /// @return status reported by the device, if the error was device reported
    const std::optional<DeviceStatus>& deviceStatus() const noexcept
    {
        return device_status_;
    }

    /// @return the exception text
    const char* what() const noexcept override
    {
        return text_.c_str();
    }
};
