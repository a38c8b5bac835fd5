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

#include "connect_error.hpp"

namespace zeroconnect::error::connect
{

namespace detail
{

struct category : public std::error_category
{
public:
    const char* name() const noexcept override;
    std::string message(int value) const override;
};


const char* category::name() const noexcept
{
    return "connect";
}

std::string category::message(int value) const
{
    switch (static_cast<ConnectErrc>(value))
    {
        case ConnectErrc::success:
            return "Success";
        case ConnectErrc::discovery_failed:
            return "Service discovery failed";
        case ConnectErrc::device_unreachable:
            return "Device unreachable";
        case ConnectErrc::connection_refused:
            return "Connection refused";
        case ConnectErrc::timeout:
            return "Timeout";
        case ConnectErrc::transport_error:
            return "Transport error";
        case ConnectErrc::protocol_error:
            return "Protocol error";
        case ConnectErrc::device_error:
            return "Device reported an error";
        case ConnectErrc::key_exchange_failed:
            return "Key exchange failed";
        case ConnectErrc::crypto_failed:
            return "Crypto error";
        case ConnectErrc::validation_failed:
            return "Validation failed";
        case ConnectErrc::authentication_rejected:
            return "Authentication rejected";
        case ConnectErrc::device_busy:
            return "Device busy with another session";
        case ConnectErrc::device_not_ready:
            return "Device not ready";
        case ConnectErrc::device_not_found:
            return "Device not found";
        default:
            return "Unknown";
    }
}

} // namespace detail

const std::error_category& category()
{
    // The category singleton
    static detail::category instance;
    return instance;
}

} // namespace zeroconnect::error::connect

std::error_code make_error_code(ConnectErrc errc)
{
    return std::error_code(static_cast<int>(errc), zeroconnect::error::connect::category());
}
