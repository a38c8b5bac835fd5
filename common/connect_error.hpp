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
#include <system_error>


// http://blog.think-async.com/2010/04/system-error-support-in-c0x-part-5.html


enum class ConnectErrc
{
    success = 0,

    // mDNS browser or resolver failure
    discovery_failed = 1,

    // Device did not answer within the retry bound
    device_unreachable = 10,
    // TCP connect was actively refused (transport only)
    connection_refused = 11,
    // Connect or total timeout elapsed (transport only)
    timeout = 12,
    // Any other socket or HTTP error (transport only)
    transport_error = 13,

    // Malformed or unexpected response
    protocol_error = 20,
    // Device reported a non-success status that is not an auth failure
    device_error = 21,

    // Invalid peer public key or persistent ERROR-INVALID-PUBLICKEY
    key_exchange_failed = 30,
    // Cipher, digest or blob self verification failure
    crypto_failed = 31,
    // Missing or invalid input
    validation_failed = 32,

    // Device rejected the credentials
    authentication_rejected = 40,
    // Another activation of the same device is in progress
    device_busy = 41,
    // Cast receiver app did not become ready in time
    device_not_ready = 42,
    // No directory entry matches the id or name
    device_not_found = 43
};

namespace zeroconnect::error::connect
{
const std::error_category& category();
}



namespace std
{
template <>
struct is_error_code_enum<ConnectErrc> : public std::true_type
{
};
} // namespace std

std::error_code make_error_code(ConnectErrc);
