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
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>


namespace zeroconf
{

/// HTTP request to a device
struct HttpRequest
{
    enum class Method
    {
        get,
        post
    };

    Method method{Method::get};
    std::string host;
    uint16_t port{80};
    /// path and query, e.g. "/zc?action=getInfo&version=2.7.1"
    std::string target{"/"};
    /// form encoded body (post only)
    std::string body;
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(2)};
    std::chrono::milliseconds total_timeout{std::chrono::seconds(4)};
};


/// HTTP response of a device
struct HttpResponse
{
    unsigned status{0};
    std::string content_type;
    std::string body;

    /// @return true for HTTP 2xx
    bool isSuccess() const
    {
        return (status >= 200) && (status < 300);
    }
};


/// Form fields in send order
using FormFields = std::vector<std::pair<std::string, std::string>>;

/// @return application/x-www-form-urlencoded representation of @p fields
std::string formEncode(const FormFields& fields);


/// Blocking HTTP/1.1 transport
/// Errors are returned, never thrown:
///  - ConnectErrc::connection_refused if the device refused the TCP connection
///  - ConnectErrc::timeout if the connect or total timeout elapsed
///  - ConnectErrc::transport_error for any other socket or HTTP error
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    /// Send @p request and wait for the response
    virtual zeroconnect::ErrorOr<HttpResponse> send(const HttpRequest& request) = 0;
};


/// HttpTransport based on Boost.Beast
/// Every request runs on its own io_context, so the calling thread is the only one blocked
class BeastHttpTransport : public HttpTransport
{
public:
    zeroconnect::ErrorOr<HttpResponse> send(const HttpRequest& request) override;
};

} // namespace zeroconf
