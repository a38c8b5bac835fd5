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

// 3rd party headers
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>

// standard headers
#include <optional>
#include <string>


namespace cast
{

/// CastChannel over TLS, based on Boost.Asio
/// Cast receivers present self signed certificates, the peer is not verified
class CastChannelTls : public CastChannel
{
public:
    CastChannelTls();
    ~CastChannelTls() override;

    zeroconnect::ErrorCode connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) override;
    zeroconnect::ErrorCode send(const ChannelMessage& message) override;
    zeroconnect::ErrorOr<std::optional<ChannelMessage>> receive(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    using ssl_socket = boost::asio::ssl::stream<boost::asio::ip::tcp::socket>;

    /// Run the io_context until @p done or @p timeout, cancel pending operations on timeout
    /// @return false on timeout
    bool runFor(const bool& done, std::chrono::milliseconds timeout);
    /// @return a complete frame body from rx_buffer_, if any
    std::optional<std::string> nextFrame();

    boost::asio::io_context io_context_;
    boost::asio::ssl::context ssl_context_;
    std::optional<ssl_socket> stream_;
    std::string rx_buffer_;
    std::string endpoint_;
};

} // namespace cast
