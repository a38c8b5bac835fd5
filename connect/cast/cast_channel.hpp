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
#include <optional>
#include <string>


namespace cast
{

namespace ns
{
static constexpr auto connection = "urn:x-cast:com.google.cast.tp.connection";
static constexpr auto heartbeat = "urn:x-cast:com.google.cast.tp.heartbeat";
static constexpr auto receiver = "urn:x-cast:com.google.cast.receiver";
static constexpr auto spotify = "urn:x-cast:com.spotify.chromecast.secure.v1";
} // namespace ns

static constexpr auto default_sender_id = "sender-0";
static constexpr auto default_receiver_id = "receiver-0";


/// A string message on the cast channel
struct ChannelMessage
{
    std::string source_id{default_sender_id};
    std::string destination_id{default_receiver_id};
    std::string name_space;
    /// utf-8 payload, json for all namespaces in use
    std::string payload;
};


/// @return protobuf encoded @p message, prefixed with its 4 byte big endian length
std::string encodeFrame(const ChannelMessage& message);

/// @return body size announced by the first 4 bytes of @p header (big endian)
/// @throw ConnectException(protocol_error) if @p header is shorter than 4 bytes
uint32_t frameSize(const std::string& header);

/// @return message decoded from a frame body (without length prefix)
/// @throw ConnectException(protocol_error) if @p body is not a CastMessage
ChannelMessage decodeFrame(const std::string& body);


/// Blocking, message oriented connection to a cast receiver
/// Errors are returned, never thrown:
///  - ConnectErrc::connection_refused if the receiver refused the connection
///  - ConnectErrc::timeout if connect did not complete in time
///  - ConnectErrc::transport_error for TLS and socket errors
class CastChannel
{
public:
    virtual ~CastChannel() = default;

    /// Connect to @p host:@p port and complete the TLS handshake
    virtual zeroconnect::ErrorCode connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout) = 0;
    /// Send @p message
    virtual zeroconnect::ErrorCode send(const ChannelMessage& message) = 0;
    /// Wait up to @p timeout for the next message
    /// @return the message, nullopt if none arrived in time
    virtual zeroconnect::ErrorOr<std::optional<ChannelMessage>> receive(std::chrono::milliseconds timeout) = 0;
    /// Close the connection, no-op if not connected
    virtual void close() = 0;
};

} // namespace cast
