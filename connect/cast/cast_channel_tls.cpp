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
#include "cast_channel_tls.hpp"

// local headers
#include "common/connect_exception.hpp"
#include "connect/cast/cast_channel.pb.h"

// 3rd party headers
#include <aixlog.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>

// standard headers
#include <array>
#include <cstdint>


using namespace std;
using tcp = boost::asio::ip::tcp;

static constexpr auto LOG_TAG = "CastChannel";

/// frames larger than this are treated as protocol violation
static constexpr size_t max_frame_size = 64 * 1024;


namespace cast
{

std::string encodeFrame(const ChannelMessage& message)
{
    zeroconnect::cast::proto::CastMessage msg;
    msg.set_protocol_version(zeroconnect::cast::proto::CastMessage::CASTV2_1_0);
    msg.set_source_id(message.source_id);
    msg.set_destination_id(message.destination_id);
    msg.set_namespace_(message.name_space);
    msg.set_payload_type(zeroconnect::cast::proto::CastMessage::STRING);
    msg.set_payload_utf8(message.payload);

    string body = msg.SerializeAsString();
    auto size = static_cast<uint32_t>(body.size());
    string frame;
    frame.reserve(4 + body.size());
    frame.push_back(static_cast<char>((size >> 24) & 0xff));
    frame.push_back(static_cast<char>((size >> 16) & 0xff));
    frame.push_back(static_cast<char>((size >> 8) & 0xff));
    frame.push_back(static_cast<char>(size & 0xff));
    frame += body;
    return frame;
}


uint32_t frameSize(const std::string& header)
{
    if (header.size() < 4)
        throw ConnectException(ConnectErrc::protocol_error, "Cast frame header too short: " + to_string(header.size()));
    return (static_cast<uint32_t>(static_cast<uint8_t>(header[0])) << 24) | (static_cast<uint32_t>(static_cast<uint8_t>(header[1])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(header[2])) << 8) | static_cast<uint32_t>(static_cast<uint8_t>(header[3]));
}


ChannelMessage decodeFrame(const std::string& body)
{
    zeroconnect::cast::proto::CastMessage msg;
    if (!msg.ParseFromString(body))
        throw ConnectException(ConnectErrc::protocol_error, "Failed to parse cast message");

    ChannelMessage message;
    message.source_id = msg.source_id();
    message.destination_id = msg.destination_id();
    message.name_space = msg.namespace_();
    if (msg.payload_type() == zeroconnect::cast::proto::CastMessage::STRING)
        message.payload = msg.payload_utf8();
    else
        message.payload = msg.payload_binary();
    return message;
}


CastChannelTls::CastChannelTls() : ssl_context_(boost::asio::ssl::context::tls_client)
{
    ssl_context_.set_verify_mode(boost::asio::ssl::verify_none);
}


CastChannelTls::~CastChannelTls()
{
    close();
}


bool CastChannelTls::runFor(const bool& done, std::chrono::milliseconds timeout)
{
    io_context_.restart();
    io_context_.run_for(timeout);
    if (done)
        return true;

    // cancel and let the aborted handlers finish
    boost::system::error_code ec;
    stream_->lowest_layer().cancel(ec);
    io_context_.restart();
    io_context_.run();
    return false;
}


zeroconnect::ErrorCode CastChannelTls::connect(const std::string& host, uint16_t port, std::chrono::milliseconds timeout)
{
    close();
    endpoint_ = host + ":" + to_string(port);
    LOG(DEBUG, LOG_TAG) << "Connecting to " << endpoint_ << "\n";

    boost::system::error_code resolve_ec;
    tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, to_string(port), resolve_ec);
    if (resolve_ec)
        return {ConnectErrc::transport_error, endpoint_ + ", " + resolve_ec.message()};

    stream_.emplace(io_context_, ssl_context_);
    bool done = false;
    boost::system::error_code result;
    boost::asio::async_connect(stream_->lowest_layer(), endpoints, [&](const boost::system::error_code& ec, const tcp::endpoint& /*endpoint*/)
    {
        if (ec)
        {
            result = ec;
            done = true;
            return;
        }
        stream_->async_handshake(boost::asio::ssl::stream_base::client, [&](const boost::system::error_code& ec)
        {
            result = ec;
            done = true;
        });
    });

    if (!runFor(done, timeout))
    {
        stream_ = std::nullopt;
        return {ConnectErrc::timeout, endpoint_ + ", no TLS connection within " + to_string(timeout.count()) + " ms"};
    }
    if (result)
    {
        LOG(DEBUG, LOG_TAG) << "Failed to connect to " << endpoint_ << ": " << result.message() << "\n";
        stream_ = std::nullopt;
        if (result == boost::asio::error::connection_refused)
            return {ConnectErrc::connection_refused, endpoint_ + ", " + result.message()};
        return {ConnectErrc::transport_error, endpoint_ + ", " + result.message()};
    }
    LOG(INFO, LOG_TAG) << "Connected to " << endpoint_ << "\n";
    return {};
}


zeroconnect::ErrorCode CastChannelTls::send(const ChannelMessage& message)
{
    if (!stream_.has_value())
        return {ConnectErrc::transport_error, "Not connected"};

    LOG(TRACE, LOG_TAG) << "Send " << message.name_space << " to " << message.destination_id << ": " << message.payload << "\n";
    string frame = encodeFrame(message);
    boost::system::error_code ec;
    boost::asio::write(*stream_, boost::asio::buffer(frame), ec);
    if (ec)
        return {ConnectErrc::transport_error, endpoint_ + ", " + ec.message()};
    return {};
}


std::optional<std::string> CastChannelTls::nextFrame()
{
    if (rx_buffer_.size() < 4)
        return std::nullopt;
    size_t size = frameSize(rx_buffer_);
    if (size > max_frame_size)
        throw ConnectException(ConnectErrc::protocol_error, "Cast frame too large: " + to_string(size));
    if (rx_buffer_.size() < 4 + size)
        return std::nullopt;
    string body = rx_buffer_.substr(4, size);
    rx_buffer_.erase(0, 4 + size);
    return body;
}


zeroconnect::ErrorOr<std::optional<ChannelMessage>> CastChannelTls::receive(std::chrono::milliseconds timeout)
{
    if (!stream_.has_value())
        return zeroconnect::ErrorCode(ConnectErrc::transport_error, "Not connected");

    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> chunk;
    while (true)
    {
        auto body = nextFrame();
        if (body.has_value())
        {
            auto message = decodeFrame(*body);
            LOG(TRACE, LOG_TAG) << "Received " << message.name_space << " from " << message.source_id << ": " << message.payload << "\n";
            return std::optional<ChannelMessage>(std::move(message));
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0)
            return std::optional<ChannelMessage>();

        bool done = false;
        boost::system::error_code result;
        size_t received = 0;
        stream_->async_read_some(boost::asio::buffer(chunk), [&](const boost::system::error_code& ec, size_t bytes)
        {
            result = ec;
            received = bytes;
            done = true;
        });
        if (!runFor(done, remaining))
            return std::optional<ChannelMessage>();
        if (result)
            return zeroconnect::ErrorCode(ConnectErrc::transport_error, endpoint_ + ", " + result.message());
        rx_buffer_.append(chunk.data(), received);
    }
}


void CastChannelTls::close()
{
    rx_buffer_.clear();
    if (!stream_.has_value())
        return;
    LOG(DEBUG, LOG_TAG) << "Closing connection to " << endpoint_ << "\n";
    boost::system::error_code ec;
    stream_->lowest_layer().shutdown(tcp::socket::shutdown_both, ec);
    stream_->lowest_layer().close(ec);
    stream_ = std::nullopt;
}

} // namespace cast
