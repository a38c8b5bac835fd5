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
#include "cast_app_launcher.hpp"

// local headers
#include "common/utils/string_utils.hpp"

// 3rd party headers
#include <aixlog.hpp>


using namespace std;

static constexpr auto LOG_TAG = "CastLauncher";


namespace cast
{

CastAppLauncher::CastAppLauncher(CastChannel& channel, ConnectSettings::Cast settings)
    : channel_(channel), settings_(std::move(settings)), now_([] { return Clock::now(); }), request_id_(0)
{
}


CastAppLauncher::~CastAppLauncher()
{
    close();
}


void CastAppLauncher::close()
{
    transport_id_.clear();
    channel_.close();
}


ConnectException CastAppLauncher::notReady(const std::string& detail) const
{
    return ConnectException(ConnectErrc::device_not_ready, host_ + ": " + detail);
}


void CastAppLauncher::send(const std::string& name_space, const std::string& destination, const json& payload)
{
    ChannelMessage message;
    message.destination_id = destination;
    message.name_space = name_space;
    message.payload = payload.dump();
    auto ec = channel_.send(message);
    if (ec)
        throw notReady("failed to send " + payload.value("type", std::string{}) + ": " + ec.detailed_message());
}


std::optional<std::pair<ChannelMessage, json>> CastAppLauncher::next(Clock::time_point deadline)
{
    while (true)
    {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now_());
        if (remaining.count() <= 0)
            return std::nullopt;

        auto received = channel_.receive(remaining);
        if (received.hasError())
            throw notReady(received.getError().detailed_message());
        if (!received.getValue().has_value())
            continue;

        ChannelMessage message = *received.takeValue();
        json payload = json::parse(message.payload, nullptr, false);
        if (payload.is_discarded() || !payload.is_object())
        {
            LOG(DEBUG, LOG_TAG) << "Ignoring non json message on " << message.name_space << "\n";
            continue;
        }

        if (message.name_space == ns::heartbeat)
        {
            if (payload.value("type", std::string{}) == "PING")
                send(ns::heartbeat, message.source_id, {{"type", "PONG"}});
            continue;
        }
        return std::make_pair(std::move(message), std::move(payload));
    }
}


zeroconf::DeviceInfo CastAppLauncher::launch(const std::string& host, const std::string& friendly_name, const std::string& device_id, bool is_group)
{
    host_ = host;
    transport_id_.clear();
    auto timeout = settings_.activationTimeout();
    auto deadline = now_() + timeout;
    LOG(INFO, LOG_TAG) << "Launching Spotify on '" << friendly_name << "' (" << host << "), timeout: " << timeout.count() << " ms\n";

    auto ec = channel_.connect(host, settings_.port, timeout);
    if (ec)
        throw notReady(ec.detailed_message());

    send(ns::connection, default_receiver_id, {{"type", "CONNECT"}});
    send(ns::receiver, default_receiver_id, {{"type", "LAUNCH"}, {"appId", spotify_app_id}, {"requestId", ++request_id_}});

    while (auto message = next(deadline))
    {
        const auto& [msg, payload] = *message;
        std::string type = payload.value("type", std::string{});
        LOG(DEBUG, LOG_TAG) << "Received '" << type << "' on " << msg.name_space << "\n";

        if (msg.name_space == ns::receiver)
        {
            if ((type == "LAUNCH_ERROR") || (type == "INVALID_REQUEST"))
                throw notReady("launch failed: " + payload.value("reason", type));
            if ((type != "RECEIVER_STATUS") || !transport_id_.empty())
                continue;

            auto status = payload.find("status");
            if ((status == payload.end()) || !status->is_object() || !status->contains("applications"))
                continue;
            for (const auto& app : (*status)["applications"])
            {
                if (app.is_object() && (app.value("appId", std::string{}) == spotify_app_id) && app.contains("transportId") && app["transportId"].is_string())
                {
                    transport_id_ = app["transportId"].get<std::string>();
                    break;
                }
            }
            if (transport_id_.empty())
                continue;

            LOG(DEBUG, LOG_TAG) << "App launched, transport id: " << transport_id_ << "\n";
            send(ns::connection, transport_id_, {{"type", "CONNECT"}});
            json info_payload = {{"remoteName", friendly_name}, {"deviceID", device_id}, {"deviceAPI_isGroup", is_group}};
            send(ns::spotify, transport_id_, {{"type", "getInfo"}, {"payload", info_payload}});
        }
        else if (msg.name_space == ns::spotify)
        {
            json inner = payload.value("payload", json::object());
            if (type == "getInfoResponse")
            {
                auto info = zeroconf::DeviceInfo::fromJson(inner, 200);
                info.response_source = type;
                if (info.device_id.empty())
                    info.device_id = device_id;
                if (info.remote_name.empty())
                    info.remote_name = friendly_name;
                LOG(INFO, LOG_TAG) << "Spotify is ready on '" << friendly_name << "'\n";
                return info;
            }
            if ((type == "getInfoError") || (type == "launchError"))
                throw notReady(type + ": " + inner.dump());
        }
    }

    throw notReady("Spotify app not ready within " + to_string(timeout.count()) + " ms");
}


zeroconf::ZeroconfResponse CastAppLauncher::addUser(const std::string& access_token)
{
    if (transport_id_.empty())
        throw notReady("Spotify app is not launched");

    LOG(DEBUG, LOG_TAG) << "addUser, token: " << utils::string::mask(access_token) << "\n";
    send(ns::spotify, transport_id_, {{"type", "addUser"}, {"payload", {{"blob", access_token}, {"tokenType", "accesstoken"}}}});

    auto deadline = now_() + settings_.activationTimeout();
    while (auto message = next(deadline))
    {
        const auto& [msg, payload] = *message;
        if (msg.name_space != ns::spotify)
            continue;

        std::string type = payload.value("type", std::string{});
        json inner = payload.value("payload", json::object());
        if (type == "addUserResponse")
        {
            auto response = zeroconf::ZeroconfResponse::fromJson(inner, 200);
            response.response_source = type;
            LOG(INFO, LOG_TAG) << "addUser succeeded on " << host_ << "\n";
            return response;
        }
        if (type == "addUserError")
        {
            DeviceStatus status{zeroconf::status::login_failed, "ERROR-LOGIN-FAILED", 0};
            if (inner.is_object() && (inner.contains("status") || inner.contains("statusString")))
            {
                auto response = zeroconf::ZeroconfResponse::fromJson(inner, 0);
                status = {response.status, response.status_string, response.spotify_error};
            }
            throw ConnectException(ConnectErrc::authentication_rejected, host_ + ": addUser rejected", status);
        }
    }
    throw notReady("no addUser response within " + to_string(settings_.activationTimeout().count()) + " ms");
}

} // namespace cast
