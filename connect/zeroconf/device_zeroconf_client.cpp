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
#include "device_zeroconf_client.hpp"

// local headers
#include "common/connect_exception.hpp"
#include "common/utils/string_utils.hpp"
#include "connect/crypto/diffie_hellman.hpp"
#include "connect/crypto/totp.hpp"

// 3rd party headers
#include <aixlog.hpp>

// standard headers
#include <algorithm>
#include <limits>
#include <thread>


using namespace std;
using namespace std::chrono_literals;

static constexpr auto LOG_TAG = "ZeroconfClient";


namespace zeroconf
{

std::string Endpoint::url() const
{
    return "http://" + host + ":" + std::to_string(port) + cpath;
}


Endpoint makeEndpoint(const std::string& host, size_t port, const std::string& cpath)
{
    if (host.empty())
        throw ConnectException(ConnectErrc::validation_failed, "Device host must not be empty");
    if ((port == 0) || (port > std::numeric_limits<uint16_t>::max()))
        throw ConnectException(ConnectErrc::validation_failed, "Invalid device port: " + std::to_string(port) + ", expected 1..65535");
    return Endpoint{host, static_cast<uint16_t>(port), cpath.empty() ? "/" : cpath, ""};
}


OriginDevice OriginDevice::fromName(const std::string& name)
{
    return {name, crypto::toHex(crypto::sha1(crypto::toBytes(name)))};
}


std::string to_string(ActivationState state)
{
    switch (state)
    {
        case ActivationState::idle:
            return "Idle";
        case ActivationState::fetching_info:
            return "FetchingInfo";
        case ActivationState::building_blob:
            return "BuildingBlob";
        case ActivationState::authenticating:
            return "Authenticating";
        case ActivationState::active:
            return "Active";
        case ActivationState::disconnecting:
            return "Disconnecting";
    }
    return "Unknown";
}


std::ostream& operator<<(std::ostream& os, ActivationState state)
{
    os << to_string(state);
    return os;
}


std::optional<std::string> makeTotp(const ConnectSettings::Totp& settings, std::chrono::system_clock::time_point now)
{
    if (settings.secret.empty())
    {
        LOG(WARNING, LOG_TAG) << "TOTP required, but no secret is configured\n";
        return std::nullopt;
    }
    auto unix_time = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    return crypto::TotpGenerator::generate(crypto::TotpGenerator::base32Decode(settings.secret), settings.step, settings.digits,
                                           static_cast<uint64_t>(unix_time));
}



DeviceZeroconfClient::DeviceZeroconfClient(HttpTransport& transport, Endpoint endpoint, ConnectSettings::Zeroconf settings, ConnectSettings::Totp totp)
    : transport_(transport), endpoint_(std::move(endpoint)), settings_(std::move(settings)), totp_(std::move(totp)), state_(ActivationState::idle),
      sleeper_([](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); }), clock_([] { return std::chrono::system_clock::now(); })
{
    if (endpoint_.cpath.empty())
        endpoint_.cpath = "/";
}


Endpoint DeviceZeroconfClient::endpoint() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return endpoint_;
}


HttpRequest DeviceZeroconfClient::makeRequest(const std::string& action, bool post, FormFields fields) const
{
    Endpoint endpoint = this->endpoint();
    std::string version = endpoint.version.empty() ? settings_.version : endpoint.version;

    HttpRequest request;
    request.host = endpoint.host;
    request.port = endpoint.port;
    request.connect_timeout = settings_.connect_timeout;
    request.total_timeout = (action == "getInfo") ? settings_.info_timeout : settings_.action_timeout;
    if (post)
    {
        request.method = HttpRequest::Method::post;
        request.target = endpoint.cpath;
        fields.insert(fields.begin(), {{"action", action}, {"version", version}});
        request.body = formEncode(fields);
    }
    else
    {
        request.method = HttpRequest::Method::get;
        request.target = endpoint.cpath + "?action=" + utils::string::urlEncode(action) + "&version=" + utils::string::urlEncode(version);
    }
    return request;
}


HttpResponse DeviceZeroconfClient::send(HttpRequest request, const std::string& action)
{
    size_t max_attempts = std::max<size_t>(settings_.retry.max_attempts, 1);
    for (size_t attempt = 1;; ++attempt)
    {
        auto result = transport_.send(request);
        if (result.hasValue())
            return result.takeValue();

        const zeroconnect::ErrorCode& error = result.getError();
        if ((error == ConnectErrc::connection_refused) && (attempt < max_attempts))
        {
            auto delay = settings_.retry.delay(attempt);
            LOG(WARNING, LOG_TAG) << action << " to " << request.host << ":" << request.port << " refused (attempt " << attempt << "/" << max_attempts
                                  << "), retrying in " << delay.count() << " ms\n";
            sleeper_(delay);
            continue;
        }

        LOG(ERROR, LOG_TAG) << action << " to " << request.host << ":" << request.port << " failed after " << attempt
                            << " attempt(s): " << error.detailed_message() << "\n";
        throw ConnectException(ConnectErrc::device_unreachable,
                               action + " to " + request.host + ":" + std::to_string(request.port) + " failed: " + error.detailed_message());
    }
}


std::optional<json> DeviceZeroconfClient::parseJson(const std::string& body)
{
    if (utils::string::trim_copy(body).empty())
        return std::nullopt;
    json j = json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;
    return j;
}


ZeroconfResponse DeviceZeroconfClient::toResponse(const HttpResponse& response, const std::string& action) const
{
    // devices send json with all kinds of content types, so the body decides
    if (auto j = parseJson(response.body); j.has_value())
        return ZeroconfResponse::fromJson(*j, response.status);

    if (response.isSuccess())
    {
        LOG(DEBUG, LOG_TAG) << action << " returned no json, HTTP status " << response.status << " => OK\n";
        ZeroconfResponse result;
        result.status = status::ok;
        result.status_string = statusToString(status::ok);
        result.http_status = response.status;
        return result;
    }

    throw ConnectException(ConnectErrc::protocol_error,
                           action + " failed with HTTP status " + std::to_string(response.status) + ": '" + response.body + "'");
}


void DeviceZeroconfClient::throwStatus(const ZeroconfResponse& response, const std::string& action) const
{
    std::string detail = action + " rejected by " + endpoint().url();
    switch (response.status)
    {
        case status::login_failed:
        case status::spotify_error:
            throw ConnectException(ConnectErrc::authentication_rejected, detail, response.deviceStatus());
        case status::invalid_public_key:
            throw ConnectException(ConnectErrc::key_exchange_failed, detail, response.deviceStatus());
        default:
            throw ConnectException(ConnectErrc::device_error, detail, response.deviceStatus());
    }
}


void DeviceZeroconfClient::rediscover()
{
    if (state_ != ActivationState::disconnecting)
        return;

    Endpoint current = endpoint();
    if (rediscovery_handler_)
    {
        auto endpoint = rediscovery_handler_(current);
        if (endpoint.has_value() && !(*endpoint == current))
        {
            LOG(INFO, LOG_TAG) << "Device moved from " << current.url() << " to " << endpoint->url() << "\n";
            std::lock_guard<std::mutex> lock(mutex_);
            endpoint_ = *endpoint;
            if (endpoint_.cpath.empty())
                endpoint_.cpath = "/";
        }
    }
    state_ = ActivationState::idle;
}


DeviceInfo DeviceZeroconfClient::getInfo()
{
    rediscover();

    HttpResponse response = send(makeRequest("getInfo", false), "getInfo");
    auto j = parseJson(response.body);
    if (!j.has_value())
        throw ConnectException(ConnectErrc::protocol_error,
                               "getInfo returned no json object, HTTP status " + std::to_string(response.status) + ": '" + response.body + "'");

    DeviceInfo info = DeviceInfo::fromJson(*j, response.status);
    if (!info.isSuccess())
        throwStatus(info, "getInfo");

    LOG(DEBUG, LOG_TAG) << "getInfo " << endpoint().url() << ": '" << info.remote_name << "', id: " << info.device_id << ", model: '"
                        << info.model_display_name << "', token type: '" << info.token_type << "', availability: '" << info.availability << "'\n";

    std::lock_guard<std::mutex> lock(mutex_);
    last_info_ = info;
    return info;
}


DeviceInfo DeviceZeroconfClient::waitUntilLoaded()
{
    std::chrono::milliseconds waited{0};
    while (true)
    {
        sleeper_(settings_.availability_poll_interval);
        waited += settings_.availability_poll_interval;
        DeviceInfo info = getInfo();
        if (info.availability != "NOT-LOADED")
        {
            LOG(DEBUG, LOG_TAG) << "Device '" << info.remote_name << "' available after " << waited.count() << " ms\n";
            return info;
        }
        if (waited >= settings_.availability_timeout)
        {
            LOG(WARNING, LOG_TAG) << "Device '" << info.remote_name << "' still not loaded after " << waited.count() << " ms\n";
            return info;
        }
    }
}


ZeroconfResponse DeviceZeroconfClient::addUser(const AddUserRequest& request, const RequestFactory& rebuild)
{
    auto post = [this](const AddUserRequest& req)
    {
        FormFields fields{{"tokenType", req.token_type}, {"clientKey", req.client_key}, {"loginId", req.login_id},
                          {"userName", req.user_name},   {"blob", req.blob}};
        if (req.origin.has_value())
        {
            fields.emplace_back("deviceName", req.origin->name);
            fields.emplace_back("deviceId", req.origin->id);
        }
        LOG(DEBUG, LOG_TAG) << "addUser '" << req.user_name << "', token type: '" << req.token_type
                            << "', blob: " << utils::string::mask(req.blob) << ", origin: " << (req.origin.has_value() ? req.origin->name : "-") << "\n";
        return send(makeRequest("addUser", true, std::move(fields)), "addUser");
    };

    HttpResponse http = post(request);
    ZeroconfResponse response = toResponse(http, "addUser");

    if ((response.status == status::invalid_public_key) && rebuild)
    {
        // the device supplies its current key inline, or publishes it once it is loaded
        std::string inline_key;
        if (auto j = parseJson(http.body); j.has_value())
            inline_key = DeviceInfo::fromJson(*j, http.status).public_key;

        DeviceInfo info;
        if (!inline_key.empty() && (inline_key != invalid_public_key))
        {
            LOG(INFO, LOG_TAG) << "addUser: invalid public key, retrying with the key of the error response\n";
            std::optional<DeviceInfo> last;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                last = last_info_;
            }
            info = last.has_value() ? *last : getInfo();
            info.public_key = inline_key;
        }
        else
        {
            LOG(INFO, LOG_TAG) << "addUser: invalid public key, waiting for the device to load\n";
            info = waitUntilLoaded();
        }

        http = post(rebuild(info));
        response = toResponse(http, "addUser");
    }

    if (!response.isSuccess())
        throwStatus(response, "addUser");

    sleeper_(settings_.post_action_delay);
    return response;
}


ZeroconfResponse DeviceZeroconfClient::resetUsers()
{
    HttpResponse http = send(makeRequest("resetUsers", true), "resetUsers");
    ZeroconfResponse response = toResponse(http, "resetUsers");
    if (!response.isSuccess())
        throwStatus(response, "resetUsers");

    LOG(INFO, LOG_TAG) << "resetUsers " << endpoint().url() << ": " << response.status_string << "\n";
    sleeper_(settings_.post_action_delay);
    return response;
}


AddUserRequest DeviceZeroconfClient::buildRequest(const DeviceInfo& info, const Credentials& credentials, AccessTokenProvider* token_provider) const
{
    AddUserRequest request;
    request.login_id = credentials.loginId();
    request.user_name = credentials.username;
    OriginDevice origin = OriginDevice::fromName(settings_.origin_device_name);

    if (info.isLibrespot())
    {
        if (!credentials.stored.has_value())
            throw ConnectException(ConnectErrc::validation_failed, "Device '" + info.remote_name + "' runs librespot and requires a stored credential blob");
        request.user_name = credentials.stored->username;
        if (credentials.login_id.empty())
            request.login_id = request.user_name;
        request.token_type = "";
        request.origin = origin;
        if (!info.isNotLoaded())
        {
            crypto::DiffieHellmanExchange dh;
            auto blob = crypto::LoginBlobBuilder().build(*credentials.stored, info.device_id, dh, info.public_key);
            request.blob = blob.blob;
            request.client_key = blob.client_key;
        }
    }
    else if (info.usesAccessToken())
    {
        if (token_provider == nullptr)
            throw ConnectException(ConnectErrc::validation_failed, "Device '" + info.remote_name + "' requires an access token (token type '" + info.token_type + "')");
        request.token_type = info.token_type;
        request.origin = origin;
        if (!info.isNotLoaded())
        {
            std::optional<std::string> totp;
            if (info.requiresTotp())
                totp = makeTotp(totp_, clock_());
            request.blob = token_provider->accessToken(totp);
            if (request.blob.empty())
                throw ConnectException(ConnectErrc::validation_failed, "Access token provider returned an empty token");
        }
    }
    else
    {
        if (credentials.username.empty() && !credentials.stored.has_value())
            throw ConnectException(ConnectErrc::validation_failed, "User name is required");
        request.token_type = "default";
        if (info.isNotLoaded())
        {
            request.origin = origin;
        }
        else
        {
            crypto::BlobCredentials blob_credentials;
            if (!credentials.password.empty())
                blob_credentials = {credentials.username, crypto::AuthenticationType::user_pass, crypto::toBytes(credentials.password)};
            else if (credentials.stored.has_value())
                blob_credentials = *credentials.stored;
            else
                throw ConnectException(ConnectErrc::validation_failed, "Password or stored credentials are required");

            crypto::DiffieHellmanExchange dh;
            auto blob = crypto::LoginBlobBuilder().build(blob_credentials, info.device_id, dh, info.public_key);
            request.user_name = blob.user_name;
            request.blob = blob.blob;
            request.client_key = blob.client_key;
        }
    }

    if (info.isNotLoaded())
    {
        // ask the device for a valid key, the blob follows on the retry
        LOG(DEBUG, LOG_TAG) << "Device '" << info.remote_name << "' is not loaded, sending addUser without blob\n";
        request.blob.clear();
        request.client_key.clear();
    }
    return request;
}


DeviceInfo DeviceZeroconfClient::activate(const Credentials& credentials, AccessTokenProvider* token_provider)
{
    rediscover();
    LOG(INFO, LOG_TAG) << "Activating " << endpoint().url() << " for user '" << credentials.loginId() << "'\n";
    try
    {
        state_ = ActivationState::fetching_info;
        DeviceInfo info = getInfo();

        state_ = ActivationState::building_blob;
        AddUserRequest request = buildRequest(info, credentials, token_provider);

        state_ = ActivationState::authenticating;
        addUser(request, [this, &credentials, token_provider](const DeviceInfo& current) { return buildRequest(current, credentials, token_provider); });

        state_ = ActivationState::active;
        LOG(INFO, LOG_TAG) << "Device '" << info.remote_name << "' (" << info.device_id << ") is active\n";
        return info;
    }
    catch (const ConnectException& e)
    {
        LOG(ERROR, LOG_TAG) << "Activation of " << endpoint().url() << " failed in state " << state_.load() << ": " << e.what() << "\n";
        state_ = ActivationState::idle;
        throw;
    }
}


void DeviceZeroconfClient::deactivate()
{
    ActivationState previous = state_;
    state_ = ActivationState::disconnecting;
    try
    {
        resetUsers();
    }
    catch (const ConnectException& e)
    {
        LOG(ERROR, LOG_TAG) << "Deactivation of " << endpoint().url() << " failed: " << e.what() << "\n";
        state_ = previous;
        throw;
    }

    // the device might reopen its listener on another port, resolved on the next getInfo
    if (!rediscovery_handler_)
        state_ = ActivationState::idle;
}

} // namespace zeroconf
