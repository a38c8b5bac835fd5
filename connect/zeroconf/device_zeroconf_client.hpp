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
#include "connect/connect_settings.hpp"
#include "connect/crypto/login_blob.hpp"
#include "connect/zeroconf/access_token_provider.hpp"
#include "connect/zeroconf/credentials.hpp"
#include "connect/zeroconf/device_info.hpp"
#include "connect/zeroconf/http_transport.hpp"

// standard headers
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>


namespace zeroconf
{

/// Address of a device's Zeroconf HTTP API
struct Endpoint
{
    std::string host;
    uint16_t port{0};
    /// path from the "CPath" TXT record
    std::string cpath{"/"};
    /// version from the "VERSION" TXT record, empty = use the configured version
    std::string version;

    /// @return "http://<host>:<port><cpath>"
    std::string url() const;

    bool operator==(const Endpoint& other) const
    {
        return (host == other.host) && (port == other.port) && (cpath == other.cpath) && (version == other.version);
    }
};


/// @return endpoint of the Zeroconf API at @p host:@p port
/// @throw ConnectException (validation_failed) if @p host is empty or @p port is not in [1..65535]
Endpoint makeEndpoint(const std::string& host, size_t port, const std::string& cpath = "/");


/// Identity of this controller, sent to devices that expect it
struct OriginDevice
{
    std::string name;
    /// hex sha1 of the name
    std::string id;

    /// @return origin with the id derived from @p name
    static OriginDevice fromName(const std::string& name);
};


/// Form data of the addUser action
struct AddUserRequest
{
    std::string user_name;
    std::string login_id;
    std::string blob;
    std::string client_key;
    std::string token_type{"default"};
    std::optional<OriginDevice> origin;
};


/// Activation state of a device, as seen by this controller
enum class ActivationState
{
    idle,
    fetching_info,
    building_blob,
    authenticating,
    active,
    disconnecting
};

/// @return name of @p state
std::string to_string(ActivationState state);

std::ostream& operator<<(std::ostream& os, ActivationState state);


/// @return the TOTP for @p now, nullopt if no secret is configured
std::optional<std::string> makeTotp(const ConnectSettings::Totp& settings, std::chrono::system_clock::time_point now);


/// Client of the Zeroconf HTTP API of one device
///
/// Implements the actions getInfo, addUser and resetUsers and the activation
/// sequence on top of them. Refused connections are retried with exponential
/// backoff, every other failure is reported immediately as ConnectException.
/// Instances must not be shared by concurrent activations of the same device.
class DeviceZeroconfClient
{
public:
    /// Builds the addUser request for the given device info
    using RequestFactory = std::function<AddUserRequest(const DeviceInfo& info)>;
    /// Waits the given time
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    /// Current wall clock time
    using Clock = std::function<std::chrono::system_clock::time_point()>;
    /// Returns the new endpoint of a device after resetUsers, nullopt to keep the current one
    using RediscoveryHandler = std::function<std::optional<Endpoint>(const Endpoint& endpoint)>;

    /// c'tor
    /// @param transport the HTTP transport, must outlive the client
    /// @param endpoint the device address
    /// @param settings Zeroconf API settings
    /// @param totp TOTP settings for access token devices
    DeviceZeroconfClient(HttpTransport& transport, Endpoint endpoint, ConnectSettings::Zeroconf settings, ConnectSettings::Totp totp = {});

    /// Fetch the device info
    /// A pending rediscovery (state Disconnecting) is resolved first
    DeviceInfo getInfo();

    /// Send @p request with the addUser action
    /// On ERROR-INVALID-PUBLICKEY the request is rebuilt with @p rebuild and sent once more,
    /// using the public key of the error response or, if it carries none, the key of the device once it is loaded.
    /// @return the successful response
    ZeroconfResponse addUser(const AddUserRequest& request, const RequestFactory& rebuild = nullptr);

    /// Log out the current user of the device
    /// An empty or non json response is interpreted by its HTTP status
    ZeroconfResponse resetUsers();

    /// Run the complete activation sequence
    /// getInfo, build the login blob (or fetch an access token), addUser
    /// @param credentials user credentials
    /// @param token_provider source of access tokens for token based devices, may be null
    /// @return the device info the activation was based on
    DeviceInfo activate(const Credentials& credentials, AccessTokenProvider* token_provider = nullptr);

    /// Log out and return to Idle (or Disconnecting, if a rediscovery handler is set)
    void deactivate();

    /// Build the addUser request for @p info
    AddUserRequest buildRequest(const DeviceInfo& info, const Credentials& credentials, AccessTokenProvider* token_provider) const;

    ActivationState state() const
    {
        return state_;
    }

    Endpoint endpoint() const;

    void setRediscoveryHandler(RediscoveryHandler handler)
    {
        rediscovery_handler_ = std::move(handler);
    }

    void setSleeper(Sleeper sleeper)
    {
        sleeper_ = std::move(sleeper);
    }

    void setClock(Clock clock)
    {
        clock_ = std::move(clock);
    }

private:
    /// send @p request, retrying refused connections
    HttpResponse send(HttpRequest request, const std::string& action);
    /// @return request to @p action with the given form fields (post) or query (get)
    HttpRequest makeRequest(const std::string& action, bool post, FormFields fields = {}) const;
    /// @return the json object in @p body, nullopt if the body is no json object
    static std::optional<json> parseJson(const std::string& body);
    /// @return parsed status of an addUser or resetUsers response
    ZeroconfResponse toResponse(const HttpResponse& response, const std::string& action) const;
    /// wait for the device to leave "NOT-LOADED"
    DeviceInfo waitUntilLoaded();
    /// throw the ConnectException matching a non success @p response
    [[noreturn]] void throwStatus(const ZeroconfResponse& response, const std::string& action) const;
    /// resolve a pending rediscovery
    void rediscover();

    HttpTransport& transport_;
    mutable std::mutex mutex_;
    Endpoint endpoint_;
    /// last successful getInfo, used to rebuild a rejected request
    std::optional<DeviceInfo> last_info_;
    ConnectSettings::Zeroconf settings_;
    ConnectSettings::Totp totp_;
    std::atomic<ActivationState> state_;
    RediscoveryHandler rediscovery_handler_;
    Sleeper sleeper_;
    Clock clock_;
};

} // namespace zeroconf
