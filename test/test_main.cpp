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

// local headers
#include "common/base64.h"
#include "common/connect_exception.hpp"
#include "common/error_code.hpp"
#include "common/utils/string_utils.hpp"
#include "connect/cast/cast_app_launcher.hpp"
#include "connect/cast/cast_channel.hpp"
#include "connect/connect_settings.hpp"
#include "connect/controller.hpp"
#include "connect/crypto/crypto_utils.hpp"
#include "connect/crypto/diffie_hellman.hpp"
#include "connect/crypto/login_blob.hpp"
#include "connect/crypto/totp.hpp"
#include "connect/directory/device_directory.hpp"
#include "connect/discovery/service_browser.hpp"
#include "connect/discovery/service_discovery_listener.hpp"
#include "connect/zeroconf/credentials.hpp"
#include "connect/zeroconf/device_info.hpp"
#include "connect/zeroconf/device_zeroconf_client.hpp"
#include "connect/zeroconf/http_transport.hpp"

// 3rd party headers
#include <aixlog.hpp>
#include <catch2/catch_test_macros.hpp>

// standard headers
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <system_error>
#include <vector>


using namespace std;
using namespace std::chrono_literals;


namespace
{

/// HttpTransport answering with a handler, records all requests
class FakeTransport : public zeroconf::HttpTransport
{
public:
    using Handler = std::function<zeroconnect::ErrorOr<zeroconf::HttpResponse>(const zeroconf::HttpRequest& request)>;

    explicit FakeTransport(Handler handler) : handler(std::move(handler))
    {
    }

    zeroconnect::ErrorOr<zeroconf::HttpResponse> send(const zeroconf::HttpRequest& request) override
    {
        requests.push_back(request);
        return handler(request);
    }

    Handler handler;
    std::vector<zeroconf::HttpRequest> requests;
};


zeroconf::HttpResponse response(unsigned status, const std::string& body)
{
    zeroconf::HttpResponse result;
    result.status = status;
    result.content_type = "application/json";
    result.body = body;
    return result;
}


bool isAction(const zeroconf::HttpRequest& request, const std::string& action)
{
    if (request.method == zeroconf::HttpRequest::Method::get)
        return request.target.find("action=" + action) != std::string::npos;
    return request.body.find("action=" + action) != std::string::npos;
}


std::string urlDecode(const std::string& value)
{
    std::string result;
    for (size_t n = 0; n < value.size(); ++n)
    {
        if (value[n] == '+')
            result += ' ';
        else if ((value[n] == '%') && (n + 2 < value.size()))
        {
            result += static_cast<char>(std::stoi(value.substr(n + 1, 2), nullptr, 16));
            n += 2;
        }
        else
            result += value[n];
    }
    return result;
}


/// @return the decoded form fields of @p body
std::map<std::string, std::string> formFields(const std::string& body)
{
    std::map<std::string, std::string> result;
    for (const auto& pair : utils::string::split(body, '&'))
    {
        auto pos = pair.find('=');
        if (pos == std::string::npos)
            result[urlDecode(pair)] = "";
        else
            result[urlDecode(pair.substr(0, pos))] = urlDecode(pair.substr(pos + 1));
    }
    return result;
}


crypto::Bytes fromHex(const std::string& hex)
{
    crypto::Bytes result;
    for (size_t n = 0; n + 1 < hex.size(); n += 2)
        result.push_back(static_cast<uint8_t>(std::stoi(hex.substr(n, 2), nullptr, 16)));
    return result;
}


json deviceInfoJson(const std::string& public_key, const std::string& device_id = "0123456789abcdef")
{
    return {{"status", 101},
            {"statusString", "OK"},
            {"spotifyError", 0},
            {"version", "2.7.1"},
            {"deviceID", device_id},
            {"remoteName", "Kitchen"},
            {"publicKey", public_key},
            {"deviceType", "SPEAKER"},
            {"brandDisplayName", "ACME"},
            {"modelDisplayName", "Speaker One"},
            {"libraryVersion", "3.88.29"},
            {"tokenType", "default"},
            {"availability", ""},
            {"aliases", json::array()}};
}


/// DeviceZeroconfClient of 192.168.0.10:8080/zc that never sleeps
class TestClient : public zeroconf::DeviceZeroconfClient
{
public:
    TestClient(FakeTransport& transport, ConnectSettings::Totp totp)
        : zeroconf::DeviceZeroconfClient(transport, zeroconf::Endpoint{"192.168.0.10", 8080, "/zc", ""}, ConnectSettings::Zeroconf{}, std::move(totp))
    {
        setSleeper([](std::chrono::milliseconds) {});
    }
};


TestClient makeClient(FakeTransport& transport, ConnectSettings::Totp totp = {})
{
    return TestClient(transport, std::move(totp));
}


discovery::DiscoveredService makeService(const std::string& name, const std::string& service_type, const std::string& address, uint16_t port)
{
    discovery::DiscoveredService service;
    service.key = discovery::DiscoveredService::makeKey(name);
    service.name = name;
    service.service_type = service_type;
    service.addresses = {address};
    service.port = port;
    return service;
}


/// ServiceBrowser that is fed by the test
class FakeBrowser : public discovery::ServiceBrowser
{
public:
    void start(const std::string& type, ResolvedHandler resolved, RemovedHandler removed, ErrorHandler error) override
    {
        service_type = type;
        on_resolved = std::move(resolved);
        on_removed = std::move(removed);
        on_error = std::move(error);
        ++starts;
    }

    void stop() override
    {
        ++stops;
    }

    std::string service_type;
    ResolvedHandler on_resolved;
    RemovedHandler on_removed;
    ErrorHandler on_error;
    int starts{0};
    int stops{0};
};


/// CastChannel replaying queued messages
class FakeCastChannel : public cast::CastChannel
{
public:
    zeroconnect::ErrorCode connect(const std::string& host, uint16_t port, std::chrono::milliseconds /*timeout*/) override
    {
        connected_to = host + ":" + std::to_string(port);
        return {};
    }

    zeroconnect::ErrorCode send(const cast::ChannelMessage& message) override
    {
        sent.push_back(message);
        return {};
    }

    zeroconnect::ErrorOr<std::optional<cast::ChannelMessage>> receive(std::chrono::milliseconds /*timeout*/) override
    {
        if (incoming.empty())
            return std::optional<cast::ChannelMessage>();
        cast::ChannelMessage message = incoming.front();
        incoming.pop_front();
        return std::optional<cast::ChannelMessage>(std::move(message));
    }

    void close() override
    {
        ++closes;
    }

    void push(const std::string& name_space, const std::string& source, const json& payload)
    {
        cast::ChannelMessage message;
        message.source_id = source;
        message.destination_id = cast::default_sender_id;
        message.name_space = name_space;
        message.payload = payload.dump();
        incoming.push_back(message);
    }

    /// @return sent payloads of type @p type
    std::vector<json> sentOfType(const std::string& type) const
    {
        std::vector<json> result;
        for (const auto& message : sent)
        {
            json j = json::parse(message.payload);
            if (j.value("type", "") == type)
                result.push_back(j);
        }
        return result;
    }

    std::string connected_to;
    std::deque<cast::ChannelMessage> incoming;
    std::vector<cast::ChannelMessage> sent;
    int closes{0};
};


class RecordingTokenProvider : public zeroconf::AccessTokenProvider
{
public:
    std::string accessToken(const std::optional<std::string>& totp) override
    {
        totps.push_back(totp);
        return "BQAccessToken42";
    }

    std::vector<std::optional<std::string>> totps;
};


/// MODP group 1 prime
static constexpr auto prime_hex = "FFFFFFFFFFFFFFFFC90FDAA22168C234C4C6628B80DC1CD129024E088A67CC74020BBEA63B139B22514A08798E3404DDEF9519B3CD3A431B302B0A6DF25F14374FE1356D6D51C245E485B576625E7EC6F44C42E9A63A3620FFFFFFFFFFFFFFFF";

} // namespace


TEST_CASE("String utils")
{
    using namespace utils::string;
    REQUIRE(trim_copy("  test \t") == "test");

    auto strings = split("", '*');
    REQUIRE(strings.empty());

    strings = split("1**2", '*');
    REQUIRE(strings.size() == 3);
    REQUIRE(strings[0] == "1");
    REQUIRE(strings[1].empty());
    REQUIRE(strings[2] == "2");

    REQUIRE(urlEncode("a b&c=d/~") == "a+b%26c%3Dd%2F~");
    REQUIRE(iequals("Kitchen", "kITCHEN"));
    REQUIRE(!iequals("Kitchen", "Kitchen2"));
    REQUIRE(toupper_copy("error-ok") == "ERROR-OK");
    REQUIRE(mask("0123456789abcdef") == "0123********cdef");
}


TEST_CASE("Error")
{
    std::error_code ec = ConnectErrc::device_unreachable;
    REQUIRE(ec);
    REQUIRE(ec == ConnectErrc::device_unreachable);
    REQUIRE(ec != ConnectErrc::success);
    REQUIRE(std::string(ec.category().name()) == "connect");

    zeroconnect::ErrorCode error_code{};
    REQUIRE(!error_code);

    ConnectException e(ConnectErrc::authentication_rejected, "addUser", DeviceStatus{202, "ERROR-LOGIN-FAILED", 0});
    REQUIRE(e.code() == ConnectErrc::authentication_rejected);
    REQUIRE(e.deviceStatus().has_value());
    REQUIRE(e.deviceStatus()->status == 202);
    REQUIRE(std::string(e.what()).find("ERROR-LOGIN-FAILED") != std::string::npos);
}


TEST_CASE("ErrorOr")
{
    zeroconnect::ErrorOr<std::string> value("test");
    REQUIRE(value.hasValue());
    REQUIRE(value.getValue() == "test");

    zeroconnect::ErrorOr<std::string> error(zeroconnect::ErrorCode(ConnectErrc::connection_refused, "192.168.0.10:8080"));
    REQUIRE(error.hasError());
    REQUIRE(error.getError() == ConnectErrc::connection_refused);
    REQUIRE(error.getError().detailed_message().find("192.168.0.10:8080") != std::string::npos);
}


TEST_CASE("DiffieHellman")
{
    crypto::DiffieHellmanExchange alice;
    crypto::DiffieHellmanExchange bob;
    REQUIRE(alice.publicKey().size() == 96);
    REQUIRE(base64_decode_bytes(alice.publicKeyBase64()) == alice.publicKey());

    auto secret1 = alice.deriveSharedSecret(bob.publicKey());
    auto secret2 = bob.deriveSharedSecretBase64(alice.publicKeyBase64());
    REQUIRE(secret1.size() == 96);
    REQUIRE(secret1 == secret2);

    // fixed private key: 2^2 = 4, left padded to the width of the prime
    crypto::DiffieHellmanExchange fixed(crypto::Bytes{0x02});
    auto public_key = fixed.publicKey();
    REQUIRE(public_key.size() == 96);
    REQUIRE(public_key.back() == 4);
    REQUIRE(public_key.front() == 0);
    REQUIRE(crypto::DiffieHellmanExchange(crypto::Bytes{0x02}).publicKey() == public_key);

    auto prime = fromHex(prime_hex);
    auto prime_minus_one = prime;
    prime_minus_one.back() -= 1;
    for (const auto& invalid : {crypto::Bytes{0x00}, crypto::Bytes{0x01}, prime_minus_one, prime})
    {
        try
        {
            alice.deriveSharedSecret(invalid);
            FAIL("invalid peer key accepted");
        }
        catch (const ConnectException& e)
        {
            REQUIRE(e.code() == ConnectErrc::key_exchange_failed);
        }
    }
}


TEST_CASE("LoginBlob")
{
    crypto::BlobCredentials credentials{"user", crypto::AuthenticationType::user_pass, crypto::toBytes("pw")};
    auto encoded = crypto::LoginBlobBuilder::encodeCredentials(credentials);
    REQUIRE(encoded == crypto::Bytes{0x49, 0x04, 'u', 's', 'e', 'r', 0x50, 0x00, 0x51, 0x02, 'p', 'w'});
    REQUIRE(crypto::LoginBlobDecoder::decodeCredentials(encoded) == credentials);

    crypto::DiffieHellmanExchange controller;
    crypto::DiffieHellmanExchange device;
    auto blob = crypto::LoginBlobBuilder().build(credentials, "0123456789abcdef", controller, device.publicKeyBase64());
    REQUIRE(blob.user_name == "user");
    REQUIRE(blob.client_key == controller.publicKeyBase64());
    REQUIRE(blob.checksum.size() == 20);
    REQUIRE(is_base64(blob.blob));

    auto shared = device.deriveSharedSecretBase64(blob.client_key);
    REQUIRE(crypto::LoginBlobDecoder::decode(blob.blob, "0123456789abcdef", "user", shared) == credentials);
}


TEST_CASE("TOTP")
{
    // RFC 6238, appendix B, SHA1
    auto secret = crypto::toBytes("12345678901234567890");
    REQUIRE(crypto::TotpGenerator::generate(secret, 30, 8, 59) == "94287082");
    REQUIRE(crypto::TotpGenerator::generate(secret, 30, 8, 1111111109) == "07081804");
    REQUIRE(crypto::TotpGenerator::generate(secret, 30, 8, 1234567890) == "89005924");
    REQUIRE(crypto::TotpGenerator::generate(secret, 30, 8, 2000000000) == "69279037");

    // same step, same code
    REQUIRE(crypto::TotpGenerator::generate(secret, 30, 6, 60) == crypto::TotpGenerator::generate(secret, 30, 6, 89));
    REQUIRE(crypto::TotpGenerator::generate(secret, 30, 6, 59).size() == 6);

    REQUIRE(crypto::TotpGenerator::base32Decode("GEZDGNBVGY3TQOJQ") == crypto::toBytes("1234567890"));
    REQUIRE(crypto::TotpGenerator::base32Encode(crypto::toBytes("1234567890")) == "GEZDGNBVGY3TQOJQ");

    // published obfuscated secret
    std::vector<uint8_t> cipher{12, 56, 76, 33, 88, 44, 88, 33, 78, 78, 11, 66, 22, 22, 55, 69, 54};
    REQUIRE(crypto::toString(crypto::TotpGenerator::deobfuscateSecret(cipher)) == "5507145853487499592248630329347");
    REQUIRE(crypto::toString(crypto::TotpGenerator::deobfuscateSecret({12, 56})) == "550");
    std::string secret_base32 = crypto::TotpGenerator::secretFromCipher("12, 56, 76, 33, 88, 44, 88, 33, 78, 78, 11, 66, 22, 22, 55, 69, 54");
    REQUIRE(crypto::TotpGenerator::base32Decode(secret_base32) == crypto::toBytes("5507145853487499592248630329347"));
    for (const auto& invalid : {"", "12,,56", "12,256", "12,x"})
    {
        try
        {
            crypto::TotpGenerator::secretFromCipher(invalid);
            FAIL("invalid cipher accepted: " << invalid);
        }
        catch (const ConnectException& e)
        {
            REQUIRE(e.code() == ConnectErrc::validation_failed);
        }
    }

    try
    {
        crypto::TotpGenerator::generate(secret, 30, 10, 59);
        FAIL("10 digits accepted");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::validation_failed);
    }
}


TEST_CASE("Zeroconf status")
{
    using zeroconf::ZeroconfResponse;
    REQUIRE(ZeroconfResponse::fromJson({{"status", 101}}, 200).status == 101);
    REQUIRE(ZeroconfResponse::fromJson({{"status", "202"}}, 200).status == 202);
    REQUIRE(ZeroconfResponse::fromJson({{"status", "ERROR-OK"}}, 200).isSuccess());
    REQUIRE(ZeroconfResponse::fromJson({{"statusString", "ERROR-INVALID-PUBLICKEY"}}, 200).status == 203);
    REQUIRE(ZeroconfResponse::fromJson(json::object(), 200).status == 101);

    // floats and values out of the int range are ignored
    REQUIRE(ZeroconfResponse::fromJson({{"status", 101}, {"spotifyError", 1.5e12}}, 200).spotify_error == 0);
    REQUIRE(ZeroconfResponse::fromJson({{"status", 101}, {"spotifyError", 5000000000ULL}}, 200).spotify_error == 0);
    REQUIRE(ZeroconfResponse::fromJson({{"status", 101}, {"spotifyError", -5000000000LL}}, 200).spotify_error == 0);
    REQUIRE(ZeroconfResponse::fromJson({{"status", 101}, {"spotifyError", -3}}, 200).spotify_error == -3);

    auto response = ZeroconfResponse::fromJson({{"status", 402}, {"spotifyError", "7"}}, 200);
    REQUIRE(response.status_string == "ERROR-SPOTIFY-ERROR");
    REQUIRE(response.spotify_error == 7);

    try
    {
        ZeroconfResponse::fromJson(json::object(), 500);
        FAIL("response without status accepted");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::protocol_error);
    }

    json j = deviceInfoJson("empty");
    j["aliases"] = json::array({{{"id", "a1"}, {"name", "Kitchen Group"}, {"isGroup", true}}});
    j["productID"] = 4294967296ULL;
    REQUIRE(zeroconf::DeviceInfo::fromJson(j, 200).product_id == 0);
    j["productID"] = "5";
    auto info = zeroconf::DeviceInfo::fromJson(j, 200);
    REQUIRE(info.public_key.empty());
    REQUIRE(info.product_id == 5);
    REQUIRE(info.aliases.size() == 1);
    REQUIRE(info.aliases[0].is_group);

    j = deviceInfoJson(zeroconf::invalid_public_key);
    j["availability"] = "NOT-LOADED";
    REQUIRE(zeroconf::DeviceInfo::fromJson(j, 200).isNotLoaded());
}


TEST_CASE("Zeroconf getInfo")
{
    int refused = 3;
    FakeTransport transport([&](const zeroconf::HttpRequest& /*request*/) -> zeroconnect::ErrorOr<zeroconf::HttpResponse>
    {
        if (refused-- > 0)
            return zeroconnect::ErrorCode(ConnectErrc::connection_refused, "refused");
        return response(200, deviceInfoJson("AAAA").dump());
    });
    auto client = makeClient(transport);
    auto info = client.getInfo();
    REQUIRE(info.remote_name == "Kitchen");
    REQUIRE(transport.requests.size() == 4);
    REQUIRE(transport.requests.back().method == zeroconf::HttpRequest::Method::get);
    REQUIRE(transport.requests.back().target == "/zc?action=getInfo&version=2.7.1");
    REQUIRE(transport.requests.back().host == "192.168.0.10");
}


TEST_CASE("Zeroconf retry bound")
{
    FakeTransport transport([](const zeroconf::HttpRequest& /*request*/) -> zeroconnect::ErrorOr<zeroconf::HttpResponse>
    { return zeroconnect::ErrorCode(ConnectErrc::connection_refused, "refused"); });
    auto client = makeClient(transport);
    try
    {
        client.getInfo();
        FAIL("getInfo succeeded");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::device_unreachable);
    }
    REQUIRE(transport.requests.size() == ConnectSettings::Retry{}.max_attempts);

    // timeouts are not retried
    transport.requests.clear();
    transport.handler = [](const zeroconf::HttpRequest& /*request*/) -> zeroconnect::ErrorOr<zeroconf::HttpResponse>
    { return zeroconnect::ErrorCode(ConnectErrc::timeout, "timeout"); };
    try
    {
        client.getInfo();
        FAIL("getInfo succeeded");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::device_unreachable);
    }
    REQUIRE(transport.requests.size() == 1);

    // non json getInfo
    transport.handler = [](const zeroconf::HttpRequest& /*request*/) -> zeroconnect::ErrorOr<zeroconf::HttpResponse>
    { return response(200, "<html></html>"); };
    try
    {
        client.getInfo();
        FAIL("getInfo succeeded");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::protocol_error);
    }

    REQUIRE(ConnectSettings::Retry{}.delay(1) == 250ms);
    REQUIRE(ConnectSettings::Retry{}.delay(2) == 500ms);
    REQUIRE(ConnectSettings::Retry{}.delay(10) == 2000ms);
}


TEST_CASE("Zeroconf resetUsers")
{
    FakeTransport transport([](const zeroconf::HttpRequest& /*request*/) -> zeroconnect::ErrorOr<zeroconf::HttpResponse> { return response(200, ""); });
    auto client = makeClient(transport);
    auto result = client.resetUsers();
    REQUIRE(result.isSuccess());
    REQUIRE(result.http_status == 200);
    REQUIRE(transport.requests.size() == 1);
    REQUIRE(transport.requests[0].method == zeroconf::HttpRequest::Method::post);
    REQUIRE(formFields(transport.requests[0].body)["action"] == "resetUsers");

    transport.handler = [](const zeroconf::HttpRequest& /*request*/) -> zeroconnect::ErrorOr<zeroconf::HttpResponse> { return response(500, "oops"); };
    try
    {
        client.resetUsers();
        FAIL("resetUsers succeeded");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::protocol_error);
    }
}


TEST_CASE("Zeroconf activate")
{
    crypto::DiffieHellmanExchange device;
    FakeTransport transport([&](const zeroconf::HttpRequest& request) -> zeroconnect::ErrorOr<zeroconf::HttpResponse>
    {
        if (isAction(request, "getInfo"))
            return response(200, deviceInfoJson(device.publicKeyBase64()).dump());
        return response(200, R"({"status": 101, "statusString": "OK", "spotifyError": 0})");
    });
    auto client = makeClient(transport);
    REQUIRE(client.state() == zeroconf::ActivationState::idle);

    zeroconf::Credentials credentials;
    credentials.username = "user";
    credentials.password = "secret";
    auto info = client.activate(credentials);
    REQUIRE(info.device_id == "0123456789abcdef");
    REQUIRE(client.state() == zeroconf::ActivationState::active);
    REQUIRE(transport.requests.size() == 2);

    // the device can decrypt what it received
    auto fields = formFields(transport.requests[1].body);
    REQUIRE(fields["action"] == "addUser");
    REQUIRE(fields["version"] == "2.7.1");
    REQUIRE(fields["tokenType"] == "default");
    REQUIRE(fields["userName"] == "user");
    REQUIRE(fields["loginId"] == "user");
    REQUIRE(fields.count("deviceName") == 0);
    auto shared = device.deriveSharedSecretBase64(fields["clientKey"]);
    auto decoded = crypto::LoginBlobDecoder::decode(fields["blob"], "0123456789abcdef", "user", shared);
    REQUIRE(decoded.auth_type == crypto::AuthenticationType::user_pass);
    REQUIRE(crypto::toString(decoded.auth_data) == "secret");

    client.deactivate();
    REQUIRE(client.state() == zeroconf::ActivationState::idle);
    REQUIRE(formFields(transport.requests.back().body)["action"] == "resetUsers");
}


TEST_CASE("Zeroconf addUser rejected")
{
    crypto::DiffieHellmanExchange device;
    std::string add_user_response = R"({"status": 202, "statusString": "ERROR-LOGIN-FAILED", "spotifyError": 0})";
    FakeTransport transport([&](const zeroconf::HttpRequest& request) -> zeroconnect::ErrorOr<zeroconf::HttpResponse>
    {
        if (isAction(request, "getInfo"))
            return response(200, deviceInfoJson(device.publicKeyBase64()).dump());
        return response(200, add_user_response);
    });
    auto client = makeClient(transport);
    zeroconf::Credentials credentials{"user", "wrong", "", std::nullopt};
    try
    {
        client.activate(credentials);
        FAIL("activate succeeded");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::authentication_rejected);
        REQUIRE(e.deviceStatus().has_value());
        REQUIRE(e.deviceStatus()->status == 202);
        REQUIRE(e.deviceStatus()->status_string == "ERROR-LOGIN-FAILED");
    }
    REQUIRE(client.state() == zeroconf::ActivationState::idle);

    add_user_response = R"({"status": 303, "statusString": "ERROR-INVALID-ARGUMENTS"})";
    try
    {
        client.activate(credentials);
        FAIL("activate succeeded");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::device_error);
    }
}


TEST_CASE("Zeroconf invalid public key")
{
    crypto::DiffieHellmanExchange device;
    crypto::DiffieHellmanExchange rotated;
    int add_user_calls = 0;
    bool accept_retry = true;
    FakeTransport transport([&](const zeroconf::HttpRequest& request) -> zeroconnect::ErrorOr<zeroconf::HttpResponse>
    {
        if (isAction(request, "getInfo"))
            return response(200, deviceInfoJson(device.publicKeyBase64()).dump());
        if ((++add_user_calls == 1) || !accept_retry)
        {
            json j = {{"status", 203}, {"statusString", "ERROR-INVALID-PUBLICKEY"}, {"publicKey", rotated.publicKeyBase64()}};
            return response(200, j.dump());
        }
        return response(200, R"({"status": 101})");
    });
    auto client = makeClient(transport);
    zeroconf::Credentials credentials{"user", "secret", "", std::nullopt};

    int rebuilds = 0;
    std::string rebuilt_key;
    zeroconf::DeviceZeroconfClient::RequestFactory rebuild = [&](const zeroconf::DeviceInfo& info)
    {
        ++rebuilds;
        rebuilt_key = info.public_key;
        return client.buildRequest(info, credentials, nullptr);
    };

    auto info = client.getInfo();
    auto result = client.addUser(client.buildRequest(info, credentials, nullptr), rebuild);
    REQUIRE(result.isSuccess());
    REQUIRE(rebuilds == 1);
    REQUIRE(rebuilt_key == rotated.publicKeyBase64());
    REQUIRE(add_user_calls == 2);

    // retried exactly once
    add_user_calls = 0;
    rebuilds = 0;
    accept_retry = false;
    try
    {
        client.addUser(client.buildRequest(info, credentials, nullptr), rebuild);
        FAIL("addUser succeeded");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::key_exchange_failed);
        REQUIRE(e.deviceStatus()->status == 203);
    }
    REQUIRE(rebuilds == 1);
    REQUIRE(add_user_calls == 2);
}


TEST_CASE("Zeroconf access token")
{
    FakeTransport transport([&](const zeroconf::HttpRequest& request) -> zeroconnect::ErrorOr<zeroconf::HttpResponse>
    {
        if (isAction(request, "getInfo"))
        {
            json j = deviceInfoJson("AAAA");
            j["tokenType"] = "accesstoken";
            return response(200, j.dump());
        }
        return response(200, R"({"status": 101})");
    });
    ConnectSettings::Totp totp;
    totp.secret = "GEZDGNBVGY3TQOJQ";
    auto client = makeClient(transport, totp);
    client.setClock([] { return std::chrono::system_clock::time_point(std::chrono::seconds(59)); });

    zeroconf::Credentials credentials{"user", "", "", std::nullopt};
    try
    {
        client.activate(credentials);
        FAIL("activate without token provider succeeded");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::validation_failed);
    }

    RecordingTokenProvider provider;
    client.activate(credentials, &provider);
    REQUIRE(provider.totps.size() == 1);
    REQUIRE(provider.totps[0].has_value());
    REQUIRE(*provider.totps[0] == crypto::TotpGenerator::generate(crypto::toBytes("1234567890"), 30, 6, 59));

    auto fields = formFields(transport.requests.back().body);
    REQUIRE(fields["tokenType"] == "accesstoken");
    REQUIRE(fields["blob"] == "BQAccessToken42");
    REQUIRE(fields["clientKey"].empty());
    REQUIRE(fields["deviceName"] == "zeroconnect");
    REQUIRE(fields["deviceId"] == zeroconf::OriginDevice::fromName("zeroconnect").id);
}


TEST_CASE("Zeroconf not loaded")
{
    crypto::DiffieHellmanExchange device;
    int info_calls = 0;
    int add_user_calls = 0;
    FakeTransport transport([&](const zeroconf::HttpRequest& request) -> zeroconnect::ErrorOr<zeroconf::HttpResponse>
    {
        if (isAction(request, "getInfo"))
        {
            // loaded from the third request on
            if (++info_calls < 3)
            {
                json j = deviceInfoJson(zeroconf::invalid_public_key);
                j["availability"] = "NOT-LOADED";
                return response(200, j.dump());
            }
            return response(200, deviceInfoJson(device.publicKeyBase64()).dump());
        }
        // textual status, no key in the response
        if (++add_user_calls == 1)
            return response(200, R"({"status": "ERROR-INVALID-PUBLICKEY", "spotifyError": 0})");
        return response(200, R"({"status": 101})");
    });
    auto client = makeClient(transport);
    std::vector<std::chrono::milliseconds> sleeps;
    client.setSleeper([&](std::chrono::milliseconds duration) { sleeps.push_back(duration); });

    zeroconf::Credentials credentials{"user", "secret", "", std::nullopt};
    auto info = client.activate(credentials);
    REQUIRE(info.isNotLoaded());
    REQUIRE(client.state() == zeroconf::ActivationState::active);
    REQUIRE(info_calls == 3);
    REQUIRE(add_user_calls == 2);

    std::vector<std::map<std::string, std::string>> add_users;
    for (const auto& request : transport.requests)
    {
        if (isAction(request, "addUser"))
            add_users.push_back(formFields(request.body));
    }
    REQUIRE(add_users.size() == 2);

    // the first addUser asks for a key
    REQUIRE(add_users[0]["blob"].empty());
    REQUIRE(add_users[0]["clientKey"].empty());
    REQUIRE(add_users[0]["tokenType"] == "default");
    REQUIRE(add_users[0]["deviceName"] == "zeroconnect");

    // the second one is encrypted for the key of the loaded device
    auto shared = device.deriveSharedSecretBase64(add_users[1]["clientKey"]);
    auto decoded = crypto::LoginBlobDecoder::decode(add_users[1]["blob"], "0123456789abcdef", "user", shared);
    REQUIRE(crypto::toString(decoded.auth_data) == "secret");

    // two availability polls, then the post action delay
    ConnectSettings::Zeroconf settings;
    REQUIRE(sleeps.size() == 3);
    REQUIRE(sleeps[0] == settings.availability_poll_interval);
    REQUIRE(sleeps[1] == settings.availability_poll_interval);
    REQUIRE(sleeps[2] == settings.post_action_delay);
}


TEST_CASE("Zeroconf librespot")
{
    crypto::DiffieHellmanExchange device;
    FakeTransport transport([&](const zeroconf::HttpRequest& request) -> zeroconnect::ErrorOr<zeroconf::HttpResponse>
    {
        if (isAction(request, "getInfo"))
        {
            json j = deviceInfoJson(device.publicKeyBase64(), "abcdef0123456789");
            j["modelDisplayName"] = "librespot";
            return response(200, j.dump());
        }
        return response(200, R"({"status": 101})");
    });
    auto client = makeClient(transport);

    zeroconf::Credentials credentials{"alice", "secret", "", std::nullopt};
    try
    {
        client.activate(credentials);
        FAIL("activate without stored credentials succeeded");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::validation_failed);
    }

    crypto::BlobCredentials stored{"alice", crypto::AuthenticationType::stored_spotify_credentials, crypto::Bytes{1, 2, 3, 4}};
    credentials = zeroconf::Credentials{"", "", "", stored};
    client.activate(credentials);

    auto fields = formFields(transport.requests.back().body);
    REQUIRE(fields["action"] == "addUser");
    REQUIRE(fields["tokenType"].empty());
    REQUIRE(fields["userName"] == "alice");
    REQUIRE(fields["loginId"] == "alice");
    REQUIRE(fields["deviceName"] == "zeroconnect");
    REQUIRE(fields["deviceId"] == zeroconf::OriginDevice::fromName("zeroconnect").id);
    auto shared = device.deriveSharedSecretBase64(fields["clientKey"]);
    REQUIRE(crypto::LoginBlobDecoder::decode(fields["blob"], "abcdef0123456789", "alice", shared) == stored);
}


TEST_CASE("Zeroconf rediscovery")
{
    FakeTransport transport([](const zeroconf::HttpRequest& request) -> zeroconnect::ErrorOr<zeroconf::HttpResponse>
    {
        if (isAction(request, "getInfo"))
            return response(200, deviceInfoJson("AAAA").dump());
        return response(200, "");
    });
    auto client = makeClient(transport);
    std::optional<zeroconf::Endpoint> moved;
    std::vector<zeroconf::Endpoint> lookups;
    client.setRediscoveryHandler([&](const zeroconf::Endpoint& endpoint)
    {
        lookups.push_back(endpoint);
        return moved;
    });

    client.deactivate();
    REQUIRE(client.state() == zeroconf::ActivationState::disconnecting);
    REQUIRE(lookups.empty());

    // the device reopened its listener on another port
    moved = zeroconf::Endpoint{"192.168.0.10", 8081, "/zc", ""};
    client.getInfo();
    REQUIRE(lookups.size() == 1);
    REQUIRE(lookups[0].port == 8080);
    REQUIRE(client.state() == zeroconf::ActivationState::idle);
    REQUIRE(client.endpoint().port == 8081);
    REQUIRE(transport.requests.back().port == 8081);

    // resolved once
    client.getInfo();
    REQUIRE(lookups.size() == 1);

    // nothing found: the address is kept
    client.deactivate();
    moved.reset();
    client.getInfo();
    REQUIRE(lookups.size() == 2);
    REQUIRE(transport.requests.back().port == 8081);
}


TEST_CASE("Zeroconf endpoint")
{
    auto endpoint = zeroconf::makeEndpoint("192.168.0.10", 65535, "");
    REQUIRE(endpoint.port == 65535);
    REQUIRE(endpoint.cpath == "/");
    REQUIRE(endpoint.url() == "http://192.168.0.10:65535/");

    for (size_t port : {size_t(0), size_t(65536), size_t(70000)})
    {
        try
        {
            zeroconf::makeEndpoint("192.168.0.10", port);
            FAIL("port accepted: " << port);
        }
        catch (const ConnectException& e)
        {
            REQUIRE(e.code() == ConnectErrc::validation_failed);
        }
    }
}


TEST_CASE("Discovery listener")
{
    FakeBrowser browser;
    discovery::ServiceDiscoveryListener listener(browser, "_spotify-connect._tcp");
    std::vector<std::pair<discovery::ServiceEvent, discovery::DiscoveredService>> events;
    listener.addHandler([&](discovery::ServiceEvent event, const discovery::DiscoveredService& service) { events.emplace_back(event, service); });
    listener.start();
    REQUIRE(listener.isRunning());
    REQUIRE(browser.service_type == "_spotify-connect._tcp");

    discovery::ServiceAnnouncement announcement;
    announcement.name = "Kitchen";
    announcement.service_type = "_spotify-connect._tcp";
    announcement.host_name = "kitchen.local";
    announcement.address = "192.168.0.10";
    announcement.port = 8080;
    announcement.txt["cpath"] = "/zc";
    announcement.txt["VERSION"] = "1.0";
    browser.on_resolved(announcement);

    // same instance, second address
    announcement.address = "192.168.0.11";
    browser.on_resolved(announcement);
    // unchanged re-announcement
    browser.on_resolved(announcement);

    REQUIRE(events.size() == 2);
    REQUIRE(events[0].first == discovery::ServiceEvent::added);
    REQUIRE(events[1].first == discovery::ServiceEvent::updated);
    REQUIRE(listener.services().size() == 1);

    auto service = listener.find("kitchen");
    REQUIRE(service.has_value());
    REQUIRE(service->addresses.size() == 2);
    REQUIRE(service->address() == "192.168.0.10");
    REQUIRE(service->cpath() == "/zc");
    REQUIRE(service->txtValue("CPath") == "/zc");
    REQUIRE(service->version() == "1.0");

    browser.on_removed("Kitchen", "_spotify-connect._tcp");
    REQUIRE(events.size() == 3);
    REQUIRE(events[2].first == discovery::ServiceEvent::removed);
    REQUIRE(listener.services().empty());

    listener.stop();
    REQUIRE(browser.stops == 1);
}


TEST_CASE("Discovery expiry")
{
    FakeBrowser browser;
    discovery::ServiceDiscoveryListener listener(browser, "_spotify-connect._tcp", std::chrono::seconds(10));
    auto now = discovery::Clock::now();
    listener.setNow([&] { return now; });

    discovery::ServiceAnnouncement announcement;
    announcement.name = "Den";
    announcement.service_type = "_spotify-connect._tcp";
    announcement.address = "192.168.0.20";
    announcement.port = 4070;
    listener.onResolved(announcement);

    listener.expire(now + 5s);
    REQUIRE(listener.services().size() == 1);
    listener.expire(now + 11s);
    REQUIRE(listener.services().empty());
}


TEST_CASE("Directory dynamic merge")
{
    directory::DeviceDirectory directory;
    int events = 0;
    directory.addHandler([&](directory::DirectoryEvent /*event*/, const directory::SpotifyConnectDevice& /*device*/) { ++events; });

    std::vector<directory::PlayerDevice> players{{"id1", "Living Room", "Speaker", false}, {"id2", "Phone", "Smartphone", true}};
    directory.mergeDynamic(players, std::string("id2"));
    auto first = directory.devices();
    int first_events = events;
    REQUIRE(first.size() == 2);
    REQUIRE(first_events > 0);

    // idempotent
    directory.mergeDynamic(players, std::string("id2"));
    REQUIRE(events == first_events);
    auto second = directory.devices();
    REQUIRE(second.size() == 2);
    for (size_t n = 0; n < first.size(); ++n)
    {
        REQUIRE(first[n].key == second[n].key);
        REQUIRE(first[n].is_active == second[n].is_active);
    }

    auto active = directory.getActive();
    REQUIRE(active.has_value());
    REQUIRE(active->device_id == "id2");
    REQUIRE(active->host == directory::dynamic_host);
    REQUIRE(active->cpath == directory::dynamic_cpath);

    directory.setActive("id1");
    size_t active_count = 0;
    for (const auto& device : directory.devices())
        active_count += device.is_active ? 1 : 0;
    REQUIRE(active_count == 1);
    REQUIRE(directory.resolve("*").device_id == "id1");
    REQUIRE(directory.resolve("living room").device_id == "id1");

    // id2 no longer reported
    directory.mergeDynamic({players[0]}, std::nullopt);
    REQUIRE(directory.size() == 1);
    REQUIRE(!directory.getActive().has_value());

    try
    {
        directory.resolve("Garage");
        FAIL("unknown device resolved");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::device_not_found);
    }
}


TEST_CASE("Directory static refresh")
{
    bool fail = false;
    directory::DeviceDirectory directory([&](const zeroconf::Endpoint& endpoint)
    {
        if (fail)
            throw ConnectException(ConnectErrc::device_unreachable, endpoint.url());
        auto info = zeroconf::DeviceInfo::fromJson(deviceInfoJson("AAAA", "id1"), 200);
        info.remote_name = "Living Room";
        return info;
    });

    directory.mergeDynamic({{"id1", "Living Room", "Speaker", true}}, std::string("id1"));
    REQUIRE(directory.getByKey("id1").has_value());

    discovery::DiscoveredService service;
    service.key = "living-room";
    service.name = "Living-Room";
    service.service_type = "_spotify-connect._tcp";
    service.addresses = {"192.168.0.30"};
    service.port = 4070;
    directory.refreshStatic({service});

    // the static entry replaced the dynamic one and inherited its flags
    REQUIRE(directory.size() == 1);
    REQUIRE(!directory.getByKey("id1").has_value());
    auto device = directory.getByKey("living-room");
    REQUIRE(device.has_value());
    REQUIRE(device->device_id == "id1");
    REQUIRE(device->is_active);
    REQUIRE(device->is_in_player_list);
    REQUIRE(device->endpoint().host == "192.168.0.30");
    REQUIRE(device->endpoint().port == 4070);

    directory.markUnreachable("living-room");
    REQUIRE(!directory.getByKey("living-room")->is_reachable);
    REQUIRE(directory.size() == 1);

    // getInfo failure keeps a placeholder
    fail = true;
    discovery::DiscoveredService other = service;
    other.key = "den";
    other.name = "Den";
    other.addresses = {"192.168.0.31"};
    directory.refreshStatic({service, other});
    auto den = directory.getByKey("den");
    REQUIRE(den.has_value());
    REQUIRE(den->info.has_value());
    REQUIRE(den->info->status == zeroconf::status::get_info_error);
    REQUIRE(!den->is_reachable);

    // removed from discovery, but still in the player list: demoted to dynamic
    directory.refreshStatic({other});
    auto demoted = directory.getByKey("id1");
    REQUIRE(demoted.has_value());
    REQUIRE(demoted->isDynamic());
    REQUIRE(demoted->is_active);
}


TEST_CASE("Directory cast receiver")
{
    directory::DeviceDirectory directory;
    discovery::DiscoveredService service;
    service.key = "chromecast-1234";
    service.name = "Chromecast-1234";
    service.service_type = "_googlecast._tcp";
    service.addresses = {"192.168.0.40"};
    service.port = 8009;
    service.txt["fn"] = "TV";
    directory.onServiceEvent(discovery::ServiceEvent::added, service);

    auto device = directory.resolve("tv");
    REQUIRE(device.is_cast);
    REQUIRE(device.name == "TV");
    REQUIRE(device.device_id == crypto::toHex(crypto::md5(crypto::toBytes("TV"))));

    // a cast announcement with the key of a Spotify Connect device neither replaces nor removes it
    auto connect = makeService("Living-Room", "_spotify-connect._tcp", "192.168.0.30", 4070);
    auto cast_twin = makeService("Living-Room", "_googlecast._tcp", "192.168.0.30", 8009);
    directory.onServiceEvent(discovery::ServiceEvent::added, connect);
    directory.onServiceEvent(discovery::ServiceEvent::added, cast_twin);
    REQUIRE(!directory.getByKey("living-room")->is_cast);

    directory.onServiceEvent(discovery::ServiceEvent::removed, cast_twin);
    auto living_room = directory.getByKey("living-room");
    REQUIRE(living_room.has_value());
    REQUIRE(!living_room->is_cast);
    REQUIRE(living_room->port == 4070);

    directory.onServiceEvent(discovery::ServiceEvent::removed, connect);
    REQUIRE(!directory.getByKey("living-room").has_value());
    REQUIRE(directory.size() == 1);
}


TEST_CASE("Directory snapshot refresh")
{
    directory::DeviceDirectory directory;
    auto now = std::chrono::system_clock::now();
    directory.setNow([&] { return now; });
    std::vector<std::pair<directory::DirectoryEvent, std::string>> events;
    directory.addHandler([&](directory::DirectoryEvent event, const directory::SpotifyConnectDevice& device) { events.emplace_back(event, device.key); });

    auto den = makeService("Den", "_spotify-connect._tcp", "192.168.0.31", 4070);
    directory.onServiceEvent(discovery::ServiceEvent::added, den);
    auto snapshot_time = directory.now();

    // announced while the snapshot, that does not know it yet, is processed
    now += 1s;
    auto attic = makeService("Attic", "_spotify-connect._tcp", "192.168.0.32", 4070);
    directory.onServiceEvent(discovery::ServiceEvent::added, attic);
    events.clear();

    directory.refreshStatic({}, snapshot_time);
    REQUIRE(!directory.getByKey("den").has_value());
    REQUIRE(directory.getByKey("attic").has_value());
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].first == directory::DirectoryEvent::device_removed);
    REQUIRE(events[0].second == "den");

    // gone in the next snapshot
    directory.refreshStatic({}, directory.now());
    REQUIRE(directory.size() == 0);
}


TEST_CASE("Directory device lock")
{
    directory::DeviceDirectory directory;
    directory.mergeDynamic({{"id1", "Living Room", "Speaker", false}}, std::nullopt);
    auto lock = directory.lockDevice("id1", 10ms);
    REQUIRE(lock.owns_lock());

    auto second = std::async(std::launch::async, [&]
    {
        try
        {
            directory.lockDevice("id1", 10ms);
            return ConnectErrc::success;
        }
        catch (const ConnectException& e)
        {
            return static_cast<ConnectErrc>(e.code().value());
        }
    });
    REQUIRE(second.get() == ConnectErrc::device_busy);

    lock.unlock();
    REQUIRE(directory.lockDevice("id1", 10ms).owns_lock());
}


TEST_CASE("Credential store")
{
    auto filename = (std::filesystem::temp_directory_path() / "zeroconnect_test_credentials.json").string();
    std::filesystem::remove(filename);

    zeroconf::CredentialStore store(filename);
    REQUIRE(store.load().empty());

    crypto::BlobCredentials alice{"Alice", crypto::AuthenticationType::stored_spotify_credentials, crypto::Bytes{1, 2, 3, 4}};
    crypto::BlobCredentials bob{"bob", crypto::AuthenticationType::stored_spotify_credentials, crypto::Bytes{5, 6}};
    store.save(alice);
    store.save(bob);
    REQUIRE(store.load().size() == 2);
    REQUIRE(store.find("alice").has_value());
    REQUIRE(*store.find("ALICE") == alice);

    alice.auth_data = {9, 9};
    store.save(alice);
    REQUIRE(store.load().size() == 2);
    REQUIRE(store.find("alice")->auth_data == crypto::Bytes{9, 9});
    REQUIRE(!store.find("carol").has_value());

    std::filesystem::remove(filename);
}


TEST_CASE("Cast frame")
{
    cast::ChannelMessage message;
    message.name_space = cast::ns::heartbeat;
    message.payload = R"({"type":"PING"})";
    std::string frame = cast::encodeFrame(message);
    REQUIRE(frame.size() > 4);
    REQUIRE(cast::frameSize(frame) == frame.size() - 4);
    REQUIRE(cast::frameSize(std::string("\x80\x00\x00\x01", 4)) == 0x80000001u);
    REQUIRE(cast::frameSize(std::string("\xff\xff\xff\xff", 4)) == 0xffffffffu);
    try
    {
        cast::frameSize(std::string("\x00\x01", 2));
        FAIL("short header accepted");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::protocol_error);
    }

    auto decoded = cast::decodeFrame(frame.substr(4));
    REQUIRE(decoded.source_id == cast::default_sender_id);
    REQUIRE(decoded.destination_id == cast::default_receiver_id);
    REQUIRE(decoded.name_space == cast::ns::heartbeat);
    REQUIRE(decoded.payload == message.payload);
}


TEST_CASE("Cast launcher")
{
    FakeCastChannel channel;
    channel.push(cast::ns::heartbeat, cast::default_receiver_id, {{"type", "PING"}});
    channel.push(cast::ns::receiver, cast::default_receiver_id,
                 {{"type", "RECEIVER_STATUS"}, {"status", {{"applications", json::array({{{"appId", cast::spotify_app_id}, {"transportId", "web-7"}}})}}}});
    json info = deviceInfoJson("empty", "");
    info["tokenType"] = "accesstoken";
    channel.push(cast::ns::spotify, "web-7", {{"type", "getInfoResponse"}, {"payload", info}});

    ConnectSettings::Cast settings;
    cast::CastAppLauncher launcher(channel, settings);
    auto result = launcher.launch("192.168.0.40", "TV", "cafe", true);
    REQUIRE(channel.connected_to == "192.168.0.40:8009");
    REQUIRE(launcher.transportId() == "web-7");
    REQUIRE(result.public_key.empty());
    REQUIRE(result.device_id == "cafe");
    REQUIRE(result.response_source == "getInfoResponse");

    REQUIRE(channel.sentOfType("LAUNCH").size() == 1);
    REQUIRE(channel.sentOfType("LAUNCH")[0]["appId"] == cast::spotify_app_id);
    REQUIRE(channel.sentOfType("PONG").size() == 1);
    REQUIRE(channel.sentOfType("CONNECT").size() == 2);
    auto get_info = channel.sentOfType("getInfo");
    REQUIRE(get_info.size() == 1);
    REQUIRE(get_info[0]["payload"]["remoteName"] == "TV");
    REQUIRE(get_info[0]["payload"]["deviceID"] == "cafe");
    REQUIRE(get_info[0]["payload"]["deviceAPI_isGroup"] == true);

    channel.push(cast::ns::spotify, "web-7", {{"type", "addUserResponse"}, {"payload", {{"status", 101}}}});
    REQUIRE(launcher.addUser("BQAccessToken42").isSuccess());
    auto add_user = channel.sentOfType("addUser");
    REQUIRE(add_user.size() == 1);
    REQUIRE(add_user[0]["payload"]["blob"] == "BQAccessToken42");
    REQUIRE(add_user[0]["payload"]["tokenType"] == "accesstoken");
    REQUIRE(channel.sent.back().destination_id == "web-7");

    channel.push(cast::ns::spotify, "web-7", {{"type", "addUserError"}, {"payload", {{"status", 202}}}});
    try
    {
        launcher.addUser("expired");
        FAIL("addUser succeeded");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::authentication_rejected);
        REQUIRE(e.deviceStatus()->status == 202);
    }
}


TEST_CASE("Cast launcher timeout")
{
    FakeCastChannel channel;
    ConnectSettings::Cast settings;
    settings.activation_timeout = 100ms;
    REQUIRE(settings.activationTimeout() == 1s);

    cast::CastAppLauncher launcher(channel, settings);
    auto now = cast::CastAppLauncher::Clock::now();
    launcher.setNow([&] { return now += 300ms; });
    try
    {
        launcher.launch("192.168.0.40", "TV", "cafe", false);
        FAIL("launch succeeded");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::device_not_ready);
    }

    channel.push(cast::ns::receiver, cast::default_receiver_id, {{"type", "LAUNCH_ERROR"}, {"reason", "NOT_FOUND"}});
    try
    {
        launcher.launch("192.168.0.40", "TV", "cafe", false);
        FAIL("launch succeeded");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::device_not_ready);
    }
}


TEST_CASE("Controller")
{
    crypto::DiffieHellmanExchange device;
    bool refuse = false;
    FakeTransport transport([&](const zeroconf::HttpRequest& request) -> zeroconnect::ErrorOr<zeroconf::HttpResponse>
    {
        if (refuse)
            return zeroconnect::ErrorCode(ConnectErrc::connection_refused, "refused");
        if (isAction(request, "getInfo"))
            return response(200, deviceInfoJson(device.publicKeyBase64(), "id1").dump());
        return response(200, "");
    });

    FakeBrowser browser;
    ConnectSettings settings;
    settings.discovery.refresh_interval = std::chrono::seconds(0);
    ConnectController controller(settings, transport, browser);

    discovery::ServiceAnnouncement announcement;
    announcement.name = "Kitchen";
    announcement.service_type = settings.discovery.service_type;
    announcement.address = "192.168.0.10";
    announcement.port = 8080;
    announcement.txt["CPath"] = "/zc";
    controller.setSleeper([&](std::chrono::milliseconds /*duration*/)
    {
        if (browser.on_resolved)
            browser.on_resolved(announcement);
    });

    auto devices = controller.discover();
    REQUIRE(browser.starts == 1);
    REQUIRE(devices.size() == 1);
    REQUIRE(devices[0].device_id == "id1");
    REQUIRE(devices[0].name == "Kitchen");
    REQUIRE(!controller.getActiveDevice().has_value());

    zeroconf::Credentials credentials{"user", "secret", "", std::nullopt};
    auto info = controller.activate("kitchen", credentials);
    REQUIRE(info.device_id == "id1");
    REQUIRE(controller.getActiveDevice().has_value());
    REQUIRE(controller.getActiveDevice()->device_id == "id1");

    controller.deactivate("*");
    REQUIRE(!controller.getActiveDevice().has_value());
    REQUIRE(formFields(transport.requests.back().body)["action"] == "resetUsers");

    // the device reopened its listener on another port after the logout
    announcement.port = 8081;
    browser.on_resolved(announcement);
    REQUIRE(controller.getInfo("kitchen").device_id == "id1");
    REQUIRE(transport.requests.back().port == 8081);
    REQUIRE(isAction(transport.requests.back(), "getInfo"));

    controller.updatePlayerDevices({{"id2", "Phone", "Smartphone", true}}, std::string("id2"));
    REQUIRE(controller.listDevices().size() == 2);
    REQUIRE(controller.getActiveDevice()->device_id == "id2");

    // dynamic devices have no address
    try
    {
        controller.activate("Phone", credentials);
        FAIL("activated a dynamic device");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::device_unreachable);
    }

    refuse = true;
    try
    {
        controller.activate("Kitchen", credentials);
        FAIL("activate succeeded");
    }
    catch (const ConnectException& e)
    {
        REQUIRE(e.code() == ConnectErrc::device_unreachable);
    }
    auto kitchen = controller.directory().getByKey("kitchen");
    REQUIRE(kitchen.has_value());
    REQUIRE(!kitchen->is_reachable);
}
