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
#include "common/connect_exception.hpp"
#include "common/utils/string_utils.hpp"
#include "common/version.hpp"
#include "connect/cast/cast_channel_tls.hpp"
#include "connect/connect_settings.hpp"
#include "connect/controller.hpp"
#include "connect/crypto/totp.hpp"
#include "connect/zeroconf/access_token_provider.hpp"
#include "connect/zeroconf/credentials.hpp"
#include "connect/zeroconf/device_zeroconf_client.hpp"
#include "connect/zeroconf/http_transport.hpp"
#ifdef HAS_AVAHI
#include "connect/discovery/service_browser_avahi.hpp"
#endif

// 3rd party headers
#include <aixlog.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <popl.hpp>

// standard headers
#include <chrono>
#include <iostream>
#include <memory>


using namespace std;
using namespace popl;

static constexpr auto LOG_TAG = "Zeroconnect";


namespace
{

/// @return the credentials configured in @p settings
zeroconf::Credentials loadCredentials(const ConnectSettings::Credentials& settings)
{
    zeroconf::Credentials credentials;
    credentials.username = settings.username;
    credentials.password = settings.password;
    credentials.login_id = settings.login_id;
    if (!settings.blob_file.empty())
    {
        zeroconf::CredentialStore store(settings.blob_file);
        std::optional<crypto::BlobCredentials> stored;
        if (!credentials.username.empty())
        {
            stored = store.find(credentials.username);
        }
        else
        {
            auto entries = store.load();
            if (!entries.empty())
                stored = entries.front();
        }
        if (!stored.has_value())
            throw ConnectException(ConnectErrc::validation_failed, "No credentials for '" + credentials.username + "' in " + settings.blob_file);
        if (credentials.username.empty())
            credentials.username = stored->username;
        credentials.stored = std::move(stored);
    }
    return credentials;
}


void initLogging(ConnectSettings::Logging& logging)
{
    if (logging.sink.empty())
        logging.sink = "stdout";

    AixLog::Filter logfilter;
    auto filters = utils::string::split(logging.filter, ',');
    for (const auto& filter : filters)
        logfilter.add_filter(filter);

    string logformat = "%Y-%m-%d %H-%M-%S.#ms [#severity] (#tag_func)";
    if (logging.sink.find("file:") != string::npos)
    {
        string logfile = logging.sink.substr(logging.sink.find(':') + 1);
        AixLog::Log::init<AixLog::SinkFile>(logfilter, logfile, logformat);
    }
    else if (logging.sink == "stdout")
        AixLog::Log::init<AixLog::SinkCout>(logfilter, logformat);
    else if (logging.sink == "stderr")
        AixLog::Log::init<AixLog::SinkCerr>(logfilter, logformat);
    else if (logging.sink == "system")
        AixLog::Log::init<AixLog::SinkNative>("zeroconnect", logfilter);
    else if (logging.sink == "null")
        AixLog::Log::init<AixLog::SinkNull>();
    else
        throw ConnectException(ConnectErrc::validation_failed, "Invalid log sink: " + logging.sink);
}

} // namespace


int main(int argc, char** argv)
{
    int exitcode = EXIT_SUCCESS;
    try
    {
        ConnectSettings settings;
        string host;
        size_t port = 0;
        string cpath = "/";
        string totp_cipher;
        size_t discovery_timeout = settings.discovery.timeout.count();
        size_t activation_timeout = settings.cast.activation_timeout.count();

        OptionParser op("Allowed options");
        auto helpSwitch = op.add<Switch>("", "help", "produce help message");
        auto versionSwitch = op.add<Switch>("v", "version", "show version number");

        // actions
        auto listSwitch = op.add<Switch>("l", "list", "discover and list Spotify Connect devices");
        auto infoValue = op.add<Value<string>>("i", "info", "print the device info of <device id or name>");
        auto activateValue = op.add<Value<string>>("a", "activate", "log in on <device id or name>, '*' = active device");
        auto deactivateValue = op.add<Value<string>>("d", "deactivate", "log out of <device id or name>, '*' = active device");

        // device address, bypasses discovery
        op.add<Value<string>>("h", "host", "device hostname or ip address, bypasses discovery", host, &host);
        op.add<Value<size_t>>("p", "port", "device Zeroconf port", port, &port);
        op.add<Value<string>>("", "cpath", "device Zeroconf path", cpath, &cpath);

        // discovery
        op.add<Value<size_t>>("", "discovery-timeout", "time to collect announcements [ms]", discovery_timeout, &discovery_timeout);
        auto noCastSwitch = op.add<Switch>("", "no-cast", "don't browse for cast receivers");
        op.add<Value<size_t>>("", "cast-timeout", "time for Spotify to launch on cast receivers [ms]", activation_timeout, &activation_timeout);

        // credentials
        op.add<Value<string>>("u", "user", "Spotify user name", "", &settings.credentials.username);
        op.add<Value<string>>("", "password", "Spotify password", "", &settings.credentials.password);
        op.add<Value<string>>("", "loginid", "canonical user id, default is the user name", "", &settings.credentials.login_id);
        op.add<Value<string>>("", "credentials", "credential blob file (librespot credentials.json)", "", &settings.credentials.blob_file);
        op.add<Value<string>>("", "token", "access token for token based devices", "", &settings.credentials.access_token);
        op.add<Value<string>>("", "totp-secret", "base32 TOTP secret for access token devices", "", &settings.totp.secret);
        op.add<Value<string>>("", "totp-cipher", "obfuscated TOTP secret as comma separated byte list, alternative to --totp-secret", "", &totp_cipher);
        op.add<Value<string>>("", "zeroconf-version", "Zeroconf protocol version", settings.zeroconf.version, &settings.zeroconf.version);

        // logging
        op.add<Value<string>>("", "logsink", "log sink [null,system,stdout,stderr,file:<filename>]", settings.logging.sink, &settings.logging.sink);
        auto logfilterOption = op.add<Value<string>>(
            "", "logfilter", "log filter <tag>:<level>[,<tag>:<level>]* with tag = * or <log tag> and level = [trace,debug,info,notice,warning,error,fatal]",
            settings.logging.filter);

        try
        {
            op.parse(argc, argv);
        }
        catch (const std::invalid_argument& e)
        {
            cerr << "Exception: " << e.what() << std::endl;
            cout << "\n" << op << "\n";
            exit(EXIT_FAILURE);
        }

        if (versionSwitch->is_set())
        {
            cout << "zeroconnect v" << version::code << (!version::rev().empty() ? (" (rev " + version::rev(8) + ")") : ("")) << "\n"
                 << "License GPLv3+: GNU GPL version 3 or later <http://gnu.org/licenses/gpl.html>.\n"
                 << "This is free software: you are free to change and redistribute it.\n"
                 << "There is NO WARRANTY, to the extent permitted by law.\n\n";
            exit(EXIT_SUCCESS);
        }

        if (helpSwitch->is_set() || (!listSwitch->is_set() && !infoValue->is_set() && !activateValue->is_set() && !deactivateValue->is_set()))
        {
            cout << op << "\n";
            exit(EXIT_SUCCESS);
        }

        settings.logging.filter = logfilterOption->value();
        if (logfilterOption->is_set())
        {
            for (size_t n = 1; n < logfilterOption->count(); ++n)
                settings.logging.filter += "," + logfilterOption->value(n);
        }
        initLogging(settings.logging);

        if (!totp_cipher.empty())
            settings.totp.secret = crypto::TotpGenerator::secretFromCipher(totp_cipher);
        settings.discovery.timeout = std::chrono::milliseconds(discovery_timeout);
        settings.discovery.cast_enabled = !noCastSwitch->is_set();
        settings.cast.activation_timeout = std::chrono::milliseconds(activation_timeout);
        // one shot: no periodic refresh
        settings.discovery.refresh_interval = std::chrono::seconds(0);

        LOG(DEBUG, LOG_TAG) << "Version " << version::code << (!version::rev().empty() ? (", revision " + version::rev(8)) : ("")) << "\n";

        std::unique_ptr<zeroconf::AccessTokenProvider> token_provider;
        if (!settings.credentials.access_token.empty())
            token_provider = std::make_unique<zeroconf::StaticAccessTokenProvider>(settings.credentials.access_token);

        zeroconf::BeastHttpTransport transport;

        if (!host.empty())
        {
            zeroconf::DeviceZeroconfClient client(transport, zeroconf::makeEndpoint(host, port, cpath), settings.zeroconf, settings.totp);
            if (infoValue->is_set() || listSwitch->is_set())
                cout << client.getInfo().toJson().dump(4) << "\n";
            if (activateValue->is_set())
            {
                auto info = client.activate(loadCredentials(settings.credentials), token_provider.get());
                cout << "Activated '" << info.remote_name << "' (" << info.device_id << ")\n";
            }
            if (deactivateValue->is_set())
            {
                client.deactivate();
                cout << "Deactivated " << host << ":" << port << "\n";
            }
            exit(EXIT_SUCCESS);
        }

#ifndef HAS_AVAHI
        throw ConnectException(ConnectErrc::discovery_failed, "mDNS not available, please configure the device with \"--host\" and \"--port\"");
#else
        boost::asio::io_context io_context;
        auto work = boost::asio::make_work_guard(io_context);
        discovery::ServiceBrowserAvahi connect_browser(io_context);
        discovery::ServiceBrowserAvahi cast_browser(io_context);

        ConnectController controller(settings, transport, connect_browser, &cast_browser);
        // Avahi is polled on this thread while the controller waits
        controller.setSleeper([&](std::chrono::milliseconds duration) { io_context.run_for(duration); });
        controller.setAccessTokenProvider(token_provider.get());
        controller.setCastChannelFactory([] { return std::make_unique<cast::CastChannelTls>(); });

        int result = EXIT_SUCCESS;
        try
        {
            auto devices = controller.discover();
            if (listSwitch->is_set())
            {
                json j = json::array();
                for (const auto& device : devices)
                    j.push_back(device.toJson());
                cout << j.dump(4) << "\n";
            }
            if (infoValue->is_set())
                cout << controller.getInfo(infoValue->value()).toJson().dump(4) << "\n";
            if (activateValue->is_set())
            {
                auto info = controller.activate(activateValue->value(), loadCredentials(settings.credentials));
                cout << "Activated '" << info.remote_name << "' (" << info.device_id << ")\n";
            }
            if (deactivateValue->is_set())
            {
                controller.deactivate(deactivateValue->value());
                cout << "Deactivated '" << deactivateValue->value() << "'\n";
            }
        }
        catch (const ConnectException& e)
        {
            LOG(ERROR, LOG_TAG) << "Error: " << e.what() << "\n";
            result = EXIT_FAILURE;
        }

        controller.stop();
        work.reset();
        exitcode = result;
#endif
    }
    catch (const std::exception& e)
    {
        LOG(FATAL, LOG_TAG) << "Exception: " << e.what() << std::endl;
        exitcode = EXIT_FAILURE;
    }

    LOG(DEBUG, LOG_TAG) << "zeroconnect terminated." << endl;
    exit(exitcode);
}
