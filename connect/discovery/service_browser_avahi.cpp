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
#include "service_browser_avahi.hpp"

// local headers
#include "common/connect_exception.hpp"

// 3rd party headers
#include <aixlog.hpp>

// standard headers
#include <chrono>


static constexpr auto LOG_TAG = "Avahi";


namespace discovery
{

ServiceBrowserAvahi::ServiceBrowserAvahi(boost::asio::io_context& ioc) : timer_(ioc), simple_poll_(nullptr), client_(nullptr), sb_(nullptr)
{
}


ServiceBrowserAvahi::~ServiceBrowserAvahi()
{
    stop();
}


void ServiceBrowserAvahi::stop()
{
    timer_.cancel();

    if (sb_ != nullptr)
        avahi_service_browser_free(sb_);
    sb_ = nullptr;

    if (client_ != nullptr)
        avahi_client_free(client_);
    client_ = nullptr;

    if (simple_poll_ != nullptr)
        avahi_simple_poll_free(simple_poll_);
    simple_poll_ = nullptr;
}


void ServiceBrowserAvahi::fail(const std::string& message)
{
    LOG(ERROR, LOG_TAG) << message << "\n";
    if (on_error_)
        on_error_(zeroconnect::ErrorCode(ConnectErrc::discovery_failed, message));
}


void ServiceBrowserAvahi::start(const std::string& service_type, ResolvedHandler on_resolved, RemovedHandler on_removed, ErrorHandler on_error)
{
    stop();
    service_type_ = service_type;
    on_resolved_ = std::move(on_resolved);
    on_removed_ = std::move(on_removed);
    on_error_ = std::move(on_error);

    // Allocate main loop object
    if ((simple_poll_ = avahi_simple_poll_new()) == nullptr)
        throw ConnectException(ConnectErrc::discovery_failed, "Failed to create simple poll object");

    // Allocate a new client
    int error;
    if ((client_ = avahi_client_new(avahi_simple_poll_get(simple_poll_), static_cast<AvahiClientFlags>(0), client_callback, this, &error)) == nullptr)
    {
        std::string message = "Failed to create client: " + std::string(avahi_strerror(error));
        stop();
        throw ConnectException(ConnectErrc::discovery_failed, message);
    }

    // Create the service browser, IPv4 only
    if ((sb_ = avahi_service_browser_new(client_, AVAHI_IF_UNSPEC, AVAHI_PROTO_INET, service_type_.c_str(), nullptr, static_cast<AvahiLookupFlags>(0),
                                         browse_callback, this)) == nullptr)
    {
        std::string message = "Failed to create service browser: " + std::string(avahi_strerror(avahi_client_errno(client_)));
        stop();
        throw ConnectException(ConnectErrc::discovery_failed, message);
    }

    LOG(DEBUG, LOG_TAG) << "Browsing for '" << service_type_ << "'\n";
    poll();
}


void ServiceBrowserAvahi::poll()
{
    timer_.expires_after(std::chrono::milliseconds(50));
    timer_.async_wait([this](const boost::system::error_code& ec)
    {
        if (ec || (simple_poll_ == nullptr))
            return;
        if (avahi_simple_poll_iterate(simple_poll_, 0) == 0)
            poll();
        else
            fail("Avahi main loop stopped while browsing for '" + service_type_ + "'");
    });
}


void ServiceBrowserAvahi::client_callback(AvahiClient* c, AvahiClientState state, AVAHI_GCC_UNUSED void* userdata)
{
    auto* browser = static_cast<ServiceBrowserAvahi*>(userdata);

    // Called whenever the client or server state changes
    if (state == AVAHI_CLIENT_FAILURE)
    {
        browser->fail("Server connection failure: " + std::string(avahi_strerror(avahi_client_errno(c))));
        avahi_simple_poll_quit(browser->simple_poll_);
    }
}


void ServiceBrowserAvahi::browse_callback(AvahiServiceBrowser* b, AvahiIfIndex interface, AvahiProtocol protocol, AvahiBrowserEvent event, const char* name,
                                          const char* type, const char* domain, AVAHI_GCC_UNUSED AvahiLookupResultFlags flags, void* userdata)
{
    auto* browser = static_cast<ServiceBrowserAvahi*>(userdata);

    // Called whenever a new services becomes available on the LAN or is removed from the LAN
    switch (event)
    {
        case AVAHI_BROWSER_FAILURE:
            browser->fail("(Browser) " + std::string(avahi_strerror(avahi_client_errno(avahi_service_browser_get_client(b)))));
            avahi_simple_poll_quit(browser->simple_poll_);
            return;

        case AVAHI_BROWSER_NEW:
            LOG(DEBUG, LOG_TAG) << "(Browser) NEW: service '" << name << "' of type '" << type << "' in domain '" << domain << "'\n";

            // The resolver is freed in the callback, or by the client if it is freed before
            if ((avahi_service_resolver_new(browser->client_, interface, protocol, name, type, domain, AVAHI_PROTO_INET, static_cast<AvahiLookupFlags>(0),
                                            resolve_callback, userdata)) == nullptr)
                LOG(ERROR, LOG_TAG) << "Failed to resolve service '" << name << "': " << avahi_strerror(avahi_client_errno(browser->client_)) << "\n";
            break;

        case AVAHI_BROWSER_REMOVE:
            LOG(DEBUG, LOG_TAG) << "(Browser) REMOVE: service '" << name << "' of type '" << type << "' in domain '" << domain << "'\n";
            if (browser->on_removed_)
                browser->on_removed_(name, type);
            break;

        case AVAHI_BROWSER_ALL_FOR_NOW:
        case AVAHI_BROWSER_CACHE_EXHAUSTED:
            LOG(DEBUG, LOG_TAG) << "(Browser) " << (event == AVAHI_BROWSER_CACHE_EXHAUSTED ? "CACHE_EXHAUSTED" : "ALL_FOR_NOW") << "\n";
            break;
    }
}


void ServiceBrowserAvahi::resolve_callback(AvahiServiceResolver* r, AVAHI_GCC_UNUSED AvahiIfIndex interface, AVAHI_GCC_UNUSED AvahiProtocol protocol,
                                           AvahiResolverEvent event, const char* name, const char* type, const char* domain, const char* host_name,
                                           const AvahiAddress* address, uint16_t port, AvahiStringList* txt, AvahiLookupResultFlags flags, void* userdata)
{
    auto* browser = static_cast<ServiceBrowserAvahi*>(userdata);

    // Called whenever a service has been resolved successfully or timed out
    switch (event)
    {
        case AVAHI_RESOLVER_FAILURE:
            LOG(WARNING, LOG_TAG) << "(Resolver) Failed to resolve service '" << name << "' of type '" << type << "' in domain '" << domain
                                  << "': " << avahi_strerror(avahi_client_errno(avahi_service_resolver_get_client(r))) << "\n";
            break;

        case AVAHI_RESOLVER_FOUND:
        {
            char a[AVAHI_ADDRESS_STR_MAX];
            avahi_address_snprint(a, sizeof(a), address);

            ServiceAnnouncement announcement;
            announcement.name = name;
            announcement.service_type = type;
            announcement.host_name = host_name;
            announcement.address = a;
            announcement.port = port;

            for (AvahiStringList* e = txt; e != nullptr; e = avahi_string_list_get_next(e))
            {
                char* key = nullptr;
                char* value = nullptr;
                size_t size = 0;
                if (avahi_string_list_get_pair(e, &key, &value, &size) == 0)
                {
                    announcement.txt[key] = (value != nullptr) ? std::string(value, size) : "";
                    avahi_free(key);
                    avahi_free(value);
                }
            }

            LOG(DEBUG, LOG_TAG) << "Service '" << name << "' of type '" << type << "': " << host_name << ":" << port << " (" << a << "), "
                                << announcement.txt.size() << " TXT entries, cached: " << ((flags & AVAHI_LOOKUP_RESULT_CACHED) != 0) << "\n";
            if (browser->on_resolved_)
                browser->on_resolved_(announcement);
            break;
        }
    }

    avahi_service_resolver_free(r);
}

} // namespace discovery
