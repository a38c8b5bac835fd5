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
#include "connect/discovery/service_browser.hpp"

// 3rd party headers
#include <avahi-client/client.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/simple-watch.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

// standard headers
#include <string>


namespace discovery
{

/// ServiceBrowser based on the Avahi client library
/// The Avahi main loop is polled on the io_context, so all handlers run on the io_context's thread
class ServiceBrowserAvahi : public ServiceBrowser
{
public:
    explicit ServiceBrowserAvahi(boost::asio::io_context& ioc);
    ~ServiceBrowserAvahi() override;

    void start(const std::string& service_type, ResolvedHandler on_resolved, RemovedHandler on_removed, ErrorHandler on_error) override;
    void stop() override;

private:
    static void client_callback(AvahiClient* c, AvahiClientState state, AVAHI_GCC_UNUSED void* userdata);
    static void browse_callback(AvahiServiceBrowser* b, AvahiIfIndex interface, AvahiProtocol protocol, AvahiBrowserEvent event, const char* name,
                                const char* type, const char* domain, AVAHI_GCC_UNUSED AvahiLookupResultFlags flags, void* userdata);
    static void resolve_callback(AvahiServiceResolver* r, AVAHI_GCC_UNUSED AvahiIfIndex interface, AVAHI_GCC_UNUSED AvahiProtocol protocol,
                                 AvahiResolverEvent event, const char* name, const char* type, const char* domain, const char* host_name,
                                 const AvahiAddress* address, uint16_t port, AvahiStringList* txt, AvahiLookupResultFlags flags, void* userdata);

    void poll();
    void fail(const std::string& message);

    boost::asio::steady_timer timer_;
    AvahiSimplePoll* simple_poll_;
    AvahiClient* client_;
    AvahiServiceBrowser* sb_;
    std::string service_type_;
    ResolvedHandler on_resolved_;
    RemovedHandler on_removed_;
    ErrorHandler on_error_;
};

} // namespace discovery
