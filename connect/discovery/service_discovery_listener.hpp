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
#include "connect/discovery/discovered_service.hpp"
#include "connect/discovery/service_browser.hpp"

// standard headers
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>


namespace discovery
{

enum class ServiceEvent
{
    added,
    updated,
    removed
};

/// @return name of @p event
std::string to_string(ServiceEvent event);


/// Registry of the instances of one service type
///
/// Translates the browser's per address notifications into added, updated
/// and removed events. Announcements are merged by instance name, so an
/// instance reachable by several addresses is one service.
class ServiceDiscoveryListener
{
public:
    using EventHandler = std::function<void(ServiceEvent event, const DiscoveredService& service)>;
    using ErrorHandler = std::function<void(const zeroconnect::ErrorCode& error)>;
    using Now = std::function<Clock::time_point()>;

    /// c'tor
    /// @param browser the mDNS browser, must outlive the listener
    /// @param service_type the service type to browse for
    /// @param ttl drop instances not seen for this time, 0 = never
    ServiceDiscoveryListener(ServiceBrowser& browser, std::string service_type, std::chrono::seconds ttl = std::chrono::seconds(0));
    ~ServiceDiscoveryListener();

    ServiceDiscoveryListener(const ServiceDiscoveryListener&) = delete;
    ServiceDiscoveryListener& operator=(const ServiceDiscoveryListener&) = delete;

    /// Add a handler, called in receipt order, outside of the registry lock
    void addHandler(EventHandler handler);

    /// Set the handler for browser failures
    void setErrorHandler(ErrorHandler handler);

    /// Start browsing
    /// @throw ConnectException (discovery_failed)
    void start();

    /// Stop browsing and release the browser's resources, known services are kept
    void stop();

    bool isRunning() const;

    const std::string& serviceType() const
    {
        return service_type_;
    }

    /// @return copy of all known services
    std::vector<DiscoveredService> services() const;

    /// @return copy of the service with @p key
    std::optional<DiscoveredService> find(const std::string& key) const;

    /// Drop all services not seen since @p now - ttl
    void expire(Clock::time_point now);

    /// Override the clock
    void setNow(Now now)
    {
        now_ = std::move(now);
    }

    /// Process a resolved announcement
    void onResolved(const ServiceAnnouncement& announcement);

    /// Process the removal of instance @p name
    void onRemoved(const std::string& name, const std::string& service_type);

private:
    void notify(ServiceEvent event, const DiscoveredService& service);

    ServiceBrowser& browser_;
    std::string service_type_;
    std::chrono::seconds ttl_;
    bool running_;
    Now now_;
    mutable std::mutex mutex_;
    std::map<std::string, DiscoveredService> services_;
    std::vector<EventHandler> handlers_;
    ErrorHandler error_handler_;
};

} // namespace discovery
