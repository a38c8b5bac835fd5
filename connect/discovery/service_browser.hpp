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
#include "connect/discovery/discovered_service.hpp"

// standard headers
#include <functional>
#include <string>


namespace discovery
{

/// mDNS / DNS-SD browser for one service type
class ServiceBrowser
{
public:
    /// A service instance was resolved (once per address)
    using ResolvedHandler = std::function<void(const ServiceAnnouncement& announcement)>;
    /// A service instance was removed
    using RemovedHandler = std::function<void(const std::string& name, const std::string& service_type)>;
    /// The browser failed, no more events will follow until restarted
    using ErrorHandler = std::function<void(const zeroconnect::ErrorCode& error)>;

    virtual ~ServiceBrowser() = default;

    /// Start browsing for @p service_type
    /// Handlers must not block, they are called on the browser's thread
    /// @throw ConnectException (discovery_failed) if the browser can't be created
    virtual void start(const std::string& service_type, ResolvedHandler on_resolved, RemovedHandler on_removed, ErrorHandler on_error) = 0;

    /// Stop browsing and release all resources
    virtual void stop() = 0;
};

} // namespace discovery
