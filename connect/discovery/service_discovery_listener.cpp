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
#include "service_discovery_listener.hpp"

// 3rd party headers
#include <aixlog.hpp>


static constexpr auto LOG_TAG = "Discovery";


namespace discovery
{

std::string to_string(ServiceEvent event)
{
    switch (event)
    {
        case ServiceEvent::added:
            return "ServiceAdded";
        case ServiceEvent::updated:
            return "ServiceUpdated";
        case ServiceEvent::removed:
            return "ServiceRemoved";
    }
    return "Unknown";
}


ServiceDiscoveryListener::ServiceDiscoveryListener(ServiceBrowser& browser, std::string service_type, std::chrono::seconds ttl)
    : browser_(browser), service_type_(std::move(service_type)), ttl_(ttl), running_(false), now_([] { return Clock::now(); })
{
}


ServiceDiscoveryListener::~ServiceDiscoveryListener()
{
    stop();
}


void ServiceDiscoveryListener::addHandler(EventHandler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.push_back(std::move(handler));
}


void ServiceDiscoveryListener::setErrorHandler(ErrorHandler handler)
{
    std::lock_guard<std::mutex> lock(mutex_);
    error_handler_ = std::move(handler);
}


void ServiceDiscoveryListener::start()
{
    if (isRunning())
        return;

    LOG(INFO, LOG_TAG) << "Starting discovery of '" << service_type_ << "'\n";
    browser_.start(
        service_type_, [this](const ServiceAnnouncement& announcement) { onResolved(announcement); },
        [this](const std::string& name, const std::string& service_type) { onRemoved(name, service_type); },
        [this](const zeroconnect::ErrorCode& error)
    {
        // keep the known services, the owner decides about a restart
        LOG(ERROR, LOG_TAG) << "Discovery of '" << service_type_ << "' failed: " << error.detailed_message() << "\n";
        ErrorHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = error_handler_;
        }
        if (handler)
            handler(error);
    });

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = true;
}


void ServiceDiscoveryListener::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_)
            return;
        running_ = false;
    }
    LOG(INFO, LOG_TAG) << "Stopping discovery of '" << service_type_ << "'\n";
    browser_.stop();
}


bool ServiceDiscoveryListener::isRunning() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}


std::vector<DiscoveredService> ServiceDiscoveryListener::services() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DiscoveredService> result;
    result.reserve(services_.size());
    for (const auto& [key, service] : services_)
        result.push_back(service);
    return result;
}


std::optional<DiscoveredService> ServiceDiscoveryListener::find(const std::string& key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto iter = services_.find(DiscoveredService::makeKey(key));
    if (iter == services_.end())
        return std::nullopt;
    return iter->second;
}


void ServiceDiscoveryListener::notify(ServiceEvent event, const DiscoveredService& service)
{
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers = handlers_;
    }
    for (const auto& handler : handlers)
        handler(event, service);
}


void ServiceDiscoveryListener::onResolved(const ServiceAnnouncement& announcement)
{
    std::string key = DiscoveredService::makeKey(announcement.name);
    std::optional<ServiceEvent> event;
    DiscoveredService service;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto iter = services_.find(key);
        if (iter == services_.end())
        {
            service.key = key;
            service.merge(announcement, now_());
            services_.emplace(key, service);
            event = ServiceEvent::added;
        }
        else
        {
            // re-announcements refresh last seen, only changes are reported
            if (iter->second.merge(announcement, now_()))
                event = ServiceEvent::updated;
            service = iter->second;
        }
    }

    if (!event.has_value())
        return;

    LOG(INFO, LOG_TAG) << to_string(*event) << ": '" << service.name << "' at " << service.address() << ":" << service.port << " ("
                       << service.addresses.size() << " address(es))\n";
    notify(*event, service);
}


void ServiceDiscoveryListener::onRemoved(const std::string& name, const std::string& /*service_type*/)
{
    DiscoveredService service;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto iter = services_.find(DiscoveredService::makeKey(name));
        if (iter == services_.end())
            return;
        service = iter->second;
        services_.erase(iter);
    }

    LOG(INFO, LOG_TAG) << "ServiceRemoved: '" << service.name << "'\n";
    notify(ServiceEvent::removed, service);
}


void ServiceDiscoveryListener::expire(Clock::time_point now)
{
    if (ttl_.count() == 0)
        return;

    std::vector<DiscoveredService> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto iter = services_.begin(); iter != services_.end();)
        {
            if (now - iter->second.last_seen > ttl_)
            {
                expired.push_back(iter->second);
                iter = services_.erase(iter);
            }
            else
            {
                ++iter;
            }
        }
    }

    for (const auto& service : expired)
    {
        LOG(INFO, LOG_TAG) << "ServiceRemoved (expired): '" << service.name << "'\n";
        notify(ServiceEvent::removed, service);
    }
}

} // namespace discovery
