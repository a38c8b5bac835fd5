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
#include "controller.hpp"

// local headers
#include "common/utils/string_utils.hpp"
#include "connect/cast/cast_app_launcher.hpp"

// 3rd party headers
#include <aixlog.hpp>
#include <boost/asio/post.hpp>


using namespace std;
using namespace directory;

static constexpr auto LOG_TAG = "Controller";

static constexpr auto cast_group_model = "Google Cast Group";


ConnectController::ConnectController(ConnectSettings settings, zeroconf::HttpTransport& transport, discovery::ServiceBrowser& connect_browser,
                                     discovery::ServiceBrowser* cast_browser)
    : settings_(std::move(settings)), transport_(transport),
      connect_listener_(connect_browser, settings_.discovery.service_type, settings_.discovery.ttl),
      directory_([this](const zeroconf::Endpoint& endpoint)
      {
          zeroconf::DeviceZeroconfClient client(transport_, endpoint, settings_.zeroconf, settings_.totp);
          client.setSleeper(sleeper_);
          return client.getInfo();
      }),
      player_source_(nullptr), token_provider_(nullptr),
      sleeper_([](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); }), refresh_timer_(refresh_ioc_), running_(false)
{
    if ((cast_browser != nullptr) && settings_.discovery.cast_enabled)
        cast_listener_ = std::make_unique<discovery::ServiceDiscoveryListener>(*cast_browser, settings_.discovery.cast_service_type, settings_.discovery.ttl);

    auto on_event = [this](discovery::ServiceEvent event, const discovery::DiscoveredService& service)
    {
        LOG(DEBUG, LOG_TAG) << discovery::to_string(event) << ": " << service.name << "\n";
        directory_.onServiceEvent(event, service);
    };
    auto on_error = [](const zeroconnect::ErrorCode& error) { LOG(ERROR, LOG_TAG) << "Discovery error: " << error.detailed_message() << "\n"; };

    connect_listener_.addHandler(on_event);
    connect_listener_.setErrorHandler(on_error);
    if (cast_listener_)
    {
        cast_listener_->addHandler(on_event);
        cast_listener_->setErrorHandler(on_error);
    }
}


ConnectController::~ConnectController()
{
    stop();
}


void ConnectController::start()
{
    if (running_)
        return;

    LOG(INFO, LOG_TAG) << "Starting, service type: " << settings_.discovery.service_type
                       << (cast_listener_ ? ", cast service type: " + settings_.discovery.cast_service_type : "") << "\n";
    if (!connect_listener_.isRunning())
        connect_listener_.start();
    if (cast_listener_ && !cast_listener_->isRunning())
    {
        try
        {
            cast_listener_->start();
        }
        catch (const ConnectException& e)
        {
            // cast discovery is optional, Spotify Connect discovery keeps running
            LOG(ERROR, LOG_TAG) << "Failed to start cast discovery: " << e.what() << "\n";
        }
    }

    running_ = true;
    if (settings_.discovery.refresh_interval.count() > 0)
    {
        refresh_ioc_.restart();
        scheduleRefresh();
        refresh_thread_ = std::thread([this] { refresh_ioc_.run(); });
    }
}


void ConnectController::stop()
{
    if (!running_)
        return;

    LOG(DEBUG, LOG_TAG) << "Stopping\n";
    running_ = false;
    boost::asio::post(refresh_ioc_, [this] { refresh_timer_.cancel(); });
    if (refresh_thread_.joinable())
        refresh_thread_.join();

    connect_listener_.stop();
    if (cast_listener_)
        cast_listener_->stop();
}


void ConnectController::scheduleRefresh()
{
    refresh_timer_.expires_after(settings_.discovery.refresh_interval);
    refresh_timer_.async_wait([this](const boost::system::error_code& ec)
    {
        if (ec || !running_)
            return;
        try
        {
            refresh();
        }
        catch (const ConnectException& e)
        {
            LOG(WARNING, LOG_TAG) << "Refresh failed: " << e.what() << "\n";
        }
        if (running_)
            scheduleRefresh();
    });
}


std::vector<discovery::DiscoveredService> ConnectController::discoveredServices() const
{
    auto services = connect_listener_.services();
    if (cast_listener_)
    {
        auto cast_services = cast_listener_->services();
        services.insert(services.end(), cast_services.begin(), cast_services.end());
    }
    return services;
}


void ConnectController::refresh()
{
    if (settings_.discovery.ttl.count() > 0)
    {
        connect_listener_.expire(discovery::Clock::now());
        if (cast_listener_)
            cast_listener_->expire(discovery::Clock::now());
    }

    auto snapshot_time = directory_.now();
    directory_.refreshStatic(discoveredServices(), snapshot_time);

    if (player_source_ != nullptr)
    {
        auto player_list = player_source_->playerDevices();
        directory_.mergeDynamic(player_list.devices, player_list.active_device_id);
    }
    LOG(DEBUG, LOG_TAG) << "Refreshed, " << directory_.size() << " devices\n";
}


std::vector<SpotifyConnectDevice> ConnectController::discover()
{
    bool was_running = running_;
    if (!connect_listener_.isRunning())
        connect_listener_.start();
    if (cast_listener_ && !cast_listener_->isRunning())
        cast_listener_->start();

    LOG(INFO, LOG_TAG) << "Discovering devices for " << settings_.discovery.timeout.count() << " ms\n";
    sleeper_(settings_.discovery.timeout);
    refresh();

    if (!was_running)
    {
        connect_listener_.stop();
        if (cast_listener_)
            cast_listener_->stop();
    }
    return directory_.devices();
}


std::vector<SpotifyConnectDevice> ConnectController::listDevices() const
{
    return directory_.devices();
}


std::optional<SpotifyConnectDevice> ConnectController::getActiveDevice() const
{
    return directory_.getActive();
}


void ConnectController::updatePlayerDevices(const std::vector<PlayerDevice>& devices, const std::optional<std::string>& active_device_id)
{
    directory_.mergeDynamic(devices, active_device_id);
}


std::shared_ptr<zeroconf::DeviceZeroconfClient> ConnectController::clientFor(const SpotifyConnectDevice& device)
{
    if (device.isDynamic())
        throw ConnectException(ConnectErrc::device_unreachable, "'" + device.name + "' is only known to the backend, its address is unknown");

    std::lock_guard<std::mutex> lock(clients_mutex_);
    auto iter = clients_.find(device.key);
    if (iter != clients_.end())
    {
        auto& client = iter->second;
        // a disconnecting client resolves its new address on the next action
        if ((client->state() == zeroconf::ActivationState::disconnecting) || (client->endpoint() == device.endpoint()))
            return client;
        LOG(DEBUG, LOG_TAG) << "'" << device.name << "' moved to " << device.endpoint().url() << "\n";
    }

    auto client = std::make_shared<zeroconf::DeviceZeroconfClient>(transport_, device.endpoint(), settings_.zeroconf, settings_.totp);
    client->setSleeper(sleeper_);
    std::string key = device.key;
    // devices may reopen their listener on another port after a logout
    client->setRediscoveryHandler([this, key](const zeroconf::Endpoint& endpoint) -> std::optional<zeroconf::Endpoint>
    {
        auto service = connect_listener_.find(key);
        if (!service.has_value())
            return std::nullopt;
        zeroconf::Endpoint found{service->address(), service->port, service->cpath(), service->version()};
        if (found == endpoint)
            return std::nullopt;
        return found;
    });
    clients_[key] = client;
    return client;
}


zeroconf::DeviceInfo ConnectController::getInfo(const std::string& id_or_name)
{
    SpotifyConnectDevice device = directory_.resolve(id_or_name);
    if (device.is_cast)
    {
        if (device.info.has_value())
            return *device.info;
        throw ConnectException(ConnectErrc::device_not_ready, "'" + device.name + "' is a cast receiver, Spotify has not been launched");
    }

    auto lock = directory_.lockDevice(device.key, settings_.zeroconf.action_timeout);
    auto client = clientFor(device);
    try
    {
        auto info = client->getInfo();
        directory_.updateInfo(device.key, info);
        return info;
    }
    catch (const ConnectException& e)
    {
        if (e.code() == ConnectErrc::device_unreachable)
            directory_.markUnreachable(device.key);
        throw;
    }
}


zeroconf::DeviceInfo ConnectController::activateCast(const SpotifyConnectDevice& device)
{
    if (!cast_channel_factory_)
        throw ConnectException(ConnectErrc::device_not_ready, "No cast channel available for '" + device.name + "'");
    if (token_provider_ == nullptr)
        throw ConnectException(ConnectErrc::validation_failed, "Cast receivers require an access token");

    bool is_group = false;
    if (cast_listener_)
    {
        if (auto service = cast_listener_->find(device.key); service.has_value())
            is_group = (service->txtValue("md") == cast_group_model);
    }

    auto channel = cast_channel_factory_();
    cast::CastAppLauncher launcher(*channel, settings_.cast);
    zeroconf::DeviceInfo info = launcher.launch(device.host, device.name, device.device_id, is_group);

    std::optional<std::string> totp;
    if (info.token_type.empty() || info.requiresTotp())
        totp = zeroconf::makeTotp(settings_.totp, std::chrono::system_clock::now());
    launcher.addUser(token_provider_->accessToken(totp));
    return info;
}


zeroconf::DeviceInfo ConnectController::activate(const std::string& id_or_name, const zeroconf::Credentials& credentials)
{
    SpotifyConnectDevice device = directory_.resolve(id_or_name);
    LOG(INFO, LOG_TAG) << "Activating '" << device.name << "' (" << device.device_id << ")\n";

    auto lock = directory_.lockDevice(device.key, settings_.zeroconf.action_timeout);
    try
    {
        zeroconf::DeviceInfo info;
        if (device.is_cast)
        {
            info = activateCast(device);
        }
        else
        {
            info = clientFor(device)->activate(credentials, token_provider_);
        }
        directory_.updateInfo(device.key, info);
        directory_.setActive(device.key);
        LOG(INFO, LOG_TAG) << "Activated '" << device.name << "'\n";
        return info;
    }
    catch (const ConnectException& e)
    {
        LOG(ERROR, LOG_TAG) << "Failed to activate '" << device.name << "': " << e.what() << "\n";
        if (e.code() == ConnectErrc::device_unreachable)
            directory_.markUnreachable(device.key);
        throw;
    }
}


void ConnectController::deactivate(const std::string& id_or_name)
{
    SpotifyConnectDevice device = directory_.resolve(id_or_name);
    LOG(INFO, LOG_TAG) << "Deactivating '" << device.name << "'\n";

    auto lock = directory_.lockDevice(device.key, settings_.zeroconf.action_timeout);
    if (device.is_cast)
    {
        // the receiver app has no logout action, the session ends with the app
        directory_.clearActive(device.key);
        return;
    }

    auto client = clientFor(device);
    try
    {
        client->deactivate();
    }
    catch (const ConnectException& e)
    {
        LOG(ERROR, LOG_TAG) << "Failed to deactivate '" << device.name << "': " << e.what() << "\n";
        if (e.code() == ConnectErrc::device_unreachable)
            directory_.markUnreachable(device.key);
        throw;
    }
    directory_.clearActive(device.key);
}
