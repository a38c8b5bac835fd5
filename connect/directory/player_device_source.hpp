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
#include "connect/directory/connect_device.hpp"

// standard headers
#include <optional>
#include <string>
#include <vector>


namespace directory
{

/// Player list of the streaming backend
struct PlayerDeviceList
{
    std::vector<PlayerDevice> devices;
    /// id of the device the backend reports as active
    std::optional<std::string> active_device_id;
};


/// Source of the devices known to the streaming backend (its player API)
class PlayerDeviceSource
{
public:
    virtual ~PlayerDeviceSource() = default;

    /// @return the current player list
    virtual PlayerDeviceList playerDevices() = 0;
};

} // namespace directory
