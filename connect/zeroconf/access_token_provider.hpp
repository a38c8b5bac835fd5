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

// standard headers
#include <optional>
#include <string>


namespace zeroconf
{

/// Source of Spotify access tokens for devices that accept a token instead of a login blob
/// Token acquisition and refresh is done by the implementation
class AccessTokenProvider
{
public:
    virtual ~AccessTokenProvider() = default;

    /// @param totp one time passcode, set if the device requires it ("accesstoken" token type)
    /// @return the access token
    virtual std::string accessToken(const std::optional<std::string>& totp) = 0;
};


/// Returns a preconfigured token
class StaticAccessTokenProvider : public AccessTokenProvider
{
public:
    explicit StaticAccessTokenProvider(std::string token) : token_(std::move(token))
    {
    }

    std::string accessToken(const std::optional<std::string>& /*totp*/) override
    {
        return token_;
    }

private:
    std::string token_;
};

} // namespace zeroconf
