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
#include "connect/crypto/login_blob.hpp"

// standard headers
#include <mutex>
#include <optional>
#include <string>
#include <vector>


namespace zeroconf
{

/// User credentials for an activation
struct Credentials
{
    /// Spotify user name (or e-mail)
    std::string username;
    /// Spotify password, may be empty if a stored credential blob is used
    std::string password;
    /// canonical user id sent as "loginId", defaults to the user name
    std::string login_id;
    /// reusable credential blob harvested from a previously authenticated client
    std::optional<crypto::BlobCredentials> stored;

    /// @return login id, or the user name if no login id is set
    std::string loginId() const
    {
        return login_id.empty() ? username : login_id;
    }

    /// @return true if a password or a stored blob is available
    bool hasSecret() const
    {
        return !password.empty() || stored.has_value();
    }
};


/// Persistent store of credential blobs
///
/// The file holds either one object or a list of objects:
/// {"username": "...", "auth_type": 1, "auth_data": "<base64>"}
/// This is the format librespot writes to its "credentials.json".
class CredentialStore
{
public:
    /// c'tor
    /// @param filename the json file, created on first save
    explicit CredentialStore(std::string filename);

    /// @return all entries of the file, empty if the file does not exist
    std::vector<crypto::BlobCredentials> load() const;

    /// @return entry for @p username (case insensitive)
    std::optional<crypto::BlobCredentials> find(const std::string& username) const;

    /// Add or replace the entry of @p credentials.username and write the file
    void save(const crypto::BlobCredentials& credentials);

    const std::string& filename() const
    {
        return filename_;
    }

private:
    std::string filename_;
    mutable std::mutex mutex_;
};

} // namespace zeroconf
