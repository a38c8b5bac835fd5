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
#include "credentials.hpp"

// local headers
#include "common/base64.h"
#include "common/connect_exception.hpp"
#include "common/utils/file_utils.hpp"
#include "common/utils/string_utils.hpp"

// 3rd party headers
#include <aixlog.hpp>
#include <nlohmann/json.hpp>

// standard headers
#include <fstream>


using namespace std;
using json = nlohmann::json;

static constexpr auto LOG_TAG = "CredentialStore";


namespace zeroconf
{

namespace
{

crypto::BlobCredentials fromJson(const json& j)
{
    crypto::BlobCredentials result;
    result.username = j.value("username", "");
    int auth_type = j.value("auth_type", 1);
    if ((auth_type < 0) || (auth_type > static_cast<int>(crypto::AuthenticationType::facebook_token)))
        throw ConnectException(ConnectErrc::validation_failed, "Invalid auth_type in credential file: " + to_string(auth_type));
    result.auth_type = static_cast<crypto::AuthenticationType>(auth_type);
    result.auth_data = base64_decode_bytes(j.value("auth_data", ""));
    if (result.username.empty() || result.auth_data.empty())
        throw ConnectException(ConnectErrc::validation_failed, "Credential file entry without username or auth_data");
    return result;
}


json toJson(const crypto::BlobCredentials& credentials)
{
    return {{"username", credentials.username}, {"auth_type", static_cast<int>(credentials.auth_type)}, {"auth_data", base64_encode(credentials.auth_data)}};
}

} // namespace


CredentialStore::CredentialStore(std::string filename) : filename_(std::move(filename))
{
}


std::vector<crypto::BlobCredentials> CredentialStore::load() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<crypto::BlobCredentials> result;
    if (!utils::file::exists(filename_))
        return result;

    ifstream ifs(filename_, std::ifstream::in);
    if (!ifs.good() || (ifs.peek() == std::ifstream::traits_type::eof()))
        return result;

    json j;
    try
    {
        ifs >> j;
    }
    catch (const json::exception& e)
    {
        throw ConnectException(ConnectErrc::validation_failed, "Failed to parse credential file '" + filename_ + "': " + e.what());
    }

    if (j.is_array())
    {
        for (const auto& entry : j)
            result.push_back(fromJson(entry));
    }
    else
    {
        result.push_back(fromJson(j));
    }
    LOG(DEBUG, LOG_TAG) << "Loaded " << result.size() << " credential(s) from '" << filename_ << "'\n";
    return result;
}


std::optional<crypto::BlobCredentials> CredentialStore::find(const std::string& username) const
{
    auto lower = utils::string::tolower_copy(username);
    for (auto& entry : load())
    {
        if (utils::string::tolower_copy(entry.username) == lower)
            return entry;
    }
    return std::nullopt;
}


void CredentialStore::save(const crypto::BlobCredentials& credentials)
{
    auto entries = load();
    auto lower = utils::string::tolower_copy(credentials.username);
    bool replaced = false;
    for (auto& entry : entries)
    {
        if (utils::string::tolower_copy(entry.username) == lower)
        {
            entry = credentials;
            replaced = true;
        }
    }
    if (!replaced)
        entries.push_back(credentials);

    json j;
    if (entries.size() == 1)
    {
        j = toJson(entries.front());
    }
    else
    {
        j = json::array();
        for (const auto& entry : entries)
            j.push_back(toJson(entry));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!utils::file::createParentDirectory(filename_))
        throw ConnectException(ConnectErrc::validation_failed, "Failed to create the directory of credential file '" + filename_ + "'");
    std::ofstream ofs(filename_.c_str(), std::ofstream::out | std::ofstream::trunc);
    if (!ofs.good())
        throw ConnectException(ConnectErrc::validation_failed, "Failed to open credential file '" + filename_ + "' for writing");
    ofs << j.dump(4);
    ofs.close();
    LOG(INFO, LOG_TAG) << "Saved credentials of '" << credentials.username << "' to '" << filename_ << "'\n";
}

} // namespace zeroconf
