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
#include "file_utils.hpp"

// 3rd party headers
#include <aixlog.hpp>

// standard headers
#include <filesystem>
#include <system_error>


namespace utils::file
{

static constexpr auto LOG_TAG = "FileUtils";


bool exists(const std::string& filename)
{
    std::error_code ec;
    return std::filesystem::exists(filename, ec);
}


bool createParentDirectory(const std::string& filename)
{
    std::filesystem::path directory = std::filesystem::path(filename).parent_path();
    if (directory.empty())
        return true;

    std::error_code ec;
    if (std::filesystem::is_directory(directory, ec))
        return true;
    std::filesystem::create_directories(directory, ec);
    if (ec)
    {
        LOG(ERROR, LOG_TAG) << "Failed to create directory '" << directory.string() << "': " << ec.message() << "\n";
        return false;
    }
    return true;
}

} // namespace utils::file
