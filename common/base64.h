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

#include <cstdint>
#include <string>
#include <vector>

std::string base64_encode(const unsigned char* bytes_to_encode, size_t in_len);
std::string base64_encode(const std::string& text);
std::string base64_encode(const std::vector<uint8_t>& bytes);

/// Decode @p encoded_string, stops at the first character outside the alphabet
std::string base64_decode(const std::string& encoded_string);
std::vector<uint8_t> base64_decode_bytes(const std::string& encoded_string);

/// @return true if @p text consists of base64 characters and padding only
bool is_base64(const std::string& text);
