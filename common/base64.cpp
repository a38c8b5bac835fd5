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
#include "base64.h"

// standard headers
#include <array>

namespace
{

constexpr auto base64_chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                              "abcdefghijklmnopqrstuvwxyz"
                              "0123456789+/";

/// @return index of @p c in the alphabet or -1
int decode_char(unsigned char c)
{
    if ((c >= 'A') && (c <= 'Z'))
        return c - 'A';
    if ((c >= 'a') && (c <= 'z'))
        return c - 'a' + 26;
    if ((c >= '0') && (c <= '9'))
        return c - '0' + 52;
    if (c == '+')
        return 62;
    if (c == '/')
        return 63;
    return -1;
}

} // namespace


std::string base64_encode(const unsigned char* bytes_to_encode, size_t in_len)
{
    std::string ret;
    ret.reserve(((in_len + 2) / 3) * 4);
    std::array<unsigned char, 3> in{};
    size_t i = 0;

    while (in_len-- > 0)
    {
        in[i++] = *(bytes_to_encode++);
        if (i == 3)
        {
            ret += base64_chars[(in[0] & 0xfc) >> 2];
            ret += base64_chars[((in[0] & 0x03) << 4) + ((in[1] & 0xf0) >> 4)];
            ret += base64_chars[((in[1] & 0x0f) << 2) + ((in[2] & 0xc0) >> 6)];
            ret += base64_chars[in[2] & 0x3f];
            i = 0;
        }
    }

    if (i > 0)
    {
        for (size_t j = i; j < 3; ++j)
            in[j] = 0;

        ret += base64_chars[(in[0] & 0xfc) >> 2];
        ret += base64_chars[((in[0] & 0x03) << 4) + ((in[1] & 0xf0) >> 4)];
        ret += (i > 1) ? base64_chars[((in[1] & 0x0f) << 2) + ((in[2] & 0xc0) >> 6)] : '=';
        ret += '=';
    }

    return ret;
}


std::string base64_encode(const std::string& text)
{
    return base64_encode(reinterpret_cast<const unsigned char*>(text.data()), text.size());
}


std::string base64_encode(const std::vector<uint8_t>& bytes)
{
    return base64_encode(bytes.data(), bytes.size());
}


std::string base64_decode(const std::string& encoded_string)
{
    std::string ret;
    ret.reserve((encoded_string.size() / 4) * 3);
    uint32_t buffer = 0;
    int bits = 0;

    for (unsigned char c : encoded_string)
    {
        int value = decode_char(c);
        if (value < 0)
            break;
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8)
        {
            bits -= 8;
            ret += static_cast<char>((buffer >> bits) & 0xff);
        }
    }
    return ret;
}


std::vector<uint8_t> base64_decode_bytes(const std::string& encoded_string)
{
    std::string decoded = base64_decode(encoded_string);
    return {decoded.begin(), decoded.end()};
}


bool is_base64(const std::string& text)
{
    if (text.empty() || (text.size() % 4 != 0))
        return false;

    size_t padding = 0;
    for (unsigned char c : text)
    {
        if (c == '=')
            ++padding;
        else if ((padding > 0) || (decode_char(c) < 0))
            return false;
    }
    return padding <= 2;
}
