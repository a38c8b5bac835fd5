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
#include "totp.hpp"

// local headers
#include "common/connect_exception.hpp"
#include "common/utils/string_utils.hpp"

// standard headers
#include <algorithm>
#include <cctype>


namespace crypto
{

namespace
{
constexpr auto base32_chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
}


std::string TotpGenerator::generate(const Bytes& secret, uint32_t time_step_seconds, uint32_t digits, uint64_t unix_time)
{
    if (secret.empty())
        throw ConnectException(ConnectErrc::validation_failed, "TOTP secret must not be empty");
    if (time_step_seconds == 0)
        throw ConnectException(ConnectErrc::validation_failed, "TOTP time step must be > 0");
    if ((digits == 0) || (digits > 9))
        throw ConnectException(ConnectErrc::validation_failed, "TOTP digits must be in [1..9]");

    uint64_t counter = unix_time / time_step_seconds;
    Bytes message(8);
    for (int n = 7; n >= 0; --n)
    {
        message[static_cast<size_t>(n)] = static_cast<uint8_t>(counter & 0xff);
        counter >>= 8;
    }

    Bytes hash = hmacSha1(secret, message);
    // dynamic truncation, RFC 4226 5.3
    size_t offset = hash.back() & 0x0f;
    uint32_t binary = ((hash[offset] & 0x7f) << 24) | (hash[offset + 1] << 16) | (hash[offset + 2] << 8) | hash[offset + 3];

    uint32_t modulo = 1;
    for (uint32_t n = 0; n < digits; ++n)
        modulo *= 10;

    std::string code = std::to_string(binary % modulo);
    if (code.size() < digits)
        code.insert(0, digits - code.size(), '0');
    return code;
}


Bytes TotpGenerator::base32Decode(const std::string& secret)
{
    Bytes result;
    uint32_t buffer = 0;
    int bits = 0;
    for (char c : secret)
    {
        if ((c == '=') || std::isspace(static_cast<unsigned char>(c)))
            continue;
        auto upper = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        int value = -1;
        if ((upper >= 'A') && (upper <= 'Z'))
            value = upper - 'A';
        else if ((upper >= '2') && (upper <= '7'))
            value = upper - '2' + 26;
        else
            throw ConnectException(ConnectErrc::validation_failed, std::string("Invalid base32 character: '") + c + "'");

        buffer = (buffer << 5) | static_cast<uint32_t>(value);
        bits += 5;
        if (bits >= 8)
        {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buffer >> bits) & 0xff));
        }
    }
    return result;
}


std::string TotpGenerator::base32Encode(const Bytes& data)
{
    std::string result;
    uint32_t buffer = 0;
    int bits = 0;
    for (auto b : data)
    {
        buffer = (buffer << 8) | b;
        bits += 8;
        while (bits >= 5)
        {
            bits -= 5;
            result += base32_chars[(buffer >> bits) & 0x1f];
        }
    }
    if (bits > 0)
        result += base32_chars[(buffer << (5 - bits)) & 0x1f];
    return result;
}


Bytes TotpGenerator::deobfuscateSecret(const std::vector<uint8_t>& cipher)
{
    std::string joined;
    for (size_t idx = 0; idx < cipher.size(); ++idx)
        joined += std::to_string(cipher[idx] ^ ((idx % 33) + 9));
    return toBytes(joined);
}


std::string TotpGenerator::secretFromCipher(const std::string& cipher)
{
    std::vector<uint8_t> bytes;
    for (const auto& item : utils::string::split(cipher, ','))
    {
        std::string value = utils::string::trim_copy(item);
        if (value.empty() || (value.size() > 3) || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; }))
            throw ConnectException(ConnectErrc::validation_failed, "Invalid TOTP cipher byte: '" + value + "'");
        int byte = std::stoi(value);
        if (byte > 255)
            throw ConnectException(ConnectErrc::validation_failed, "TOTP cipher byte out of range: " + value);
        bytes.push_back(static_cast<uint8_t>(byte));
    }
    if (bytes.empty())
        throw ConnectException(ConnectErrc::validation_failed, "TOTP cipher is empty");
    return base32Encode(deobfuscateSecret(bytes));
}

} // namespace crypto
