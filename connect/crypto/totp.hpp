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
#include "crypto_utils.hpp"

// standard headers
#include <cstdint>
#include <string>
#include <vector>


namespace crypto
{

/// Time based one time passwords (RFC 6238, HMAC-SHA1)
class TotpGenerator
{
public:
    /// Generate the passcode for @p unix_time
    /// @param secret the shared secret (raw bytes)
    /// @param time_step_seconds length of a time window, > 0
    /// @param digits number of digits, 1..9
    /// @param unix_time seconds since epoch
    /// @return zero padded passcode with @p digits digits
    static std::string generate(const Bytes& secret, uint32_t time_step_seconds, uint32_t digits, uint64_t unix_time);

    /// Decode a RFC 4648 base32 secret, case insensitive, padding and spaces ignored
    static Bytes base32Decode(const std::string& secret);

    /// Encode @p data as RFC 4648 base32 without padding
    static std::string base32Encode(const Bytes& data);

    /// Recover a secret published as obfuscated byte list
    /// Each byte is xor'ed with (index % 33) + 9, the results are joined as decimal numbers
    static Bytes deobfuscateSecret(const std::vector<uint8_t>& cipher);

    /// @return base32 secret of the obfuscated, comma separated byte list @p cipher (e.g. "12,56,76")
    /// @throw ConnectException (validation_failed) if @p cipher is no list of bytes
    static std::string secretFromCipher(const std::string& cipher);
};

} // namespace crypto
