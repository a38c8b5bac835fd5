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
#include <cstdint>
#include <string>
#include <vector>


namespace crypto
{

using Bytes = std::vector<uint8_t>;

/// @return bytes of @p text
Bytes toBytes(const std::string& text);

/// @return @p bytes as string
std::string toString(const Bytes& bytes);

/// @return lower case hex representation of @p bytes
std::string toHex(const Bytes& bytes);

/// @return SHA-1 digest of @p data (20 bytes)
Bytes sha1(const Bytes& data);

/// @return MD5 digest of @p data (16 bytes)
Bytes md5(const Bytes& data);

/// @return HMAC-SHA1 of @p data with @p key (20 bytes)
Bytes hmacSha1(const Bytes& key, const Bytes& data);

/// PBKDF2 with HMAC-SHA1
/// @return @p key_len derived key bytes
Bytes pbkdf2HmacSha1(const Bytes& password, const Bytes& salt, int iterations, size_t key_len);

/// AES-ECB without padding, the key size (16, 24, 32) selects AES-128/192/256
/// @param encrypt true to encrypt, false to decrypt
/// @param data must be a multiple of the block size
Bytes aesEcb(const Bytes& key, const Bytes& data, bool encrypt);

/// AES-128-CTR, encryption and decryption are the same operation
Bytes aesCtr128(const Bytes& key, const Bytes& iv, const Bytes& data);

/// @return @p count random bytes from the OpenSSL CSPRNG
Bytes randomBytes(size_t count);

} // namespace crypto
