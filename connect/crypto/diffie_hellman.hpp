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

// 3rd party headers
#include <openssl/bn.h>

// standard headers
#include <memory>
#include <string>


namespace crypto
{

/// Ephemeral Diffie-Hellman key pair over the 768 bit MODP group (RFC 2409 group 1, g = 2)
/**
 * The private exponent is generated on construction, the public value is
 * sent to the device as "clientKey". The shared secret is always returned
 * with the full width of the prime (96 bytes), left padded with zeros.
 */
class DiffieHellmanExchange
{
public:
    /// Width of the prime and of the shared secret in bytes
    static constexpr size_t key_size = 96;
    /// Width of the generated private exponent in bytes
    static constexpr size_t private_key_size = 95;

    /// c'tor, generates a random private key
    DiffieHellmanExchange();

    /// c'tor with a fixed private key (big endian)
    explicit DiffieHellmanExchange(const Bytes& private_key);

    /// @return the public key, big endian, 96 bytes
    Bytes publicKey() const;

    /// @return the public key as base64 encoded string
    std::string publicKeyBase64() const;

    /// Derive the shared secret from the device's public key
    /// @param peer_public_key big endian peer public value
    /// @return shared secret, big endian, 96 bytes
    /// @throw ConnectException key_exchange_failed if the peer key is not in (1, p-1)
    Bytes deriveSharedSecret(const Bytes& peer_public_key) const;

    /// @sa deriveSharedSecret, with the base64 encoded public key reported by getInfo
    Bytes deriveSharedSecretBase64(const std::string& peer_public_key) const;

private:
    void init(const Bytes& private_key);

    std::shared_ptr<BN_CTX> ctx_;
    std::shared_ptr<BIGNUM> prime_;
    std::shared_ptr<BIGNUM> private_key_;
    std::shared_ptr<BIGNUM> public_key_;
};

} // namespace crypto
