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
#include "diffie_hellman.hpp"

// local headers
#include "common/base64.h"
#include "common/connect_exception.hpp"

// 3rd party headers
#include <aixlog.hpp>

// standard headers


static constexpr auto LOG_TAG = "DH";


namespace crypto
{

namespace
{

constexpr auto dh_prime = "ffffffffffffffffc90fdaa22168c234c4c6628b80dc1cd1"
                          "29024e088a67cc74020bbea63b139b22514a08798e3404dd"
                          "ef9519b3cd3a431b302b0a6df25f14374fe1356d6d51c245"
                          "e485b576625e7ec6f44c42e9a63a3620ffffffffffffffff";

constexpr unsigned long dh_generator = 2;

std::shared_ptr<BIGNUM> makeBignum(BIGNUM* bn)
{
    if (bn == nullptr)
        throw ConnectException(ConnectErrc::crypto_failed, "BN_new failed");
    return {bn, [](auto p) { BN_clear_free(p); }};
}


Bytes toPaddedBytes(const BIGNUM* bn)
{
    Bytes result(DiffieHellmanExchange::key_size);
    if (BN_bn2binpad(bn, result.data(), static_cast<int>(result.size())) < 0)
        throw ConnectException(ConnectErrc::crypto_failed, "BN_bn2binpad failed");
    return result;
}

} // namespace


DiffieHellmanExchange::DiffieHellmanExchange()
{
    init(randomBytes(private_key_size));
}


DiffieHellmanExchange::DiffieHellmanExchange(const Bytes& private_key)
{
    if (private_key.empty() || (private_key.size() > key_size))
        throw ConnectException(ConnectErrc::validation_failed, "Invalid DH private key size: " + std::to_string(private_key.size()));
    init(private_key);
}


void DiffieHellmanExchange::init(const Bytes& private_key)
{
    ctx_ = std::shared_ptr<BN_CTX>(BN_CTX_new(), [](auto p) { BN_CTX_free(p); });
    if (!ctx_)
        throw ConnectException(ConnectErrc::crypto_failed, "BN_CTX_new failed");

    BIGNUM* prime = nullptr;
    if (BN_hex2bn(&prime, dh_prime) == 0)
        throw ConnectException(ConnectErrc::crypto_failed, "BN_hex2bn failed");
    prime_ = makeBignum(prime);

    private_key_ = makeBignum(BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()), nullptr));

    auto generator = makeBignum(BN_new());
    BN_set_word(generator.get(), dh_generator);
    public_key_ = makeBignum(BN_new());
    if (BN_mod_exp(public_key_.get(), generator.get(), private_key_.get(), prime_.get(), ctx_.get()) != 1)
        throw ConnectException(ConnectErrc::crypto_failed, "BN_mod_exp failed");
}


Bytes DiffieHellmanExchange::publicKey() const
{
    return toPaddedBytes(public_key_.get());
}


std::string DiffieHellmanExchange::publicKeyBase64() const
{
    return base64_encode(publicKey());
}


Bytes DiffieHellmanExchange::deriveSharedSecret(const Bytes& peer_public_key) const
{
    auto peer = makeBignum(BN_bin2bn(peer_public_key.data(), static_cast<int>(peer_public_key.size()), nullptr));

    // reject 0, 1, p-1 and everything >= p, these would yield a degenerate secret
    auto upper = makeBignum(BN_dup(prime_.get()));
    BN_sub_word(upper.get(), 1);
    if (BN_is_zero(peer.get()) || BN_is_one(peer.get()) || (BN_cmp(peer.get(), upper.get()) >= 0))
    {
        LOG(ERROR, LOG_TAG) << "Peer public key out of range (" << peer_public_key.size() << " bytes)\n";
        throw ConnectException(ConnectErrc::key_exchange_failed, "Peer public key is not a valid residue");
    }

    auto shared = makeBignum(BN_new());
    if (BN_mod_exp(shared.get(), peer.get(), private_key_.get(), prime_.get(), ctx_.get()) != 1)
        throw ConnectException(ConnectErrc::crypto_failed, "BN_mod_exp failed");

    return toPaddedBytes(shared.get());
}


Bytes DiffieHellmanExchange::deriveSharedSecretBase64(const std::string& peer_public_key) const
{
    if (!is_base64(peer_public_key))
        throw ConnectException(ConnectErrc::key_exchange_failed, "Peer public key is not base64: '" + peer_public_key + "'");
    return deriveSharedSecret(base64_decode_bytes(peer_public_key));
}

} // namespace crypto
