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
#include "crypto_utils.hpp"

// local headers
#include "common/connect_exception.hpp"

// 3rd party headers
#include <aixlog.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

// standard headers
#include <iomanip>
#include <memory>
#include <sstream>


static constexpr auto LOG_TAG = "Crypto";


namespace crypto
{

namespace
{

[[noreturn]] void fail(const std::string& what)
{
    LOG(ERROR, LOG_TAG) << what << " failed\n";
    throw ConnectException(ConnectErrc::crypto_failed, what + " failed");
}


Bytes digest(const EVP_MD* md, const Bytes& data, const char* name)
{
    std::shared_ptr<EVP_MD_CTX> ctx(EVP_MD_CTX_new(), [](auto p) { EVP_MD_CTX_free(p); });
    if (!ctx)
        fail("EVP_MD_CTX_new");

    Bytes result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if ((EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) || (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) ||
        (EVP_DigestFinal_ex(ctx.get(), result.data(), &len) != 1))
        fail(name);

    result.resize(len);
    return result;
}


Bytes cipher(const EVP_CIPHER* type, const Bytes& key, const Bytes* iv, const Bytes& data, bool encrypt)
{
    std::shared_ptr<EVP_CIPHER_CTX> ctx(EVP_CIPHER_CTX_new(), [](auto p) { EVP_CIPHER_CTX_free(p); });
    if (!ctx)
        fail("EVP_CIPHER_CTX_new");

    if (EVP_CipherInit_ex(ctx.get(), type, nullptr, key.data(), (iv != nullptr) ? iv->data() : nullptr, encrypt ? 1 : 0) != 1)
        fail("EVP_CipherInit_ex");
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    Bytes result(data.size() + EVP_MAX_BLOCK_LENGTH);
    int len = 0;
    if (EVP_CipherUpdate(ctx.get(), result.data(), &len, data.data(), static_cast<int>(data.size())) != 1)
        fail("EVP_CipherUpdate");
    int final_len = 0;
    if (EVP_CipherFinal_ex(ctx.get(), result.data() + len, &final_len) != 1)
        fail("EVP_CipherFinal_ex");

    result.resize(static_cast<size_t>(len + final_len));
    return result;
}

} // namespace


Bytes toBytes(const std::string& text)
{
    return {text.begin(), text.end()};
}


std::string toString(const Bytes& bytes)
{
    return {bytes.begin(), bytes.end()};
}


std::string toHex(const Bytes& bytes)
{
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (auto b : bytes)
        ss << std::setw(2) << static_cast<int>(b);
    return ss.str();
}


Bytes sha1(const Bytes& data)
{
    return digest(EVP_sha1(), data, "SHA1");
}


Bytes md5(const Bytes& data)
{
    return digest(EVP_md5(), data, "MD5");
}


Bytes hmacSha1(const Bytes& key, const Bytes& data)
{
    Bytes result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (HMAC(EVP_sha1(), key.data(), static_cast<int>(key.size()), data.data(), data.size(), result.data(), &len) == nullptr)
        fail("HMAC-SHA1");
    result.resize(len);
    return result;
}


Bytes pbkdf2HmacSha1(const Bytes& password, const Bytes& salt, int iterations, size_t key_len)
{
    Bytes result(key_len);
    if (PKCS5_PBKDF2_HMAC_SHA1(reinterpret_cast<const char*>(password.data()), static_cast<int>(password.size()), salt.data(), static_cast<int>(salt.size()),
                               iterations, static_cast<int>(key_len), result.data()) != 1)
        fail("PBKDF2-HMAC-SHA1");
    return result;
}


Bytes aesEcb(const Bytes& key, const Bytes& data, bool encrypt)
{
    const EVP_CIPHER* type = nullptr;
    switch (key.size())
    {
        case 16:
            type = EVP_aes_128_ecb();
            break;
        case 24:
            type = EVP_aes_192_ecb();
            break;
        case 32:
            type = EVP_aes_256_ecb();
            break;
        default:
            throw ConnectException(ConnectErrc::crypto_failed, "Invalid AES key size: " + std::to_string(key.size()));
    }
    if (data.size() % 16 != 0)
        throw ConnectException(ConnectErrc::crypto_failed, "AES-ECB data is not block aligned: " + std::to_string(data.size()));
    return cipher(type, key, nullptr, data, encrypt);
}


Bytes aesCtr128(const Bytes& key, const Bytes& iv, const Bytes& data)
{
    if ((key.size() != 16) || (iv.size() != 16))
        throw ConnectException(ConnectErrc::crypto_failed, "AES-128-CTR requires a 16 byte key and iv");
    return cipher(EVP_aes_128_ctr(), key, &iv, data, true);
}


Bytes randomBytes(size_t count)
{
    Bytes result(count);
    if (RAND_bytes(result.data(), static_cast<int>(count)) != 1)
        fail("RAND_bytes");
    return result;
}

} // namespace crypto
