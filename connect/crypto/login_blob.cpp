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
#include "login_blob.hpp"

// local headers
#include "common/base64.h"
#include "common/connect_exception.hpp"

// 3rd party headers
#include <aixlog.hpp>
#include <openssl/crypto.h>

// standard headers
#include <algorithm>


static constexpr auto LOG_TAG = "LoginBlob";


namespace crypto
{

namespace
{

constexpr uint8_t tag_username = 0x49;
constexpr uint8_t tag_auth_type = 0x50;
constexpr uint8_t tag_auth_data = 0x51;
constexpr size_t block_size = 16;
constexpr size_t checksum_size = 20;
constexpr size_t max_field_length = 0x3fff;


void writeVarint(Bytes& out, size_t value)
{
    if (value < 0x80)
    {
        out.push_back(static_cast<uint8_t>(value));
    }
    else
    {
        out.push_back(static_cast<uint8_t>(0x80 | (value & 0x7f)));
        out.push_back(static_cast<uint8_t>(value >> 7));
    }
}


void writeField(Bytes& out, const Bytes& value)
{
    writeVarint(out, value.size());
    out.insert(out.end(), value.begin(), value.end());
}


/// Sequential reader over the decrypted structure
class Reader
{
public:
    explicit Reader(const Bytes& data) : data_(data), pos_(0)
    {
    }

    uint8_t byte()
    {
        if (pos_ >= data_.size())
            throw ConnectException(ConnectErrc::crypto_failed, "Login blob truncated");
        return data_[pos_++];
    }

    size_t varint()
    {
        size_t value = byte();
        if ((value & 0x80) != 0)
            value = (value & 0x7f) | (static_cast<size_t>(byte()) << 7);
        return value;
    }

    Bytes field()
    {
        size_t len = varint();
        if (pos_ + len > data_.size())
            throw ConnectException(ConnectErrc::crypto_failed, "Login blob field exceeds data");
        Bytes result(data_.begin() + static_cast<std::ptrdiff_t>(pos_), data_.begin() + static_cast<std::ptrdiff_t>(pos_ + len));
        pos_ += len;
        return result;
    }

    void expect(uint8_t tag)
    {
        if (byte() != tag)
            throw ConnectException(ConnectErrc::crypto_failed, "Unexpected tag in login blob");
    }

private:
    const Bytes& data_;
    size_t pos_;
};


Bytes outerBaseKey(const Bytes& shared_secret)
{
    Bytes base_key = sha1(shared_secret);
    base_key.resize(16);
    return base_key;
}

} // namespace


LoginBlobBuilder::LoginBlobBuilder(bool verify) : verify_(verify)
{
}


const Bytes& LoginBlobBuilder::iv()
{
    static const Bytes iv{253, 81, 222, 19, 70, 203, 45, 89, 141, 68, 210, 240, 93, 20, 76, 30};
    return iv;
}


Bytes LoginBlobBuilder::encodeCredentials(const BlobCredentials& credentials)
{
    if (credentials.username.empty())
        throw ConnectException(ConnectErrc::validation_failed, "User name is required to build the login blob");
    if (credentials.auth_data.empty())
        throw ConnectException(ConnectErrc::validation_failed, "Password or credential blob is required to build the login blob");
    if ((credentials.username.size() > max_field_length) || (credentials.auth_data.size() > max_field_length))
        throw ConnectException(ConnectErrc::validation_failed, "Credential field too long for the login blob");

    Bytes blob;
    blob.push_back(tag_username);
    writeField(blob, toBytes(credentials.username));
    blob.push_back(tag_auth_type);
    writeVarint(blob, static_cast<size_t>(credentials.auth_type));
    blob.push_back(tag_auth_data);
    writeField(blob, credentials.auth_data);

    size_t n_zeros = block_size - (blob.size() % block_size) - 1;
    blob.insert(blob.end(), n_zeros, 0);
    blob.push_back(static_cast<uint8_t>(n_zeros + 1));

    // chain each byte with the one 16 positions before it
    size_t len = blob.size();
    for (size_t j = block_size; j < len; ++j)
        blob[j] ^= blob[j - block_size];

    return blob;
}


Bytes LoginBlobBuilder::innerKey(const std::string& device_id, const std::string& username)
{
    Bytes secret = sha1(toBytes(device_id));
    Bytes derived = pbkdf2HmacSha1(secret, toBytes(username), 0x100, 20);
    Bytes key = sha1(derived);
    key.insert(key.end(), {0x00, 0x00, 0x00, 0x14});
    return key;
}


LoginBlob LoginBlobBuilder::build(const BlobCredentials& credentials, const std::string& device_id, const Bytes& shared_secret,
                                  const std::string& client_key) const
{
    if (device_id.empty())
        throw ConnectException(ConnectErrc::validation_failed, "Device id is required to build the login blob");
    if (shared_secret.empty())
        throw ConnectException(ConnectErrc::validation_failed, "Shared secret is required to build the login blob");

    // inner layer
    Bytes plain = encodeCredentials(credentials);
    Bytes inner = aesEcb(innerKey(device_id, credentials.username), plain, true);
    std::string inner_b64 = base64_encode(inner);

    // outer layer
    Bytes base_key = outerBaseKey(shared_secret);
    Bytes enc_key = hmacSha1(base_key, toBytes("encryption"));
    enc_key.resize(16);
    Bytes checksum_key = hmacSha1(base_key, toBytes("checksum"));

    LoginBlob result;
    result.user_name = credentials.username;
    result.client_key = client_key;
    result.device_id = device_id;
    result.ciphertext = aesCtr128(enc_key, iv(), toBytes(inner_b64));
    result.checksum = hmacSha1(checksum_key, result.ciphertext);

    Bytes transport = iv();
    transport.insert(transport.end(), result.ciphertext.begin(), result.ciphertext.end());
    transport.insert(transport.end(), result.checksum.begin(), result.checksum.end());
    result.blob = base64_encode(transport);

    LOG(DEBUG, LOG_TAG) << "Built login blob for device '" << device_id << "', " << result.blob.size() << " chars\n";
    if (result.blob.size() > max_blob_length)
        LOG(WARNING, LOG_TAG) << "Login blob exceeds " << max_blob_length << " chars and might be rejected\n";

    if (verify_)
    {
        BlobCredentials decoded = LoginBlobDecoder::decode(result.blob, device_id, credentials.username, shared_secret);
        if (!(decoded == credentials))
            throw ConnectException(ConnectErrc::crypto_failed, "Login blob self verification failed");
    }
    return result;
}


LoginBlob LoginBlobBuilder::build(const BlobCredentials& credentials, const std::string& device_id, const DiffieHellmanExchange& dh,
                                  const std::string& device_public_key) const
{
    return build(credentials, device_id, dh.deriveSharedSecretBase64(device_public_key), dh.publicKeyBase64());
}


BlobCredentials LoginBlobDecoder::decode(const std::string& blob, const std::string& device_id, const std::string& username, const Bytes& shared_secret)
{
    Bytes transport = base64_decode_bytes(blob);
    const Bytes& iv = LoginBlobBuilder::iv();
    if (transport.size() < iv.size() + checksum_size + 1)
        throw ConnectException(ConnectErrc::crypto_failed, "Login blob too short");

    auto cipher_begin = transport.begin() + static_cast<std::ptrdiff_t>(iv.size());
    auto cipher_end = transport.end() - static_cast<std::ptrdiff_t>(checksum_size);
    Bytes received_iv(transport.begin(), cipher_begin);
    Bytes ciphertext(cipher_begin, cipher_end);
    Bytes checksum(cipher_end, transport.end());

    Bytes base_key = outerBaseKey(shared_secret);
    Bytes checksum_key = hmacSha1(base_key, toBytes("checksum"));
    Bytes expected = hmacSha1(checksum_key, ciphertext);
    if (CRYPTO_memcmp(expected.data(), checksum.data(), checksum_size) != 0)
        throw ConnectException(ConnectErrc::crypto_failed, "Login blob checksum mismatch");

    Bytes enc_key = hmacSha1(base_key, toBytes("encryption"));
    enc_key.resize(16);
    std::string inner_b64 = toString(aesCtr128(enc_key, received_iv, ciphertext));
    if (!is_base64(inner_b64))
        throw ConnectException(ConnectErrc::crypto_failed, "Login blob inner layer is not base64");

    Bytes plain = aesEcb(LoginBlobBuilder::innerKey(device_id, username), base64_decode_bytes(inner_b64), false);
    return decodeCredentials(std::move(plain));
}


BlobCredentials LoginBlobDecoder::decodeCredentials(Bytes data)
{
    // undo the xor chain, back to front
    for (size_t j = data.size(); j-- > block_size;)
        data[j] ^= data[j - block_size];

    Reader reader(data);
    BlobCredentials result;
    reader.expect(tag_username);
    result.username = toString(reader.field());
    reader.expect(tag_auth_type);
    auto auth_type = reader.varint();
    if (auth_type > static_cast<size_t>(AuthenticationType::facebook_token))
        throw ConnectException(ConnectErrc::crypto_failed, "Unknown auth type in login blob: " + std::to_string(auth_type));
    result.auth_type = static_cast<AuthenticationType>(auth_type);
    reader.expect(tag_auth_data);
    result.auth_data = reader.field();
    return result;
}

} // namespace crypto
