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
#include "diffie_hellman.hpp"

// standard headers
#include <cstdint>
#include <string>


namespace crypto
{

/// Authentication type marker inside the login blob
enum class AuthenticationType : uint8_t
{
    user_pass = 0,                   ///< plain password
    stored_spotify_credentials = 1,  ///< reusable credential blob of a previously authenticated client
    stored_facebook_credentials = 2, ///< reusable facebook credential blob
    spotify_token = 3,               ///< spotify access token
    facebook_token = 4               ///< facebook access token
};

/// The plaintext credential structure carried in the blob
struct BlobCredentials
{
    /// canonical user name
    std::string username;
    /// type of the auth data
    AuthenticationType auth_type{AuthenticationType::user_pass};
    /// password or stored credential bytes
    Bytes auth_data;

    bool operator==(const BlobCredentials& other) const
    {
        return (username == other.username) && (auth_type == other.auth_type) && (auth_data == other.auth_data);
    }
};

/// The authentication payload of an addUser request
struct LoginBlob
{
    /// userName form field
    std::string user_name;
    /// blob form field: base64(iv + ciphertext + checksum)
    std::string blob;
    /// AES-CTR ciphertext
    Bytes ciphertext;
    /// HMAC-SHA1 over the ciphertext
    Bytes checksum;
    /// clientKey form field: our DH public key, base64
    std::string client_key;
    /// id of the device the blob is encrypted for
    std::string device_id;
};


/// Builds the encrypted login blob for the Zeroconf addUser action
/**
 * The credential structure is encrypted twice:
 * - with AES-192-ECB, keyed from sha1(deviceId) and the user name (PBKDF2)
 * - with AES-128-CTR, keyed from the DH shared secret, followed by an
 *   HMAC-SHA1 checksum over the ciphertext
 * Every built blob is decoded again and compared against the input.
 */
class LoginBlobBuilder
{
public:
    /// Max length of a blob accepted by the device firmware
    static constexpr size_t max_blob_length = 2047;

    /// c'tor
    /// @param verify decode each built blob and compare it with the input
    explicit LoginBlobBuilder(bool verify = true);

    /// Build the blob for a device
    /// @param credentials user name and auth data
    /// @param device_id the device id reported by getInfo
    /// @param shared_secret DH shared secret with the device
    /// @param client_key our DH public key, base64
    /// @throw ConnectException validation_failed on missing auth material, crypto_failed on self verification mismatch
    LoginBlob build(const BlobCredentials& credentials, const std::string& device_id, const Bytes& shared_secret, const std::string& client_key) const;

    /// Build the blob with the key exchange @p dh and the device's base64 public key
    LoginBlob build(const BlobCredentials& credentials, const std::string& device_id, const DiffieHellmanExchange& dh,
                    const std::string& device_public_key) const;

    /// @return the padded and xor-chained credential structure
    static Bytes encodeCredentials(const BlobCredentials& credentials);

    /// @return the 24 byte AES-192 key for the inner layer
    static Bytes innerKey(const std::string& device_id, const std::string& username);

    /// @return the fixed AES-CTR initialization vector
    static const Bytes& iv();

private:
    bool verify_;
};


/// Decodes a login blob, i.e. the receiving side of the protocol
class LoginBlobDecoder
{
public:
    /// Decode a transport blob
    /// @param blob the base64 transport blob
    /// @param device_id the id of the receiving device
    /// @param username the userName form field
    /// @param shared_secret DH shared secret with the sender
    /// @throw ConnectException crypto_failed on checksum mismatch or malformed content
    static BlobCredentials decode(const std::string& blob, const std::string& device_id, const std::string& username, const Bytes& shared_secret);

    /// Parse the plaintext structure produced by LoginBlobBuilder::encodeCredentials
    static BlobCredentials decodeCredentials(Bytes data);
};

} // namespace crypto
