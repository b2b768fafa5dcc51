/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "OtpKey.hpp"
#include "../crypto/Random.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <sstream>

namespace tfac {

OtpKey::~OtpKey()
{
    dataWipe(key_);
}

Status
OtpKey::create(size_t keySize)
{
    DataChunk key;
    TFAC_CHECK(randomData(key, keySize));
    dataWipe(key_);
    key_ = std::move(key);
    return Status();
}

Status
OtpKey::decode(DataSlice secret, SecretFormat format)
{
    DataChunk key;
    TFAC_CHECK(secretDecode(key, secret, format));
    dataWipe(key_);
    key_ = std::move(key);
    return Status();
}

Status
OtpKey::hotp(std::string &result, uint64_t counter, unsigned digits) const
{
    // Do HMAC_SHA1(key_, counter):
    DataArray<20> hmac;
    DataArray<8> cb =
    {{
        static_cast<uint8_t>(counter >> 56),
        static_cast<uint8_t>(counter >> 48),
        static_cast<uint8_t>(counter >> 40),
        static_cast<uint8_t>(counter >> 32),
        static_cast<uint8_t>(counter >> 24),
        static_cast<uint8_t>(counter >> 16),
        static_cast<uint8_t>(counter >> 8),
        static_cast<uint8_t>(counter)
    }};

    // OpenSSL treats a NULL key as "reuse the last key", so an empty
    // key still needs a valid pointer:
    static const uint8_t emptyKey = 0;
    const uint8_t *keyData = key_.empty() ? &emptyKey : key_.data();
    unsigned hmacSize = hmac.size();
    if (!HMAC(EVP_sha1(), keyData, key_.size(), cb.data(), cb.size(),
        hmac.data(), &hmacSize) || hmac.size() != hmacSize)
        return TFAC_ERROR(TFAC_CC_SysError, "HMAC-SHA1 failed");

    // Calculate the truncated output:
    unsigned offset = hmac[19] & 0xf;
    uint32_t p = (uint32_t(hmac[offset]) << 24) |
        (uint32_t(hmac[offset + 1]) << 16) |
        (uint32_t(hmac[offset + 2]) << 8) | hmac[offset + 3];
    p &= 0x7fffffff;

    // Format as a fixed-width decimal number:
    std::stringstream ss;
    ss.width(digits);
    ss.fill('0');
    ss << p;
    auto s = ss.str();
    s.erase(0, s.size() - digits);

    result = std::move(s);
    return Status();
}

std::string
OtpKey::encode(SecretFormat format) const
{
    return secretEncode(key_, format);
}

} // namespace tfac
