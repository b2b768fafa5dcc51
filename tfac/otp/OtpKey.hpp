/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TFAC_OTP_OTPKEY_HPP
#define TFAC_OTP_OTPKEY_HPP

#include "SecretFormat.hpp"

namespace tfac {

/**
 * A decoded shared secret.
 * Implements the HOTP algorithm defined by rfc4226.
 */
class OtpKey
{
public:
    OtpKey() {}
    OtpKey(DataSlice key): key_(key.begin(), key.end()) {}
    ~OtpKey();

    /**
     * Initializes the key with random data.
     */
    Status
    create(size_t keySize=TFAC_DEFAULT_SECRET_BYTES);

    /**
     * Initializes the key from an encoded secret.
     */
    Status
    decode(DataSlice secret, SecretFormat format);

    /**
     * Produces a counter-based password with the given number of digits.
     * Past 10 digits, the extra places are always leading zeros.
     */
    Status
    hotp(std::string &result, uint64_t counter,
        unsigned digits=TFAC_DEFAULT_TOKEN_LENGTH) const;

    /**
     * Encodes the key in the given format.
     */
    std::string
    encode(SecretFormat format) const;

    /**
     * Obtains access to the underlying binary key.
     */
    DataSlice
    key() const { return key_; }

private:
    DataChunk key_;
};

} // namespace tfac

#endif
