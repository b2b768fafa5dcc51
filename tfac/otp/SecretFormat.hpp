/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TFAC_OTP_SECRET_FORMAT_HPP
#define TFAC_OTP_SECRET_FORMAT_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace tfac {

/**
 * The ways a shared secret can be written down.
 */
enum class SecretFormat
{
    binary,
    base32,
    base64
};

/**
 * Returns the lower-case name of a format, such as "base32".
 */
const char *
secretFormatName(SecretFormat format);

/**
 * Looks up a format by its lower-case name.
 */
Status
secretFormatFromName(SecretFormat &result, const std::string &name);

/**
 * Converts a C API format code, rejecting unknown values.
 */
Status
secretFormatFromCode(SecretFormat &result, int code);

/**
 * Recovers the raw secret bytes from their encoded form.
 */
Status
secretDecode(DataChunk &result, DataSlice secret, SecretFormat format);

/**
 * Writes raw secret bytes in the given format.
 * The binary format returns the bytes unchanged.
 */
std::string
secretEncode(DataSlice data, SecretFormat format);

} // namespace tfac

#endif
