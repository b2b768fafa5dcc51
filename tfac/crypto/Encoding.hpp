/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TFAC_CRYPTO_ENCODING_HPP
#define TFAC_CRYPTO_ENCODING_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace tfac {

/**
 * Encodes data into a base-32 string according to rfc4648.
 */
std::string
base32Encode(DataSlice data);

/**
 * Decodes a base-32 string as defined by rfc4648.
 * The input must be upper-case and padded to a multiple of 8 characters.
 */
Status
base32Decode(DataChunk &result, const std::string &in);

/**
 * Encodes data into a base-64 string according to rfc4648.
 */
std::string
base64Encode(DataSlice data);

/**
 * Decodes a padded base-64 string as defined by rfc4648.
 */
Status
base64Decode(DataChunk &result, const std::string &in);

} // namespace tfac

#endif
