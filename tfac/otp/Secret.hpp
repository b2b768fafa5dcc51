/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TFAC_OTP_SECRET_HPP
#define TFAC_OTP_SECRET_HPP

#include "SecretFormat.hpp"

namespace tfac {

/**
 * Creates a new random shared secret, encoded in the requested format.
 * Base32 and base64 secrets come back as the bytes of their text.
 */
Status
generateSecret(DataChunk &result, size_t bytes=TFAC_DEFAULT_SECRET_BYTES,
    SecretFormat format=SecretFormat::binary);

} // namespace tfac

#endif
