/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Random.hpp"
#include <openssl/err.h>
#include <openssl/rand.h>
#include <limits.h>

namespace tfac {

Status
randomData(DataChunk &result, size_t size)
{
    if (INT_MAX < size)
        return TFAC_ERROR(TFAC_CC_InvalidOption,
            "Cannot create " + std::to_string(size) + " random bytes");

    DataChunk out(size);
    if (size && 1 != RAND_bytes(out.data(), size))
        return TFAC_ERROR(TFAC_CC_SysError, "Random data generation failed: " +
            std::to_string(ERR_get_error()));

    result = std::move(out);
    return Status();
}

} // namespace tfac
