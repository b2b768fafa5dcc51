/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef TFAC_CRYPTO_RANDOM_HPP
#define TFAC_CRYPTO_RANDOM_HPP

#include "../util/Data.hpp"
#include "../util/Status.hpp"

namespace tfac {

/**
 * Creates a buffer of cryptographically-secure random data.
 */
Status
randomData(DataChunk &result, size_t size);

} // namespace tfac

#endif
