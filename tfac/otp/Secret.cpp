/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Secret.hpp"
#include "OtpKey.hpp"
#include "../util/Util.hpp"

namespace tfac {

Status
generateSecret(DataChunk &result, size_t bytes, SecretFormat format)
{
    OtpKey key;
    TFAC_CHECK(key.create(bytes));

    auto text = key.encode(format);
    result.assign(text.begin(), text.end());
    TFAC_UtilGuaranteedMemset(&text[0], 0, text.size());

    TFAC_DebugLevel(1, "Generated a %zu-byte %s secret", bytes,
        secretFormatName(format));
    return Status();
}

} // namespace tfac
