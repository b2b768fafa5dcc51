/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "SecretFormat.hpp"
#include "../crypto/Encoding.hpp"

namespace tfac {

const char *
secretFormatName(SecretFormat format)
{
    switch (format)
    {
    case SecretFormat::binary:
        return "binary";
    case SecretFormat::base32:
        return "base32";
    case SecretFormat::base64:
        return "base64";
    }
    return "unknown";
}

Status
secretFormatFromName(SecretFormat &result, const std::string &name)
{
    for (auto format: {SecretFormat::binary, SecretFormat::base32,
        SecretFormat::base64})
    {
        if (name == secretFormatName(format))
        {
            result = format;
            return Status();
        }
    }

    return TFAC_ERROR(TFAC_CC_InvalidFormat, "Invalid secret format \"" +
        name + "\", valid options are binary, base32, and base64");
}

Status
secretFormatFromCode(SecretFormat &result, int code)
{
    switch (code)
    {
    case TFAC_SecretFormat_Binary:
        result = SecretFormat::binary;
        return Status();
    case TFAC_SecretFormat_Base32:
        result = SecretFormat::base32;
        return Status();
    case TFAC_SecretFormat_Base64:
        result = SecretFormat::base64;
        return Status();
    }

    return TFAC_ERROR(TFAC_CC_InvalidFormat, "Invalid secret format " +
        std::to_string(code) + ", valid options are binary, base32, and base64");
}

Status
secretDecode(DataChunk &result, DataSlice secret, SecretFormat format)
{
    Status s;
    switch (format)
    {
    case SecretFormat::binary:
        result.assign(secret.begin(), secret.end());
        return Status();
    case SecretFormat::base32:
        s = base32Decode(result, toString(secret));
        break;
    case SecretFormat::base64:
        s = base64Decode(result, toString(secret));
        break;
    }

    if (!s)
        return TFAC_ERROR(TFAC_CC_SecretDecodeError,
            std::string("Secret format specified as ") +
            secretFormatName(format) + ", but the secret is not valid " +
            secretFormatName(format) + ": " + s.message());
    return Status();
}

std::string
secretEncode(DataSlice data, SecretFormat format)
{
    switch (format)
    {
    case SecretFormat::binary:
        return toString(data);
    case SecretFormat::base32:
        return base32Encode(data);
    case SecretFormat::base64:
        return base64Encode(data);
    }
    return std::string();
}

} // namespace tfac
