/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "../Command.hpp"
#include "../Util.hpp"
#include "../../tfac/otp/OtpKey.hpp"
#include "../../tfac/otp/Secret.hpp"
#include <iostream>

using namespace tfac;

COMMAND(SecretGenerate, "secret-generate",
        " [<bytes>]")
{
    if (1 < argc)
        return TFAC_ERROR(TFAC_CC_Error, helpString(*this));

    unsigned bytes = TFAC_DEFAULT_SECRET_BYTES;
    if (argc == 1)
        TFAC_CHECK(parseCount(bytes, argv[0], 1 << 16, "byte count"));

    DataChunk secret;
    TFAC_CHECK(generateSecret(secret, bytes, session.options.secretFormat));
    if (SecretFormat::binary == session.options.secretFormat)
        std::cout.write(reinterpret_cast<const char *>(secret.data()),
            secret.size());
    else
        std::cout << toString(secret) << std::endl;
    dataWipe(secret);

    return Status();
}

COMMAND(FormatConvert, "format-convert",
        " <secret> <to-format>")
{
    if (argc != 2)
        return TFAC_ERROR(TFAC_CC_Error, helpString(*this));
    const std::string secret = argv[0];
    const auto toFormat = argv[1];

    SecretFormat format;
    TFAC_CHECK(secretFormatFromName(format, toFormat));

    OtpKey key;
    TFAC_CHECK(key.decode(secret, session.options.secretFormat));
    if (SecretFormat::binary == format)
    {
        auto data = key.key();
        std::cout.write(reinterpret_cast<const char *>(data.data()),
            data.size());
    }
    else
    {
        std::cout << key.encode(format) << std::endl;
    }

    return Status();
}
