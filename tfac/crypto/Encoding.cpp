/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Encoding.hpp"
#include <openssl/evp.h>
#include <algorithm>

namespace tfac {

std::string
base32Encode(DataSlice data)
{
    const char base32Sym[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";
    std::string out;
    auto chunks = (data.size() + 4) / 5; // Rounding up
    out.reserve(8 * chunks);

    auto i = data.begin();
    uint16_t buffer = 0; // Bits waiting to be written out, MSB first
    int bits = 0; // Number of bits currently in the buffer
    while (i != data.end() || 0 < bits)
    {
        // Reload the buffer if we need more bits:
        if (i != data.end() && bits < 5)
        {
            buffer |= *i++ << (8 - bits);
            bits += 8;
        }

        // Write out 5 most-significant bits in the buffer:
        out += base32Sym[buffer >> 11];
        buffer <<= 5;
        bits -= 5;
    }

    // Pad the final string to a multiple of 8 characters long:
    out.append(-out.size() % 8, '=');
    return out;
}

Status
base32Decode(DataChunk &result, const std::string &in)
{
    // The string must be a multiple of 8 characters long:
    if (in.size() % 8)
        return TFAC_ERROR(TFAC_CC_SecretDecodeError,
            "Bad base32 length " + std::to_string(in.size()));

    DataChunk out;
    out.reserve(5 * (in.size() / 8));

    auto i = in.begin();
    uint16_t buffer = 0; // Bits waiting to be written out, MSB first
    int bits = 0; // Number of bits currently in the buffer
    while (i != in.end())
    {
        // Read one character from the string:
        int value = 0;
        if ('A' <= *i && *i <= 'Z')
            value = *i++ - 'A';
        else if ('2' <= *i && *i <= '7')
            value = 26 + *i++ - '2';
        else
            break;

        // Append the bits to the buffer:
        buffer |= value << (11 - bits);
        bits += 5;

        // Write out some bits if the buffer has a byte's worth:
        if (8 <= bits)
        {
            out.push_back(buffer >> 8);
            buffer <<= 8;
            bits -= 8;
        }
    }

    // Any extra characters must be '=':
    if (!std::all_of(i, in.end(), [](char c){ return '=' == c; }))
        return TFAC_ERROR(TFAC_CC_SecretDecodeError,
            "Bad base32 character at position " +
            std::to_string(i - in.begin()));

    // Only 1, 3, 4, or 6 padding characters can end a group:
    auto padding = in.end() - i;
    if (2 == padding || 5 == padding || 7 <= padding)
        return TFAC_ERROR(TFAC_CC_SecretDecodeError, "Bad base32 padding");

    // Any extra bits must be 0 (but rfc4648 decoders can be liberal here):
//    if (buffer != 0)
//        return false;

    result = std::move(out);
    return Status();
}

std::string
base64Encode(DataSlice data)
{
    std::string out;
    if (data.empty())
        return out;

    std::vector<unsigned char> buffer(4 * ((data.size() + 2) / 3) + 1);
    int length = EVP_EncodeBlock(buffer.data(), data.data(), data.size());
    out.assign(reinterpret_cast<const char *>(buffer.data()), length);
    return out;
}

Status
base64Decode(DataChunk &result, const std::string &in)
{
    // The string must be a multiple of 4 characters long:
    if (in.size() % 4)
        return TFAC_ERROR(TFAC_CC_SecretDecodeError,
            "Bad base64 length " + std::to_string(in.size()));

    if (in.empty())
    {
        result.clear();
        return Status();
    }

    // Padding may only appear at the very end, at most twice:
    auto isSymbol = [](char c)
    {
        return ('A' <= c && c <= 'Z') || ('a' <= c && c <= 'z') ||
            ('0' <= c && c <= '9') || '+' == c || '/' == c;
    };
    auto i = std::find_if_not(in.begin(), in.end(), isSymbol);
    if (!std::all_of(i, in.end(), [](char c){ return '=' == c; }))
        return TFAC_ERROR(TFAC_CC_SecretDecodeError,
            "Bad base64 character at position " +
            std::to_string(i - in.begin()));
    auto padding = in.end() - i;
    if (2 < padding)
        return TFAC_ERROR(TFAC_CC_SecretDecodeError, "Bad base64 padding");

    // OpenSSL decodes the padding characters as zero bytes:
    DataChunk out(3 * (in.size() / 4));
    int length = EVP_DecodeBlock(out.data(),
        reinterpret_cast<const unsigned char *>(in.data()), in.size());
    if (length < 0 || static_cast<size_t>(length) != out.size())
        return TFAC_ERROR(TFAC_CC_SecretDecodeError, "Bad base64 data");
    out.resize(out.size() - padding);

    result = std::move(out);
    return Status();
}

} // namespace tfac
