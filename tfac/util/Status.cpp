/*
 *  Copyright (c) 2015, AirBitz, Inc.
 *  All rights reserved.
 */
#include "Status.hpp"
#include "Debug.hpp"

#include <string.h>

namespace tfac {

Status::Status() :
    value_(TFAC_CC_Ok),
    file_(""),
    function_(""),
    line_(0)
{
}

Status::Status(tTFAC_CC value, std::string message,
    const char *file, const char *function, size_t line) :
    value_(value),
    message_(message),
    file_(file),
    function_(function),
    line_(line)
{
}

const Status &
Status::log() const
{
    if (!*this)
        TFAC_DebugLog("Error: %s, code: %d, func: %s, source: %s, line: %d",
            message_.c_str(), value_, function_, file_,
            static_cast<int>(line_));
    return *this;
}

void Status::toError(tTFAC_Error &error) const
{
    error.code = value_;
    strncpy(error.szDescription, message_.c_str(), TFAC_MAX_STRING_LENGTH);
    strncpy(error.szSourceFunc, function_, TFAC_MAX_STRING_LENGTH);
    strncpy(error.szSourceFile, file_, TFAC_MAX_STRING_LENGTH);
    error.nSourceLine = line_;

    error.szDescription[TFAC_MAX_STRING_LENGTH] = 0;
    error.szSourceFunc[TFAC_MAX_STRING_LENGTH] = 0;
    error.szSourceFile[TFAC_MAX_STRING_LENGTH] = 0;
}

std::ostream &operator<<(std::ostream &output, const Status &s)
{
    output <<
        s.file() << ":" << s.line() << ": " << s.function() <<
        " returned error " << s.value() << " (" << s.message() << ")";
    return output;
}

} // namespace tfac
