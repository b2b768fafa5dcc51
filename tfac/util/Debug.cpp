/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Debug.hpp"
#include "FileIO.hpp"
#include <stdarg.h>
#include <stdio.h>
#include <time.h>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace tfac {

#define MAX_LOG_SIZE (1 << 19) // Max size 512 KiB

static std::mutex gDebugMutex;
static FILE *gLogFile = nullptr;
static std::string gLogPath;

static Status
debugLogRotate()
{
    if (gLogFile)
        fclose(gLogFile);
    gLogFile = nullptr;

    if (fileExists(gLogPath))
        rename(gLogPath.c_str(), (gLogPath + ".prev").c_str());

    gLogFile = fopen(gLogPath.c_str(), "w");
    if (!gLogFile)
        return TFAC_ERROR(TFAC_CC_SysError, "Cannot open " + gLogPath);

    return Status();
}

Status
debugInitialize(const std::string &path)
{
    std::lock_guard<std::mutex> lock(gDebugMutex);
    gLogPath = path;
    TFAC_CHECK(debugLogRotate());

    return Status();
}

void
debugTerminate()
{
    std::lock_guard<std::mutex> lock(gDebugMutex);
    if (gLogFile)
        fclose(gLogFile);
    gLogFile = nullptr;
}

void TFAC_DebugLog(const char *format, ...)
{
#ifdef DEBUG
    time_t t = time(nullptr);
    struct tm utc;
    gmtime_r(&t, &utc);

    std::stringstream date;
    date << std::setfill('0');
    date << std::setw(4) << utc.tm_year + 1900 << '-';
    date << std::setw(2) << utc.tm_mon + 1 << '-';
    date << std::setw(2) << utc.tm_mday << ' ';
    date << std::setw(2) << utc.tm_hour << ':';
    date << std::setw(2) << utc.tm_min << ':';
    date << std::setw(2) << utc.tm_sec << " TFAC_Log: ";

    // Get the message length:
    va_list args;
    va_start(args, format);
    char temp[1];
    int size = vsnprintf(temp, sizeof(temp), format, args);
    va_end(args);
    if (size < 0)
        return;

    // Format the message:
    va_start(args, format);
    std::vector<char> message(size + 1);
    vsnprintf(message.data(), message.size(), format, args);
    va_end(args);

    // Put the pieces together:
    std::string out = date.str();
    out.append(message.begin(), message.end() - 1);
    if (out.back() != '\n')
        out.append(1, '\n');

    std::lock_guard<std::mutex> lock(gDebugMutex);
    fputs(out.c_str(), stderr);

    if (gLogFile && MAX_LOG_SIZE < ftell(gLogFile))
    {
        Status s = debugLogRotate();
        if (!s)
            fprintf(stderr, "%s\n", s.message().c_str());
    }

    if (gLogFile)
    {
        fwrite(out.c_str(), 1, out.size(), gLogFile);
        fflush(gLogFile);
    }
#else
    (void)format;
#endif
}

} // namespace tfac
