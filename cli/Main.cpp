/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include "Util.hpp"
#include "../tfac/config/OtpConfig.hpp"
#include "../tfac/util/Debug.hpp"
#include <iostream>
#include <getopt.h>

using namespace tfac;

/**
 * Option values given on the command line,
 * which override the configuration file.
 */
struct Overrides
{
    const char *format = nullptr;
    const char *length = nullptr;
    const char *interval = nullptr;
    const char *offset = nullptr;
    const char *timestamp = nullptr;
    const char *past = nullptr;
    const char *future = nullptr;
    bool fullWindow = false;
};

static Status
applyOverrides(TotpOptions &options, const Overrides &overrides)
{
    if (overrides.format)
        TFAC_CHECK(secretFormatFromName(options.secretFormat, overrides.format));
    if (overrides.length)
        TFAC_CHECK(parseCount(options.tokenLength, overrides.length,
            TFAC_MAX_TOKEN_LENGTH, "token length"));
    if (overrides.interval)
        TFAC_CHECK(parseInteger(options.intervalSeconds, overrides.interval,
            "interval"));
    if (overrides.offset)
        TFAC_CHECK(parseInteger(options.offsetSeconds, overrides.offset,
            "offset"));
    if (overrides.timestamp)
    {
        int64_t timestamp;
        TFAC_CHECK(parseInteger(timestamp, overrides.timestamp, "timestamp"));
        options.injectTimestamp(timestamp);
    }
    if (overrides.past)
        TFAC_CHECK(parseCount(options.acceptablePastTokens, overrides.past,
            TFAC_MAX_DRIFT_TOKENS, "past token count"));
    if (overrides.future)
        TFAC_CHECK(parseCount(options.acceptableFutureTokens, overrides.future,
            TFAC_MAX_DRIFT_TOKENS, "future token count"));
    if (overrides.fullWindow)
        options.scanFullWindow = true;

    TFAC_CHECK(options.check());
    return Status();
}

/**
 * The main program body.
 */
static Status run(int argc, char *argv[])
{
    // Parse out the command-line options:
    std::string configFile = configPath();
    Overrides overrides;
    bool wantHelp = false;

    static const struct option long_options[] =
    {
        {"config",      required_argument, nullptr, 'c'},
        {"format",      required_argument, nullptr, 'f'},
        {"length",      required_argument, nullptr, 'l'},
        {"interval",    required_argument, nullptr, 'i'},
        {"offset",      required_argument, nullptr, 'o'},
        {"timestamp",   required_argument, nullptr, 't'},
        {"past",        required_argument, nullptr, 'p'},
        {"future",      required_argument, nullptr, 'n'},
        {"full-window", no_argument,       nullptr, 'w'},
        {"help",        no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    opterr = 0;
    int c;
    while (-1 != (c = getopt_long(argc, argv, "+c:f:l:i:o:t:p:n:wh",
        long_options, nullptr)))
    {
        switch (c)
        {
        case 'c':
            configFile = optarg;
            break;
        case 'f':
            overrides.format = optarg;
            break;
        case 'l':
            overrides.length = optarg;
            break;
        case 'i':
            overrides.interval = optarg;
            break;
        case 'o':
            overrides.offset = optarg;
            break;
        case 't':
            overrides.timestamp = optarg;
            break;
        case 'p':
            overrides.past = optarg;
            break;
        case 'n':
            overrides.future = optarg;
            break;
        case 'w':
            overrides.fullWindow = true;
            break;
        case 'h':
            wantHelp = true;
            break;
        case '?':
            if (optopt)
                return TFAC_ERROR(TFAC_CC_Error, std::string("Option '-") +
                    static_cast<char>(optopt) + "' is unknown or needs a value.");
            return TFAC_ERROR(TFAC_CC_Error, std::string("Unknown option '") +
                argv[optind - 1] + "'.");
        default:
            return TFAC_ERROR(TFAC_CC_Error, "Cannot parse the command line.");
        }
    }

    // At this point, all non-option arguments should be out of the list:
    argc -= optind;
    argv += optind;

    // Load the settings:
    OtpConfig config;
    TFAC_CHECK(config.loadIfExists(configFile));
    TFAC_CHECK(config.logFileValid());
    if (config.logFile())
        TFAC_CHECK(debugInitialize(config.logFile()));

    Session session;
    TFAC_CHECK(config.options(session.options));
    TFAC_CHECK(applyOverrides(session.options, overrides));

    // Find the command:
    if (argc < 1)
    {
        CommandRegistry::print();
        return Status();
    }
    const auto commandName = argv[0];
    --argc;
    ++argv;

    Command *command = CommandRegistry::find(commandName);
    if (!command)
        return TFAC_ERROR(TFAC_CC_Error,
                          "unknown command " + std::string(commandName));

    // If the user wants help, just print the string and return:
    if (wantHelp)
    {
        std::cout << helpString(*command) << std::endl;
        return Status();
    }

    // Invoke the command:
    TFAC_CHECK((*command)(session, argc, argv));
    return Status();
}

int main(int argc, char *argv[])
{
    Status s = run(argc, argv);
    if (!s)
        std::cerr << s.log() << std::endl;
    debugTerminate();
    return s ? 0 : 1;
}
