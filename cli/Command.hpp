/*
 * Copyright (c) 2015, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef CLI_COMMAND_HPP
#define CLI_COMMAND_HPP

#include "../tfac/otp/Totp.hpp"
#include <string>

/**
 * The main function fills this in,
 * giving the commands access to the settings they need.
 */
struct Session
{
    tfac::TotpOptions options;
};

/**
 * The function prototype for commands.
 */
#define COMMAND_PROTO \
    operator ()(Session &session, int argc, char *argv[])

/**
 * Abstract base class for commands.
 */
class Command
{
public:
    virtual ~Command();
    virtual tfac::Status COMMAND_PROTO = 0;
    virtual const char *name() const = 0;
    virtual const char *help() const = 0;
};

/**
 * Inserts a new command in to the global command list.
 */
class CommandRegistry
{
public:
    CommandRegistry(const char *name, Command *c);

    /**
     * Finds a command in the global list.
     */
    static Command *
    find(const std::string &name);

    /**
     * Prints the list of commands.
     */
    static void
    print();
};

/**
 * Registers and defines new command.
 * Should be followed by the command implementation in curly braces.
 */
#define COMMAND(NAME, TEXT, HELP) \
    class NAME: public Command { \
        tfac::Status COMMAND_PROTO override; \
        const char *name() const override { return TEXT; } \
        const char *help() const override { return HELP; } \
    } implement##NAME; \
    CommandRegistry register##NAME(TEXT, &implement##NAME); \
    tfac::Status NAME::COMMAND_PROTO

/**
 * Builds a documentation string for a command.
 */
std::string
helpString(const Command &command);

#endif
