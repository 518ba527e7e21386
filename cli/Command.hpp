/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#ifndef CLI_COMMAND_HPP
#define CLI_COMMAND_HPP

#include "../coinuri/coin/CoinRegistry.hpp"
#include "../coinuri/util/Status.hpp"

/**
 * Everything a command may need, filled in by main.
 */
struct Session
{
    coinuri::CoinRegistry registry;

    // Set by --coin, or null to pick by URI scheme:
    coinuri::CoinTypePtr coin;
};

#define COMMAND_PROTO \
    operator ()(Session &session, int argc, char *argv[])

/**
 * A sub-command of the coinuri-cli tool.
 * Each instance adds itself to the global command table on construction,
 * so commands must live at namespace scope.
 */
class Command
{
public:
    Command(const char *name, const char *usage);
    virtual ~Command();

    virtual coinuri::Status COMMAND_PROTO = 0;

    const char *name() const { return name_; }

    /**
     * The full usage line, suitable for an error message.
     */
    std::string usage() const;

    /**
     * Looks up a command by name, returning null if there is none.
     */
    static Command *
    find(const std::string &name);

    /**
     * Writes one usage line per command to standard output.
     */
    static void
    printAll();

private:
    const char *name_;
    const char *usage_;
};

/**
 * Defines a command and registers it under TEXT.
 * The command body follows in curly braces.
 */
#define COMMAND(NAME, TEXT, USAGE) \
    class NAME: public Command { \
    public: \
        NAME(): Command(TEXT, USAGE) {} \
        coinuri::Status COMMAND_PROTO override; \
    } command##NAME; \
    coinuri::Status NAME::COMMAND_PROTO

#endif
