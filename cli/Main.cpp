/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include "../coinuri/json/JsonObject.hpp"
#include "../coinuri/util/Debug.hpp"
#include <iostream>
#include <getopt.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

using namespace coinuri;

/**
 * Optional settings file, which the command line can override.
 */
struct ConfigJson:
    public JsonObject
{
    CU_JSON_STRING(coinsFile, "coinsFile", nullptr)
    CU_JSON_STRING(logFile, "logFile", nullptr)
};

struct Options
{
    std::string coinsFile;
    std::string coinId;
    bool help = false;
};

static std::string
configPath()
{
    const char *home = getenv("HOME");
    if (!home || !strlen(home))
        home = "/";

#ifdef MAC_OSX
    return std::string(home) + "/Library/Application Support/CoinUri/coinuri.conf";
#else
    return std::string(home) + "/.config/coinuri/coinuri.conf";
#endif
}

/**
 * Consumes the leading options, leaving optind at the command name.
 */
static Status
parseOptions(Options &out, int argc, char *argv[])
{
    static const struct option longOptions[] =
    {
        {"coins", required_argument, nullptr, 'f'},
        {"coin",  required_argument, nullptr, 'c'},
        {"help",  no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    // Stop at the first non-option, since that is the command:
    opterr = 0;
    int c;
    while (-1 != (c = getopt_long(argc, argv, "+f:c:h", longOptions, nullptr)))
    {
        if ('f' == c)
            out.coinsFile = optarg;
        else if ('c' == c)
            out.coinId = optarg;
        else if ('h' == c)
            out.help = true;
        else if ('f' == optopt)
            return CU_ERROR(CU_CC_Error, "--coins requires a file name");
        else if ('c' == optopt)
            return CU_ERROR(CU_CC_Error, "--coin requires a coin id");
        else
            return CU_ERROR(CU_CC_Error, "Unknown option '" +
                            std::string(argv[optind - 1]) + "'");
    }
    return Status();
}

static Status
run(int argc, char *argv[])
{
    ConfigJson config;
    const auto path = configPath();
    if (0 == access(path.c_str(), F_OK))
        CU_CHECK(config.load(path));

    Options options;
    CU_CHECK(parseOptions(options, argc, argv));
    argc -= optind;
    argv += optind;

    if (argc < 1)
    {
        Command::printAll();
        return Status();
    }
    Command *command = Command::find(argv[0]);
    if (!command)
        return CU_ERROR(CU_CC_Error, "unknown command " + std::string(argv[0]));
    --argc;
    ++argv;

    if (options.help)
    {
        std::cout << command->usage() << std::endl;
        return Status();
    }

    if (config.logFileOk())
        CU_CHECK(debugInitialize(config.logFile()));

    Session session;
    session.registry = CoinRegistry::builtin();
    if (options.coinsFile.empty() && config.coinsFileOk())
        options.coinsFile = config.coinsFile();
    if (!options.coinsFile.empty())
        CU_CHECK(session.registry.load(options.coinsFile));
    if (!options.coinId.empty())
        CU_CHECK(session.registry.coin(session.coin, options.coinId));

    const auto s = (*command)(session, argc, argv);
    debugTerminate();
    return s;
}

int main(int argc, char *argv[])
{
    const auto s = run(argc, argv);
    if (!s)
        std::cerr << s << std::endl;
    return s ? 0 : 1;
}
