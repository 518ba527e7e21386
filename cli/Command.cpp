/*
 * Copyright (c) 2015, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include <iostream>
#include <map>

typedef std::map<std::string, Command *> CommandTable;

// Commands register during static initialization,
// so the table must come into being on first use.
static CommandTable &
commandTable()
{
    static CommandTable table;
    return table;
}

Command::Command(const char *name, const char *usage):
    name_(name),
    usage_(usage)
{
    auto &table = commandTable();
    if (!table.insert(CommandTable::value_type(name, this)).second)
        std::cerr << "warning: Duplicate command " << name << std::endl;
}

Command::~Command()
{
}

std::string
Command::usage() const
{
    return std::string("usage: coinuri-cli [--coins <file>] [--coin <id>] ") +
        name_ + usage_;
}

Command *
Command::find(const std::string &name)
{
    const auto &table = commandTable();
    const auto i = table.find(name);
    return table.end() == i ? nullptr : i->second;
}

void
Command::printAll()
{
    for (const auto &entry: commandTable())
        std::cout << entry.first << entry.second->usage_ << std::endl;
}
