#include "cli/commands/HelpCommand.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"

namespace rit {

namespace {

void printCommandDetail(const ICommand& cmd) {
    std::cout << "NAME:\n    " << cmd.helpNameLine() << "\n\n";
    std::cout << "SYNOPSIS:\n    " << cmd.helpSynopsis() << "\n\n";
    std::cout << "DESCRIPTION:\n    " << cmd.helpDescription() << "\n";
    auto opts = cmd.helpOptions();
    if (!opts.empty()) {
        std::cout << "\nOPTIONS:\n";
        for (const auto& [opt, desc] : opts) {
            std::cout << "    " << opt << "\n        " << desc << "\n";
        }
    }
}

}

/**
 * @brief Execute 'rit help' command
 *
 * Without arguments lists every registered command with its one-line
 * description. With a command name prints NAME, SYNOPSIS, DESCRIPTION and
 * OPTIONS for it. An unknown topic is InvalidArgs.
 */
Expected<void> HelpCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    const CommandFactory& factory = CommandFactory::instance();

    if (args.size() > 1) {
        return Error{ErrorCode::InvalidArgs, "usage: " + std::string(helpSynopsis())};
    }
    if (!args.empty()) {
        auto cmd = factory.create(args.front());
        if (!cmd) {
            return Error{ErrorCode::InvalidArgs, "'" + args.front() + "' is not a rit command"};
        }
        printCommandDetail(*cmd);
        return {};
    }

    std::cout << "usage: rit <command> [<args>]\n\nCommands:\n";
    for (const auto& name : factory.names()) {
        auto cmd = factory.create(name);
        std::cout << "  " << std::left << std::setw(8) << name << "\t" << cmd->description() << "\n";
    }
    std::cout << "\nSee 'rit help <command>' for details on a command.\n";
    return {};
}

}
