// CLI entry: commands are registered with the factory and run by the invoker.

#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/ICommand.hpp"

using namespace rit;

int main(int argc, char** argv) {
    CommandFactory& factory = CommandFactory::instance();
    registerBuiltinCommands(factory);

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);

    AppContext ctx{};
    ctx.color = isatty(STDOUT_FILENO) != 0;
    CommandInvoker invoker;

    if (args.empty()) {
        auto help = factory.create("help");
        return invoker.invoke(*help, ctx, {}) ? 0 : 1;
    }

    std::string cmdName = args.front();
    args.erase(args.begin());
    auto cmd = factory.create(cmdName);
    if (!cmd) {
        std::cerr << "rit: '" << cmdName << "' is not a rit command. See 'rit help'.\n";
        return 1;
    }
    auto res = invoker.invoke(*cmd, ctx, args);
    return res ? 0 : 1;
}
