#include "cli/CommandFactory.hpp"

#include <algorithm>

#include "cli/commands/AddCommand.hpp"
#include "cli/commands/CommitCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/InitCommand.hpp"
#include "cli/commands/LogCommand.hpp"
#include "cli/commands/ShowCommand.hpp"

namespace rit {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

std::vector<std::string> CommandFactory::names() const {
    std::vector<std::string> out;
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

void registerBuiltinCommands(CommandFactory& factory) {
    factory.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    factory.registerCreator("init", [] { return std::make_unique<InitCommand>(); });
    factory.registerCreator("add", [] { return std::make_unique<AddCommand>(); });
    factory.registerCreator("commit", [] { return std::make_unique<CommitCommand>(); });
    factory.registerCreator("log", [] { return std::make_unique<LogCommand>(); });
    factory.registerCreator("show", [] { return std::make_unique<ShowCommand>(); });
}

}
