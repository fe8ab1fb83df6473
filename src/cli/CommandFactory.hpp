#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "cli/ICommand.hpp"

namespace rit {

/**
 * @brief Registry mapping a subcommand name to a creator
 *
 * main() registers the built-in commands once (registerBuiltinCommands);
 * a later registration under the same name replaces the earlier one.
 */
class CommandFactory {
public:
    using Creator = std::function<std::unique_ptr<ICommand>()>;

    static CommandFactory& instance();
    void registerCreator(const std::string& name, Creator creator);

    /// New command instance, nullptr for an unknown name
    std::unique_ptr<ICommand> create(const std::string& name) const;

    bool has(const std::string& name) const { return creators.count(name) != 0; }

    /// Registered names in alphabetical order
    std::vector<std::string> names() const;

private:
    CommandFactory() = default;
    std::unordered_map<std::string, Creator> creators;
};

/// Register help, init, add, commit, log and show
void registerBuiltinCommands(CommandFactory& factory);

}
