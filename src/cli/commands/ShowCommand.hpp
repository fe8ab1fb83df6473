#pragma once

#include "cli/ICommand.hpp"

namespace rit {

class ShowCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "show"; }
    const char* description() const override { return "Show a commit and its changes"; }
    const char* helpNameLine() const override { return "show -  Show the file changes of a commit"; }
    const char* helpSynopsis() const override { return "rit show <commitHash>"; }
    const char* helpDescription() const override { return "Print the commit's metadata and, for every file it records, a line diff against the same path in the parent commit. Files of a root commit, and paths the parent does not have, are reported without a diff."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
