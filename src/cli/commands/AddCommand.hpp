#pragma once

#include "cli/ICommand.hpp"

namespace rit {

class AddCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "add"; }
    const char* description() const override { return "Stage file contents for the next commit"; }
    const char* helpNameLine() const override { return "add -  Add file contents to the index"; }
    const char* helpSynopsis() const override { return "rit add <file>..."; }
    const char* helpDescription() const override { return "Store the current content of each <file> as a blob and append it to the staging index. Adding a file twice stages it twice."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
