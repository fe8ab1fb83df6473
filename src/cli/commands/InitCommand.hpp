#pragma once

#include "cli/ICommand.hpp"

namespace rit {

class InitCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "init"; }
    const char* description() const override { return "Initialize a new rit repository"; }
    const char* helpNameLine() const override { return "init -  Create an empty rit repository"; }
    const char* helpSynopsis() const override { return "rit init [<directory>]"; }
    const char* helpDescription() const override { return "Create a new empty rit repository. If <directory> is omitted, the current directory is used. Running init in an existing repository is harmless."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override { return {}; }
};

}
