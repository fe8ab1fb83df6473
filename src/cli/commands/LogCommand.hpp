#pragma once

#include "cli/ICommand.hpp"

namespace rit {

class LogCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "log"; }
    const char* description() const override { return "Show commit history"; }
    const char* helpNameLine() const override { return "log -  Show commit logs"; }
    const char* helpSynopsis() const override { return "rit log [-n <count>]"; }
    const char* helpDescription() const override { return "List commits reachable from HEAD, newest first, with their timestamp, parent and message."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"-n <count>", "Show at most <count> commits."}
        };
    }
};

}
