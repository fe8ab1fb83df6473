#pragma once

#include "cli/ICommand.hpp"

namespace rit {

class CommitCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx, const std::vector<std::string>& args) override;
    const char* name() const override { return "commit"; }
    const char* description() const override { return "Record staged files as a new commit"; }
    const char* helpNameLine() const override { return "commit -  Record changes to the repository"; }
    const char* helpSynopsis() const override { return "rit commit <message> | rit commit -m <msg> [-m <msg>...]"; }
    const char* helpDescription() const override { return "Create a new commit containing the staged entries, with the current HEAD as parent, then move HEAD to it and empty the index. An empty index still produces a commit."; }
    std::vector<std::pair<std::string, std::string>> helpOptions() const override {
        return {
            {"-m <msg>", "Use the given <msg> as the commit message. Multiple -m options are joined as separate paragraphs."}
        };
    }
};

}
