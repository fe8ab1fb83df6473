#include "cli/commands/ShowCommand.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>

#include "core/DiffEngine.hpp"
#include "core/Repository.hpp"
#include "core/Workspace.hpp"

namespace rit {

namespace {

void printSegment(const DiffSegment& seg, bool color) {
    const char* prefix = "  ";
    const char* on = "";
    if (seg.kind == SegmentKind::Added) {
        prefix = "++";
        on = "\033[32m";
    } else if (seg.kind == SegmentKind::Removed) {
        prefix = "--";
        on = "\033[31m";
    }

    for (const auto& line : DiffEngine::splitLines(seg.text)) {
        if (color && seg.kind != SegmentKind::Equal) std::cout << on;
        std::cout << prefix << line;
        if (line.empty() || line.back() != '\n') std::cout << "\n";
        if (color && seg.kind != SegmentKind::Equal) std::cout << "\033[0m";
    }
}

}

/**
 * @brief Execute 'rit show' command
 *
 * Output:
 *   commit <hash>
 *   Date:   <timestamp>
 *
 *       <message>
 *
 *   File: <path>
 *   (initial commit) | First Commit | diff lines prefixed "++", "--" or "  "
 */
Expected<void> ShowCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.size() != 1) {
        return Error{ErrorCode::InvalidArgs, "usage: rit show <commitHash>"};
    }
    const std::string& hash = args.front();

    auto rootRes = Repository::instance().discoverRoot(std::filesystem::current_path());
    if (!rootRes) return rootRes.error();

    FileStorage storage = Repository::storage(rootRes.value());
    Workspace ws(storage, ctx.clock);

    auto commit = ws.getCommit(hash);
    if (!commit) return commit.error();
    auto diffs = ws.showCommitDiff(hash);
    if (!diffs) return diffs.error();

    const Commit& c = commit.value();
    if (ctx.color) std::cout << "\033[33m";
    std::cout << "commit " << c.hash;
    if (ctx.color) std::cout << "\033[0m";
    std::cout << "\n";
    std::cout << "Date:   " << c.timestamp << "\n\n";
    std::istringstream iss(c.message);
    std::string line;
    while (std::getline(iss, line)) {
        std::cout << "    " << line << "\n";
    }

    for (const auto& fd : diffs.value()) {
        std::cout << "\nFile: " << fd.path << "\n";
        switch (fd.status) {
            case FileStatus::InitialCommit:
                std::cout << "(initial commit)\n";
                break;
            case FileStatus::NewFile:
                std::cout << "First Commit\n";
                break;
            case FileStatus::Modified:
                for (const auto& seg : fd.segments) {
                    printSegment(seg, ctx.color);
                }
                break;
        }
    }
    return {};
}

}
