#include "cli/commands/LogCommand.hpp"

#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "core/Constants.hpp"
#include "core/Repository.hpp"
#include "core/Workspace.hpp"

namespace rit {

namespace {

Expected<size_t> parseCount(const std::string& value) {
    try {
        size_t used = 0;
        long long n = std::stoll(value, &used);
        if (used != value.size() || n < 0) {
            return Error{ErrorCode::InvalidArgs, "invalid count '" + value + "'"};
        }
        return static_cast<size_t>(n);
    } catch (const std::exception&) {
        return Error{ErrorCode::InvalidArgs, "invalid count '" + value + "'"};
    }
}

}

/**
 * @brief Execute 'rit log' command
 *
 * Walks parent links from HEAD. For each commit displays:
 *   - Commit hash (yellow when color is on)
 *   - Timestamp
 *   - Parent hash, or "(root)"
 *   - Commit message (indented)
 */
Expected<void> LogCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    size_t limit = Constants::DEFAULT_LOG_LIMIT;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-n" && i + 1 < args.size()) {
            auto n = parseCount(args[++i]);
            if (!n) return n.error();
            limit = n.value();
        } else {
            return Error{ErrorCode::InvalidArgs, "unexpected argument '" + args[i] + "'"};
        }
    }

    auto rootRes = Repository::instance().discoverRoot(std::filesystem::current_path());
    if (!rootRes) return rootRes.error();

    FileStorage storage = Repository::storage(rootRes.value());
    Workspace ws(storage, ctx.clock);

    auto history = ws.log();
    if (!history) return history.error();
    CommitHistory& walk = history.value();

    if (walk.done()) {
        std::cout << "No commits yet\n";
        return {};
    }

    size_t shown = 0;
    while (!walk.done() && (limit == 0 || shown < limit)) {
        auto entry = walk.next();
        if (!entry) return entry.error();
        const CommitSummary& c = entry.value();

        if (shown > 0) std::cout << "\n";
        if (ctx.color) std::cout << "\033[33m";
        std::cout << "commit " << c.hash;
        if (ctx.color) std::cout << "\033[0m";
        std::cout << "\n";
        std::cout << "Date:   " << c.timestamp << "\n";
        std::cout << "Parent: " << (c.parent.empty() ? "(root)" : c.parent) << "\n";
        std::cout << "\n";

        std::istringstream iss(c.message);
        std::string line;
        while (std::getline(iss, line)) {
            std::cout << "    " << line << "\n";
        }
        ++shown;
    }
    return {};
}

}
