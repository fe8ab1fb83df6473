#include "cli/commands/CommitCommand.hpp"

#include <filesystem>
#include <iostream>

#include "core/Repository.hpp"
#include "core/Workspace.hpp"

namespace rit {

/**
 * @brief Execute 'rit commit' command
 *
 * Message forms:
 *   rit commit "message"             positional words are joined with spaces
 *   rit commit -m "first" -m "more"  each -m is a paragraph (blank line between)
 */
Expected<void> CommitCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    std::vector<std::string> paragraphs;
    std::string positional;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-m") {
            if (i + 1 >= args.size()) {
                return Error{ErrorCode::InvalidArgs, "switch `m' requires a value"};
            }
            paragraphs.push_back(args[++i]);
        } else {
            if (!positional.empty()) positional += ' ';
            positional += args[i];
        }
    }

    if (!paragraphs.empty() && !positional.empty()) {
        return Error{ErrorCode::InvalidArgs, "use either <message> or -m, not both"};
    }

    std::string message = positional;
    for (size_t i = 0; i < paragraphs.size(); ++i) {
        if (i > 0) message += "\n\n";
        message += paragraphs[i];
    }
    if (paragraphs.empty() && positional.empty()) {
        return Error{ErrorCode::InvalidArgs, "missing <message>"};
    }

    auto rootRes = Repository::instance().discoverRoot(std::filesystem::current_path());
    if (!rootRes) return rootRes.error();

    FileStorage storage = Repository::storage(rootRes.value());
    Workspace ws(storage, ctx.clock);

    auto hash = ws.commit(message);
    if (!hash) return hash.error();

    std::cout << "Committed with hash: " << hash.value() << "\n";
    return {};
}

}
