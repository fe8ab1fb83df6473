#include "cli/commands/AddCommand.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "core/Constants.hpp"
#include "core/Repository.hpp"
#include "core/Workspace.hpp"

namespace fs = std::filesystem;

namespace rit {

namespace {

Expected<std::string> readWorkingFile(const fs::path& filePath) {
    std::error_code ec;
    if (!fs::is_regular_file(filePath, ec)) {
        return Error{ErrorCode::NotFound, "pathspec '" + filePath.string() + "' did not match any file"};
    }
    std::ifstream in(filePath, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open file for reading: " + filePath.string()};
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Error reading file: " + filePath.string()};
    }
    return bytes;
}

}

/**
 * @brief Execute 'rit add' command
 *
 * For each file argument:
 *   1. Read the file from the working tree
 *   2. Store its content as a blob in .rit/objects/<hash>
 *   3. Append {path relative to repo root, hash} to .rit/index
 *
 * Stops at the first file that cannot be staged; files staged before it
 * stay staged.
 */
Expected<void> AddCommand::execute(const AppContext& ctx, const std::vector<std::string>& args) {
    if (args.empty()) {
        return Error{ErrorCode::InvalidArgs, "missing <file>"};
    }

    auto rootRes = Repository::instance().discoverRoot(fs::current_path());
    if (!rootRes) return rootRes.error();
    fs::path root = rootRes.value();

    FileStorage storage = Repository::storage(root);
    Workspace ws(storage, ctx.clock);

    for (const auto& arg : args) {
        fs::path abs = fs::absolute(arg).lexically_normal();
        fs::path rel = abs.lexically_relative(root);
        std::string relStr = rel.generic_string();
        if (rel.empty() || relStr == ".." || relStr.rfind("../", 0) == 0) {
            return Error{ErrorCode::InvalidArgs, "'" + arg + "' is outside repository at " + root.string()};
        }
        if (relStr == Constants::REPO_DIR_NAME || relStr.rfind(std::string(Constants::REPO_DIR_NAME) + "/", 0) == 0) {
            return Error{ErrorCode::InvalidArgs, "'" + arg + "' is inside the repository directory"};
        }

        auto content = readWorkingFile(abs);
        if (!content) return content.error();

        auto entry = ws.add(relStr, content.value());
        if (!entry) return entry.error();

        std::cout << entry.value().hashHex << "\n";
        std::cout << "Added " << entry.value().path << "\n";
    }
    return {};
}

}
