#include "cli/commands/InitCommand.hpp"

#include <filesystem>
#include <iostream>

#include "core/Repository.hpp"

namespace rit {

Expected<void> InitCommand::execute(const AppContext&, const std::vector<std::string>& args) {
    std::filesystem::path target = std::filesystem::current_path();
    if (!args.empty()) {
        target = args.front();
    }
    std::string where = Repository::ritDir(std::filesystem::absolute(target).lexically_normal()).string();

    auto res = Repository::instance().init(target);
    if (!res) {
        if (res.error().code == ErrorCode::AlreadyInitialized) {
            std::cout << "rit repository already exists in " << where << "/\n";
            return {};
        }
        return Error{res.error().code, "Failed to initialize repository in " + where + ": " + res.error().message};
    }
    std::cout << "Initialized empty rit repository in " << where << "/\n";
    return {};
}

}
