#include "core/Repository.hpp"

#include <utility>

#include "core/Constants.hpp"
#include "core/StagingIndex.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace rit {

Repository& Repository::instance() {
    static Repository repo;
    return repo;
}

fs::path Repository::ritDir(const fs::path& root) {
    return root / Constants::REPO_DIR_NAME;
}

FileStorage Repository::storage(const fs::path& root) {
    return FileStorage(ritDir(root));
}

Expected<void> Repository::init(const fs::path& path) {
    fs::path root = fs::absolute(path).lexically_normal();
    fs::path rd = ritDir(root);

    std::error_code ec;
    bool existed = fs::exists(rd, ec);
    if (existed && !fs::is_directory(rd, ec)) {
        return Error{ErrorCode::IoError, rd.string() + " exists and is not a directory"};
    }

    fs::create_directories(rd / Constants::OBJECTS_DIR, ec);
    if (ec) return Error{ErrorCode::IoError, std::string("Failed to create directories: ") + ec.message()};

    FileStorage files(rd);
    const std::pair<const char*, std::string> records[] = {
        {Constants::HEAD_FILE, ""},
        {Constants::INDEX_FILE, StagingIndex().serialize("")},
    };
    for (const auto& [key, initial] : records) {
        auto present = files.exists(key);
        if (!present) return present.error();
        if (!present.value()) {
            auto res = files.write(key, initial);
            if (!res) return res.error();
        }
    }

    if (existed) {
        return Error{ErrorCode::AlreadyInitialized, rd.string() + " already exists"};
    }
    Logger::instance().debug("initialized " + rd.string());
    return {};
}

Expected<fs::path> Repository::discoverRoot(const fs::path& start) const {
    fs::path cur = fs::absolute(start).lexically_normal();
    std::error_code ec;
    while (true) {
        fs::path rd = ritDir(cur);
        if (fs::exists(rd, ec) && fs::is_directory(rd, ec)) {
            return cur;
        }
        if (!cur.has_parent_path() || cur == cur.parent_path()) {
            return Error{ErrorCode::NotARepository, "Not inside a rit repository (run `rit init`)"};
        }
        cur = cur.parent_path();
    }
}

}
