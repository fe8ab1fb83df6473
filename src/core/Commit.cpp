#include "core/Commit.hpp"

#include <sstream>

#include "core/Constants.hpp"
#include "core/ObjectStore.hpp"

namespace rit {

namespace {

Error corrupt(const std::string& hash, const std::string& what) {
    return Error{ErrorCode::CorruptObject, "Object " + hash + " is not a valid commit: " + what};
}

bool startsWith(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

}

std::string serializeCommit(const Commit& commit) {
    std::ostringstream out;
    out << Constants::COMMIT_MAGIC << ' ' << Constants::COMMIT_VERSION << '\n';
    out << "timestamp " << commit.timestamp << '\n';
    if (!commit.parent.empty()) {
        out << "parent " << commit.parent << '\n';
    }
    for (const auto& f : commit.files) {
        out << "file " << f.hashHex << '\t' << f.path << '\n';
    }
    out << '\n';
    out << commit.message;
    return out.str();
}

Expected<Commit> parseCommit(const std::string& bytes, const std::string& hash) {
    // Header lines are never empty, so the first blank line ends the header
    size_t split = bytes.find("\n\n");
    if (split == std::string::npos) {
        return corrupt(hash, "no header terminator");
    }

    Commit commit;
    commit.hash = hash;
    commit.message = bytes.substr(split + 2);

    std::istringstream header(bytes.substr(0, split + 1));
    std::string line;

    const std::string magic = std::string(Constants::COMMIT_MAGIC) + ' ' +
                              std::to_string(Constants::COMMIT_VERSION);
    if (!std::getline(header, line) || line != magic) {
        return corrupt(hash, "unsupported header '" + line + "'");
    }

    if (!std::getline(header, line) || !startsWith(line, "timestamp ") || line.size() == 10) {
        return corrupt(hash, "missing timestamp");
    }
    commit.timestamp = line.substr(10);

    bool sawFile = false;
    while (std::getline(header, line)) {
        if (startsWith(line, "parent ")) {
            if (!commit.parent.empty() || sawFile) {
                return corrupt(hash, "unexpected parent line");
            }
            commit.parent = line.substr(7);
            if (!ObjectStore::isValidHash(commit.parent)) {
                return corrupt(hash, "bad parent hash");
            }
        } else if (startsWith(line, "file ")) {
            size_t tab = line.find('\t', 5);
            if (tab == std::string::npos) {
                return corrupt(hash, "file line without path");
            }
            IndexEntry entry{line.substr(tab + 1), line.substr(5, tab - 5)};
            if (!ObjectStore::isValidHash(entry.hashHex) || !StagingIndex::isStorablePath(entry.path)) {
                return corrupt(hash, "bad file entry '" + line + "'");
            }
            commit.files.push_back(std::move(entry));
            sawFile = true;
        } else {
            return corrupt(hash, "unknown header line '" + line + "'");
        }
    }

    return commit;
}

}
