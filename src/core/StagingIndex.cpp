#include "core/StagingIndex.hpp"

#include <filesystem>
#include <sstream>
#include <string>

#include "core/Constants.hpp"
#include "core/ObjectStore.hpp"

namespace fs = std::filesystem;

namespace rit {

std::string StagingIndex::normalizePath(const std::string& path) {
    std::string normalized = fs::path(path).lexically_normal().generic_string();

    // Remove leading ./ if present
    while (normalized.length() >= 2 && normalized.compare(0, 2, "./") == 0) {
        normalized = normalized.substr(2);
    }
    return normalized;
}

bool StagingIndex::isStorablePath(const std::string& path) {
    return !path.empty() && path.find_first_of("\t\r\n") == std::string::npos;
}

Expected<void> StagingIndex::add(const std::string& path, const std::string& hash) {
    if (!ObjectStore::isValidHash(hash)) {
        return Error{ErrorCode::InvalidArgs, "Invalid hash format: " + hash};
    }
    std::string normalized = normalizePath(path);
    if (!isStorablePath(normalized)) {
        return Error{ErrorCode::InvalidArgs, "Path cannot be staged: '" + path + "'"};
    }
    entryList.push_back(IndexEntry{normalized, hash});
    return {};
}

std::string StagingIndex::serialize(const std::string& base) const {
    std::ostringstream out;
    out << Constants::INDEX_MAGIC << ' ' << Constants::INDEX_VERSION << '\n';
    out << "base";
    if (!base.empty()) out << ' ' << base;
    out << '\n';
    for (const auto& e : entryList) {
        out << e.hashHex << '\t' << e.path << '\n';
    }
    return out.str();
}

Expected<StagingIndex> StagingIndex::parse(const std::string& bytes, std::string& base) {
    std::istringstream in(bytes);
    std::string line;

    const std::string header = std::string(Constants::INDEX_MAGIC) + ' ' +
                               std::to_string(Constants::INDEX_VERSION);
    if (!std::getline(in, line) || line != header) {
        return Error{ErrorCode::CorruptObject, "index: unsupported header '" + line + "'"};
    }

    if (!std::getline(in, line) || line.compare(0, 4, "base") != 0) {
        return Error{ErrorCode::CorruptObject, "index: missing base line"};
    }
    if (line == "base") {
        base.clear();
    } else if (line.size() > 5 && line[4] == ' ' && ObjectStore::isValidHash(line.substr(5))) {
        base = line.substr(5);
    } else {
        return Error{ErrorCode::CorruptObject, "index: malformed base line '" + line + "'"};
    }

    StagingIndex index;
    size_t lineNo = 2;
    while (std::getline(in, line)) {
        ++lineNo;
        size_t tab = line.find('\t');
        if (tab == std::string::npos) {
            return Error{ErrorCode::CorruptObject, "index: line " + std::to_string(lineNo) + " has no tab"};
        }
        std::string hash = line.substr(0, tab);
        std::string path = line.substr(tab + 1);
        if (!ObjectStore::isValidHash(hash) || !isStorablePath(path)) {
            return Error{ErrorCode::CorruptObject, "index: bad entry on line " + std::to_string(lineNo)};
        }
        index.entryList.push_back(IndexEntry{path, hash});
    }
    return index;
}

}
