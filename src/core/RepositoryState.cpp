#include "core/RepositoryState.hpp"

#include <cctype>

#include "core/Constants.hpp"
#include "core/ObjectStore.hpp"
#include "storage/IStorage.hpp"
#include "util/Logger.hpp"

namespace rit {

namespace {

std::string trimTrailingSpace(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

}

Expected<RepositoryState> RepositoryState::load(const IStorage& storage) {
    RepositoryState state;

    auto headRes = storage.read(Constants::HEAD_FILE);
    if (headRes) {
        state.head = trimTrailingSpace(headRes.value());
        if (!state.head.empty() && !ObjectStore::isValidHash(state.head)) {
            return Error{ErrorCode::CorruptObject, "HEAD does not hold a commit hash: '" + state.head + "'"};
        }
    } else if (headRes.error().code != ErrorCode::NotFound) {
        return headRes.error();
    }

    auto indexRes = storage.read(Constants::INDEX_FILE);
    if (!indexRes) {
        if (indexRes.error().code == ErrorCode::NotFound) {
            return state;
        }
        return indexRes.error();
    }

    std::string base;
    auto parsed = StagingIndex::parse(indexRes.value(), base);
    if (!parsed) {
        return parsed.error();
    }

    if (base != state.head) {
        Logger::instance().debug("index was staged on '" + base + "' but HEAD is '" + state.head +
                                 "'; dropping " + std::to_string(parsed.value().size()) + " stale entries");
        return state;
    }

    state.index = std::move(parsed.value());
    return state;
}

Expected<void> RepositoryState::saveIndex(IStorage& storage) const {
    auto res = storage.write(Constants::INDEX_FILE, index.serialize(head));
    if (!res) {
        return Error{res.error().code, "Failed to write index: " + res.error().message};
    }
    return {};
}

Expected<void> RepositoryState::advanceHead(IStorage& storage, const std::string& commitHash) {
    auto res = storage.write(Constants::HEAD_FILE, commitHash + "\n");
    if (!res) {
        return Error{res.error().code, "Failed to update HEAD: " + res.error().message};
    }
    head = commitHash;
    index.clear();

    auto saved = saveIndex(storage);
    if (!saved) {
        Logger::instance().warn(saved.error().message + " (staged entries are already part of " + commitHash + ")");
    }
    return {};
}

}
