#include "core/CommitChain.hpp"

#include "core/ObjectStore.hpp"
#include "core/RepositoryState.hpp"
#include "storage/IStorage.hpp"
#include "util/Logger.hpp"

namespace rit {

CommitHistory::CommitHistory(const ObjectStore& store, std::string start)
    : store(&store), nextHash(std::move(start)) {}

Expected<CommitSummary> CommitHistory::next() {
    if (done()) {
        return Error{ErrorCode::InternalError, "history: next() past the root commit"};
    }

    std::string hash = nextHash;
    nextHash.clear();

    if (!visited.insert(hash).second) {
        return Error{ErrorCode::CorruptObject, "Commit chain loops back to " + hash};
    }

    auto bytes = store->get(hash);
    if (!bytes) {
        return bytes.error();
    }
    auto commit = parseCommit(bytes.value(), hash);
    if (!commit) {
        return commit.error();
    }

    Commit& c = commit.value();
    nextHash = c.parent;
    return CommitSummary{c.hash, c.timestamp, c.message, c.parent};
}

CommitChain::CommitChain(IStorage& storage, ObjectStore& store, TimestampSource clock)
    : storage(storage), store(store), clock(std::move(clock)) {}

Expected<std::string> CommitChain::head() const {
    auto state = RepositoryState::load(storage);
    if (!state) return state.error();
    return state.value().head;
}

std::string CommitChain::hashOf(const Commit& commit) {
    return store.hashOf(serializeCommit(commit));
}

Expected<std::string> CommitChain::commit(const std::string& message) {
    auto loaded = RepositoryState::load(storage);
    if (!loaded) return loaded.error();
    RepositoryState& state = loaded.value();

    Commit commit;
    commit.timestamp = clock();
    commit.message = message;
    commit.files = state.index.snapshot();
    commit.parent = state.head;

    // Every referenced blob must already be stored
    for (const auto& f : commit.files) {
        auto present = store.contains(f.hashHex);
        if (!present) {
            return present.error();
        }
        if (!present.value()) {
            return Error{ErrorCode::NotFound, "Staged blob " + f.hashHex + " for " + f.path + " is missing"};
        }
    }

    auto stored = store.put(serializeCommit(commit));
    if (!stored) {
        return stored.error();
    }
    const std::string& hash = stored.value();

    auto advanced = state.advanceHead(storage, hash);
    if (!advanced) {
        // The commit object stays behind unreferenced; HEAD and index are untouched
        return advanced.error();
    }

    Logger::instance().debug("commit " + hash + " with " + std::to_string(commit.files.size()) +
                             " file(s), parent '" + commit.parent + "'");
    return hash;
}

Expected<CommitHistory> CommitChain::log() const {
    auto current = head();
    if (!current) return current.error();
    return CommitHistory(store, current.value());
}

Expected<Commit> CommitChain::getCommit(const std::string& hash) const {
    auto bytes = store.get(hash);
    if (!bytes) {
        return bytes.error();
    }
    return parseCommit(bytes.value(), hash);
}

}
