#pragma once

#include <string>
#include <unordered_set>

#include "core/Commit.hpp"
#include "util/Clock.hpp"
#include "util/Expected.hpp"

namespace rit {

class IStorage;
class ObjectStore;

/**
 * @brief Lazy walk over the commit chain, newest first
 *
 * Each next() loads one commit and steps to its parent. The walk ends after
 * the root commit. A missing or unparseable commit, or a parent link that
 * leads back to an already visited commit, is returned as an error and ends
 * the walk.
 *
 * Usage:
 *   auto history = chain.log();
 *   while (history && !history.value().done()) {
 *       auto entry = history.value().next();
 *       ...
 *   }
 */
class CommitHistory {
public:
    CommitHistory() = default;
    CommitHistory(const ObjectStore& store, std::string start);

    /// True once the root commit has been returned or an error occurred
    bool done() const { return nextHash.empty(); }

    /// Load the next commit (must not be called when done())
    Expected<CommitSummary> next();

private:
    const ObjectStore* store{nullptr};
    std::string nextHash;
    std::unordered_set<std::string> visited;
};

/**
 * @brief Builds, stores and reads the linear chain of commits
 *
 * Commit protocol:
 *   1. load HEAD and the index (RepositoryState)
 *   2. build Commit{now, message, index snapshot, parent = HEAD}
 *   3. store its serialization in the ObjectStore
 *   4. advance HEAD and clear the index in a single commit point
 */
class CommitChain {
public:
    /**
     * @param storage Holds HEAD and the index
     * @param store Object store for commit records and blobs
     * @param clock Timestamp source for new commits
     */
    CommitChain(IStorage& storage, ObjectStore& store, TimestampSource clock = currentIsoTimestamp);

    /// Current HEAD, empty before the first commit
    Expected<std::string> head() const;

    /**
     * @brief Commit the staged entries
     * @param message Commit message (stored verbatim)
     * @return New commit hash. An empty index still produces a commit.
     */
    Expected<std::string> commit(const std::string& message);

    /// Walk history from the current HEAD
    Expected<CommitHistory> log() const;

    /**
     * @brief Load a commit
     * @return Commit, NotFound if absent, CorruptObject if not a commit record
     */
    Expected<Commit> getCommit(const std::string& hash) const;

    /// Serialize and hash a commit without storing it
    std::string hashOf(const Commit& commit);

private:
    IStorage& storage;
    ObjectStore& store;
    TimestampSource clock;
};

}
