#pragma once

#include <string>
#include <vector>

#include "core/CommitChain.hpp"
#include "core/DiffEngine.hpp"
#include "core/ObjectStore.hpp"
#include "core/StagingIndex.hpp"
#include "util/Clock.hpp"
#include "util/Expected.hpp"

namespace rit {

class IStorage;

/**
 * @brief Core operations of one repository, over an injected IStorage
 *
 * Commands build a Workspace on a FileStorage rooted at .rit/; tests build
 * one on a MemoryStorage. Each call loads the state it needs, does its work
 * and persists before returning. The Workspace never prints.
 */
class Workspace {
public:
    explicit Workspace(IStorage& storage, TimestampSource clock = currentIsoTimestamp);

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    /**
     * @brief Stage file content under path
     *
     * Stores the blob, then appends {path, hash} to the index and saves it.
     * @return The appended entry (normalized path), or InvalidArgs for a
     *         path that cannot be recorded
     */
    Expected<IndexEntry> add(const std::string& path, const std::string& content);

    /// Entries currently staged
    Expected<std::vector<IndexEntry>> staged() const;

    Expected<std::string> head() const { return chain.head(); }
    Expected<std::string> commit(const std::string& message) { return chain.commit(message); }
    Expected<CommitHistory> log() const { return chain.log(); }
    Expected<Commit> getCommit(const std::string& hash) const { return chain.getCommit(hash); }
    Expected<std::vector<FileDiff>> showCommitDiff(const std::string& hash) const { return diffs.showCommitDiff(hash); }

    ObjectStore& objects() { return store; }
    CommitChain& commits() { return chain; }

private:
    IStorage& storage;
    ObjectStore store;
    CommitChain chain;
    DiffEngine diffs;
};

}
