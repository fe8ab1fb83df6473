#pragma once

#include <string>

#include "core/StagingIndex.hpp"
#include "util/Expected.hpp"

namespace rit {

class IStorage;

/**
 * @brief Mutable repository state: HEAD plus the staged entries
 *
 * Loaded at the start of an operation and written back at its end; nothing
 * else in the core reads or writes HEAD or the index.
 *
 * The index records the HEAD it was staged against ("base"). HEAD is the
 * commit point: once it moves, an index whose base no longer matches is
 * stale (its entries were already committed) and loads as empty. So a
 * crash between advancing HEAD and rewriting the index cannot fold old
 * entries into the next commit.
 */
struct RepositoryState {
    std::string head;        // Latest commit hash, empty before the first commit
    StagingIndex index;      // Entries staged on top of head

    /**
     * @brief Read HEAD and the index
     * @return State, or CorruptObject if either record is malformed, or
     *         IoError if storage fails. Missing records load as empty.
     */
    static Expected<RepositoryState> load(const IStorage& storage);

    /// Persist the index (stamped with the current head)
    Expected<void> saveIndex(IStorage& storage) const;

    /**
     * @brief Move HEAD to a new commit and empty the index
     *
     * HEAD is written first, atomically. Failing to rewrite the index after
     * that is only logged: the stale index is ignored by the next load().
     */
    Expected<void> advanceHead(IStorage& storage, const std::string& commitHash);
};

}
