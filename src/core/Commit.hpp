#pragma once

#include <string>
#include <vector>

#include "core/StagingIndex.hpp"
#include "util/Expected.hpp"

namespace rit {

/**
 * @brief Parsed commit record
 *
 * Serialized form (also the bytes that are hashed):
 *   rit-commit 1
 *   timestamp 2024-03-01T12:34:56.789Z
 *   parent <hash>              (absent for a root commit)
 *   file <hash><TAB><path>     (one per entry, in staging order)
 *
 *   <message, verbatim to the end of the record>
 *
 * Fields are always written in this order, so the same logical commit
 * always produces the same bytes and therefore the same hash.
 */
struct Commit {
    std::string hash;              // Identity; not part of the serialized record
    std::string timestamp;         // ISO-8601 UTC
    std::string message;           // Full commit message
    std::vector<IndexEntry> files; // Staged entries, duplicates included
    std::string parent;            // Parent commit hash, empty for a root commit

    bool isRoot() const { return parent.empty(); }
};

/**
 * @brief Log view of a commit (file list omitted)
 */
struct CommitSummary {
    std::string hash;
    std::string timestamp;
    std::string message;
    std::string parent;
};

/// Deterministic encoding of {timestamp, message, files, parent}
std::string serializeCommit(const Commit& commit);

/**
 * @brief Decode a commit record
 * @param bytes Stored record
 * @param hash Hash the record was stored under (copied into the result)
 * @return Commit, or CorruptObject if the bytes do not follow the schema
 */
Expected<Commit> parseCommit(const std::string& bytes, const std::string& hash);

}
