#pragma once

#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace rit {

/**
 * @brief One staged file: where it lives and which blob holds its content
 */
struct IndexEntry {
    std::string path;     // Path relative to repo root, forward slashes (e.g., "src/main.cpp")
    std::string hashHex;  // SHA-1 of the blob (40-char hex)

    bool operator==(const IndexEntry& other) const {
        return path == other.path && hashHex == other.hashHex;
    }
    bool operator!=(const IndexEntry& other) const { return !(*this == other); }
};

/**
 * @brief Ordered list of entries waiting for the next commit
 *
 * Entries are kept in the order they were added. Adding a path twice keeps
 * both entries; nothing is merged or deduplicated.
 *
 * On-disk format (.rit/index):
 *   rit-index 1
 *   base <head hash the entries were staged against, may be empty>
 *   <hash><TAB><path>
 *   ...
 */
class StagingIndex {
public:
    /**
     * @brief Append an entry
     * @return InvalidArgs if hash is not 40-char hex or the path is empty or
     *         contains a tab or newline
     */
    Expected<void> add(const std::string& path, const std::string& hash);

    /// Copy of the current entries, in insertion order
    std::vector<IndexEntry> snapshot() const { return entryList; }

    /// Remove every entry
    void clear() { entryList.clear(); }

    const std::vector<IndexEntry>& entries() const { return entryList; }
    bool empty() const { return entryList.empty(); }
    size_t size() const { return entryList.size(); }

    /// Encode entries together with the head they were staged against
    std::string serialize(const std::string& base) const;

    /**
     * @brief Decode an index record
     * @param bytes Record content
     * @param base Receives the recorded base head
     * @return Index, or CorruptObject if the record does not match the schema
     */
    static Expected<StagingIndex> parse(const std::string& bytes, std::string& base);

    /// Forward slashes, lexically normal, no leading "./"
    static std::string normalizePath(const std::string& path);

    /// True if path can be stored in index and commit records
    static bool isStorablePath(const std::string& path);

private:
    std::vector<IndexEntry> entryList;
};

}
