#pragma once

#include <string>
#include <vector>

#include "util/Expected.hpp"

namespace rit {

class CommitChain;
class ObjectStore;

enum class SegmentKind { Equal, Added, Removed };

/**
 * @brief Run of whole lines (terminators included) with one edit kind
 */
struct DiffSegment {
    SegmentKind kind;
    std::string text;

    bool operator==(const DiffSegment& other) const {
        return kind == other.kind && text == other.text;
    }
};

enum class FileStatus {
    InitialCommit,  // Commit has no parent, nothing to compare against
    NewFile,        // Parent commit does not list this path
    Modified        // Parent lists the path; segments hold the line diff
};

/**
 * @brief One file entry of a shown commit
 */
struct FileDiff {
    std::string path;
    std::string hash;                   // Blob in the shown commit
    FileStatus status{FileStatus::InitialCommit};
    std::string parentHash;             // Blob in the parent (Modified only)
    std::vector<DiffSegment> segments;  // Modified only
};

/**
 * @brief Line-level diffs between blobs and between a commit and its parent
 *
 * The line diff is a shortest edit script (Myers), so its Equal lines form a
 * longest common subsequence. Memory is linear in the number of lines.
 * Concatenating the Equal and Removed segments gives back the old text
 * exactly; Equal and Added give back the new text.
 */
class DiffEngine {
public:
    DiffEngine(const ObjectStore& store, const CommitChain& chain);

    /**
     * @brief Diff every file of a commit against its parent
     *
     * Files come back in the commit's order, duplicates included. When the
     * parent lists a path more than once, the last entry for that path is
     * the one compared against.
     *
     * @return One FileDiff per file entry, NotFound if the commit, its
     *         parent or a blob is missing, CorruptObject for bad records
     */
    Expected<std::vector<FileDiff>> showCommitDiff(const std::string& hash) const;

    /// Shortest line edit script of two texts; adjacent segments of a kind are merged
    static std::vector<DiffSegment> diffLines(const std::string& oldText, const std::string& newText);

    /// Split into lines, each keeping its "\n"; a trailing partial line is kept as is
    static std::vector<std::string> splitLines(const std::string& text);

    /// Concatenation of Equal and Removed segments
    static std::string reconstructOld(const std::vector<DiffSegment>& segments);

    /// Concatenation of Equal and Added segments
    static std::string reconstructNew(const std::vector<DiffSegment>& segments);

private:
    const ObjectStore& store;
    const CommitChain& chain;
};

}
