#pragma once

#include <filesystem>
#include <string>

#include "storage/FileStorage.hpp"
#include "util/Expected.hpp"

namespace rit {

/**
 * @brief Repository singleton - manages the .rit directory
 *
 * Provides the directory-level operations: initialization and root
 * discovery. Everything inside the directory is handled by the core through
 * a FileStorage (see storage()).
 *
 * Repository layout:
 *   .rit/
 *     HEAD              - Latest commit hash, empty before the first commit
 *     index             - Staged entries
 *     objects/
 *       <hash>          - Blob and commit objects
 */
class Repository {
public:
    /// Get the global repository instance
    static Repository& instance();

    /**
     * @brief Initialize a new rit repository
     * @param path Directory to initialize (creates .rit subdirectory)
     * @return Success, or AlreadyInitialized if .rit already existed
     *
     * Creates whatever is missing of:
     *   - .rit/objects/
     *   - .rit/HEAD (empty)
     *   - .rit/index (no entries)
     * Existing files are never overwritten, so running init twice is safe.
     */
    Expected<void> init(const std::filesystem::path& path);

    /**
     * @brief Find repository root by searching upwards for .rit
     * @param start Starting directory (usually current working directory)
     * @return Absolute path to repository root, or NotARepository
     */
    Expected<std::filesystem::path> discoverRoot(const std::filesystem::path& start) const;

    /// .rit directory below a working tree root
    static std::filesystem::path ritDir(const std::filesystem::path& root);

    /// Storage over the .rit directory of root
    static FileStorage storage(const std::filesystem::path& root);

private:
    Repository() = default;
};

}
