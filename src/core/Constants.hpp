#pragma once

#include <cstddef>

/**
 * @brief Constants shared by the core and the CLI
 */
namespace rit {

namespace Constants {
    // Repository layout
    constexpr const char* REPO_DIR_NAME = ".rit";     // Lives at the working tree root
    constexpr const char* OBJECTS_DIR = "objects";    // objects/<hash>
    constexpr const char* HEAD_FILE = "HEAD";
    constexpr const char* INDEX_FILE = "index";

    // Hash algorithm
    constexpr size_t SHA1_HEX_LENGTH = 40;            // SHA-1 produces 40-char hex strings

    // Record schemas (first line of each record)
    constexpr const char* INDEX_MAGIC = "rit-index";
    constexpr int INDEX_VERSION = 1;
    constexpr const char* COMMIT_MAGIC = "rit-commit";
    constexpr int COMMIT_VERSION = 1;

    // Commit log limit (0 = unbounded)
    constexpr size_t DEFAULT_LOG_LIMIT = 0;
}

}
