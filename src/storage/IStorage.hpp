#pragma once

#include <string>

#include "util/Expected.hpp"

namespace rit {

/**
 * @brief Record storage capability used by the core
 *
 * Keys are slash-separated names relative to the repository directory:
 *   "objects/<hash>", "HEAD", "index"
 *
 * Every write replaces the whole record; a reader never observes a partially
 * written record. The core is handed an IStorage instead of touching the
 * filesystem, so it can run against MemoryStorage in tests.
 */
class IStorage {
public:
    virtual ~IStorage() = default;

    /// Read a whole record, NotFound if the key is absent
    virtual Expected<std::string> read(const std::string& key) const = 0;

    /// Replace (or create) a record atomically
    virtual Expected<void> write(const std::string& key, const std::string& bytes) = 0;

    /// Whether a record exists under key, IoError if that cannot be determined
    virtual Expected<bool> exists(const std::string& key) const = 0;
};

}
