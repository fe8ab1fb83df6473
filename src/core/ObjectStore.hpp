#pragma once

#include <memory>
#include <string>

#include "util/Expected.hpp"

namespace rit {

class IHasher;
class IStorage;

/**
 * @brief Content-addressable object storage
 *
 * Every object (file blob or serialized commit) is stored under the hex
 * SHA-1 of its raw bytes:
 *   .rit/objects/<40-hex-hash>
 *
 * Objects are immutable. Writing content that is already present is a no-op,
 * and nothing is ever deleted. Stored bytes are not re-verified on read.
 *
 * Strategy Pattern:
 *   The digest comes from an IHasher (SHA-1 unless told otherwise) and the
 *   bytes go to an IStorage, so the store runs on disk or in memory.
 */
class ObjectStore {
public:
    /// Store hashing with SHA-1
    explicit ObjectStore(IStorage& storage);

    /**
     * @param storage Record storage (not owned, must outlive the store)
     * @param hasher Hash algorithm to use (SHA-1 if nullptr)
     */
    ObjectStore(IStorage& storage, std::unique_ptr<IHasher> hasher);

    /// Destructor (must be defined in .cpp to allow incomplete IHasher type)
    ~ObjectStore();

    ObjectStore(const ObjectStore&) = delete;
    ObjectStore& operator=(const ObjectStore&) = delete;

    ObjectStore(ObjectStore&&) noexcept;
    ObjectStore& operator=(ObjectStore&&) noexcept;

    /**
     * @brief Store content and return its hash
     * @param content Raw bytes
     * @return Hex hash, or IoError if the object could not be written
     */
    Expected<std::string> put(const std::string& content);

    /**
     * @brief Read an object back
     * @param hash Object hash (hex)
     * @return Raw bytes, or NotFound if no object exists under hash
     */
    Expected<std::string> get(const std::string& hash) const;

    /// Whether an object is stored under hash (false for a malformed hash)
    Expected<bool> contains(const std::string& hash) const;

    /// Hash content without storing it
    std::string hashOf(const std::string& content);

    /// Storage key of an object: "objects/<hash>"
    static std::string keyOf(const std::string& hash);

    /// True for a 40-character lowercase hex string
    static bool isValidHash(const std::string& hash);

private:
    IStorage* storage;                // Where object records live
    std::unique_ptr<IHasher> hasher;  // Hash algorithm (SHA-1)
};

}
