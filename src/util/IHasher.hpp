#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace rit {

/**
 * @brief Strategy interface for the digest behind object identities
 *
 * The object store only ever talks to this interface, so the digest can be
 * swapped in tests. Rit uses SHA-1 (see HasherFactory::createDefault).
 */
class IHasher {
public:
    virtual ~IHasher() = default;

    /// Reset hasher to initial state
    virtual void reset() = 0;

    /// Update hash with raw bytes
    virtual void update(const uint8_t* data, size_t len) = 0;

    /// Update hash with string
    virtual void update(const std::string& data) = 0;

    /// Finalize and return digest bytes (hasher is reset afterwards)
    virtual std::vector<uint8_t> digest() = 0;

    /// Algorithm name (e.g., "sha1")
    virtual const char* name() const = 0;

    /// Digest size in bytes (20 for SHA-1)
    virtual size_t digestSize() const = 0;

    /// Convert binary hash to lowercase hex string
    static std::string toHex(const std::vector<uint8_t>& bytes);

    /// Digest of a whole buffer, hex encoded
    std::string hexDigest(const std::string& content);
};

/**
 * @brief Factory for creating hasher instances
 */
class HasherFactory {
public:
    /// Create default hasher (SHA-1)
    static std::unique_ptr<IHasher> createDefault();

    /// Create hasher by name, nullptr if the algorithm is unknown
    static std::unique_ptr<IHasher> create(const std::string& algorithm);
};

}
