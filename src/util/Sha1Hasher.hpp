#pragma once

#include "util/IHasher.hpp"
#include <cstdint>

namespace rit {

/**
 * @brief SHA-1 (FIPS 180-4), 160-bit digest
 *
 * Object identities in rit are SHA-1 over the raw content bytes, so the
 * hash of a blob equals `sha1sum` of the file it came from.
 */
class Sha1Hasher : public IHasher {
public:
    Sha1Hasher();

    void reset() override;
    void update(const uint8_t* data, size_t len) override;
    void update(const std::string& data) override;
    std::vector<uint8_t> digest() override;
    const char* name() const override { return "sha1"; }
    size_t digestSize() const override { return 20; }

private:
    void transform(const uint8_t* block);

    uint32_t state[5];      // A, B, C, D, E
    uint64_t bitlen;        // Bits consumed by completed blocks
    uint8_t buffer[64];     // Partial block
    size_t bufferLen;
};

}
