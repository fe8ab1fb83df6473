#pragma once

#include <map>
#include <set>
#include <string>

#include "storage/IStorage.hpp"

namespace rit {

/**
 * @brief In-memory IStorage
 *
 * Used by the core unit tests. Writes to keys registered with failWrites()
 * return IoError without changing anything, which lets tests stop an
 * operation between two of its writes.
 */
class MemoryStorage : public IStorage {
public:
    Expected<std::string> read(const std::string& key) const override;
    Expected<void> write(const std::string& key, const std::string& bytes) override;
    Expected<bool> exists(const std::string& key) const override;

    /// Make every later write to key fail with IoError
    void failWrites(const std::string& key) { failing.insert(key); }

    /// Undo failWrites for key
    void allowWrites(const std::string& key) { failing.erase(key); }

    /// Overwrite a record directly, bypassing failure injection
    void poke(const std::string& key, const std::string& bytes) { records[key] = bytes; }

    const std::map<std::string, std::string>& contents() const { return records; }

private:
    std::map<std::string, std::string> records;
    std::set<std::string> failing;
};

}
