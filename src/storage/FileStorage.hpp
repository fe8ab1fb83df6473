#pragma once

#include <filesystem>
#include <string>

#include "storage/IStorage.hpp"

namespace rit {

/**
 * @brief IStorage backed by files below a repository directory
 *
 * Key "objects/ab12..." maps to <dir>/objects/ab12...
 * Writes go to "<file>.tmp" first and are renamed over the target, so a
 * crash leaves either the old or the new record on disk.
 */
class FileStorage : public IStorage {
public:
    explicit FileStorage(std::filesystem::path dir);

    Expected<std::string> read(const std::string& key) const override;
    Expected<void> write(const std::string& key, const std::string& bytes) override;
    Expected<bool> exists(const std::string& key) const override;

    /// Directory all keys are resolved against (usually <root>/.rit)
    const std::filesystem::path& dir() const { return baseDir; }

    /// Filesystem location of a key
    std::filesystem::path pathOf(const std::string& key) const;

private:
    std::filesystem::path baseDir;
};

}
