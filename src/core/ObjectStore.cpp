#include "core/ObjectStore.hpp"

#include <algorithm>
#include <string>

#include "core/Constants.hpp"
#include "storage/IStorage.hpp"
#include "util/IHasher.hpp"
#include "util/Logger.hpp"

namespace rit {

ObjectStore::ObjectStore(IStorage& storage)
    : storage(&storage), hasher(HasherFactory::createDefault()) {}

ObjectStore::ObjectStore(IStorage& storage, std::unique_ptr<IHasher> hasher)
    : storage(&storage), hasher(hasher ? std::move(hasher) : HasherFactory::createDefault()) {}

ObjectStore::~ObjectStore() = default;

ObjectStore::ObjectStore(ObjectStore&&) noexcept = default;
ObjectStore& ObjectStore::operator=(ObjectStore&&) noexcept = default;

std::string ObjectStore::keyOf(const std::string& hash) {
    return std::string(Constants::OBJECTS_DIR) + "/" + hash;
}

bool ObjectStore::isValidHash(const std::string& hash) {
    return hash.length() == Constants::SHA1_HEX_LENGTH &&
           std::all_of(hash.begin(), hash.end(), [](char c) {
               return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
           });
}

std::string ObjectStore::hashOf(const std::string& content) {
    return hasher->hexDigest(content);
}

Expected<std::string> ObjectStore::put(const std::string& content) {
    std::string hash = hashOf(content);
    std::string key = keyOf(hash);

    // Same content, same key: an existing object already holds these bytes
    auto present = storage->exists(key);
    if (!present) {
        return present.error();
    }
    if (present.value()) {
        return hash;
    }

    auto res = storage->write(key, content);
    if (!res) {
        return Error{res.error().code, "Failed to write object " + hash + ": " + res.error().message};
    }
    Logger::instance().debug("stored object " + hash + " (" + std::to_string(content.size()) + " bytes)");
    return hash;
}

Expected<std::string> ObjectStore::get(const std::string& hash) const {
    // Never turn an arbitrary string into a storage key
    if (!isValidHash(hash)) {
        return Error{ErrorCode::NotFound, "Object not found: " + hash};
    }
    auto res = storage->read(keyOf(hash));
    if (!res) {
        if (res.error().code == ErrorCode::NotFound) {
            return Error{ErrorCode::NotFound, "Object not found: " + hash};
        }
        return res.error();
    }
    return std::move(res.value());
}

Expected<bool> ObjectStore::contains(const std::string& hash) const {
    if (!isValidHash(hash)) {
        return false;
    }
    return storage->exists(keyOf(hash));
}

}
