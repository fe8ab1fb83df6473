#include "storage/MemoryStorage.hpp"

namespace rit {

Expected<std::string> MemoryStorage::read(const std::string& key) const {
    auto it = records.find(key);
    if (it == records.end()) {
        return Error{ErrorCode::NotFound, "No such record: " + key};
    }
    return it->second;
}

Expected<void> MemoryStorage::write(const std::string& key, const std::string& bytes) {
    if (failing.count(key) != 0) {
        return Error{ErrorCode::IoError, "Simulated write failure: " + key};
    }
    records[key] = bytes;
    return {};
}

Expected<bool> MemoryStorage::exists(const std::string& key) const {
    return records.count(key) != 0;
}

}
