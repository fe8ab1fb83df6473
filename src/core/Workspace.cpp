#include "core/Workspace.hpp"

#include "core/RepositoryState.hpp"
#include "storage/IStorage.hpp"

namespace rit {

Workspace::Workspace(IStorage& storage, TimestampSource clock)
    : storage(storage),
      store(storage),
      chain(storage, store, std::move(clock)),
      diffs(store, chain) {}

Expected<IndexEntry> Workspace::add(const std::string& path, const std::string& content) {
    std::string normalized = StagingIndex::normalizePath(path);
    bool outside = !normalized.empty() && (normalized == "." || normalized == ".." || normalized.rfind("../", 0) == 0 ||
                   normalized.front() == '/');
    if (!StagingIndex::isStorablePath(normalized) || outside) {
        return Error{ErrorCode::InvalidArgs, "Cannot stage path '" + path + "'"};
    }

    auto loaded = RepositoryState::load(storage);
    if (!loaded) return loaded.error();
    RepositoryState& state = loaded.value();

    // Blob first, so the index never names a missing object
    auto hash = store.put(content);
    if (!hash) return hash.error();

    auto added = state.index.add(normalized, hash.value());
    if (!added) return added.error();
    auto saved = state.saveIndex(storage);
    if (!saved) return saved.error();

    return state.index.entries().back();
}

Expected<std::vector<IndexEntry>> Workspace::staged() const {
    auto loaded = RepositoryState::load(storage);
    if (!loaded) return loaded.error();
    return loaded.value().index.snapshot();
}

}
