#include <gtest/gtest.h>
#include <string>
#include <utility>
#include <vector>
#include "storage/MemoryStorage.hpp"
#include "core/StagingIndex.hpp"
#include "core/RepositoryState.hpp"

using namespace rit;

namespace {
const std::string H1 = "f572d396fae9206628714fb2ce00f72e94f2258f";
const std::string H2 = "58853e8a5e8272b1012f9a52a80758b27bd0d3cb";
const std::string C1 = "1111111111111111111111111111111111111111";
const std::string C2 = "2222222222222222222222222222222222222222";
}

// Test: Entries keep insertion order and duplicates
TEST(StagingIndexTest, AddAppendsWithoutDedup) {
    StagingIndex index;
    ASSERT_TRUE(index.add("a.txt", H1).has_value());
    ASSERT_TRUE(index.add("b.txt", H2).has_value());
    ASSERT_TRUE(index.add("a.txt", H2).has_value());

    ASSERT_EQ(index.size(), 3u);
    EXPECT_EQ(index.entries()[0], (IndexEntry{"a.txt", H1}));
    EXPECT_EQ(index.entries()[1], (IndexEntry{"b.txt", H2}));
    EXPECT_EQ(index.entries()[2], (IndexEntry{"a.txt", H2}));
}

// Test: Snapshot is a copy
TEST(StagingIndexTest, SnapshotDoesNotAlias) {
    StagingIndex index;
    ASSERT_TRUE(index.add("a.txt", H1).has_value());
    auto snap = index.snapshot();
    index.clear();
    EXPECT_TRUE(index.empty());
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0].path, "a.txt");
}

// Test: Paths are normalized
TEST(StagingIndexTest, NormalizesPaths) {
    StagingIndex index;
    ASSERT_TRUE(index.add("./src/../src/main.cpp", H1).has_value());
    EXPECT_EQ(index.entries()[0].path, "src/main.cpp");
    EXPECT_EQ(StagingIndex::normalizePath("./a.txt"), "a.txt");
}

// Test: Invalid input is rejected
TEST(StagingIndexTest, RejectsInvalidEntries) {
    StagingIndex index;
    const std::vector<std::pair<std::string, std::string>> cases = {
        {"a.txt", "nothex"}, {"", H1}, {"tab\there", H1}, {"new\nline", H1}};
    for (const auto& [path, hash] : cases) {
        auto res = index.add(path, hash);
        ASSERT_FALSE(res.has_value()) << path;
        EXPECT_EQ(res.error().code, ErrorCode::InvalidArgs);
    }
    EXPECT_TRUE(index.empty());
}

// Test: Serialized form
TEST(StagingIndexTest, SerializeFormat) {
    StagingIndex index;
    ASSERT_TRUE(index.add("a b.txt", H1).has_value());
    EXPECT_EQ(index.serialize(""), "rit-index 1\nbase\n" + H1 + "\ta b.txt\n");
    EXPECT_EQ(StagingIndex().serialize(C1), "rit-index 1\nbase " + C1 + "\n");
}

// Test: Parse accepts what serialize writes
TEST(StagingIndexTest, ParseSerialized) {
    StagingIndex index;
    ASSERT_TRUE(index.add("a.txt", H1).has_value());
    ASSERT_TRUE(index.add("dir/b.txt", H2).has_value());

    std::string base;
    auto parsed = StagingIndex::parse(index.serialize(C1), base);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(base, C1);
    EXPECT_EQ(parsed.value().entries(), index.entries());
}

// Test: Shape mismatches are CorruptObject
TEST(StagingIndexTest, ParseRejectsMalformedRecords) {
    std::string base;
    for (const std::string bad : {std::string(""), std::string("[]"), std::string("rit-index 2\nbase\n"),
                                  std::string("rit-index 1\n"), std::string("rit-index 1\nbase xyz\n"),
                                  "rit-index 1\nbase\n" + H1 + " a.txt\n",
                                  std::string("rit-index 1\nbase\nnothex\ta.txt\n")}) {
        auto res = StagingIndex::parse(bad, base);
        ASSERT_FALSE(res.has_value()) << bad;
        EXPECT_EQ(res.error().code, ErrorCode::CorruptObject);
    }
}

// Test: Missing HEAD and index load as empty state
TEST(RepositoryStateTest, LoadEmptyStorage) {
    MemoryStorage storage;
    auto state = RepositoryState::load(storage);
    ASSERT_TRUE(state.has_value()) << state.error().message;
    EXPECT_TRUE(state.value().head.empty());
    EXPECT_TRUE(state.value().index.empty());
}

// Test: Save then load keeps entries
TEST(RepositoryStateTest, SaveAndLoad) {
    MemoryStorage storage;
    storage.poke("HEAD", C1 + "\n");

    auto state = RepositoryState::load(storage);
    ASSERT_TRUE(state.has_value());
    ASSERT_TRUE(state.value().index.add("a.txt", H1).has_value());
    ASSERT_TRUE(state.value().saveIndex(storage).has_value());

    auto again = RepositoryState::load(storage);
    ASSERT_TRUE(again.has_value()) << again.error().message;
    EXPECT_EQ(again.value().head, C1);
    ASSERT_EQ(again.value().index.size(), 1u);
    EXPECT_EQ(again.value().index.entries()[0].hashHex, H1);
}

// Test: Index staged against an older HEAD is ignored
TEST(RepositoryStateTest, StaleIndexLoadsEmpty) {
    MemoryStorage storage;
    storage.poke("HEAD", C2 + "\n");
    storage.poke("index", "rit-index 1\nbase " + C1 + "\n" + H1 + "\ta.txt\n");

    auto state = RepositoryState::load(storage);
    ASSERT_TRUE(state.has_value()) << state.error().message;
    EXPECT_TRUE(state.value().index.empty());
    EXPECT_EQ(state.value().head, C2);

    // Saving again restamps the index on the current head
    ASSERT_TRUE(state.value().saveIndex(storage).has_value());
    EXPECT_EQ(storage.read("index").value(), "rit-index 1\nbase " + C2 + "\n");
}

// Test: Advancing HEAD clears the index
TEST(RepositoryStateTest, AdvanceHeadClearsIndex) {
    MemoryStorage storage;
    RepositoryState state;
    ASSERT_TRUE(state.index.add("a.txt", H1).has_value());
    ASSERT_TRUE(state.saveIndex(storage).has_value());

    ASSERT_TRUE(state.advanceHead(storage, C1).has_value());
    EXPECT_EQ(storage.read("HEAD").value(), C1 + "\n");
    EXPECT_EQ(storage.read("index").value(), "rit-index 1\nbase " + C1 + "\n");
}

// Test: HEAD moved but index rewrite failed: entries still do not survive
TEST(RepositoryStateTest, AdvanceHeadSurvivesIndexWriteFailure) {
    MemoryStorage storage;
    RepositoryState state;
    ASSERT_TRUE(state.index.add("a.txt", H1).has_value());
    ASSERT_TRUE(state.saveIndex(storage).has_value());

    storage.failWrites("index");
    ASSERT_TRUE(state.advanceHead(storage, C1).has_value());

    auto reloaded = RepositoryState::load(storage);
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_EQ(reloaded.value().head, C1);
    EXPECT_TRUE(reloaded.value().index.empty());
}

// Test: HEAD write failure changes nothing
TEST(RepositoryStateTest, AdvanceHeadFailureKeepsState) {
    MemoryStorage storage;
    RepositoryState state;
    ASSERT_TRUE(state.index.add("a.txt", H1).has_value());
    ASSERT_TRUE(state.saveIndex(storage).has_value());

    storage.failWrites("HEAD");
    auto res = state.advanceHead(storage, C1);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::IoError);

    auto reloaded = RepositoryState::load(storage);
    ASSERT_TRUE(reloaded.has_value());
    EXPECT_TRUE(reloaded.value().head.empty());
    EXPECT_EQ(reloaded.value().index.size(), 1u);
}

// Test: Garbage in HEAD is CorruptObject
TEST(RepositoryStateTest, CorruptHead) {
    MemoryStorage storage;
    storage.poke("HEAD", "ref: refs/heads/main\n");
    auto state = RepositoryState::load(storage);
    ASSERT_FALSE(state.has_value());
    EXPECT_EQ(state.error().code, ErrorCode::CorruptObject);
}
