#include <gtest/gtest.h>
#include <filesystem>
#include "test_utils.hpp"
#include "core/Repository.hpp"
#include "core/Workspace.hpp"

namespace fs = std::filesystem;

using namespace rit;
using namespace rit::test::utils;

class RepositoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        originalCwd = getCwd();
        setCwd(tempDir);
    }

    void TearDown() override {
        setCwd(originalCwd);
        removeDir(tempDir);
    }

    fs::path tempDir;
    fs::path originalCwd;
};

// Test: Discover repository root in current directory
TEST_F(RepositoryTest, DiscoverRootCurrentDirectory) {
    initTestRepo(tempDir);

    auto result = Repository::instance().discoverRoot(tempDir);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value(), tempDir);
}

// Test: Discover repository root from a nested subdirectory
TEST_F(RepositoryTest, DiscoverRootFromSubdirectory) {
    initTestRepo(tempDir);
    fs::path subdir = tempDir / "src" / "util" / "deep";
    fs::create_directories(subdir);

    auto result = Repository::instance().discoverRoot(subdir);
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value(), tempDir);
}

// Test: Discover fails when not in repository
TEST_F(RepositoryTest, DiscoverFailsNotInRepository) {
    auto result = Repository::instance().discoverRoot(tempDir);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::NotARepository);
}

// Test: A plain file named .rit is not a repository
TEST_F(RepositoryTest, DiscoverIgnoresRitFile) {
    createFile(tempDir, ".rit", "not a directory");
    auto result = Repository::instance().discoverRoot(tempDir);
    EXPECT_FALSE(result.has_value());
}

// Test: init creates the repository layout
TEST_F(RepositoryTest, InitCreatesLayout) {
    auto result = Repository::instance().init(tempDir);
    ASSERT_TRUE(result.has_value()) << result.error().message;

    fs::path rd = tempDir / ".rit";
    EXPECT_TRUE(fs::is_directory(rd / "objects"));
    EXPECT_TRUE(fs::is_regular_file(rd / "HEAD"));
    EXPECT_TRUE(fs::is_regular_file(rd / "index"));
    EXPECT_EQ(readFile(rd / "HEAD"), "");
    EXPECT_EQ(readFile(rd / "index"), "rit-index 1\nbase\n");
    EXPECT_TRUE(fs::is_empty(rd / "objects"));
}

// Test: Second init reports AlreadyInitialized and keeps existing data
TEST_F(RepositoryTest, InitTwiceKeepsData) {
    ASSERT_TRUE(Repository::instance().init(tempDir).has_value());

    auto files = Repository::storage(tempDir);
    Workspace ws(files, nextTestTimestamp);
    ASSERT_TRUE(ws.add("a.txt", "hello\n").has_value());
    auto commit = ws.commit("first");
    ASSERT_TRUE(commit.has_value()) << commit.error().message;
    ASSERT_TRUE(ws.add("b.txt", "staged\n").has_value());
    const std::string indexBefore = readFile(tempDir / ".rit" / "index");

    auto again = Repository::instance().init(tempDir);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::AlreadyInitialized);
    EXPECT_EQ(readHead(tempDir), commit.value());
    EXPECT_EQ(readFile(tempDir / ".rit" / "index"), indexBefore);
    EXPECT_TRUE(fs::exists(tempDir / ".rit" / "objects" / commit.value()));
}

// Test: init fills in pieces missing from a partial .rit
TEST_F(RepositoryTest, InitRepairsMissingFiles) {
    fs::create_directories(tempDir / ".rit");

    auto result = Repository::instance().init(tempDir);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::AlreadyInitialized);
    EXPECT_TRUE(fs::is_directory(tempDir / ".rit" / "objects"));
    EXPECT_TRUE(fs::exists(tempDir / ".rit" / "HEAD"));
    EXPECT_TRUE(fs::exists(tempDir / ".rit" / "index"));
}

// Test: init refuses when .rit is a regular file
TEST_F(RepositoryTest, InitFailsOnRitFile) {
    createFile(tempDir, ".rit", "x");
    auto result = Repository::instance().init(tempDir);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::IoError);
}

// Test: Repository is a singleton
TEST_F(RepositoryTest, SingletonInstance) {
    Repository& a = Repository::instance();
    Repository& b = Repository::instance();
    EXPECT_EQ(&a, &b);
}

// Test: Storage over .rit sees the files written by init
TEST_F(RepositoryTest, StorageRootedAtRitDir) {
    ASSERT_TRUE(Repository::instance().init(tempDir).has_value());
    EXPECT_EQ(Repository::ritDir(tempDir), tempDir / ".rit");

    auto files = Repository::storage(tempDir);
    EXPECT_TRUE(files.exists("HEAD").value());
    EXPECT_TRUE(files.exists("index").value());
    EXPECT_FALSE(files.exists("objects/0123456789abcdef0123456789abcdef01234567").value());
}
