#include "test_utils.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace rit::test::utils {

fs::path createTempDir() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::string dirname = "rit_test_";
    for (int i = 0; i < 8; ++i) {
        dirname += "0123456789abcdef"[dis(gen)];
    }

    fs::path tempDir = fs::temp_directory_path() / dirname;
    fs::create_directories(tempDir);
    return tempDir;
}

void removeDir(const fs::path& dir) {
    if (fs::exists(dir)) {
        fs::remove_all(dir);
    }
}

fs::path createFile(
    const fs::path& baseDir,
    const std::string& filename,
    const std::string& content
) {
    fs::path filePath = baseDir / filename;

    // Create parent directories if needed
    fs::create_directories(filePath.parent_path());

    std::ofstream file(filePath, std::ios::binary | std::ios::trunc);
    file << content;
    file.close();

    return filePath;
}

std::string readFile(const fs::path& filePath) {
    std::ifstream file(filePath, std::ios::binary);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

fs::path initTestRepo(const fs::path& repoPath) {
    fs::path ritDir = repoPath / ".rit";
    fs::create_directories(ritDir / "objects");

    std::ofstream headFile(ritDir / "HEAD", std::ios::binary);
    headFile.close();

    std::ofstream indexFile(ritDir / "index", std::ios::binary);
    indexFile << "rit-index 1\nbase\n";
    indexFile.close();

    return repoPath;
}

std::string readHead(const fs::path& repoPath) {
    std::string head = readFile(repoPath / ".rit" / "HEAD");
    while (!head.empty() && (head.back() == '\n' || head.back() == '\r')) head.pop_back();
    return head;
}

std::string nextTestTimestamp() {
    static int counter = 0;
    int s = counter++;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "2024-01-01T00:%02d:%02d.000Z", (s / 60) % 60, s % 60);
    return buf;
}

fs::path getCwd() {
    return fs::current_path();
}

void setCwd(const fs::path& dir) {
    fs::current_path(dir);
}

} // namespace rit::test::utils
