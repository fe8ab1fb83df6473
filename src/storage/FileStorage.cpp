#include "storage/FileStorage.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace rit {

namespace {

// Regular file at p, or IoError when p cannot be examined
Expected<bool> isRecordFile(const fs::path& p) {
    std::error_code ec;
    fs::file_status st = fs::status(p, ec);
    if (st.type() == fs::file_type::not_found) {
        return false;
    }
    if (ec) {
        return Error{ErrorCode::IoError, "Cannot stat " + p.string() + ": " + ec.message()};
    }
    return fs::is_regular_file(st);
}

}

FileStorage::FileStorage(fs::path dir) : baseDir(std::move(dir)) {}

fs::path FileStorage::pathOf(const std::string& key) const {
    return baseDir / fs::path(key).lexically_normal();
}

Expected<std::string> FileStorage::read(const std::string& key) const {
    fs::path p = pathOf(key);
    auto present = isRecordFile(p);
    if (!present) {
        return present.error();
    }
    if (!present.value()) {
        return Error{ErrorCode::NotFound, "No such record: " + key};
    }

    std::ifstream in(p, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::IoError, "Failed to open for reading: " + p.string()};
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Error{ErrorCode::IoError, "Error reading: " + p.string()};
    }
    return bytes;
}

Expected<void> FileStorage::write(const std::string& key, const std::string& bytes) {
    fs::path target = pathOf(key);
    fs::path temp = target.string() + ".tmp";

    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return Error{ErrorCode::IoError, "Failed to create directory: " + ec.message()};
    }

    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IoError, "Failed to open for writing: " + temp.string()};
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out || !out.good()) {
        out.close();
        fs::remove(temp, ec);
        return Error{ErrorCode::IoError, "Failed to write: " + target.string()};
    }
    out.close();

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return Error{ErrorCode::IoError, "Failed to replace " + target.string() + ": " + ec.message()};
    }
    return {};
}

Expected<bool> FileStorage::exists(const std::string& key) const {
    return isRecordFile(pathOf(key));
}

}
