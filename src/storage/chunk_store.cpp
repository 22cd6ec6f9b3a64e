#include "chunkyard/storage/chunk_store.h"

#include <cctype>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <system_error>

#include <Poco/UUIDGenerator.h>

#include "chunkyard/core/ids.h"

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace chunkyard::storage {

namespace {

core::Error IoError(const std::string& what, const std::filesystem::path& path) {
    return core::Error{core::ErrorCode::kIoError, what + ": " + path.string()};
}

bool ParseDecimal(const std::string& text, int* out) {
    if (text.empty() || text.size() > 9 || text[0] == '0') {
        return false;
    }
    int value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    *out = value;
    return true;
}

}  // namespace

std::filesystem::path TempPathFor(const std::filesystem::path& target) {
    return target.parent_path() / ("." + target.filename().string() + "." +
                                   Poco::UUIDGenerator().createOne().toString() + ".partial");
}

core::Result<bool> PublishFile(const std::filesystem::path& temp,
                               const std::filesystem::path& target, bool replace) {
#ifdef _WIN32
    std::error_code ec;
    if (!replace && std::filesystem::exists(target, ec)) {
        std::filesystem::remove(temp, ec);
        return false;
    }
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return IoError("failed to publish file", target);
    }
    return true;
#else
    if (replace) {
        if (::rename(temp.c_str(), target.c_str()) != 0) {
            ::unlink(temp.c_str());
            return IoError("failed to publish file", target);
        }
        return true;
    }

    // link() refuses to clobber, so racing writers of the same name keep the first copy.
    const int linked = ::link(temp.c_str(), target.c_str());
    const int link_errno = errno;
    ::unlink(temp.c_str());
    if (linked != 0) {
        if (link_errno == EEXIST) {
            return false;
        }
        return IoError("failed to publish file", target);
    }
    return true;
#endif
}

core::Result<bool> WriteFileAtomically(const std::filesystem::path& target, std::string_view data,
                                       bool replace) {
    const auto temp_path = TempPathFor(target);

#ifdef _WIN32
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return IoError("failed to open temp file", temp_path);
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    out.flush();
    out.close();
    if (!out) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return IoError("failed to write temp file", temp_path);
    }
#else
    const int fd = ::open(temp_path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        return IoError("failed to open temp file", temp_path);
    }
    std::size_t offset = 0;
    while (offset < data.size()) {
        const ssize_t written = ::write(fd, data.data() + offset, data.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::close(fd);
            ::unlink(temp_path.c_str());
            return IoError("failed to write temp file", temp_path);
        }
        offset += static_cast<std::size_t>(written);
    }
    if (::fsync(fd) != 0) {
        ::close(fd);
        ::unlink(temp_path.c_str());
        return IoError("failed to sync temp file", temp_path);
    }
    ::close(fd);
#endif
    return PublishFile(temp_path, target, replace);
}

ChunkStore::ChunkStore(std::string root) : root_(std::move(root)) {}

core::Result<void> ChunkStore::EnsureRoot() const {
    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        return IoError("failed to create staging root", root_);
    }
    return core::Ok();
}

core::Result<bool> ChunkStore::Put(const std::string& upload_id, int part, int total,
                                   std::string_view payload) const {
    if (!IsValidUploadId(upload_id)) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid upload id"};
    }
    if (part < 1 || total < 1 || part > total) {
        return core::Error{core::ErrorCode::kInvalidArgument, "invalid part number"};
    }

    const auto chunk_path = ChunkPath(upload_id, part, total);
    if (Exists(chunk_path)) {
        return false;
    }

    std::error_code ec;
    std::filesystem::create_directories(chunk_path.parent_path(), ec);
    if (ec) {
        return IoError("failed to create staging directory", chunk_path.parent_path());
    }
    return WriteFileAtomically(chunk_path, payload, false);
}

core::Result<std::vector<ChunkKey>> ChunkStore::ListChunks(const std::string& upload_id) const {
    std::vector<ChunkKey> chunks;
    const auto dir = StagingDir(upload_id);
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return chunks;
        }
        return IoError("failed to list staging directory", dir);
    }
    for (const auto& entry : it) {
        auto key = ParseChunkFileName(entry.path().filename().string());
        if (key) {
            chunks.push_back(*key);
        }
    }
    return chunks;
}

core::Result<void> ChunkStore::WriteErrorMarker(const std::string& upload_id,
                                                const std::string& reason) const {
    const auto dir = StagingDir(upload_id);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return IoError("failed to create staging directory", dir);
    }
    auto written = WriteFileAtomically(dir / kErrorMarkerName, reason, true);
    if (!written.ok()) {
        return written.error();
    }
    return core::Ok();
}

std::optional<std::string> ChunkStore::ReadErrorMarker(const std::string& upload_id) const {
    std::ifstream in(StagingDir(upload_id) / kErrorMarkerName, std::ios::binary);
    if (!in.is_open()) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

core::Result<void> ChunkStore::RemoveStaging(const std::string& upload_id) const {
    const auto dir = StagingDir(upload_id);
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        return IoError("failed to remove staging directory", dir);
    }
    return core::Ok();
}

bool ChunkStore::HasStaging(const std::string& upload_id) const {
    std::error_code ec;
    return std::filesystem::is_directory(StagingDir(upload_id), ec);
}

bool ChunkStore::HasFinalArtifact(const std::string& upload_id) const {
    return Exists(FinalPath(upload_id));
}

std::filesystem::path ChunkStore::StagingDir(const std::string& upload_id) const {
    return root_ / (std::string(kStagingPrefix) + upload_id);
}

std::filesystem::path ChunkStore::FinalPath(const std::string& upload_id) const {
    return root_ / upload_id;
}

std::filesystem::path ChunkStore::ChunkPath(const std::string& upload_id, int part,
                                            int total) const {
    return StagingDir(upload_id) / ChunkFileName(part, total);
}

bool ChunkStore::Exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

bool ChunkStore::IsValidUploadId(const std::string& upload_id) {
    return core::IsCanonicalUuid(upload_id);
}

std::string ChunkStore::ChunkFileName(int part, int total) {
    return std::to_string(part) + "-" + std::to_string(total);
}

std::optional<ChunkKey> ChunkStore::ParseChunkFileName(const std::string& name) {
    const auto dash = name.find('-');
    if (dash == std::string::npos) {
        return std::nullopt;
    }
    ChunkKey key;
    if (!ParseDecimal(name.substr(0, dash), &key.part) ||
        !ParseDecimal(name.substr(dash + 1), &key.total)) {
        return std::nullopt;
    }
    return key;
}

}  // namespace chunkyard::storage
