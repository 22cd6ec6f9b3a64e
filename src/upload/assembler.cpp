#include "chunkyard/upload/assembler.h"

#include <array>
#include <fstream>
#include <system_error>

#include <Poco/DigestEngine.h>
#include <Poco/SHA2Engine.h>

#include "chunkyard/core/logger.h"

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace chunkyard::upload {

namespace {

constexpr std::size_t kBufferSize = 8192;

core::Error AbortAssembly(const std::filesystem::path& temp_path, const std::string& message) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    return core::Error{core::ErrorCode::kIoError, message};
}

bool SyncFile(const std::filesystem::path& path) {
#ifdef _WIN32
    (void)path;
    return true;
#else
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return false;
    }
    const bool synced = ::fsync(fd) == 0;
    ::close(fd);
    return synced;
#endif
}

}  // namespace

core::Result<AssembledArtifact> Assembler::Assemble(const std::string& upload_id,
                                                    int total) const {
    const auto final_path = store_.FinalPath(upload_id);
    if (storage::ChunkStore::Exists(final_path)) {
        return core::Error{core::ErrorCode::kAlreadyExists, "Upload already exists"};
    }

    const auto temp_path = storage::TempPathFor(store_.StagingDir(upload_id) / upload_id);
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return core::Error{core::ErrorCode::kIoError, "failed to open assembly file"};
    }

    Poco::SHA2Engine256 sha256;
    std::uint64_t total_size = 0;
    std::array<char, kBufferSize> buffer{};
    for (int part = 1; part <= total; ++part) {
        std::ifstream in(store_.ChunkPath(upload_id, part, total), std::ios::binary);
        if (!in.is_open()) {
            out.close();
            return AbortAssembly(temp_path, "failed to read chunk " + std::to_string(part));
        }
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const auto bytes = in.gcount();
            if (bytes <= 0) {
                break;
            }
            out.write(buffer.data(), bytes);
            sha256.update(buffer.data(), static_cast<unsigned int>(bytes));
            total_size += static_cast<std::uint64_t>(bytes);
        }
        if (in.bad() || !out) {
            out.close();
            return AbortAssembly(temp_path, "failed to copy chunk " + std::to_string(part));
        }
    }
    out.flush();
    out.close();
    if (!out || !SyncFile(temp_path)) {
        return AbortAssembly(temp_path, "failed to flush assembly file");
    }

    auto published = storage::PublishFile(temp_path, final_path, false);
    if (!published.ok()) {
        return published.error();
    }
    if (!published.value()) {
        return core::Error{core::ErrorCode::kAlreadyExists, "Upload already exists"};
    }

    auto removed = store_.RemoveStaging(upload_id);
    if (!removed.ok()) {
        // The artifact is complete; leftover chunks are reclaimed by the reaper.
        core::LogWarning("assembled " + upload_id + " but " + removed.error().message);
    }

    AssembledArtifact artifact;
    artifact.path = final_path;
    artifact.size_bytes = total_size;
    artifact.parts = total;
    artifact.sha256 = Poco::DigestEngine::digestToHex(sha256.digest());
    return artifact;
}

}  // namespace chunkyard::upload
