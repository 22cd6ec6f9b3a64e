#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chunkyard/core/error.h"
#include "chunkyard/core/result.h"

namespace chunkyard::storage {

/// @brief Position of one chunk within an upload: part index and declared part count.
struct ChunkKey {
    int part{0};
    int total{0};
};

inline bool operator==(const ChunkKey& lhs, const ChunkKey& rhs) {
    return lhs.part == rhs.part && lhs.total == rhs.total;
}

/// @brief Durable staging of upload chunks under a single root directory.
///
/// Layout:
///   <root>/chunks_<upload_id>/<part>-<total>   one file per chunk
///   <root>/chunks_<upload_id>/error.txt        last rejection reason
///   <root>/<upload_id>                         assembled artifact
///
/// Files whose name starts with '.' inside a staging directory are in-progress writes
/// and are never reported as chunks.
class ChunkStore {
public:
    explicit ChunkStore(std::string root);

    /// @brief Create the staging root if it does not exist.
    core::Result<void> EnsureRoot() const;

    /// @brief Persist one chunk. Returns false when the chunk already existed and the
    /// write was skipped; the stored bytes are never overwritten.
    core::Result<bool> Put(const std::string& upload_id, int part, int total,
                           std::string_view payload) const;

    core::Result<std::vector<ChunkKey>> ListChunks(const std::string& upload_id) const;
    core::Result<void> WriteErrorMarker(const std::string& upload_id,
                                        const std::string& reason) const;
    std::optional<std::string> ReadErrorMarker(const std::string& upload_id) const;
    core::Result<void> RemoveStaging(const std::string& upload_id) const;

    bool HasStaging(const std::string& upload_id) const;
    bool HasFinalArtifact(const std::string& upload_id) const;

    std::filesystem::path StagingDir(const std::string& upload_id) const;
    std::filesystem::path FinalPath(const std::string& upload_id) const;
    std::filesystem::path ChunkPath(const std::string& upload_id, int part, int total) const;

    const std::filesystem::path& root() const { return root_; }

    /// @brief True when path names an existing regular file.
    static bool Exists(const std::filesystem::path& path);
    static bool IsValidUploadId(const std::string& upload_id);
    static std::string ChunkFileName(int part, int total);
    static std::optional<ChunkKey> ParseChunkFileName(const std::string& name);
    static constexpr const char* kErrorMarkerName = "error.txt";
    static constexpr const char* kStagingPrefix = "chunks_";

private:
    std::filesystem::path root_;
};

/// @brief Hidden sibling path used while target is being written.
std::filesystem::path TempPathFor(const std::filesystem::path& target);

/// @brief Move a fully written temp file to target. When replace is false an existing
/// target is left untouched, temp is discarded and the result is false.
core::Result<bool> PublishFile(const std::filesystem::path& temp,
                               const std::filesystem::path& target, bool replace);

/// @brief Write data to a hidden temp file next to target, fsync it and publish it.
core::Result<bool> WriteFileAtomically(const std::filesystem::path& target, std::string_view data,
                                       bool replace);

}  // namespace chunkyard::storage
