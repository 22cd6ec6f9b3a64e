#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "chunkyard/core/result.h"
#include "chunkyard/storage/chunk_store.h"

namespace chunkyard::upload {

/// @brief The reassembled file produced from a complete staging area.
struct AssembledArtifact {
    std::filesystem::path path;
    std::uint64_t size_bytes{0};
    int parts{0};
    std::string sha256;
};

/// @brief Concatenates chunks 1..total in part order into the final artifact.
///
/// Bytes go to a hidden temp file inside the staging area that is synced and then linked
/// to the final path, so readers see either a complete artifact or none. The staging area
/// is removed only after the artifact is published; on failure it is left untouched and
/// the submission can be retried.
class Assembler {
public:
    explicit Assembler(const storage::ChunkStore& store) : store_(store) {}

    core::Result<AssembledArtifact> Assemble(const std::string& upload_id, int total) const;

private:
    const storage::ChunkStore& store_;
};

}  // namespace chunkyard::upload
