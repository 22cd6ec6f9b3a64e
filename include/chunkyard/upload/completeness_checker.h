#pragma once

#include <optional>
#include <vector>

#include "chunkyard/core/result.h"
#include "chunkyard/storage/chunk_store.h"

namespace chunkyard::upload {

/// @brief Outcome of inspecting a staging area against a declared part count.
struct Completeness {
    std::optional<int> first_missing;
    /// Totals declared by stored chunks that disagree with the expected total.
    std::vector<int> conflicting_totals;

    bool complete() const { return !first_missing && conflicting_totals.empty(); }
};

class CompletenessChecker {
public:
    explicit CompletenessChecker(const storage::ChunkStore& store) : store_(store) {}

    core::Result<Completeness> Inspect(const std::string& upload_id, int total) const;

private:
    const storage::ChunkStore& store_;
};

}  // namespace chunkyard::upload
