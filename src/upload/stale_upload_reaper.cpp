#include "chunkyard/upload/stale_upload_reaper.h"

#include <system_error>
#include <utility>
#include <vector>

#include "chunkyard/core/logger.h"
#include "chunkyard/storage/chunk_store.h"

namespace chunkyard::upload {

StaleUploadReaper::StaleUploadReaper(std::filesystem::path staging_root,
                                     std::chrono::seconds max_age)
    : staging_root_(std::move(staging_root)), max_age_(max_age) {}

ReapStats StaleUploadReaper::Reap() const {
    ReapStats stats;
    std::error_code ec;
    std::filesystem::directory_iterator it(staging_root_, ec);
    if (ec) {
        if (ec != std::errc::no_such_file_or_directory) {
            core::LogError("reaper cannot list " + staging_root_.string() + ": " + ec.message());
        }
        return stats;
    }

    // Collect first so removals do not disturb the directory iteration.
    std::vector<std::filesystem::path> expired;
    const auto now = std::filesystem::file_time_type::clock::now();
    const std::filesystem::directory_iterator end;
    while (it != end) {
        ++stats.scanned;
        std::error_code entry_ec;
        const auto modified = std::filesystem::last_write_time(it->path(), entry_ec);
        if (!entry_ec && now - modified > max_age_) {
            expired.push_back(it->path());
        }
        it.increment(ec);
        if (ec) {
            core::LogError("reaper listing interrupted: " + ec.message());
            break;
        }
    }

    for (const auto& path : expired) {
        std::error_code remove_ec;
        std::filesystem::remove_all(path, remove_ec);
        if (remove_ec) {
            ++stats.failed;
            core::LogError("failed to reap " + path.string() + ": " + remove_ec.message());
            continue;
        }
        ++stats.removed;
        auto name = path.filename().string();
        const std::string prefix = storage::ChunkStore::kStagingPrefix;
        const bool staging = name.compare(0, prefix.size(), prefix) == 0;
        core::LogUploadEvent("reaped", staging ? name.substr(prefix.size()) : name,
                             staging ? "staging" : "artifact");
    }
    return stats;
}

}  // namespace chunkyard::upload
