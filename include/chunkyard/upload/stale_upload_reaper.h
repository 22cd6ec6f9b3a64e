#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace chunkyard::upload {

struct ReapStats {
    std::size_t scanned{0};
    std::size_t removed{0};
    std::size_t failed{0};
};

/// @brief Removes staging areas and artifacts whose modification time is older than the
/// configured maximum age. Runs inline with request handling; there is no sweep thread.
class StaleUploadReaper {
public:
    StaleUploadReaper(std::filesystem::path staging_root, std::chrono::seconds max_age);

    ReapStats Reap() const;

    std::chrono::seconds max_age() const { return max_age_; }

private:
    std::filesystem::path staging_root_;
    std::chrono::seconds max_age_;
};

}  // namespace chunkyard::upload
