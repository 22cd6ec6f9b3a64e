#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkyard::upload {

/// @brief Mutual exclusion keyed by upload identifier.
///
/// Entries are reference counted and erased when the last holder releases, so the table
/// only ever holds identifiers with an in-flight submission.
class UploadLockTable {
    struct Entry {
        std::mutex mutex;
        int holders{0};
    };

public:
    /// @brief Holds the lock for one identifier until destroyed.
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

    private:
        friend class UploadLockTable;
        Guard(UploadLockTable* table, std::string upload_id, std::shared_ptr<Entry> entry);

        UploadLockTable* table_{nullptr};
        std::string upload_id_;
        std::shared_ptr<Entry> entry_;
    };

    Guard Acquire(const std::string& upload_id);
    std::size_t size() const;

private:
    void Release(const std::string& upload_id, const std::shared_ptr<Entry>& entry);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

}  // namespace chunkyard::upload
