#include "chunkyard/upload/upload_lock_table.h"

#include <utility>

namespace chunkyard::upload {

UploadLockTable::Guard::Guard(UploadLockTable* table, std::string upload_id,
                              std::shared_ptr<Entry> entry)
    : table_(table), upload_id_(std::move(upload_id)), entry_(std::move(entry)) {}

UploadLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_),
      upload_id_(std::move(other.upload_id_)),
      entry_(std::move(other.entry_)) {
    other.table_ = nullptr;
}

UploadLockTable::Guard::~Guard() {
    if (table_ && entry_) {
        table_->Release(upload_id_, entry_);
    }
}

UploadLockTable::Guard UploadLockTable::Acquire(const std::string& upload_id) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& slot = entries_[upload_id];
        if (!slot) {
            slot = std::make_shared<Entry>();
        }
        ++slot->holders;
        entry = slot;
    }
    // Block outside the table lock so other identifiers are never serialized behind us.
    entry->mutex.lock();
    return Guard(this, upload_id, std::move(entry));
}

std::size_t UploadLockTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void UploadLockTable::Release(const std::string& upload_id, const std::shared_ptr<Entry>& entry) {
    entry->mutex.unlock();
    std::lock_guard<std::mutex> lock(mutex_);
    if (--entry->holders == 0) {
        entries_.erase(upload_id);
    }
}

}  // namespace chunkyard::upload
