#include "chunkyard/upload/completeness_checker.h"

#include <set>

namespace chunkyard::upload {

core::Result<Completeness> CompletenessChecker::Inspect(const std::string& upload_id,
                                                        int total) const {
    auto listed = store_.ListChunks(upload_id);
    if (!listed.ok()) {
        return listed.error();
    }

    std::set<int> present;
    std::set<int> other_totals;
    for (const auto& key : listed.value()) {
        if (key.total == total) {
            present.insert(key.part);
        } else {
            other_totals.insert(key.total);
        }
    }

    Completeness result;
    for (int part = 1; part <= total; ++part) {
        if (present.count(part) == 0) {
            result.first_missing = part;
            break;
        }
    }
    result.conflicting_totals.assign(other_totals.begin(), other_totals.end());
    return result;
}

}  // namespace chunkyard::upload
