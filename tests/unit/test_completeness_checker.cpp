#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "chunkyard/upload/completeness_checker.h"

namespace {

std::filesystem::path MakeTempRoot() {
    const auto name = "chunkyard_check_" + Poco::UUIDGenerator().createOne().toString();
    return std::filesystem::temp_directory_path() / name;
}

std::string NewUploadId() {
    return Poco::UUIDGenerator().createRandom().toString();
}

}  // namespace

TEST(CompletenessChecker, CompleteWhenEveryPartPresent) {
    const auto root = MakeTempRoot();
    chunkyard::storage::ChunkStore store(root.string());
    chunkyard::upload::CompletenessChecker checker(store);
    const auto id = NewUploadId();

    ASSERT_TRUE(store.Put(id, 3, 3, "c").ok());
    ASSERT_TRUE(store.Put(id, 1, 3, "a").ok());
    ASSERT_TRUE(store.Put(id, 2, 3, "b").ok());
    ASSERT_TRUE(store.WriteErrorMarker(id, "earlier failure").ok());

    auto inspected = checker.Inspect(id, 3);
    ASSERT_TRUE(inspected.ok());
    EXPECT_TRUE(inspected.value().complete());

    std::filesystem::remove_all(root);
}

TEST(CompletenessChecker, ReportsLowestMissingPart) {
    const auto root = MakeTempRoot();
    chunkyard::storage::ChunkStore store(root.string());
    chunkyard::upload::CompletenessChecker checker(store);
    const auto id = NewUploadId();

    ASSERT_TRUE(store.Put(id, 1, 5, "a").ok());
    ASSERT_TRUE(store.Put(id, 3, 5, "c").ok());
    ASSERT_TRUE(store.Put(id, 5, 5, "e").ok());
    std::ofstream(store.StagingDir(id) / ".2-5.x.partial") << "in flight";

    auto inspected = checker.Inspect(id, 5);
    ASSERT_TRUE(inspected.ok());
    ASSERT_TRUE(inspected.value().first_missing.has_value());
    EXPECT_EQ(*inspected.value().first_missing, 2);

    std::filesystem::remove_all(root);
}

TEST(CompletenessChecker, ChunksWithOtherTotalsDoNotCount) {
    const auto root = MakeTempRoot();
    chunkyard::storage::ChunkStore store(root.string());
    chunkyard::upload::CompletenessChecker checker(store);
    const auto id = NewUploadId();

    ASSERT_TRUE(store.Put(id, 1, 4, "a").ok());
    ASSERT_TRUE(store.Put(id, 1, 2, "a").ok());
    ASSERT_TRUE(store.Put(id, 2, 2, "b").ok());

    auto inspected = checker.Inspect(id, 2);
    ASSERT_TRUE(inspected.ok());
    EXPECT_FALSE(inspected.value().first_missing.has_value());
    ASSERT_EQ(inspected.value().conflicting_totals.size(), 1u);
    EXPECT_EQ(inspected.value().conflicting_totals[0], 4);
    EXPECT_FALSE(inspected.value().complete());

    std::filesystem::remove_all(root);
}

TEST(CompletenessChecker, MissingStagingReportsFirstPart) {
    const auto root = MakeTempRoot();
    chunkyard::storage::ChunkStore store(root.string());
    chunkyard::upload::CompletenessChecker checker(store);

    auto inspected = checker.Inspect(NewUploadId(), 2);
    ASSERT_TRUE(inspected.ok());
    ASSERT_TRUE(inspected.value().first_missing.has_value());
    EXPECT_EQ(*inspected.value().first_missing, 1);
}
