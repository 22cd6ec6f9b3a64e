#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "chunkyard/upload/quota_guard.h"

namespace {

std::filesystem::path MakeTempRoot() {
    const auto name = "chunkyard_quota_" + Poco::UUIDGenerator().createOne().toString();
    auto root = std::filesystem::temp_directory_path() / name;
    std::filesystem::create_directories(root);
    return root;
}

void WriteBytes(const std::filesystem::path& path, std::size_t count) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << std::string(count, 'x');
}

chunkyard::upload::ChunkSubmission MakeSubmission(std::uint64_t declared, std::size_t actual) {
    chunkyard::upload::ChunkSubmission submission;
    submission.info.upload_id = Poco::UUIDGenerator().createRandom().toString();
    submission.info.upload_size = declared;
    submission.info.part = 1;
    submission.info.total = 1;
    submission.payload = std::string(actual, 'p');
    submission.has_payload = true;
    return submission;
}

}  // namespace

TEST(QuotaGuard, DirectorySizeIsRecursive) {
    const auto root = MakeTempRoot();
    WriteBytes(root / "chunks_a" / "1-2", 100);
    WriteBytes(root / "chunks_a" / "2-2", 50);
    WriteBytes(root / "artifact", 25);

    EXPECT_EQ(chunkyard::upload::DirectorySize(root), 175u);
    EXPECT_EQ(chunkyard::upload::DirectorySize(root / "missing"), 0u);

    std::filesystem::remove_all(root);
}

TEST(QuotaGuard, AdmitsWithinLimits) {
    const auto root = MakeTempRoot();
    chunkyard::upload::QuotaGuard guard(root, {1000, 5000});

    EXPECT_TRUE(guard.Admit(MakeSubmission(300, 100)).ok());

    std::filesystem::remove_all(root);
}

TEST(QuotaGuard, PredicateIsCheckedFirst) {
    const auto root = MakeTempRoot();
    chunkyard::upload::QuotaGuard guard(
        root, {10, 10}, [](const chunkyard::upload::ChunkSubmission&) { return false; });

    // Also over every size limit; the predicate still wins.
    auto admitted = guard.Admit(MakeSubmission(500, 500));
    ASSERT_FALSE(admitted.ok());
    EXPECT_EQ(admitted.error().code, chunkyard::core::ErrorCode::kForbidden);
    EXPECT_EQ(admitted.error().message, "File not allowed");

    std::filesystem::remove_all(root);
}

TEST(QuotaGuard, ThrowingPredicateRejects) {
    const auto root = MakeTempRoot();
    chunkyard::upload::QuotaGuard guard(root, {1000, 1000},
                                        [](const chunkyard::upload::ChunkSubmission&) -> bool {
                                            throw std::runtime_error("policy unavailable");
                                        });

    auto admitted = guard.Admit(MakeSubmission(10, 10));
    ASSERT_FALSE(admitted.ok());
    EXPECT_EQ(admitted.error().message, "File not allowed");

    std::filesystem::remove_all(root);
}

TEST(QuotaGuard, DeclaredSizeOverUploadLimit) {
    const auto root = MakeTempRoot();
    chunkyard::upload::QuotaGuard guard(root, {1000, 100});

    auto admitted = guard.Admit(MakeSubmission(1001, 1));
    ASSERT_FALSE(admitted.ok());
    EXPECT_EQ(admitted.error().code, chunkyard::core::ErrorCode::kFileTooLarge);
    EXPECT_EQ(admitted.error().message, "File size exceeded");

    std::filesystem::remove_all(root);
}

TEST(QuotaGuard, DirectoryLimitUsesLargerOfDeclaredAndActual) {
    const auto root = MakeTempRoot();
    WriteBytes(root / "chunks_other" / "1-1", 900);
    chunkyard::upload::QuotaGuard guard(root, {10000, 1000});

    // Under-declared payload: 900 + max(10, 200) > 1000.
    auto admitted = guard.Admit(MakeSubmission(10, 200));
    ASSERT_FALSE(admitted.ok());
    EXPECT_EQ(admitted.error().code, chunkyard::core::ErrorCode::kQuotaExceeded);
    EXPECT_EQ(admitted.error().message, "Directory size exceeded");

    // Exactly at the limit is still admitted.
    EXPECT_TRUE(guard.Admit(MakeSubmission(100, 100)).ok());

    std::filesystem::remove_all(root);
}

TEST(QuotaGuard, AggregatePlusDeclaredOverUploadLimit) {
    const auto root = MakeTempRoot();
    WriteBytes(root / "chunks_other" / "1-1", 800);
    chunkyard::upload::QuotaGuard guard(root, {1000, 100000});

    auto admitted = guard.Admit(MakeSubmission(300, 100));
    ASSERT_FALSE(admitted.ok());
    EXPECT_EQ(admitted.error().code, chunkyard::core::ErrorCode::kUploadTooLarge);
    EXPECT_EQ(admitted.error().message, "Upload size exceeded");

    std::filesystem::remove_all(root);
}
