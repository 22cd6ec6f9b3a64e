#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "chunkyard/upload/stale_upload_reaper.h"

namespace {

std::filesystem::path MakeTempRoot() {
    const auto name = "chunkyard_reap_" + Poco::UUIDGenerator().createOne().toString();
    auto root = std::filesystem::temp_directory_path() / name;
    std::filesystem::create_directories(root);
    return root;
}

void Age(const std::filesystem::path& path, std::chrono::minutes by) {
    std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - by);
}

}  // namespace

TEST(StaleUploadReaper, RemovesOnlyEntriesOlderThanMaxAge) {
    const auto root = MakeTempRoot();
    const auto stale_dir = root / "chunks_stale";
    const auto fresh_dir = root / "chunks_fresh";
    const auto stale_artifact = root / "old-artifact";
    std::filesystem::create_directories(stale_dir);
    std::filesystem::create_directories(fresh_dir);
    std::ofstream(stale_dir / "1-2") << "a";
    std::ofstream(fresh_dir / "1-2") << "a";
    std::ofstream(stale_artifact) << "done";
    Age(stale_dir, std::chrono::minutes(120));
    Age(stale_artifact, std::chrono::minutes(120));
    Age(fresh_dir, std::chrono::minutes(10));

    chunkyard::upload::StaleUploadReaper reaper(root, std::chrono::minutes(90));
    const auto stats = reaper.Reap();

    EXPECT_EQ(stats.scanned, 3u);
    EXPECT_EQ(stats.removed, 2u);
    EXPECT_EQ(stats.failed, 0u);
    EXPECT_FALSE(std::filesystem::exists(stale_dir));
    EXPECT_FALSE(std::filesystem::exists(stale_artifact));
    EXPECT_TRUE(std::filesystem::exists(fresh_dir / "1-2"));

    std::filesystem::remove_all(root);
}

TEST(StaleUploadReaper, MissingRootIsNotAnError) {
    const auto root = MakeTempRoot();
    std::filesystem::remove_all(root);

    chunkyard::upload::StaleUploadReaper reaper(root, std::chrono::seconds(1));
    const auto stats = reaper.Reap();
    EXPECT_EQ(stats.scanned, 0u);
    EXPECT_EQ(stats.removed, 0u);
}
