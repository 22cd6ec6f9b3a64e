#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "chunkyard/storage/chunk_store.h"

namespace {

std::filesystem::path MakeTempRoot() {
    const auto name = "chunkyard_store_" + Poco::UUIDGenerator().createOne().toString();
    return std::filesystem::temp_directory_path() / name;
}

std::string NewUploadId() {
    return Poco::UUIDGenerator().createRandom().toString();
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}  // namespace

TEST(ChunkStore, PutWritesChunkUnderStagingDirectory) {
    const auto root = MakeTempRoot();
    chunkyard::storage::ChunkStore store(root.string());
    const auto id = NewUploadId();

    auto put = store.Put(id, 2, 3, "bbb");
    ASSERT_TRUE(put.ok());
    EXPECT_TRUE(put.value());

    const auto expected = root / ("chunks_" + id) / "2-3";
    EXPECT_EQ(store.ChunkPath(id, 2, 3), expected);
    EXPECT_EQ(ReadFile(expected), "bbb");
    EXPECT_EQ(store.FinalPath(id), root / id);

    std::filesystem::remove_all(root);
}

TEST(ChunkStore, DuplicatePutKeepsFirstBytes) {
    const auto root = MakeTempRoot();
    chunkyard::storage::ChunkStore store(root.string());
    const auto id = NewUploadId();

    ASSERT_TRUE(store.Put(id, 1, 2, "first").ok());
    auto again = store.Put(id, 1, 2, "second");
    ASSERT_TRUE(again.ok());
    EXPECT_FALSE(again.value());
    EXPECT_EQ(ReadFile(store.ChunkPath(id, 1, 2)), "first");

    std::filesystem::remove_all(root);
}

TEST(ChunkStore, RejectsNonUuidIdentifiers) {
    const auto root = MakeTempRoot();
    chunkyard::storage::ChunkStore store(root.string());

    EXPECT_FALSE(chunkyard::storage::ChunkStore::IsValidUploadId("../etc"));
    EXPECT_FALSE(chunkyard::storage::ChunkStore::IsValidUploadId(
        "0123456789abcdef0123456789abcdef"));
    EXPECT_TRUE(chunkyard::storage::ChunkStore::IsValidUploadId(NewUploadId()));

    auto put = store.Put("../escape", 1, 1, "x");
    ASSERT_FALSE(put.ok());
    EXPECT_EQ(put.error().code, chunkyard::core::ErrorCode::kInvalidArgument);
    EXPECT_FALSE(std::filesystem::exists(root));
}

TEST(ChunkStore, ParsesChunkFileNamesStrictly) {
    using chunkyard::storage::ChunkStore;
    auto key = ChunkStore::ParseChunkFileName("12-40");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->part, 12);
    EXPECT_EQ(key->total, 40);

    EXPECT_FALSE(ChunkStore::ParseChunkFileName("error.txt").has_value());
    EXPECT_FALSE(ChunkStore::ParseChunkFileName("01-3").has_value());
    EXPECT_FALSE(ChunkStore::ParseChunkFileName("1-").has_value());
    EXPECT_FALSE(ChunkStore::ParseChunkFileName("1-3-4").has_value());
    EXPECT_FALSE(ChunkStore::ParseChunkFileName(".1-3.abc.partial").has_value());
}

TEST(ChunkStore, ListChunksSkipsMarkerAndTempFiles) {
    const auto root = MakeTempRoot();
    chunkyard::storage::ChunkStore store(root.string());
    const auto id = NewUploadId();

    ASSERT_TRUE(store.Put(id, 1, 2, "a").ok());
    ASSERT_TRUE(store.WriteErrorMarker(id, "Missing chunk 2, upload failed").ok());
    std::ofstream(store.StagingDir(id) / ".2-2.tmp.partial") << "half";

    auto listed = store.ListChunks(id);
    ASSERT_TRUE(listed.ok());
    ASSERT_EQ(listed.value().size(), 1u);
    EXPECT_EQ(listed.value()[0], (chunkyard::storage::ChunkKey{1, 2}));

    auto missing = store.ListChunks(NewUploadId());
    ASSERT_TRUE(missing.ok());
    EXPECT_TRUE(missing.value().empty());

    std::filesystem::remove_all(root);
}

TEST(ChunkStore, ErrorMarkerIsReplaced) {
    const auto root = MakeTempRoot();
    chunkyard::storage::ChunkStore store(root.string());
    const auto id = NewUploadId();

    EXPECT_FALSE(store.ReadErrorMarker(id).has_value());
    ASSERT_TRUE(store.WriteErrorMarker(id, "Directory size exceeded").ok());
    ASSERT_TRUE(store.WriteErrorMarker(id, "Missing chunk 1, upload failed").ok());

    auto marker = store.ReadErrorMarker(id);
    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(*marker, "Missing chunk 1, upload failed");

    ASSERT_TRUE(store.RemoveStaging(id).ok());
    EXPECT_FALSE(store.HasStaging(id));
    EXPECT_FALSE(store.ReadErrorMarker(id).has_value());

    std::filesystem::remove_all(root);
}

TEST(ChunkStore, PublishWithoutReplaceKeepsExistingTarget) {
    const auto root = MakeTempRoot();
    std::filesystem::create_directories(root);
    const auto target = root / "artifact";
    std::ofstream(target) << "original";

    auto written = chunkyard::storage::WriteFileAtomically(target, "intruder", false);
    ASSERT_TRUE(written.ok());
    EXPECT_FALSE(written.value());
    EXPECT_EQ(ReadFile(target), "original");

    auto replaced = chunkyard::storage::WriteFileAtomically(target, "updated", true);
    ASSERT_TRUE(replaced.ok());
    EXPECT_TRUE(replaced.value());
    EXPECT_EQ(ReadFile(target), "updated");

    // No temp files left behind either way.
    std::size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(root)) {
        (void)entry;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);

    std::filesystem::remove_all(root);
}
