#include "uplink/snapshot_store.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

using namespace uplink;

namespace {

BatchSnapshot make_snapshot(const std::string &id, std::int64_t timestamp_ms) {
    BatchSnapshot snapshot;
    snapshot.batch_id = id;
    snapshot.timestamp_ms = timestamp_ms;
    snapshot.destination.fields["chapter_id"] = "ch-7";
    snapshot.destination.required_fields = {"chapter_id"};

    FileUploadTask done;
    done.file_name = "a.mp3";
    done.local_path = "/data/a.mp3";
    done.record_id = "rec-1";
    done.file_size_bytes = 100;
    done.uploaded_bytes = 100;
    done.status = UploadStatus::Completed;
    done.remote_object_key = "b/rec-1-a.mp3";

    FileUploadTask failed = done;
    failed.file_name = "b.mp3";
    failed.local_path = "/data/b.mp3";
    failed.record_id = "rec-2";
    failed.uploaded_bytes = 40;
    failed.status = UploadStatus::Failed;
    failed.error = "http_500: Internal error";
    failed.retry_count = 3;

    snapshot.files = {done, failed};
    return snapshot;
}

} // namespace

TEST(SnapshotStoreTest, SavesAndLoadsBatch) {
    fakes::TempDir dir;
    FileSnapshotStore store(dir.path());
    store.save(make_snapshot("batch1", now_ms()));

    auto loaded = store.load("batch1");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->destination.fields.at("chapter_id"), "ch-7");
    ASSERT_EQ(loaded->files.size(), 2u);
    EXPECT_EQ(loaded->files[0].status, UploadStatus::Completed);
    EXPECT_EQ(loaded->files[1].status, UploadStatus::Failed);
    EXPECT_EQ(loaded->files[1].retry_count, 3);
    EXPECT_EQ(loaded->files[1].uploaded_bytes, 40u);
    EXPECT_EQ(loaded->files[1].local_path, std::filesystem::path("/data/b.mp3"));
    EXPECT_EQ(loaded->files[0].remote_object_key, "b/rec-1-a.mp3");
    EXPECT_TRUE(loaded->settled());
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "batch1.json.tmp"));
}

TEST(SnapshotStoreTest, StaleSnapshotsAreIgnoredAndPurged) {
    fakes::TempDir dir;
    FileSnapshotStore store(dir.path(), std::chrono::hours(24));
    std::int64_t two_days_ago = now_ms() - 48LL * 3600 * 1000;
    store.save(make_snapshot("old", two_days_ago));
    store.save(make_snapshot("fresh", now_ms()));

    EXPECT_FALSE(store.load("old").has_value());
    auto all = store.loadAll();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].batch_id, "fresh");

    EXPECT_EQ(store.purgeStale(), 1u);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "old.json"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "fresh.json"));
}

TEST(SnapshotStoreTest, MalformedSnapshotsArePurged) {
    fakes::TempDir dir;
    FileSnapshotStore store(dir.path());
    {
        std::ofstream out(dir.path() / "broken.json");
        out << "{\"batchId\": ";
    }
    EXPECT_TRUE(store.loadAll().empty());
    EXPECT_EQ(store.purgeStale(), 1u);
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "broken.json"));
}

TEST(SnapshotStoreTest, RemoveDeletesSnapshot) {
    fakes::TempDir dir;
    FileSnapshotStore store(dir.path());
    store.save(make_snapshot("gone", now_ms()));
    store.remove("gone");
    EXPECT_FALSE(store.load("gone").has_value());
    EXPECT_NO_THROW(store.remove("gone"));
}

TEST(SnapshotStoreTest, RejectsPathLikeBatchIds) {
    fakes::TempDir dir;
    FileSnapshotStore store(dir.path());
    EXPECT_THROW(store.save(make_snapshot("../escape", now_ms())), std::invalid_argument);
}

TEST(SnapshotStoreTest, UnsettledWhileAnyFileIsActive) {
    auto snapshot = make_snapshot("b", now_ms());
    snapshot.files[1].status = UploadStatus::Retrying;
    EXPECT_FALSE(snapshot.settled());
}
