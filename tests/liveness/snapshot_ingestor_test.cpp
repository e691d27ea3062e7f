/**
 * @file snapshot_ingestor_test.cpp
 * @brief Unit tests for SnapshotIngestor
 */

#include "liveness/snapshot_ingestor.h"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "../storage/storage_test_helpers.h"
#include "cache/in_memory_cache.h"
#include "liveness_test_fakes.h"

using namespace snapkeep::liveness;
using namespace snapkeep::liveness::testing;
using namespace std::chrono;
using snapkeep::cache::InMemoryCache;
using snapkeep::storage::testing::FakeObjectStore;
using snapkeep::storage::testing::TempDirectory;
using snapkeep::utils::ErrorCode;

namespace {

const TimePoint kNow{sys_days{2024y / March / 5} + hours{7} + minutes{8} + seconds{9} + microseconds{250000}};

/**
 * @brief Returns a fixed level, or fails when `fail` is set
 */
class FakeMotionComparator : public MotionComparator {
 public:
  snapkeep::utils::Expected<double, snapkeep::utils::Error> Compare(const std::string& /*exid*/,
                                                                    std::string_view current,
                                                                    std::string_view previous) override {
    last_current = std::string(current);
    last_previous = std::string(previous);
    ++calls;
    if (fail) {
      return snapkeep::utils::MakeUnexpected(
          snapkeep::utils::MakeError(snapkeep::utils::ErrorCode::kInternalError, "decoder error"));
    }
    return level;
  }

  double level = 0.0;
  bool fail = false;
  int calls = 0;
  std::string last_current;
  std::string last_previous;
};

}  // namespace

class SnapshotIngestorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    storage_config_.local_root = temp_.Path();
    storage_config_.remote_root = "/archive";
    store_ = std::make_unique<snapkeep::storage::SnapshotStore>(remote_, local_, storage_config_);

    snapkeep::config::LivenessConfig liveness_config;
    liveness_config.notify_threads = 1;
    tracker_ = std::make_unique<LivenessTracker>(LivenessServices{repository_, users_, broadcaster_, jobs_, mailer_},
                                                 error_totals_, cameras_, liveness_config);
    ingestor_ = std::make_unique<SnapshotIngestor>(*store_, *tracker_, repository_, comparator_, last_images_);

    Camera camera;
    camera.id = 42;
    camera.exid = "gate";
    camera.is_online = true;
    repository_.AddCamera(camera);
  }

  TempDirectory temp_;
  FakeObjectStore remote_;
  snapkeep::storage::LocalDiskStore local_;
  snapkeep::config::StorageConfig storage_config_;
  std::unique_ptr<snapkeep::storage::SnapshotStore> store_;

  CallLog log_;
  FakeCameraRepository repository_{log_};
  FakeUserDirectory users_{log_};
  FakeBroadcaster broadcaster_{log_};
  FakeJobQueue jobs_{log_};
  FakeMailer mailer_{log_};
  FakeMotionComparator comparator_;
  InMemoryCache<int> error_totals_{100};
  InMemoryCache<Camera> cameras_{100};
  InMemoryCache<CachedImage> last_images_{100};
  std::unique_ptr<LivenessTracker> tracker_;
  std::unique_ptr<SnapshotIngestor> ingestor_;
};

TEST_F(SnapshotIngestorTest, StoresAndRecordsFirstSnapshot) {
  auto record = ingestor_->OnSnapshot("gate", kNow, "frame-1");
  ASSERT_TRUE(record);
  EXPECT_EQ(record->camera_id, 42);
  EXPECT_EQ(record->created_at, kNow);
  EXPECT_EQ(record->notes, "Proxy");
  EXPECT_EQ(record->snapshot_id, "42_20240305070809250000");
  EXPECT_FALSE(record->motion_level.has_value());
  EXPECT_EQ(comparator_.calls, 0);

  EXPECT_EQ(remote_.Object("/archive/gate/snapshots/recordings/2024/03/05/07/08_09_250.jpg"), "frame-1");
  ASSERT_EQ(repository_.records.size(), 1U);
  EXPECT_EQ(repository_.records[0].snapshot_id, record->snapshot_id);

  auto cached = last_images_.Get("gate");
  ASSERT_TRUE(cached.has_value());
  EXPECT_EQ(cached->image, "frame-1");
  EXPECT_EQ(cached->timestamp, kNow);
}

TEST_F(SnapshotIngestorTest, StoredSnapshotLoadsBackById) {
  auto record = ingestor_->OnSnapshot("gate", kNow, "frame-1");
  ASSERT_TRUE(record);
  auto bytes = store_->Load("gate", record->snapshot_id, snapkeep::storage::SourceTag::kRecordings);
  ASSERT_TRUE(bytes);
  EXPECT_EQ(*bytes, "frame-1");
}

TEST_F(SnapshotIngestorTest, MotionLevelComparesWithPreviousImage) {
  comparator_.level = 17.5;
  ASSERT_TRUE(ingestor_->OnSnapshot("gate", kNow, "frame-1"));
  auto record = ingestor_->OnSnapshot("gate", kNow + seconds{1}, "frame-2");
  ASSERT_TRUE(record);

  ASSERT_TRUE(record->motion_level.has_value());
  EXPECT_DOUBLE_EQ(*record->motion_level, 17.5);
  EXPECT_EQ(comparator_.last_current, "frame-2");
  EXPECT_EQ(comparator_.last_previous, "frame-1");
}

TEST_F(SnapshotIngestorTest, ComparatorFailureLeavesMotionUnset) {
  comparator_.fail = true;
  ASSERT_TRUE(ingestor_->OnSnapshot("gate", kNow, "frame-1"));
  auto record = ingestor_->OnSnapshot("gate", kNow + seconds{1}, "frame-2");
  ASSERT_TRUE(record);
  EXPECT_FALSE(record->motion_level.has_value());
  EXPECT_EQ(repository_.records.size(), 2U);
}

TEST_F(SnapshotIngestorTest, SnapshotBringsCameraOnline) {
  Camera offline;
  offline.id = 7;
  offline.exid = "yard";
  offline.is_online = false;
  repository_.AddCamera(offline);

  ASSERT_TRUE(ingestor_->OnSnapshot("yard", kNow, "frame"));
  tracker_->WaitIdle();
  EXPECT_TRUE(repository_.Stored("yard").is_online);
  EXPECT_EQ(log_.Count("activity:online"), 1);
}

TEST_F(SnapshotIngestorTest, SaveFailureSkipsRecordButCachesImage) {
  remote_.FailPath("/archive/gate/snapshots/recordings/2024/03/05/07/08_09_250.jpg");

  auto record = ingestor_->OnSnapshot("gate", kNow, "frame-1");
  ASSERT_FALSE(record);
  EXPECT_EQ(record.error().code(), ErrorCode::kBackendFault);
  EXPECT_TRUE(repository_.records.empty());
  EXPECT_TRUE(last_images_.Get("gate").has_value());
}

TEST_F(SnapshotIngestorTest, RecordInsertFailureIsReturned) {
  repository_.fail_snapshot_records = true;
  auto record = ingestor_->OnSnapshot("gate", kNow, "frame-1");
  ASSERT_FALSE(record);
  EXPECT_EQ(record.error().code(), ErrorCode::kInternalError);
  EXPECT_TRUE(remote_.Has("/archive/gate/snapshots/recordings/2024/03/05/07/08_09_250.jpg"));
}

TEST_F(SnapshotIngestorTest, UnknownCameraIsRejected) {
  auto record = ingestor_->OnSnapshot("ghost", kNow, "frame");
  ASSERT_FALSE(record);
  EXPECT_EQ(record.error().code(), ErrorCode::kNotFound);
  EXPECT_EQ(remote_.create_calls, 0);
}

TEST_F(SnapshotIngestorTest, ErrorsAccumulateTowardOffline) {
  auto first = ingestor_->OnSnapshotError("gate", kNow, "timeout", 50);
  ASSERT_TRUE(first);
  EXPECT_EQ(*first, Transition::kNone);

  auto second = ingestor_->OnSnapshotError("gate", kNow + seconds{1}, "timeout", 50);
  ASSERT_TRUE(second);
  EXPECT_EQ(*second, Transition::kWentOffline);
  tracker_->WaitIdle();
  EXPECT_FALSE(repository_.Stored("gate").is_online);
}
