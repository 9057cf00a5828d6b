// Copyright 2026 The skitch Authors
// Tests for: SnapshotWriter (write-behind queue, overflow policies,
//            coalescing, read-your-writes)

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "gtest/gtest.h"
#include "history/snapshot_writer.h"
#include "test_util.h"

using skitch::internal::Snapshot;
using skitch::internal::SnapshotWriter;
using skitch_test::CloseGate;
using skitch_test::MakeSnapshot;
using skitch_test::MemorySnapshotStore;
using skitch_test::OpenGate;
using skitch_test::SnapshotText;
using skitch_test::StoreHas;
using skitch_test::StoreSize;
using skitch_test::WaitForPutsStarted;

class SnapshotWriterTest : public ::testing::Test {
 protected:
  std::unique_ptr<SnapshotWriter> MakeWriter(size_t capacity,
                                             SkitchWritePolicy policy) {
    return std::make_unique<SnapshotWriter>(
        std::make_unique<MemorySnapshotStore>(&shared_), capacity, policy);
  }

  void TearDown() override { OpenGate(&shared_); }

  MemorySnapshotStore::Shared shared_;
};

TEST_F(SnapshotWriterTest, PutReachesStore) {
  auto writer = MakeWriter(8, kSkitchWritePolicyBlock);
  writer->Put(1, MakeSnapshot("one"));
  writer->Flush();
  EXPECT_TRUE(StoreHas(&shared_, 1));
  EXPECT_EQ(writer->pending(), 0u);
}

TEST_F(SnapshotWriterTest, ReadYourWrites) {
  auto writer = MakeWriter(8, kSkitchWritePolicyBlock);
  writer->Put(1, MakeSnapshot("one"));
  Snapshot out;
  ASSERT_TRUE(writer->Get(1, &out));
  EXPECT_EQ(SnapshotText(out), "one");

  writer->Put(1, MakeSnapshot("uno"));
  ASSERT_TRUE(writer->Get(1, &out));
  EXPECT_EQ(SnapshotText(out), "uno");

  writer->Delete(1);
  EXPECT_FALSE(writer->Get(1, &out));
}

TEST_F(SnapshotWriterTest, ClearHidesEverything) {
  auto writer = MakeWriter(8, kSkitchWritePolicyBlock);
  writer->Put(1, MakeSnapshot("a"));
  writer->Put(2, MakeSnapshot("b"));
  writer->Clear();
  Snapshot out;
  EXPECT_FALSE(writer->Get(1, &out));
  EXPECT_FALSE(writer->Get(2, &out));
  writer->Put(3, MakeSnapshot("c"));
  EXPECT_TRUE(writer->Get(3, &out));
  writer->Flush();
  EXPECT_EQ(StoreSize(&shared_), 1u);
}

TEST_F(SnapshotWriterTest, DeleteAllExceptKeepsLive) {
  auto writer = MakeWriter(8, kSkitchWritePolicyBlock);
  for (int id = 1; id <= 4; ++id) writer->Put(id, MakeSnapshot("x"));
  writer->DeleteAllExcept({2, 3});
  Snapshot out;
  EXPECT_FALSE(writer->Get(1, &out));
  EXPECT_TRUE(writer->Get(2, &out));
  writer->Flush();
  EXPECT_FALSE(StoreHas(&shared_, 1));
  EXPECT_TRUE(StoreHas(&shared_, 2));
  EXPECT_TRUE(StoreHas(&shared_, 3));
  EXPECT_FALSE(StoreHas(&shared_, 4));
}

TEST_F(SnapshotWriterTest, DropOldestDiscardsOldestPendingPut) {
  auto writer = MakeWriter(2, kSkitchWritePolicyDropOldest);
  CloseGate(&shared_);
  writer->Put(1, MakeSnapshot("1"));
  WaitForPutsStarted(&shared_, 1);  // Put(1) is in flight.

  writer->Put(2, MakeSnapshot("2"));
  writer->Put(3, MakeSnapshot("3"));
  writer->Put(4, MakeSnapshot("4"));  // Queue full: Put(2) is dropped.
  EXPECT_EQ(writer->dropped_count(), 1u);
  EXPECT_EQ(writer->pending(), 3u);

  OpenGate(&shared_);
  writer->Flush();
  EXPECT_TRUE(StoreHas(&shared_, 1));
  EXPECT_FALSE(StoreHas(&shared_, 2));
  EXPECT_TRUE(StoreHas(&shared_, 3));
  EXPECT_TRUE(StoreHas(&shared_, 4));
}

TEST_F(SnapshotWriterTest, DropOldestKeepsPendingClear) {
  auto writer = MakeWriter(2, kSkitchWritePolicyDropOldest);
  CloseGate(&shared_);
  writer->Put(1, MakeSnapshot("1"));
  WaitForPutsStarted(&shared_, 1);

  writer->Clear();
  writer->Delete(5);
  writer->Put(6, MakeSnapshot("6"));  // Queue full: Delete(5) is dropped.
  EXPECT_EQ(writer->dropped_count(), 1u);

  OpenGate(&shared_);
  writer->Flush();
  std::lock_guard<std::mutex> lock(shared_.mu);
  EXPECT_EQ(shared_.clears, 1);
  EXPECT_EQ(shared_.blobs.size(), 1u);
  EXPECT_EQ(shared_.blobs.count(6), 1u);
}

TEST_F(SnapshotWriterTest, BlockPolicyWaitsForSpace) {
  auto writer = MakeWriter(1, kSkitchWritePolicyBlock);
  CloseGate(&shared_);
  writer->Put(1, MakeSnapshot("1"));
  WaitForPutsStarted(&shared_, 1);
  writer->Put(2, MakeSnapshot("2"));  // Fills the queue.

  std::atomic<bool> done(false);
  std::thread producer([&] {
    writer->Put(3, MakeSnapshot("3"));
    done = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(done.load());

  OpenGate(&shared_);
  producer.join();
  EXPECT_TRUE(done.load());
  writer->Flush();
  EXPECT_EQ(writer->dropped_count(), 0u);
  EXPECT_EQ(StoreSize(&shared_), 3u);
}

TEST_F(SnapshotWriterTest, DeleteCancelsPendingPut) {
  auto writer = MakeWriter(8, kSkitchWritePolicyBlock);
  CloseGate(&shared_);
  writer->Put(1, MakeSnapshot("1"));
  WaitForPutsStarted(&shared_, 1);
  writer->Put(2, MakeSnapshot("2"));
  writer->Delete(2);
  EXPECT_EQ(writer->pending(), 2u);  // In-flight Put(1) + Delete(2).

  OpenGate(&shared_);
  writer->Flush();
  std::lock_guard<std::mutex> lock(shared_.mu);
  EXPECT_EQ(shared_.puts, 1);
  EXPECT_EQ(shared_.blobs.count(2), 0u);
}

TEST_F(SnapshotWriterTest, ClearDropsPendingOps) {
  auto writer = MakeWriter(8, kSkitchWritePolicyBlock);
  CloseGate(&shared_);
  writer->Put(1, MakeSnapshot("1"));
  WaitForPutsStarted(&shared_, 1);
  writer->Put(2, MakeSnapshot("2"));
  writer->Put(3, MakeSnapshot("3"));
  writer->Clear();
  EXPECT_EQ(writer->pending(), 2u);  // In-flight Put(1) + Clear.

  OpenGate(&shared_);
  writer->Flush();
  std::lock_guard<std::mutex> lock(shared_.mu);
  EXPECT_EQ(shared_.puts, 1);
  EXPECT_EQ(shared_.clears, 1);
  EXPECT_TRUE(shared_.blobs.empty());
}

TEST_F(SnapshotWriterTest, StoreFailuresAreCounted) {
  auto writer = MakeWriter(8, kSkitchWritePolicyBlock);
  {
    std::lock_guard<std::mutex> lock(shared_.mu);
    shared_.fail = true;
  }
  writer->Put(1, MakeSnapshot("1"));
  writer->Flush();
  EXPECT_EQ(writer->failed_count(), 1u);
}

namespace {

// Throws from Put() for one id; everything else reaches the memory store.
class ThrowingPutStore : public MemorySnapshotStore {
 public:
  ThrowingPutStore(Shared* shared, skitch::internal::SnapshotId bad_id)
      : MemorySnapshotStore(shared), bad_id_(bad_id) {}

  bool Put(skitch::internal::SnapshotId id,
           const Snapshot& snapshot) override {
    if (id == bad_id_) throw std::runtime_error("disk on fire");
    return MemorySnapshotStore::Put(id, snapshot);
  }

 private:
  skitch::internal::SnapshotId bad_id_;
};

}  // namespace

TEST_F(SnapshotWriterTest, ThrowingStoreCountsFailureAndKeepsDraining) {
  SnapshotWriter writer(std::make_unique<ThrowingPutStore>(&shared_, 2), 8,
                        kSkitchWritePolicyBlock);
  writer.Put(1, MakeSnapshot("1"));
  writer.Put(2, MakeSnapshot("2"));
  writer.Put(3, MakeSnapshot("3"));
  writer.Flush();
  EXPECT_EQ(writer.failed_count(), 1u);
  EXPECT_EQ(writer.pending(), 0u);
  EXPECT_TRUE(StoreHas(&shared_, 1));
  EXPECT_FALSE(StoreHas(&shared_, 2));
  EXPECT_TRUE(StoreHas(&shared_, 3));

  writer.Put(4, MakeSnapshot("4"));
  writer.Flush();
  EXPECT_TRUE(StoreHas(&shared_, 4));
}

TEST_F(SnapshotWriterTest, DestructorDrainsQueue) {
  auto writer = MakeWriter(64, kSkitchWritePolicyBlock);
  for (int id = 1; id <= 20; ++id) writer->Put(id, MakeSnapshot("x"));
  writer.reset();
  EXPECT_EQ(StoreSize(&shared_), 20u);
}

TEST(SnapshotWriterNoStoreTest, ActsAsSink) {
  SnapshotWriter writer(nullptr, 4, kSkitchWritePolicyBlock);
  EXPECT_FALSE(writer.has_store());
  writer.Put(1, MakeSnapshot("x"));
  Snapshot out;
  EXPECT_FALSE(writer.Get(1, &out));
  writer.Flush();
  EXPECT_EQ(writer.pending(), 0u);
}
