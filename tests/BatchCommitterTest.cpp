#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "core/storage/ContentHasher.hpp"
#include "services/scan/BatchCommitter.hpp"

using namespace testing_support;
using imgcat::BatchCommitter;
using imgcat::Outcome;
using imgcat::Reconciliation;

namespace {

Reconciliation new_file(const std::string& path, const std::string& content) {
  Reconciliation r;
  r.path = path;
  r.outcome = Outcome::New;
  CatalogRecord rec;
  rec.name = std::filesystem::path(path).filename().string();
  rec.path = path;
  rec.size_bytes = static_cast<int64_t>(content.size());
  rec.content_hash = sha256_hex(content);
  rec.scanned_at = 1;
  r.record = rec;
  r.marker = ProcessedMarker{path, rec.content_hash, 1};
  return r;
}

} // namespace

TEST(BatchCommitter, SignalsWhenBatchIsFull) {
  CatalogFixture f;
  BatchCommitter c(*f.store, 2);
  EXPECT_FALSE(c.add(new_file("/p/1.png", "1")));
  EXPECT_TRUE(c.add(new_file("/p/2.png", "2")));
  EXPECT_EQ(c.pendingFiles(), 2u);
  EXPECT_EQ(f.store->countRecords(), 0);
}

TEST(BatchCommitter, FlushWritesRecordsThenMarkers) {
  CatalogFixture f;
  BatchCommitter c(*f.store, 10);
  c.add(new_file("/p/1.png", "1"));
  c.add(new_file("/p/2.png", "2"));
  c.flush();

  EXPECT_EQ(c.pendingFiles(), 0u);
  EXPECT_EQ(c.committedFiles(), 2u);
  EXPECT_EQ(c.batchesCommitted(), 1u);
  EXPECT_EQ(f.store->countRecords(), 2);
  EXPECT_EQ(f.store->countMarkers(), 2);
  EXPECT_TRUE(f.store->findMarkerByPath("/p/2.png"));

  c.flush();  // empty flush is a no-op
  EXPECT_EQ(c.batchesCommitted(), 1u);
}

TEST(BatchCommitter, SupersedingResultReplacesPendingRecord) {
  CatalogFixture f;
  BatchCommitter c(*f.store, 10);
  c.add(new_file("/p/a.png", "same"));

  auto hit = c.findPendingByHash(sha256_hex("same"));
  ASSERT_TRUE(hit);
  EXPECT_EQ(hit->slot, 0u);

  auto moved = new_file("/p/b.png", "same");
  moved.outcome = Outcome::Moved;
  moved.supersedes = hit->slot;
  c.add(moved);

  EXPECT_EQ(c.pendingFiles(), 2u);
  EXPECT_TRUE(c.findPendingByPath("/p/b.png"));
  EXPECT_FALSE(c.findPendingByPath("/p/a.png"));

  c.flush();
  EXPECT_EQ(f.store->countRecords(), 1);
  EXPECT_EQ(f.store->countMarkers(), 2);
}

TEST(BatchCommitter, UnchangedRefreshesShareTheMarkerTransaction) {
  CatalogFixture f;
  f.store->upsertMarker({"/p/old.png", sha256_hex("old"), 1});
  CorruptingStore counting(*f.store, 99);
  BatchCommitter c(counting, 2);

  EXPECT_FALSE(c.refreshMarker({"/p/old.png", sha256_hex("old"), 500}));
  EXPECT_FALSE(c.add(new_file("/p/new.png", "new")));
  EXPECT_EQ(c.pendingFiles(), 1u);
  EXPECT_EQ(c.pendingRefreshes(), 1u);
  c.flush();

  EXPECT_EQ(counting.markerBatches, 1);
  EXPECT_EQ(c.committedFiles(), 1u);
  EXPECT_EQ(c.refreshedMarkers(), 1u);
  EXPECT_EQ(f.store->countRecords(), 1);
  EXPECT_EQ(f.store->findMarkerByPath("/p/old.png")->last_processed, 500);
}

TEST(BatchCommitter, RefreshesAloneFlushWithoutRecords) {
  CatalogFixture f;
  BatchCommitter c(*f.store, 2);
  EXPECT_FALSE(c.refreshMarker({"/p/a.png", sha256_hex("a"), 7}));
  EXPECT_TRUE(c.refreshMarker({"/p/b.png", sha256_hex("b"), 7}));
  c.flush();

  EXPECT_EQ(f.store->countMarkers(), 2);
  EXPECT_EQ(f.store->countRecords(), 0);
  EXPECT_EQ(c.batchesCommitted(), 0u);
  EXPECT_EQ(c.pendingRefreshes(), 0u);
}

TEST(BatchCommitter, RejectsResultsWithoutRecord) {
  CatalogFixture f;
  BatchCommitter c(*f.store, 10);
  Reconciliation skipped;
  skipped.outcome = Outcome::SkippedByPolicy;
  EXPECT_THROW(c.add(skipped), std::invalid_argument);
}

TEST(BatchCommitter, FailedBatchLeavesNothingBehind) {
  CatalogFixture f;
  const size_t n = 3;
  CorruptingStore failing(*f.store, n);  // the (n+1)th record is rejected
  BatchCommitter c(failing, n + 5);
  for (size_t i = 0; i < n + 5; ++i) {
    c.add(new_file("/p/" + std::to_string(i) + ".png", std::to_string(i)));
  }

  EXPECT_THROW(c.flush(), StorageError);
  EXPECT_EQ(f.store->countRecords(), 0);
  EXPECT_EQ(f.store->countMarkers(), 0);
  EXPECT_EQ(failing.markerBatches, 0);
  EXPECT_EQ(c.committedFiles(), 0u);
}
