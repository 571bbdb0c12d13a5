#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "core/Errors.hpp"
#include "core/catalog/InitDb.hpp"
#include "core/storage/ContentHasher.hpp"

using namespace testing_support;

namespace {

CatalogRecord make_record(const std::string& path, const std::string& content, int64_t scannedAt = 1000) {
  CatalogRecord r;
  r.name = std::filesystem::path(path).filename().string();
  r.path = path;
  r.size_bytes = static_cast<int64_t>(content.size());
  r.width = 640;
  r.height = 480;
  r.content_hash = sha256_hex(content);
  r.file_created_at = 1600000000;
  r.file_modified_at = 1600000100;
  r.scanned_at = scannedAt;
  return r;
}

} // namespace

TEST(CatalogStore, InsertAssignsIdentityAndIsFoundByPathHashAndId) {
  CatalogFixture f;
  auto rec = make_record("/photos/a.jpg", "aaa");
  rec.camera_model = "X100V";
  rec.date_taken = 1622550645;

  const auto ids = f.store->upsertRecordsBatch({rec});
  ASSERT_EQ(ids.size(), 1u);

  auto byPath = f.store->findRecordByPath("/photos/a.jpg");
  ASSERT_TRUE(byPath);
  ASSERT_TRUE(byPath->id);
  EXPECT_EQ(*byPath->id, ids[0]);
  EXPECT_EQ(byPath->camera_model.value_or(""), "X100V");
  EXPECT_EQ(byPath->date_taken.value_or(0), 1622550645);
  EXPECT_EQ(byPath->extra_metadata_json, "{}");

  auto byHash = f.store->findRecordByHash(sha256_hex("aaa"));
  ASSERT_TRUE(byHash);
  EXPECT_EQ(*byHash->id, ids[0]);

  auto byId = f.store->findRecordById(ids[0]);
  ASSERT_TRUE(byId);
  EXPECT_EQ(byId->path, "/photos/a.jpg");

  EXPECT_FALSE(f.store->findRecordByPath("/photos/missing.jpg"));
  EXPECT_FALSE(f.store->findRecordByHash(sha256_hex("zzz")));
}

TEST(CatalogStore, UpdateKeepsIdentityAndScannedAtStrictlyIncreases) {
  CatalogFixture f;
  const auto ids = f.store->upsertRecordsBatch({make_record("/p/a.png", "v1", 5000)});

  auto rec = *f.store->findRecordById(ids[0]);
  rec.path = "/p/b.png";
  rec.name = "b.png";
  rec.scanned_at = 10;  // older than what is stored
  const auto again = f.store->upsertRecordsBatch({rec});
  EXPECT_EQ(again[0], ids[0]);

  auto updated = f.store->findRecordById(ids[0]);
  ASSERT_TRUE(updated);
  EXPECT_EQ(updated->path, "/p/b.png");
  EXPECT_GT(updated->scanned_at, 5000);
  EXPECT_FALSE(f.store->findRecordByPath("/p/a.png"));
  EXPECT_EQ(f.store->countRecords(), 1);
}

TEST(CatalogStore, BatchIsAllOrNothing) {
  CatalogFixture f;
  auto good = make_record("/p/good.png", "good");
  auto bad = make_record("/p/bad.png", "bad");
  bad.content_hash = "short";

  EXPECT_THROW(f.store->upsertRecordsBatch({good, bad}), StorageError);
  EXPECT_EQ(f.store->countRecords(), 0);
  EXPECT_FALSE(f.store->findRecordByPath("/p/good.png"));

  // The connection is usable after the rollback.
  EXPECT_NO_THROW(f.store->upsertRecordsBatch({good}));
  EXPECT_EQ(f.store->countRecords(), 1);
}

TEST(CatalogStore, UpdatingUnknownIdentityFails) {
  CatalogFixture f;
  auto rec = make_record("/p/x.png", "x");
  rec.id = 4242;
  EXPECT_THROW(f.store->upsertRecordsBatch({rec}), StorageError);
}

TEST(CatalogStore, WritingToAnOccupiedPathDetachesTheOccupant) {
  CatalogFixture f;
  const auto ids = f.store->upsertRecordsBatch({make_record("/p/a.png", "A"), make_record("/p/b.png", "B")});

  auto movedA = *f.store->findRecordById(ids[0]);
  movedA.path = "/p/b.png";
  f.store->upsertRecordsBatch({movedA});

  auto atB = f.store->findRecordByPath("/p/b.png");
  ASSERT_TRUE(atB);
  EXPECT_EQ(*atB->id, ids[0]);

  auto oldB = f.store->findRecordById(ids[1]);
  ASSERT_TRUE(oldB);
  EXPECT_TRUE(oldB->path.empty());
  EXPECT_EQ(f.store->countRecords(), 2);
}

TEST(CatalogStore, HashLookupPrefersLiveRecords) {
  CatalogFixture f;
  // Two records with the same content; the first one gets detached.
  const auto ids = f.store->upsertRecordsBatch({make_record("/p/a.png", "same"), make_record("/p/b.png", "same")});
  auto other = make_record("/p/a.png", "other");
  f.store->upsertRecordsBatch({other});

  auto hit = f.store->findRecordByHash(sha256_hex("same"));
  ASSERT_TRUE(hit);
  EXPECT_EQ(*hit->id, ids[1]);

  const auto all = f.store->findRecordsByHash(sha256_hex("same"));
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(*all[0].id, ids[1]);
  EXPECT_EQ(*all[1].id, ids[0]);
  EXPECT_TRUE(all[1].path.empty());
  EXPECT_TRUE(f.store->findRecordsByHash(sha256_hex("none")).empty());
}

TEST(CatalogStore, MarkersAreUpsertedByPath) {
  CatalogFixture f;
  f.store->upsertMarker({"/p/a.png", sha256_hex("1"), 100});
  f.store->upsertMarkersBatch({{"/p/a.png", sha256_hex("2"), 200}, {"/p/b.png", sha256_hex("3"), 300}});

  auto a = f.store->findMarkerByPath("/p/a.png");
  ASSERT_TRUE(a);
  EXPECT_EQ(a->content_hash, sha256_hex("2"));
  EXPECT_EQ(a->last_processed, 200);
  EXPECT_EQ(f.store->countMarkers(), 2);
  EXPECT_FALSE(f.store->findMarkerByPath("/p/c.png"));
}

TEST(CatalogStore, InitIsIdempotent) {
  CatalogFixture f;
  f.store->upsertRecordsBatch({make_record("/p/a.png", "a")});
  EXPECT_TRUE(initDatabase(f.dbPath, IMGCAT_SCHEMA_FILE));
  EXPECT_EQ(f.store->countRecords(), 1);
}
