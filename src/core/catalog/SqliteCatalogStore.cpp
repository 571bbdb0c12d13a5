#include "SqliteCatalogStore.hpp"
#include <memory>
#include <sqlite3.h>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace {

void finalizeStmt(sqlite3_stmt* st) {
  if (st) sqlite3_finalize(st);
}

using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&finalizeStmt)>;

StmtPtr prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw StorageError("prepare failed: " + err);
  }
  return StmtPtr(st, &finalizeStmt);
}

void exec(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw StorageError(std::string("exec failed: ") + msg);
  }
}

void stepDone(sqlite3* db, sqlite3_stmt* st, const char* what) {
  if (sqlite3_step(st) != SQLITE_DONE) {
    throw StorageError(std::string(what) + " failed: " + sqlite3_errmsg(db));
  }
}

void bindText(sqlite3_stmt* st, int i, const std::string& s) {
  sqlite3_bind_text(st, i, s.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt* st, int i, const std::optional<std::string>& s) {
  if (s) bindText(st, i, *s);
  else sqlite3_bind_null(st, i);
}

void bindOptionalInt64(sqlite3_stmt* st, int i, const std::optional<int64_t>& v) {
  if (v) sqlite3_bind_int64(st, i, *v);
  else sqlite3_bind_null(st, i);
}

std::string columnText(sqlite3_stmt* st, int col) {
  const unsigned char* p = sqlite3_column_text(st, col);
  return p ? reinterpret_cast<const char*>(p) : std::string();
}

// Rolls back unless commit() was reached.
class Transaction {
public:
  explicit Transaction(sqlite3* db) : db_(db) { exec(db_, "BEGIN IMMEDIATE;"); }
  ~Transaction() {
    if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
  }
  void commit() {
    exec(db_, "COMMIT;");
    done_ = true;
  }

private:
  sqlite3* db_;
  bool done_ = false;
};

constexpr const char* kRecordColumns =
  "id, name, path, size_bytes, width, height, content_hash, file_created_at, "
  "file_modified_at, date_taken, camera_model, extra_metadata, scanned_at";

CatalogRecord readRecord(sqlite3_stmt* st) {
  CatalogRecord r;
  r.id               = sqlite3_column_int64(st, 0);
  r.name             = columnText(st, 1);
  r.path             = columnText(st, 2);
  r.size_bytes       = sqlite3_column_int64(st, 3);
  r.width            = sqlite3_column_int(st, 4);
  r.height           = sqlite3_column_int(st, 5);
  r.content_hash     = columnText(st, 6);
  r.file_created_at  = sqlite3_column_int64(st, 7);
  r.file_modified_at = sqlite3_column_int64(st, 8);
  if (sqlite3_column_type(st, 9) != SQLITE_NULL) r.date_taken = sqlite3_column_int64(st, 9);
  if (sqlite3_column_type(st, 10) != SQLITE_NULL) r.camera_model = columnText(st, 10);
  r.extra_metadata_json = columnText(st, 11);
  r.scanned_at       = sqlite3_column_int64(st, 12);
  return r;
}

} // namespace

SqliteCatalogStore::SqliteCatalogStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db=nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE, nullptr)!=SQLITE_OK) {
    std::string err = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StorageError("failed to open db " + dbPath + ": " + err);
  }
  db_ = db;
  try {
    exec(db, "PRAGMA synchronous=NORMAL;");
    exec(db, "PRAGMA foreign_keys=ON;");
    exec(db, "PRAGMA busy_timeout=5000;");
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
}

SqliteCatalogStore::~SqliteCatalogStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

std::optional<ProcessedMarker> SqliteCatalogStore::findMarkerByPath(const std::string& path) {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, "SELECT path, content_hash, last_processed FROM processed_files WHERE path = ?");
  bindText(st.get(), 1, path);
  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw StorageError(std::string("findMarkerByPath failed: ") + sqlite3_errmsg(db));
  ProcessedMarker m;
  m.path           = columnText(st.get(), 0);
  m.content_hash   = columnText(st.get(), 1);
  m.last_processed = sqlite3_column_int64(st.get(), 2);
  return m;
}

std::optional<CatalogRecord> SqliteCatalogStore::findRecordByPath(const std::string& path) {
  return findRecord("path = ?1", &path, 0);
}

std::optional<CatalogRecord> SqliteCatalogStore::findRecordByHash(const std::string& hash) {
  return findRecord("content_hash = ?1 ORDER BY (path IS NULL), id", &hash, 0);
}

std::vector<CatalogRecord> SqliteCatalogStore::findRecordsByHash(const std::string& hash) {
  auto* db = static_cast<sqlite3*>(db_);
  const std::string sql = std::string("SELECT ") + kRecordColumns +
                          " FROM images WHERE content_hash = ?1 ORDER BY (path IS NULL), id";
  auto st = prepare(db, sql.c_str());
  bindText(st.get(), 1, hash);

  std::vector<CatalogRecord> out;
  int rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) out.push_back(readRecord(st.get()));
  if (rc != SQLITE_DONE) throw StorageError(std::string("findRecordsByHash failed: ") + sqlite3_errmsg(db));
  return out;
}

std::optional<CatalogRecord> SqliteCatalogStore::findRecordById(RecordId id) {
  return findRecord("id = ?1", nullptr, id);
}

std::optional<CatalogRecord> SqliteCatalogStore::findRecord(const char* whereClause,
                                                            const std::string* textKey,
                                                            RecordId idKey) {
  auto* db = static_cast<sqlite3*>(db_);
  const std::string sql = std::string("SELECT ") + kRecordColumns +
                          " FROM images WHERE " + whereClause + " LIMIT 1";
  auto st = prepare(db, sql.c_str());
  if (textKey) bindText(st.get(), 1, *textKey);
  else sqlite3_bind_int64(st.get(), 1, idKey);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw StorageError(std::string("findRecord failed: ") + sqlite3_errmsg(db));
  return readRecord(st.get());
}

std::vector<RecordId> SqliteCatalogStore::upsertRecordsBatch(const std::vector<CatalogRecord>& records) {
  std::vector<RecordId> ids;
  if (records.empty()) return ids;
  ids.reserve(records.size());

  auto* db = static_cast<sqlite3*>(db_);
  try {
    Transaction tx(db);
    for (const auto& r : records) ids.push_back(writeRecord(r));
    tx.commit();
  } catch (const StorageError& e) {
    spdlog::error("batch of {} records rolled back: {}", records.size(), e.what());
    throw;
  }
  spdlog::debug("committed batch of {} records", records.size());
  return ids;
}

RecordId SqliteCatalogStore::writeRecord(const CatalogRecord& r) {
  auto* db = static_cast<sqlite3*>(db_);

  if (!r.path.empty()) {
    auto detach = prepare(db, "UPDATE images SET path = NULL WHERE path = ?1 AND id IS NOT ?2");
    bindText(detach.get(), 1, r.path);
    bindOptionalInt64(detach.get(), 2, r.id);
    stepDone(db, detach.get(), "detach");
    if (sqlite3_changes(db) > 0) {
      spdlog::warn("detached stale catalog record previously at {}", r.path);
    }
  }

  const char* sql = r.id
    ? R"SQL(
      UPDATE images SET
        name=?1, path=?2, size_bytes=?3, width=?4, height=?5, content_hash=?6,
        file_created_at=?7, file_modified_at=?8, date_taken=?9, camera_model=?10,
        extra_metadata=?11, scanned_at=MAX(?12, scanned_at + 1)
      WHERE id=?13
    )SQL"
    : R"SQL(
      INSERT INTO images
        (name, path, size_bytes, width, height, content_hash, file_created_at,
         file_modified_at, date_taken, camera_model, extra_metadata, scanned_at)
      VALUES (?1,?2,?3,?4,?5,?6,?7,?8,?9,?10,?11,?12)
    )SQL";

  auto st = prepare(db, sql);
  int i=1;
  bindText(st.get(), i++, r.name);
  if (r.path.empty()) sqlite3_bind_null(st.get(), i++);
  else bindText(st.get(), i++, r.path);
  sqlite3_bind_int64(st.get(), i++, r.size_bytes);
  sqlite3_bind_int(st.get(), i++, r.width);
  sqlite3_bind_int(st.get(), i++, r.height);
  bindText(st.get(), i++, r.content_hash);
  sqlite3_bind_int64(st.get(), i++, r.file_created_at);
  sqlite3_bind_int64(st.get(), i++, r.file_modified_at);
  bindOptionalInt64(st.get(), i++, r.date_taken);
  bindOptionalText(st.get(), i++, r.camera_model);
  bindText(st.get(), i++, r.extra_metadata_json.empty() ? std::string("{}") : r.extra_metadata_json);
  sqlite3_bind_int64(st.get(), i++, r.scanned_at);
  if (r.id) sqlite3_bind_int64(st.get(), i++, *r.id);

  stepDone(db, st.get(), r.id ? "update record" : "insert record");

  if (r.id) {
    if (sqlite3_changes(db) == 0) {
      throw StorageError("record " + std::to_string(*r.id) + " does not exist");
    }
    return *r.id;
  }
  return sqlite3_last_insert_rowid(db);
}

void SqliteCatalogStore::upsertMarker(const ProcessedMarker& marker) {
  writeMarker(marker);
}

void SqliteCatalogStore::upsertMarkersBatch(const std::vector<ProcessedMarker>& markers) {
  if (markers.empty()) return;
  Transaction tx(static_cast<sqlite3*>(db_));
  for (const auto& m : markers) writeMarker(m);
  tx.commit();
}

void SqliteCatalogStore::writeMarker(const ProcessedMarker& m) {
  auto* db = static_cast<sqlite3*>(db_);
  const char* sql = R"SQL(
    INSERT INTO processed_files (path, content_hash, last_processed)
    VALUES (?,?,?)
    ON CONFLICT(path) DO UPDATE SET
      content_hash = excluded.content_hash,
      last_processed = excluded.last_processed
  )SQL";
  auto st = prepare(db, sql);
  bindText(st.get(), 1, m.path);
  bindText(st.get(), 2, m.content_hash);
  sqlite3_bind_int64(st.get(), 3, m.last_processed);
  stepDone(db, st.get(), "upsertMarker");
}

int64_t SqliteCatalogStore::countRecords() {
  return countRows("SELECT COUNT(*) FROM images");
}

int64_t SqliteCatalogStore::countMarkers() {
  return countRows("SELECT COUNT(*) FROM processed_files");
}

int64_t SqliteCatalogStore::countRows(const char* sql) {
  auto* db = static_cast<sqlite3*>(db_);
  auto st = prepare(db, sql);
  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw StorageError(std::string("count failed: ") + sqlite3_errmsg(db));
  }
  return sqlite3_column_int64(st.get(), 0);
}
