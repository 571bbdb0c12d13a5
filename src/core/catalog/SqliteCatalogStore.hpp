#pragma once
#include <string>
#include <optional>
#include <vector>

#include "core/catalog/CatalogStore.hpp"

// SQLite-backed catalog. The schema must already exist (see initDatabase).
class SqliteCatalogStore : public CatalogStore {
public:
  explicit SqliteCatalogStore(const std::string& dbPath);
  ~SqliteCatalogStore() override;

  SqliteCatalogStore(const SqliteCatalogStore&) = delete;
  SqliteCatalogStore& operator=(const SqliteCatalogStore&) = delete;

  std::optional<ProcessedMarker> findMarkerByPath(const std::string& path) override;
  std::optional<CatalogRecord>   findRecordByPath(const std::string& path) override;
  std::optional<CatalogRecord>   findRecordByHash(const std::string& hash) override;
  std::vector<CatalogRecord>     findRecordsByHash(const std::string& hash) override;
  std::optional<CatalogRecord>   findRecordById(RecordId id) override;

  std::vector<RecordId> upsertRecordsBatch(const std::vector<CatalogRecord>& records) override;

  void upsertMarker(const ProcessedMarker& marker) override;
  void upsertMarkersBatch(const std::vector<ProcessedMarker>& markers) override;

  int64_t countRecords() override;
  int64_t countMarkers() override;

private:
  std::optional<CatalogRecord> findRecord(const char* whereClause,
                                          const std::string* textKey,
                                          RecordId idKey);
  RecordId writeRecord(const CatalogRecord& r);
  void writeMarker(const ProcessedMarker& m);
  int64_t countRows(const char* sql);

  void* db_; // sqlite3*
};
