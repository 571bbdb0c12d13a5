#pragma once
#include <optional>
#include <string>
#include <vector>

#include "core/catalog/CatalogTypes.hpp"

// Persisted catalog consumed by the reconciliation engine. Every method may
// throw StorageError.
class CatalogStore {
public:
  virtual ~CatalogStore() = default;

  virtual std::optional<ProcessedMarker> findMarkerByPath(const std::string& path) = 0;
  virtual std::optional<CatalogRecord>   findRecordByPath(const std::string& path) = 0;
  // Live records win over detached ones; ties go to the lowest id.
  virtual std::optional<CatalogRecord>   findRecordByHash(const std::string& hash) = 0;
  // Every record with this hash, in findRecordByHash order.
  virtual std::vector<CatalogRecord>     findRecordsByHash(const std::string& hash) = 0;
  virtual std::optional<CatalogRecord>   findRecordById(RecordId id) = 0;

  // All-or-nothing. Records without an id are inserted; the returned ids are
  // in input order. A record written to a path held by another record detaches
  // the other record.
  virtual std::vector<RecordId> upsertRecordsBatch(const std::vector<CatalogRecord>& records) = 0;

  virtual void upsertMarker(const ProcessedMarker& marker) = 0;
  virtual void upsertMarkersBatch(const std::vector<ProcessedMarker>& markers) = 0;

  virtual int64_t countRecords() = 0;
  virtual int64_t countMarkers() = 0;
};
