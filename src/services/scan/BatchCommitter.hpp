#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "core/catalog/CatalogStore.hpp"
#include "services/scan/ScanTypes.hpp"

namespace imgcat {

// Groups New/Modified/Moved results and writes them to the catalog in one
// transaction per batch, followed by their markers. Marker refreshes for
// unchanged files ride along in the marker transaction; they never enter the
// record accumulator.
class BatchCommitter {
public:
  struct PendingHit {
    size_t slot;
    CatalogRecord record;
  };

  BatchCommitter(CatalogStore& store, size_t batchSize);

  // Returns true once the batch has reached its size and should be flushed.
  bool add(const Reconciliation& r);

  // Queues a marker whose file was found unchanged. Returns true once enough
  // refreshes are queued to warrant a flush.
  bool refreshMarker(const ProcessedMarker& m);

  // Throws StorageError; nothing of a failed batch becomes visible.
  void flush();

  size_t pendingFiles() const { return markers_.size(); }
  size_t pendingRefreshes() const { return refreshes_.size(); }
  size_t committedFiles() const { return committed_; }
  size_t refreshedMarkers() const { return refreshed_; }
  size_t batchesCommitted() const { return batches_; }

  // Newest pending entry first.
  std::optional<PendingHit> findPendingByHash(const std::string& hash) const;
  std::optional<PendingHit> findPendingByPath(const std::string& path) const;
  std::optional<PendingHit> findPendingById(RecordId id) const;

private:
  template <typename Pred>
  std::optional<PendingHit> findPending(Pred pred) const;

  CatalogStore& store_;
  size_t batchSize_;
  std::vector<CatalogRecord> records_;
  std::vector<ProcessedMarker> markers_;
  std::vector<ProcessedMarker> refreshes_;
  size_t committed_ = 0;
  size_t refreshed_ = 0;
  size_t batches_ = 0;
};

} // namespace imgcat
