#pragma once
#include <optional>
#include <string>

#include "core/Cancellation.hpp"
#include "core/catalog/CatalogStore.hpp"
#include "core/metadata/MetadataExtractor.hpp"
#include "core/storage/ContentHasher.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "services/config/Settings.hpp"
#include "services/scan/BatchCommitter.hpp"
#include "services/scan/ScanTypes.hpp"

namespace imgcat {

// Classifies one discovered file against the catalog and the batch still being
// accumulated, and builds the record to persist.
//
// Per-file failures come back as SkippedWithError. StorageError propagates, and
// so does Cancelled while the file is still being hashed. Unchanged results
// carry a refreshed marker for the committer to write.
class Reconciler {
public:
  Reconciler(CatalogStore& store,
             const LocalFSBackend& fs,
             const ContentHasher& hasher,
             MetadataExtractor& metadata,
             const ScanSettings& settings,
             const BatchCommitter& pending);

  Reconciliation reconcile(const std::string& path, const CancellationToken& token);

private:
  struct Match {
    CatalogRecord record;
    std::optional<size_t> slot;  // set when the match is still in the batch
  };

  void classify(Reconciliation& r, const FileStat& st, const std::string& hash);
  std::optional<Match> lookupByHash(const std::string& hash) const;
  std::optional<Match> lookupByPath(const std::string& path) const;
  std::optional<Match> overlayPending(std::optional<CatalogRecord> stored) const;

  CatalogStore& store_;
  const LocalFSBackend& fs_;
  const ContentHasher& hasher_;
  MetadataExtractor& metadata_;
  const ScanSettings& settings_;
  const BatchCommitter& pending_;
};

// Epoch milliseconds.
int64_t now_ms();

} // namespace imgcat
