#pragma once
#include "core/Cancellation.hpp"
#include "core/catalog/CatalogStore.hpp"
#include "core/metadata/MetadataExtractor.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "services/config/Settings.hpp"
#include "services/scan/ScanTypes.hpp"

namespace imgcat {

// Drives one synchronization run: discover, reconcile, batch-commit.
class ScanRunner {
public:
  ScanRunner(CatalogStore& store, const LocalFSBackend& fs, MetadataExtractor& metadata)
    : store_(store), fs_(fs), metadata_(metadata) {}

  // Always returns a complete result. Cancellation and storage failures are
  // reported through ScanResult::cancelled and ScanResult::fatal_error.
  ScanResult run(const ScanSettings& settings, const CancellationToken& token);

private:
  CatalogStore& store_;
  const LocalFSBackend& fs_;
  MetadataExtractor& metadata_;
};

} // namespace imgcat
