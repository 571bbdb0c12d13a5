#include "ScanRunner.hpp"
#include <chrono>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"
#include "core/storage/ContentHasher.hpp"
#include "core/storage/FileDiscoverer.hpp"
#include "services/scan/BatchCommitter.hpp"
#include "services/scan/Reconciler.hpp"

namespace imgcat {

static void tally(ScanResult& res, const Reconciliation& r) {
  switch (r.outcome) {
    case Outcome::Unchanged:        ++res.unchanged; break;
    case Outcome::New:              ++res.added; break;
    case Outcome::Modified:         ++res.modified; break;
    case Outcome::Moved:            ++res.moved; break;
    case Outcome::SkippedByPolicy:  ++res.skipped; break;
    case Outcome::SkippedWithError: ++res.errors; break;
  }
  if (r.outcome != Outcome::SkippedByPolicy && r.outcome != Outcome::SkippedWithError) {
    res.bytes_counted += r.bytes;
  }
}

ScanResult ScanRunner::run(const ScanSettings& settings, const CancellationToken& token) {
  const auto started = std::chrono::steady_clock::now();
  ScanResult res;

  auto finish = [&]() {
    res.cancelled = token.isCancelled();
    res.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
    return res;
  };

  if (!fs_.isReadableDirectory(settings.root)) {
    res.fatal_error = "not a readable directory: " + settings.root;
    spdlog::error("{}", *res.fatal_error);
    return finish();
  }

  ContentHasher hasher(fs_);
  BatchCommitter committer(store_, settings.batch_size);
  Reconciler reconciler(store_, fs_, hasher, metadata_, settings, committer);
  FileDiscoverer discoverer(settings.root, settings.extensions, settings.recursive, token);

  try {
    try {
      while (!token.isCancelled()) {
        const auto path = discoverer.next();
        if (!path) break;
        ++res.found;

        const Reconciliation r = reconciler.reconcile(*path, token);
        tally(res, r);
        if (r.record) {
          if (committer.add(r)) committer.flush();
        } else if (r.outcome == Outcome::Unchanged && r.marker) {
          if (committer.refreshMarker(*r.marker)) committer.flush();
        }
      }
    } catch (const Cancelled&) {
      spdlog::warn("cancelled while reading a file; it will be picked up next run");
    }
    // Stream end, or cancellation: the accumulated batch is still written.
    committer.flush();
  } catch (const StorageError& e) {
    spdlog::error("catalog write failed, stopping the run: {}", e.what());
    res.fatal_error = e.what();
  }

  res.discovery_warning = discoverer.warning();
  if (token.isCancelled()) spdlog::warn("scan cancelled after {} files", res.found);
  return finish();
}

} // namespace imgcat
