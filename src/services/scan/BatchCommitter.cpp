#include "BatchCommitter.hpp"
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace imgcat {

BatchCommitter::BatchCommitter(CatalogStore& store, size_t batchSize)
  : store_(store), batchSize_(batchSize == 0 ? 1 : batchSize) {}

bool BatchCommitter::add(const Reconciliation& r) {
  if (!r.record || !r.marker) {
    throw std::invalid_argument(std::string("nothing to commit for outcome ") + to_string(r.outcome));
  }

  if (r.supersedes) {
    if (*r.supersedes >= records_.size()) throw std::out_of_range("stale pending slot");
    records_[*r.supersedes] = *r.record;
  } else {
    records_.push_back(*r.record);
  }
  markers_.push_back(*r.marker);
  return markers_.size() >= batchSize_;
}

bool BatchCommitter::refreshMarker(const ProcessedMarker& m) {
  refreshes_.push_back(m);
  return refreshes_.size() >= batchSize_;
}

void BatchCommitter::flush() {
  if (markers_.empty() && refreshes_.empty()) return;

  std::vector<RecordId> ids;
  if (!records_.empty()) {
    spdlog::debug("writing batch of {} records to the catalog", records_.size());
    ids = store_.upsertRecordsBatch(records_);
  }

  std::vector<ProcessedMarker> markers = markers_;
  markers.insert(markers.end(), refreshes_.begin(), refreshes_.end());
  store_.upsertMarkersBatch(markers);

  refreshed_ += refreshes_.size();
  if (!markers_.empty()) {
    committed_ += markers_.size();
    ++batches_;
    spdlog::info("batch committed: {} records, {} files so far", ids.size(), committed_);
  } else {
    spdlog::debug("refreshed {} unchanged markers", refreshes_.size());
  }
  records_.clear();
  markers_.clear();
  refreshes_.clear();
}

template <typename Pred>
std::optional<BatchCommitter::PendingHit> BatchCommitter::findPending(Pred pred) const {
  for (size_t i = records_.size(); i-- > 0;) {
    if (pred(records_[i])) return PendingHit{i, records_[i]};
  }
  return std::nullopt;
}

std::optional<BatchCommitter::PendingHit> BatchCommitter::findPendingByHash(const std::string& hash) const {
  return findPending([&](const CatalogRecord& r) { return r.content_hash == hash; });
}

std::optional<BatchCommitter::PendingHit> BatchCommitter::findPendingByPath(const std::string& path) const {
  return findPending([&](const CatalogRecord& r) { return r.path == path; });
}

std::optional<BatchCommitter::PendingHit> BatchCommitter::findPendingById(RecordId id) const {
  return findPending([&](const CatalogRecord& r) { return r.id && *r.id == id; });
}

} // namespace imgcat
