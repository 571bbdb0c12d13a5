#include "Reconciler.hpp"
#include <algorithm>
#include <chrono>
#include <map>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace imgcat {

namespace {

std::string shortHash(const std::string& h) { return h.substr(0, 7); }

// Exif ASCII is often Latin-1; invalid UTF-8 becomes U+FFFD instead of throwing.
std::string tagsJson(const std::map<std::string, std::string>& tags) {
  return nlohmann::json(tags).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Every field derived from the file and its metadata, identity untouched.
void refreshAll(CatalogRecord& r, const std::string& path, const FileStat& st,
                const std::string& hash, const ImageMetadata& md) {
  r.name             = st.name;
  r.path             = path;
  r.size_bytes       = st.size_bytes;
  r.width            = md.width;
  r.height           = md.height;
  r.content_hash     = hash;
  r.file_created_at  = st.created_at;
  r.file_modified_at = st.modified_at;
  r.date_taken.reset();
  r.camera_model.reset();
  if (auto it = md.tags.find("Date/Time Original"); it != md.tags.end()) {
    r.date_taken = parse_exif_datetime(it->second);
  }
  if (auto it = md.tags.find("Model"); it != md.tags.end()) r.camera_model = it->second;
  r.extra_metadata_json = tagsJson(md.tags);
}

// Location fields only; previously captured metadata survives unless re-extracted.
void relocate(CatalogRecord& r, const std::string& path, const FileStat& st,
              const ImageMetadata& md) {
  r.name             = st.name;
  r.path             = path;
  r.size_bytes       = st.size_bytes;
  r.file_created_at  = st.created_at;
  r.file_modified_at = st.modified_at;
  if (md.width > 0 && md.height > 0) {
    r.width  = md.width;
    r.height = md.height;
  }
  if (auto it = md.tags.find("Date/Time Original"); it != md.tags.end()) {
    if (auto taken = parse_exif_datetime(it->second)) r.date_taken = taken;
  }
  if (auto it = md.tags.find("Model"); it != md.tags.end()) r.camera_model = it->second;
  if (!md.tags.empty()) r.extra_metadata_json = tagsJson(md.tags);
}

} // namespace

int64_t now_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

const char* to_string(Outcome o) {
  switch (o) {
    case Outcome::Unchanged:        return "unchanged";
    case Outcome::New:              return "new";
    case Outcome::Modified:         return "modified";
    case Outcome::Moved:            return "moved";
    case Outcome::SkippedByPolicy:  return "skipped";
    case Outcome::SkippedWithError: return "error";
  }
  return "unknown";
}

Reconciler::Reconciler(CatalogStore& store,
                       const LocalFSBackend& fs,
                       const ContentHasher& hasher,
                       MetadataExtractor& metadata,
                       const ScanSettings& settings,
                       const BatchCommitter& pending)
  : store_(store), fs_(fs), hasher_(hasher), metadata_(metadata),
    settings_(settings), pending_(pending) {}

Reconciliation Reconciler::reconcile(const std::string& path, const CancellationToken& token) {
  Reconciliation r;
  r.path = path;

  try {
    const FileStat st = fs_.stat(path);
    const bool tooSmall = st.size_bytes < settings_.min_size;
    const bool tooLarge = settings_.max_size > 0 && st.size_bytes > settings_.max_size;
    if (tooSmall || tooLarge) {
      spdlog::debug("skipping {} due to size constraints ({}B)", path, st.size_bytes);
      r.outcome = Outcome::SkippedByPolicy;
      return r;
    }

    const std::string hash = hasher_.hash(path, token);
    r.bytes = st.size_bytes;

    auto marker = store_.findMarkerByPath(path);
    if (marker && marker->content_hash == hash) {
      marker->last_processed = now_ms();
      r.outcome = Outcome::Unchanged;
      r.marker = std::move(marker);
      spdlog::debug("{} is unchanged", path);
      return r;
    }

    classify(r, st, hash);
  } catch (const StorageError&) {
    throw;
  } catch (const Cancelled&) {
    throw;
  } catch (const std::exception& e) {
    spdlog::warn("failed to process {}: {}. Skipping.", path, e.what());
    r = Reconciliation{};
    r.path = path;
    r.outcome = Outcome::SkippedWithError;
    r.error = e.what();
  }
  return r;
}

void Reconciler::classify(Reconciliation& r, const FileStat& st, const std::string& hash) {
  const std::string& path = r.path;

  // The file is hashed; it finishes even if cancellation arrives now.
  const auto md = metadata_.extract(path, settings_.metadata_fields, CancellationToken());
  if (!md) throw MetadataUnavailable("could not extract metadata for " + path);

  const int64_t now = now_ms();
  CatalogRecord rec;

  if (auto byHash = lookupByHash(hash)) {
    rec = byHash->record;
    r.supersedes = byHash->slot;
    if (rec.path == path) {
      refreshAll(rec, path, st, hash, *md);
      r.outcome = Outcome::Modified;
    } else {
      spdlog::info("{} with hash {}... looks like a moved/renamed version of {}. Updating path.",
                   st.name, shortHash(hash), rec.path.empty() ? "a detached record" : rec.path);
      relocate(rec, path, st, *md);
      r.outcome = Outcome::Moved;
    }
  } else if (auto byPath = lookupByPath(path)) {
    rec = byPath->record;
    r.supersedes = byPath->slot;
    spdlog::info("content of {} changed ({}... -> {}...)", path,
                 shortHash(rec.content_hash), shortHash(hash));
    refreshAll(rec, path, st, hash, *md);
    r.outcome = Outcome::Modified;
  } else {
    refreshAll(rec, path, st, hash, *md);
    r.outcome = Outcome::New;
  }

  rec.scanned_at = std::max(now, rec.scanned_at + 1);
  spdlog::debug("prepared {} record: {} (size {}B, {}x{})", to_string(r.outcome),
                rec.name, rec.size_bytes, rec.width, rec.height);

  r.record = std::move(rec);
  r.marker = ProcessedMarker{path, hash, now};
}

std::optional<Reconciler::Match> Reconciler::lookupByHash(const std::string& hash) const {
  if (auto hit = pending_.findPendingByHash(hash)) return Match{hit->record, hit->slot};

  // A stored record may already carry different content in this batch; fall
  // through to the next live or detached record with this hash.
  for (auto& stored : store_.findRecordsByHash(hash)) {
    auto match = overlayPending(std::move(stored));
    if (match && match->record.content_hash == hash) return match;
  }
  return std::nullopt;
}

std::optional<Reconciler::Match> Reconciler::lookupByPath(const std::string& path) const {
  if (auto hit = pending_.findPendingByPath(path)) return Match{hit->record, hit->slot};

  auto match = overlayPending(store_.findRecordByPath(path));
  // The stored record may already have moved elsewhere in this batch.
  if (match && match->record.path != path) return std::nullopt;
  return match;
}

std::optional<Reconciler::Match> Reconciler::overlayPending(std::optional<CatalogRecord> stored) const {
  if (!stored) return std::nullopt;
  if (stored->id) {
    if (auto hit = pending_.findPendingById(*stored->id)) return Match{hit->record, hit->slot};
  }
  return Match{std::move(*stored), std::nullopt};
}

} // namespace imgcat
