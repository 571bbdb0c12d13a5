#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "core/catalog/CatalogTypes.hpp"

namespace imgcat {

enum class Outcome {
  Unchanged,
  New,
  Modified,
  Moved,
  SkippedByPolicy,
  SkippedWithError,
};

const char* to_string(Outcome o);

// What the reconciler decided for one path.
struct Reconciliation {
  std::string path;
  Outcome     outcome = Outcome::SkippedWithError;
  std::optional<CatalogRecord>   record;       // New, Modified, Moved
  std::optional<ProcessedMarker> marker;       // every non-skipped outcome
  std::optional<size_t>          supersedes;   // pending batch slot this record replaces
  int64_t     bytes = 0;                       // bytes hashed
  std::string error;
};

struct ScanResult {
  size_t  found = 0;
  size_t  unchanged = 0;
  size_t  added = 0;
  size_t  modified = 0;
  size_t  moved = 0;
  size_t  skipped = 0;     // size policy
  size_t  errors = 0;
  int64_t bytes_counted = 0;
  std::chrono::milliseconds elapsed{0};
  bool    cancelled = false;
  std::optional<std::string> fatal_error;
  std::optional<std::string> discovery_warning;

  bool ok() const { return !cancelled && !fatal_error; }
};

} // namespace imgcat
