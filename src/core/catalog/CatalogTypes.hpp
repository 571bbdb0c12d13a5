#pragma once
#include <cstdint>
#include <optional>
#include <string>

using RecordId = int64_t;

struct CatalogRecord {
  std::optional<RecordId> id;   // unassigned until the store inserts it
  std::string name;
  std::string path;             // empty once detached
  int64_t     size_bytes = 0;
  int         width = 0;
  int         height = 0;
  std::string content_hash;
  int64_t     file_created_at = 0;   // epoch seconds
  int64_t     file_modified_at = 0;  // epoch seconds
  std::optional<int64_t>     date_taken;   // epoch seconds, UTC
  std::optional<std::string> camera_model;
  std::string extra_metadata_json = "{}";
  int64_t     scanned_at = 0;        // epoch milliseconds
};

struct ProcessedMarker {
  std::string path;
  std::string content_hash;
  int64_t     last_processed = 0;    // epoch milliseconds
};
