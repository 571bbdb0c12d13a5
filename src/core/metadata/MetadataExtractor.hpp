#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "core/Cancellation.hpp"

struct ImageMetadata {
  int width = 0;
  int height = 0;
  std::map<std::string, std::string> tags;  // tag name -> description
};

// Metadata collaborator. nullopt means extraction failed, not "no metadata".
class MetadataExtractor {
public:
  virtual ~MetadataExtractor() = default;

  virtual std::optional<ImageMetadata> extract(const std::string& path,
                                               const std::vector<std::string>& fields,
                                               const CancellationToken& token) = 0;
};

// Case-insensitive; "*" requests every tag.
bool field_requested(const std::vector<std::string>& fields, const std::string& tag);

// "yyyy:MM:dd HH:mm:ss" read as UTC -> epoch seconds.
std::optional<int64_t> parse_exif_datetime(const std::string& s);
