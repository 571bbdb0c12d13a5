#pragma once
#include <optional>
#include <string>
#include <vector>

#include "core/metadata/MetadataExtractor.hpp"

class LocalFSBackend;

// Reads dimensions from PNG, GIF, BMP and JPEG headers and the common Exif
// tags from a JPEG APP1 segment. Never decodes pixel data.
class HeaderMetadataExtractor : public MetadataExtractor {
public:
  explicit HeaderMetadataExtractor(const LocalFSBackend& fs) : fs_(fs) {}

  std::optional<ImageMetadata> extract(const std::string& path,
                                       const std::vector<std::string>& fields,
                                       const CancellationToken& token) override;

private:
  const LocalFSBackend& fs_;
};
