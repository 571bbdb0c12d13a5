#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "core/Cancellation.hpp"

class LocalFSBackend;

std::string to_hex(const uint8_t* data, size_t len);

// SHA-256 of an in-memory buffer, lowercase hex.
std::string sha256_hex(std::string_view bytes);

// Streams a file through SHA-256 in fixed-size chunks.
class ContentHasher {
public:
  static constexpr size_t kChunkSize = 8192;

  explicit ContentHasher(const LocalFSBackend& fs) : fs_(fs) {}
  virtual ~ContentHasher() = default;

  // Throws IoError, HashUnavailable or Cancelled; never returns a partial digest.
  virtual std::string hash(const std::string& path, const CancellationToken& token) const;

private:
  const LocalFSBackend& fs_;
};
