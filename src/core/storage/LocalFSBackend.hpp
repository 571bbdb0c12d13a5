#pragma once
#include <cstdint>
#include <fstream>
#include <string>

struct FileStat {
  std::string name;
  int64_t     size_bytes = 0;
  int64_t     created_at = 0;   // epoch seconds; birth time where the filesystem records it
  int64_t     modified_at = 0;  // epoch seconds
};

// Local filesystem access used by discovery, hashing and reconciliation.
class LocalFSBackend {
public:
  // Throws IoError when the path is missing or not a regular file.
  FileStat stat(const std::string& path) const;

  // Opens for shared binary reading. Throws IoError.
  std::ifstream openRead(const std::string& path) const;

  // Root pre-check: tells "no files" apart from "bad root" before a walk.
  bool isReadableDirectory(const std::string& path) const;
};
