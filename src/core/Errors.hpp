#pragma once
#include <stdexcept>
#include <string>

// Per-file, recoverable: the file is skipped and counted.
struct IoError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct HashUnavailable : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct MetadataUnavailable : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Fatal for the current batch and the run.
struct StorageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Not a failure: the run was asked to stop.
struct Cancelled : std::runtime_error {
  Cancelled() : std::runtime_error("operation cancelled") {}
};

struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};
