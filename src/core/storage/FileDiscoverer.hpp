#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/Cancellation.hpp"

// Lowercases and prefixes a dot: "JPG" -> ".jpg".
std::string normalize_extension(std::string ext);

// Lazy walk over files under root whose extension is in the allow-list.
// Walk errors end the sequence and are reported through warning().
class FileDiscoverer {
public:
  FileDiscoverer(const std::string& root,
                 const std::vector<std::string>& extensions,
                 bool recursive,
                 CancellationToken token);

  // Next matching absolute path, or nullopt when the walk is over.
  std::optional<std::string> next();

  // Begins a fresh walk from the root.
  void restart();

  const std::optional<std::string>& warning() const { return warning_; }

private:
  bool matches(const std::filesystem::path& p) const;
  void fail(const std::string& what, const std::error_code& ec);

  std::filesystem::path root_;
  std::vector<std::string> extensions_;
  bool recursive_;
  CancellationToken token_;

  bool started_ = false;
  bool finished_ = false;
  std::filesystem::recursive_directory_iterator rit_;
  std::filesystem::directory_iterator it_;
  std::optional<std::string> warning_;
};
