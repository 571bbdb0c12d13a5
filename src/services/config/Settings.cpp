#include "Settings.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

using nlohmann::json;

namespace imgcat {

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

std::vector<std::string> split_list(const std::string& csv) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= csv.size()) {
    size_t comma = csv.find(',', start);
    if (comma == std::string::npos) comma = csv.size();
    std::string item = csv.substr(start, comma - start);
    const auto b = item.find_first_not_of(" \t");
    const auto e = item.find_last_not_of(" \t");
    if (b != std::string::npos) out.push_back(item.substr(b, e - b + 1));
    start = comma + 1;
  }
  return out;
}

void apply_settings_json(ScanSettings& s, const json& doc) {
  if (!doc.is_object()) throw ConfigError("settings document must be a JSON object");
  if (!doc.contains("scanner")) return;
  const json& j = doc["scanner"];
  if (!j.is_object()) throw ConfigError("\"scanner\" must be an object");

  try {
    if (j.contains("defaultImageExtensions"))
      s.extensions = j["defaultImageExtensions"].get<std::vector<std::string>>();
    if (j.contains("metadataFieldsToExtract"))
      s.metadata_fields = j["metadataFieldsToExtract"].get<std::vector<std::string>>();
    if (j.contains("databasePath")) s.database_path = j["databasePath"].get<std::string>();
    if (j.contains("logFilePath"))  s.log_file_path = j["logFilePath"].get<std::string>();
    if (j.contains("minFileSize"))  s.min_size = j["minFileSize"].get<int64_t>();
    if (j.contains("maxFileSize"))  s.max_size = j["maxFileSize"].get<int64_t>();
    if (j.contains("databaseBatchSize")) {
      const auto n = j["databaseBatchSize"].get<int64_t>();
      if (n <= 0) throw ConfigError("databaseBatchSize must be positive");
      s.batch_size = static_cast<size_t>(n);
    }
  } catch (const json::exception& e) {
    throw ConfigError(std::string("invalid settings: ") + e.what());
  }
  if (s.min_size < 0 || s.max_size < 0) throw ConfigError("file size bounds must not be negative");
}

ScanSettings load_settings() {
  ScanSettings s;

  const std::string explicitPath = get_env_or("IMGCAT_CONFIG", "");
  const std::string path = explicitPath.empty() ? "imgcat.json" : explicitPath;
  if (std::filesystem::exists(path)) {
    std::ifstream in(path);
    if (!in) throw ConfigError("cannot read settings file: " + path);
    json doc;
    try {
      doc = json::parse(in);
    } catch (const json::parse_error& e) {
      throw ConfigError("invalid JSON in " + path + ": " + e.what());
    }
    apply_settings_json(s, doc);
    spdlog::debug("settings loaded from {}", path);
  } else if (!explicitPath.empty()) {
    throw ConfigError("settings file not found: " + explicitPath);
  }

  s.database_path = get_env_or("IMGCAT_DB_PATH", s.database_path);
  s.log_file_path = get_env_or("IMGCAT_LOG_FILE", s.log_file_path);
  return s;
}

} // namespace imgcat
