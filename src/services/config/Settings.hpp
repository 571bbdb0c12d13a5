#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace imgcat {

struct ScanSettings {
  std::string root;
  std::vector<std::string> extensions{".png", ".jpg", ".jpeg", ".bmp", ".gif"};
  bool        recursive = true;
  int64_t     min_size = 0;
  int64_t     max_size = 0;     // 0 = no upper bound
  size_t      batch_size = 100;
  std::vector<std::string> metadata_fields{
    "Make", "Model", "Date/Time Original", "Image Width", "Image Height",
    "Exposure Time", "F-Number"};
  std::string database_path = "data/image_scanner.db";
  std::string log_file_path = "image_scanner.log";
};

std::string get_env_or(const char* key, const std::string& defval);

// "a, b,,c" -> {"a","b","c"}
std::vector<std::string> split_list(const std::string& csv);

// Overlays the keys present in the "scanner" object. Throws ConfigError on
// wrong types or out-of-range values.
void apply_settings_json(ScanSettings& s, const nlohmann::json& doc);

// Defaults, then the JSON file (IMGCAT_CONFIG or ./imgcat.json, when present),
// then IMGCAT_DB_PATH / IMGCAT_LOG_FILE.
ScanSettings load_settings();

} // namespace imgcat
