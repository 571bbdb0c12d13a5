#include "MetadataExtractor.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

static std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return (char)std::tolower(c); });
  return s;
}

bool field_requested(const std::vector<std::string>& fields, const std::string& tag) {
  const std::string key = lower(tag);
  return std::any_of(fields.begin(), fields.end(), [&](const std::string& f) {
    return f == "*" || lower(f) == key;
  });
}

std::optional<int64_t> parse_exif_datetime(const std::string& s) {
  std::tm tm{};
  std::istringstream in(s);
  in >> std::get_time(&tm, "%Y:%m:%d %H:%M:%S");
  if (in.fail()) return std::nullopt;
  if (tm.tm_year < 0 || tm.tm_mon < 0 || tm.tm_mday < 1) return std::nullopt;
  return static_cast<int64_t>(timegm(&tm));
}
