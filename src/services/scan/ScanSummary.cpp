#include "ScanSummary.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <utility>
#include <vector>

namespace imgcat {

std::string format_summary(const ScanResult& r) {
  std::ostringstream mb;
  mb << std::fixed << std::setprecision(2) << (double(r.bytes_counted) / (1024.0 * 1024.0)) << " MB";
  std::ostringstream secs;
  secs << std::fixed << std::setprecision(2) << (double(r.elapsed.count()) / 1000.0) << " seconds";

  std::string status = "Completed";
  if (r.fatal_error) status = "Failed: " + *r.fatal_error;
  else if (r.cancelled) status = "Cancelled by user";

  const std::vector<std::pair<std::string, std::string>> rows = {
    {"Total Files Found",                 std::to_string(r.found)},
    {"Files Processed (Added/Updated)",   std::to_string(r.added + r.modified + r.moved)},
    {"  New Files Added",                 std::to_string(r.added)},
    {"  Files Moved/Renamed",             std::to_string(r.moved)},
    {"  Files Content Changed",           std::to_string(r.modified)},
    {"Files Unchanged",                   std::to_string(r.unchanged)},
    {"Files Skipped (Size Filter)",       std::to_string(r.skipped)},
    {"Files with Errors",                 std::to_string(r.errors)},
    {"Total Bytes Processed",             mb.str()},
    {"Total Time Taken",                  secs.str()},
    {"Status",                            status},
  };

  size_t w = 0;
  for (const auto& row : rows) w = std::max(w, row.first.size());

  std::ostringstream out;
  out << "Scan Summary\n" << std::string(w + 2, '-') << "\n";
  for (const auto& [metric, value] : rows) {
    out << std::left << std::setw(static_cast<int>(w) + 2) << metric << value << "\n";
  }
  if (r.discovery_warning) out << "Warning: " << *r.discovery_warning << "\n";
  return out.str();
}

int exit_code(const ScanResult& r) {
  if (r.fatal_error) return 2;
  if (r.cancelled) return 1;
  return 0;
}

} // namespace imgcat
