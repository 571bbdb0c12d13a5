#include "Logging.hpp"
#include <filesystem>
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace imgcat {

void init_logging(const std::string& logFile, const std::string& level) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!logFile.empty()) {
    const auto parent = std::filesystem::path(logFile).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, false));
  }

  auto logger = std::make_shared<spdlog::logger>("imgcat", sinks.begin(), sinks.end());
  logger->set_level(spdlog::level::from_str(level));
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_default_logger(logger);
}

} // namespace imgcat
