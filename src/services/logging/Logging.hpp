#pragma once
#include <string>

namespace imgcat {

// Installs the default spdlog logger: colored stdout plus, when logFile is
// non-empty, an appending file sink. level is an spdlog level name.
void init_logging(const std::string& logFile, const std::string& level);

} // namespace imgcat
