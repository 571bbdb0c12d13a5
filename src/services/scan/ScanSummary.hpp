#pragma once
#include <string>

#include "services/scan/ScanTypes.hpp"

namespace imgcat {

std::string format_summary(const ScanResult& r);

// 0 completed, 1 cancelled, 2 fatal error.
int exit_code(const ScanResult& r);

} // namespace imgcat
