// src/main.cpp
#include <csignal>
#include <cstdlib>
#include <string>
#include <iostream>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>

#include "core/Cancellation.hpp"
#include "core/Errors.hpp"
#include "core/catalog/InitDb.hpp"
#include "core/catalog/SqliteCatalogStore.hpp"
#include "core/metadata/HeaderMetadataExtractor.hpp"
#include "core/storage/FileDiscoverer.hpp"
#include "core/storage/LocalFSBackend.hpp"
#include "services/config/Settings.hpp"
#include "services/logging/Logging.hpp"
#include "services/scan/ScanRunner.hpp"
#include "services/scan/ScanSummary.hpp"

using imgcat::get_env_or;

// ---------- helpers ----------

// Only the signal handler reaches this; the run itself receives a token.
static CancellationSource* g_interrupt = nullptr;

static void on_sigint(int) {
  if (g_interrupt) g_interrupt->cancel();
}

// Look for schema.sql next to the binary's CWD first (the build copies it there), then fallback.
static std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const std::string fromEnv = get_env_or("IMGCAT_SCHEMA_PATH", "");
  if (!fromEnv.empty()) return fromEnv;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/catalog/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/catalog)");
}

static int64_t parse_size(const std::string& flag, const std::string& v) {
  size_t used = 0;
  long long n = 0;
  try {
    n = std::stoll(v, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (used != v.size() || n < 0) throw std::invalid_argument(flag + " expects a non-negative integer, got '" + v + "'");
  return static_cast<int64_t>(n);
}

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init        # create/upgrade SQLite schema\n"
            << "  " << argv0 << " scan -f|--folder <DIR> [options]\n"
            << "\n"
            << "Scan options:\n"
            << "  -e, --extensions <LIST>   comma-separated extensions (.png,.jpg)\n"
            << "      --min-size <BYTES>    skip files smaller than this\n"
            << "      --max-size <BYTES>    skip files larger than this (0 = no limit)\n"
            << "      --no-subdirs          do not descend into subdirectories\n"
            << "      --batch-size <N>      records per database transaction\n"
            << "      --summary             print a summary table when done\n";
}

struct ScanArgs {
  imgcat::ScanSettings settings;
  bool summary = false;
};

// Applies scan flags on top of the loaded settings and validates the result.
static ScanArgs parse_scan_args(int argc, char** argv, imgcat::ScanSettings base) {
  ScanArgs a{std::move(base), false};
  auto value = [&](int& i, const std::string& flag) -> std::string {
    if (i + 1 >= argc) throw std::invalid_argument(flag + " requires a value");
    return argv[++i];
  };

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "-f" || arg == "--folder") a.settings.root = value(i, arg);
    else if (arg == "-e" || arg == "--extensions") {
      auto exts = imgcat::split_list(value(i, arg));
      if (exts.empty()) throw std::invalid_argument("--extensions must name at least one extension");
      for (auto& e : exts) e = normalize_extension(e);
      a.settings.extensions = std::move(exts);
    }
    else if (arg == "--min-size") a.settings.min_size = parse_size(arg, value(i, arg));
    else if (arg == "--max-size") a.settings.max_size = parse_size(arg, value(i, arg));
    else if (arg == "--no-subdirs") a.settings.recursive = false;
    else if (arg == "--batch-size") {
      const auto n = parse_size(arg, value(i, arg));
      if (n == 0) throw std::invalid_argument("--batch-size must be positive");
      a.settings.batch_size = static_cast<size_t>(n);
    }
    else if (arg == "--summary") a.summary = true;
    else throw std::invalid_argument("unknown option: " + arg);
  }

  if (a.settings.root.empty()) throw std::invalid_argument("Folder path is required.");
  if (!LocalFSBackend().isReadableDirectory(a.settings.root)) {
    throw std::invalid_argument("The specified folder does not exist or cannot be read: " + a.settings.root);
  }
  if (a.settings.max_size > 0 && a.settings.min_size > a.settings.max_size) {
    throw std::invalid_argument("--min-size is larger than --max-size");
  }
  return a;
}

static int run_scan(const ScanArgs& args) {
  const auto& s = args.settings;
  const std::string schemaPath = findSchemaPath();
  // Self-heal DB on startup (idempotent)
  initDatabase(s.database_path, schemaPath);

  SqliteCatalogStore store(s.database_path);
  LocalFSBackend fs;
  HeaderMetadataExtractor metadata(fs);
  imgcat::ScanRunner runner(store, fs, metadata);

  CancellationSource interrupt;
  g_interrupt = &interrupt;
  std::signal(SIGINT, on_sigint);

  spdlog::info("Starting image scan for folder: {}", s.root);
  spdlog::info("Effective settings: extensions [{}], subdirectories: {}, batch size: {}, min size: {}B, max size: {}",
               fmt::join(s.extensions, ", "), s.recursive, s.batch_size, s.min_size,
               s.max_size == 0 ? std::string("unlimited") : std::to_string(s.max_size) + "B");

  const auto result = runner.run(s, interrupt.token());

  std::signal(SIGINT, SIG_DFL);
  g_interrupt = nullptr;

  if (result.ok()) spdlog::info("Scan operation finished.");
  if (args.summary || !result.ok()) std::cout << imgcat::format_summary(result);
  return imgcat::exit_code(result);
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    imgcat::ScanSettings settings = imgcat::load_settings();
    imgcat::init_logging(settings.log_file_path, get_env_or("IMGCAT_LOG_LEVEL", "info"));

    if (argc > 1 && std::string(argv[1]) == "--init") {
      initDatabase(settings.database_path, findSchemaPath());
      std::cout << "DB initialized at: " << settings.database_path << "\n";
      return 0;
    }

    if (argc > 1 && std::string(argv[1]) == "scan") {
      ScanArgs args;
      try {
        args = parse_scan_args(argc, argv, settings);
      } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
      }
      return run_scan(args);
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
