/**
 * @file main.cpp
 * @brief Entry point for the snapkeep command line tool
 */

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "config/config.h"
#include "storage/address_resolver.h"
#include "storage/local_disk_store.h"
#include "storage/retention_sweeper.h"
#include "storage/seaweed_object_store.h"
#include "storage/snapshot_store.h"
#include "storage/source_tag.h"
#include "utils/structured_log.h"
#include "version.h"

namespace {

using snapkeep::storage::TimePoint;

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " [OPTIONS] <command> [args]\n";
  std::cout << "\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>            Configuration file path\n";
  std::cout << "  -o, --output <file>            Write loaded image bytes to file (default: stdout)\n";
  std::cout << "  -t, --config-test              Test configuration file and exit\n";
  std::cout << "  -h, --help                     Show this help message\n";
  std::cout << "  -v, --version                  Show version information\n";
  std::cout << "\n";
  std::cout << "Commands:\n";
  std::cout << "  save <camera> <unix_ts> <image> [notes]   Store a snapshot\n";
  std::cout << "  load <camera> <snapshot_id> [notes]       Load a snapshot\n";
  std::cout << "  thumbnail <camera>                        Load the latest thumbnail\n";
  std::cout << "  export <path> <image>                     Upload a custom thumbnail\n";
  std::cout << "  latest <camera> [remote]                  Print the newest snapshot path\n";
  std::cout << "  range <camera> <unix_ts>                  List snapshots of that hour\n";
  std::cout << "  cleanup <camera> <storage_duration>       Delete expired local day-partitions\n";
  std::cout << "\n";
  std::cout << "Example:\n";
  std::cout << "  " << program << " -c /etc/snapkeep/config.yaml latest front-gate\n";
}

bool ReadFile(const std::string& path, std::string& contents) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return false;
  }
  contents.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
  return true;
}

bool WriteOutput(const std::string& output_path, const std::string& bytes) {
  if (output_path.empty()) {
    std::cout.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(std::cout);
  }
  std::ofstream output(output_path, std::ios::binary | std::ios::trunc);
  output.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(output);
}

std::string FormatIso8601(TimePoint timestamp) {
  const auto day_point = std::chrono::floor<std::chrono::days>(timestamp);
  const std::chrono::year_month_day ymd{day_point};
  const std::chrono::hh_mm_ss<std::chrono::microseconds> time{timestamp - day_point};
  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02uT%02d:%02d:%02dZ", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                static_cast<int>(time.hours().count()), static_cast<int>(time.minutes().count()),
                static_cast<int>(time.seconds().count()));
  return buffer;
}

bool ParseUnixSeconds(const std::string& text, TimePoint& timestamp) {
  char* end = nullptr;
  const double seconds = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0') {
    std::cerr << "Error: invalid timestamp: " << text << "\n";
    return false;
  }
  auto parsed = snapkeep::storage::FromUnixSeconds(seconds);
  if (!parsed) {
    std::cerr << "Error: " << parsed.error().ToString() << "\n";
    return false;
  }
  timestamp = *parsed;
  return true;
}

bool SetupLogging(const snapkeep::config::LoggingConfig& logging) {
  if (!logging.file.empty()) {
    try {
      spdlog::set_default_logger(spdlog::basic_logger_mt("snapkeep", logging.file));
    } catch (const spdlog::spdlog_ex& e) {
      std::cerr << "Error: cannot open log file: " << e.what() << "\n";
      return false;
    }
  } else {
    // Keep stdout free for command output
    spdlog::set_default_logger(spdlog::stderr_color_mt("snapkeep"));
  }
  spdlog::set_level(spdlog::level::from_str(logging.level));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  snapkeep::utils::StructuredLog::SetFormat(logging.json ? snapkeep::utils::LogFormat::JSON
                                                         : snapkeep::utils::LogFormat::TEXT);
  return true;
}

int ReportError(const snapkeep::utils::Error& error) {
  std::cerr << "Error: " << error.ToString() << "\n";
  return 1;
}

/**
 * @brief Storage backends wired from configuration
 */
struct Backends {
  explicit Backends(const snapkeep::config::Config& config)
      : remote(snapkeep::storage::SeaweedOptions{
            config.storage.remote_url,
            static_cast<size_t>(config.remote.upload_pool_size),
            static_cast<size_t>(config.remote.download_pool_size),
            static_cast<size_t>(config.remote.listing_page_size),
            snapkeep::storage::HttpTimeouts{std::chrono::milliseconds(config.remote.connect_timeout_ms),
                                            std::chrono::milliseconds(config.remote.read_timeout_ms),
                                            std::chrono::milliseconds(config.remote.write_timeout_ms)}}),
        store(remote, local, config.storage) {}

  snapkeep::storage::SeaweedObjectStore remote;
  snapkeep::storage::LocalDiskStore local;
  snapkeep::storage::SnapshotStore store;
};

int RunCommand(const snapkeep::config::Config& config, const std::vector<std::string>& args,
               const std::string& output_path) {
  namespace storage = snapkeep::storage;

  const std::string& command = args[0];
  auto require = [&args, &command](size_t count) {
    if (args.size() < count + 1) {
      std::cerr << "Error: " << command << " requires " << count << " argument(s)\n";
      return false;
    }
    return true;
  };

  Backends backends(config);

  if (command == "save") {
    if (!require(3)) {
      return 1;
    }
    TimePoint timestamp;
    if (!ParseUnixSeconds(args[2], timestamp)) {
      return 1;
    }
    std::string image;
    if (!ReadFile(args[3], image)) {
      std::cerr << "Error: cannot read image: " << args[3] << "\n";
      return 1;
    }
    const auto tag = args.size() > 4 ? storage::NotesToTag(args[4]) : storage::SourceTag::kRecordings;
    auto saved = backends.store.Save(args[1], timestamp, image, tag);
    if (!saved) {
      return ReportError(saved.error());
    }
    snapkeep::utils::LogStorageInfo("save", args[1] + " " + FormatIso8601(timestamp) + " (" +
                                                std::string(storage::ToDirectoryName(tag)) + ")");
    return 0;
  }

  if (command == "load") {
    if (!require(2)) {
      return 1;
    }
    const auto tag = args.size() > 3 ? storage::NotesToTag(args[3]) : storage::SourceTag::kRecordings;
    auto bytes = backends.store.Load(args[1], args[2], tag);
    if (!bytes) {
      return ReportError(bytes.error());
    }
    return WriteOutput(output_path, *bytes) ? 0 : 1;
  }

  if (command == "thumbnail") {
    if (!require(1)) {
      return 1;
    }
    auto bytes = backends.store.LoadThumbnail(args[1]);
    if (!bytes) {
      return ReportError(bytes.error());
    }
    return WriteOutput(output_path, *bytes) ? 0 : 1;
  }

  if (command == "export") {
    if (!require(2)) {
      return 1;
    }
    std::string image;
    if (!ReadFile(args[2], image)) {
      std::cerr << "Error: cannot read image: " << args[2] << "\n";
      return 1;
    }
    auto exported = backends.store.SaveThumbnailOverride(args[1], image);
    return exported ? 0 : ReportError(exported.error());
  }

  if (command == "latest") {
    if (!require(1)) {
      return 1;
    }
    const bool remote = args.size() > 2 && args[2] == "remote";
    auto latest = remote ? backends.store.LatestRemote(args[1]) : backends.store.Latest(args[1]);
    if (!latest) {
      return ReportError(latest.error());
    }
    if (latest->has_value()) {
      std::cout << **latest << "\n";
    }
    return 0;
  }

  if (command == "range") {
    if (!require(2)) {
      return 1;
    }
    TimePoint from;
    if (!ParseUnixSeconds(args[2], from)) {
      return 1;
    }
    auto snapshots = backends.store.LoadRange(args[1], from);
    if (!snapshots) {
      return ReportError(snapshots.error());
    }
    for (const auto& snapshot : *snapshots) {
      std::cout << FormatIso8601(snapshot.created_at) << "\t" << snapshot.notes << "\n";
    }
    return 0;
  }

  if (command == "cleanup") {
    if (!require(2)) {
      return 1;
    }
    int storage_duration = 0;
    try {
      storage_duration = std::stoi(args[2]);
    } catch (const std::exception&) {
      std::cerr << "Error: invalid storage_duration: " << args[2] << "\n";
      return 1;
    }
    storage::RetentionSweeper sweeper(backends.local, config.storage.local_root, config.retention);
    auto removed = sweeper.Cleanup(args[1], storage_duration);
    if (!removed) {
      return ReportError(removed.error());
    }
    std::cout << "Removed " << *removed << " day-partition(s)\n";
    return 0;
  }

  std::cerr << "Error: Unknown command: " << command << "\n";
  std::cerr << "Use -h or --help for usage information\n";
  return 1;
}

}  // namespace

/**
 * @brief Main entry point
 * @param argc Argument count
 * @param argv Argument values
 * @return Exit code
 */
int main(int argc, char* argv[]) {
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  bool config_test_mode = false;
  const char* config_path = nullptr;
  std::string output_path;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (!args.empty()) {
      // Everything after the command belongs to it, except -o
      if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
        output_path = argv[++i];
      } else {
        args.push_back(arg);
      }
      continue;
    }
    if (arg == "-h" || arg == "--help") {
      PrintUsage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      std::cout << "snapkeep version " << snapkeep::Version::String() << "\n";
      std::cout << "Camera snapshot storage, retention and liveness tracking\n";
      return 0;
    }
    if (arg == "-t" || arg == "--config-test") {
      config_test_mode = true;
    } else if (arg == "-c" || arg == "--config" || arg == "-o" || arg == "--output") {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << arg << " requires a file path\n";
        return 1;
      }
      if (arg == "-c" || arg == "--config") {
        config_path = argv[++i];
      } else {
        output_path = argv[++i];
      }
    } else if (arg[0] != '-') {
      args.push_back(arg);
    } else {
      std::cerr << "Error: Unknown option: " << arg << "\n";
      std::cerr << "Use -h or --help for usage information\n";
      return 1;
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  snapkeep::config::Config config;
  if (config_path != nullptr) {
    auto config_result = snapkeep::config::LoadConfig(config_path);
    if (!config_result) {
      std::cerr << "Failed to load config: " << config_result.error().message() << "\n";
      return 1;
    }
    config = *config_result;

    if (config_test_mode) {
      std::cout << "Configuration file is valid\n";
      std::cout << "\nConfiguration summary:\n";
      std::cout << "  Storage:\n";
      std::cout << "    local_root: " << config.storage.local_root << "\n";
      std::cout << "    remote_url: " << config.storage.remote_url << "\n";
      std::cout << "    remote_root: " << config.storage.remote_root << "\n";
      std::cout << "  Remote:\n";
      std::cout << "    upload_pool_size: " << config.remote.upload_pool_size << "\n";
      std::cout << "    download_pool_size: " << config.remote.download_pool_size << "\n";
      std::cout << "    listing_page_size: " << config.remote.listing_page_size << "\n";
      std::cout << "  Retention:\n";
      std::cout << "    delete_pause_ms: " << config.retention.delete_pause_ms << "\n";
      std::cout << "    idle_io_priority: " << (config.retention.idle_io_priority ? "true" : "false") << "\n";
      std::cout << "  Liveness:\n";
      std::cout << "    offline_threshold: " << config.liveness.offline_threshold << "\n";
      std::cout << "    persist_timeout_ms: " << config.liveness.persist_timeout_ms << "\n";
      std::cout << "  Cache:\n";
      std::cout << "    max_entries: " << config.cache.max_entries << "\n";
      std::cout << "    camera_ttl_seconds: " << config.cache.camera_ttl_seconds << "\n";
      return 0;
    }
  } else if (config_test_mode) {
    std::cerr << "Error: --config-test requires a configuration file\n";
    return 1;
  }

  if (args.empty()) {
    PrintUsage(argv[0]);
    return 1;
  }

  if (!SetupLogging(config.logging)) {
    return 1;
  }

  return RunCommand(config, args, output_path);
}
