/**
 * @file main.cpp
 * @brief btcatalog command line scanner
 *
 * Prints the aggregated device catalog as JSON on stdout. Logs go to
 * stderr (and to the configured log file).
 *
 * Exit codes: 0 success, 1 every source failed, 2 bad arguments,
 * configuration or request.
 */

#include <btcatalog/btcatalog.h>

#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_TOTAL_FAILURE = 1;
constexpr int EXIT_USAGE = 2;

/// Longest scan plus the largest grace period
constexpr long long MAX_DEADLINE_MS =
    static_cast<long long>(btcatalog::MAX_SCAN_SECONDS) * 1000 +
    btcatalog::MAX_GRACE_PERIOD_MS;

struct CliOptions {
  std::optional<double> duration;
  std::optional<std::string> filter;
  std::vector<std::string> sources;
  bool sequential = false;
  std::optional<btcatalog::ScanPreset> preset;
  std::optional<long long> deadline_ms;
  std::string config_path;
  bool no_enrich = false;
  bool sort_signal = false;
  bool list_sources = false;
  bool verbose = false;
  bool help = false;
  bool version = false;
};

void print_usage(std::ostream &out) {
  out << "Usage: btcatalog-cli [options]\n"
         "\n"
         "Options:\n"
         "  --duration <seconds>   Scan duration\n"
         "  --filter <name>        Keep devices whose name contains <name>\n"
         "  --source <id>          Source to run (repeatable)\n"
         "  --sequential           Run sources one after another\n"
         "  --preset <name>        standard, fast or thorough\n"
         "  --deadline-ms <ms>     Hard limit for the whole scan\n"
         "  --config <path>        Configuration file\n"
         "  --no-enrich            Skip vendor and name enrichment\n"
         "  --sort-signal          Strongest signal first\n"
         "  --list-sources         Print the available sources and exit\n"
         "  --verbose              Debug logging\n"
         "  --version              Print the version and exit\n"
         "  --help                 Show this help\n";
}

/// Parse argv; error message on failure
std::optional<std::string> parse_args(int argc, char *argv[],
                                      CliOptions &options) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;

    try {
      if (arg == "--duration" && has_value) {
        options.duration = std::stod(argv[++i]);
      } else if (arg == "--filter" && has_value) {
        options.filter = argv[++i];
      } else if (arg == "--source" && has_value) {
        options.sources.emplace_back(argv[++i]);
      } else if (arg == "--sequential") {
        options.sequential = true;
      } else if (arg == "--preset" && has_value) {
        options.preset = btcatalog::parse_scan_preset(argv[++i]);
        if (!options.preset) {
          return "Unknown preset: " + std::string(argv[i]);
        }
      } else if (arg == "--deadline-ms" && has_value) {
        options.deadline_ms = std::stoll(argv[++i]);
        if (*options.deadline_ms <= 0 ||
            *options.deadline_ms > MAX_DEADLINE_MS) {
          return std::string("--deadline-ms must be between 1 and ") +
                 std::to_string(MAX_DEADLINE_MS);
        }
      } else if (arg == "--config" && has_value) {
        options.config_path = argv[++i];
      } else if (arg == "--no-enrich") {
        options.no_enrich = true;
      } else if (arg == "--sort-signal") {
        options.sort_signal = true;
      } else if (arg == "--list-sources") {
        options.list_sources = true;
      } else if (arg == "--verbose" || arg == "-v") {
        options.verbose = true;
      } else if (arg == "--version") {
        options.version = true;
      } else if (arg == "--help" || arg == "-h") {
        options.help = true;
      } else {
        return "Unknown or incomplete option: " + arg;
      }
    } catch (const std::logic_error &) {
      return "Invalid number for " + arg + ": " + argv[i];
    }
  }
  return std::nullopt;
}

void print_error(const btcatalog::Error &error) {
  nlohmann::json j;
  j["error"] = btcatalog::error_to_json(error);
  std::cout << j.dump(2) << std::endl;
}

} // namespace

int main(int argc, char *argv[]) {
  using namespace btcatalog;

  CliOptions options;
  if (auto problem = parse_args(argc, argv, options)) {
    std::cerr << "btcatalog-cli: " << *problem << "\n\n";
    print_usage(std::cerr);
    return EXIT_USAGE;
  }

  if (options.help) {
    print_usage(std::cout);
    return EXIT_OK;
  }
  if (options.version) {
    std::cout << "btcatalog-cli " << get_version().version_string << std::endl;
    return EXIT_OK;
  }

  // ==========================================================================
  // Configuration and logging
  // ==========================================================================

  ConfigManager config_manager;
  auto loaded = config_manager.init(options.config_path);
  if (loaded.is_error()) {
    std::cerr << "btcatalog-cli: " << loaded.error().to_string() << std::endl;
    return EXIT_USAGE;
  }

  CatalogConfig config = config_manager.get();
  if (options.verbose) {
    config.log_level = "debug";
  }
  if (options.no_enrich) {
    config.enrich = false;
  }

  auto logging = log::init(config.log_config());
  if (logging.is_error()) {
    std::cerr << "btcatalog-cli: " << logging.error().to_string() << std::endl;
    return EXIT_USAGE;
  }

  Catalog catalog;
  auto ready = catalog.init(config);
  if (ready.is_error()) {
    log::get()->error("Startup failed: {}", ready.error().to_string());
    print_error(ready.error());
    return EXIT_USAGE;
  }

  if (options.list_sources) {
    nlohmann::json ids = catalog.sources().ids();
    std::cout << ids.dump(2) << std::endl;
    return EXIT_OK;
  }

  // ==========================================================================
  // Scan
  // ==========================================================================

  ScanRequest request =
      options.preset ? make_preset_request(*options.preset, config)
                     : make_request(config);
  if (options.duration) {
    request.duration_seconds = *options.duration;
  }
  if (!options.sources.empty()) {
    request.sources = options.sources;
  }
  if (options.sequential) {
    request.concurrent = false;
  }
  request.filter_name = normalize_filter_name(options.filter);
  if (options.deadline_ms) {
    request.deadline = std::chrono::steady_clock::now() +
                       std::chrono::milliseconds(*options.deadline_ms);
  }

  auto result = catalog.scan(request);
  if (result.is_error()) {
    print_error(result.error());
    return result.error().code == ErrorCode::TotalFailure ? EXIT_TOTAL_FAILURE
                                                          : EXIT_USAGE;
  }

  JsonOptions json_options;
  json_options.sort_by_signal = options.sort_signal;
  std::cout << to_json(result.value(), json_options) << std::endl;
  return EXIT_OK;
}
