#include "tamma/app/orchestrator.hpp"
#include "tamma/config/config.hpp"
#include "tamma/events/event_sink.hpp"
#include "tamma/util/clock.hpp"
#include "tamma/util/log.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <print>
#include <string>
#include <string_view>
#include <thread>

namespace {

std::atomic<bool> g_shutdown_requested{false};

void signal_handler(int) {
  g_shutdown_requested.store(true, std::memory_order_release);
}

void print_usage(const char* prog) {
  std::println("tamma - autonomous workflow orchestration core");
  std::println("Usage: {} [OPTIONS]", prog);
  std::println("");
  std::println("Options:");
  std::println("  -c, --config <file>   Config file (YAML)");
  std::println("  --db <file>           Database file (overrides storage.db_file)");
  std::println("  -v, --version         Show version and exit");
  std::println("  -h, --help            Show this help message");
}

void print_version() {
  std::println("tamma v0.1.0");
}

struct Options {
  std::string config_file;
  std::string db_file;
};

auto parse_args(int argc, char* argv[]) -> Options {
  Options opts;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      std::exit(0);
    } else if (arg == "-v" || arg == "--version") {
      print_version();
      std::exit(0);
    } else if (arg == "-c" || arg == "--config") {
      if (++i >= argc) {
        std::println(stderr, "Error: --config requires an argument");
        std::exit(1);
      }
      opts.config_file = argv[i];
    } else if (arg == "--db") {
      if (++i >= argc) {
        std::println(stderr, "Error: --db requires an argument");
        std::exit(1);
      }
      opts.db_file = argv[i];
    } else {
      std::println(stderr, "Unknown option: {}", arg);
      print_usage(argv[0]);
      std::exit(1);
    }
  }

  return opts;
}

auto load_config(const Options& opts) -> tamma::Result<tamma::SystemConfig> {
  tamma::SystemConfig config;
  if (!opts.config_file.empty()) {
    auto loaded = tamma::ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      return loaded;
    }
    config = std::move(*loaded);
  }
  if (!opts.db_file.empty()) {
    config.storage.db_file = opts.db_file;
  }
  return config;
}

void setup_logging(const tamma::OrchestratorConfig& cfg) {
  if (!cfg.log_file.empty() && !tamma::log::logger().open_file(cfg.log_file)) {
    std::println(stderr, "Warning: cannot open log file {}, using stdout",
                 cfg.log_file);
  }
  tamma::log::set_level(cfg.log_level);
  tamma::log::start();
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = parse_args(argc, argv);

  auto config = load_config(opts);
  if (!config) {
    std::println(stderr, "Error: Failed to load config {}: {}",
                 opts.config_file, config.error().message());
    return 1;
  }

  setup_logging(config->orchestrator);

  tamma::LogEventSink events;
  tamma::SystemClock clock;
  tamma::Orchestrator orchestrator(std::move(*config), events, clock);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  if (auto r = orchestrator.start(); !r) {
    tamma::log::error("Startup failed: {}", r.error().message());
    tamma::log::stop();
    return 1;
  }

  while (!g_shutdown_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  tamma::log::info("Received shutdown signal, draining...");

  auto report = orchestrator.shutdown();
  tamma::log::info("Shutdown report: {}", report.to_json().dump());
  tamma::log::stop();
  return 0;
}
