#pragma once

#include "tamma/core/lockfree_queue.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <format>
#include <print>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace tamma::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warn, Error };

[[nodiscard]] constexpr auto level_name(Level level) noexcept
    -> std::string_view {
  constexpr std::string_view names[] = {"trace", "debug", "info", "warn",
                                        "error"};
  return names[static_cast<std::uint8_t>(level)];
}

[[nodiscard]] constexpr auto parse_level(std::string_view name) noexcept
    -> Level {
  if (name == "trace") return Level::Trace;
  if (name == "debug") return Level::Debug;
  if (name == "warn") return Level::Warn;
  if (name == "error") return Level::Error;
  return Level::Info;
}

inline thread_local std::string t_line = [] {
  std::string s;
  s.reserve(1024);
  return s;
}();

// Producers format on their own thread and hand finished lines to a single
// writer thread. When the ring is full or the writer is not running, lines
// are written synchronously.
class Logger {
  static constexpr std::size_t kQueueCapacity = 8192;
  static constexpr std::size_t kBatchSize = 64;

  std::atomic<Level> level_{Level::Info};
  std::atomic<bool> running_{false};
  std::atomic<bool> accepting_{false};
  std::atomic<std::FILE*> out_{stdout};
  BoundedMPSCQueue<std::string> queue_{kQueueCapacity};
  std::thread writer_;

  auto writer_loop() -> void {
    std::vector<std::string> batch;
    batch.reserve(kBatchSize);
    while (running_.load(std::memory_order_acquire)) {
      batch.clear();
      while (batch.size() < kBatchSize) {
        auto line = queue_.try_pop();
        if (!line) break;
        batch.push_back(std::move(*line));
      }
      if (batch.empty()) {
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        continue;
      }
      auto* out = out_.load(std::memory_order_acquire);
      for (const auto& line : batch) {
        std::print(out, "{}", line);
      }
      std::fflush(out);
    }
    // accepting_ is already false here, nothing new can arrive
    auto* out = out_.load(std::memory_order_acquire);
    while (auto line = queue_.try_pop()) {
      std::print(out, "{}", *line);
    }
    std::fflush(out);
  }

public:
  Logger() = default;
  ~Logger() {
    stop();
    if (auto* out = out_.load(); out != stdout && out != stderr) {
      std::fclose(out);
    }
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  auto start() -> void {
    if (running_.exchange(true)) return;
    accepting_.store(true, std::memory_order_release);
    writer_ = std::thread([this] { writer_loop(); });
  }

  auto stop() -> void {
    accepting_.store(false, std::memory_order_release);
    std::atomic_thread_fence(std::memory_order_seq_cst);
    if (!running_.exchange(false)) return;
    if (writer_.joinable()) writer_.join();
  }

  // Must be called before start(); an unopenable path keeps the current sink.
  auto open_file(const std::string& path) -> bool {
    auto* file = std::fopen(path.c_str(), "a");
    if (file == nullptr) return false;
    auto* previous = out_.exchange(file);
    if (previous != stdout && previous != stderr) std::fclose(previous);
    return true;
  }

  auto set_level(Level level) noexcept -> void {
    level_.store(level, std::memory_order_release);
  }

  [[nodiscard]] auto level() const noexcept -> Level {
    return level_.load(std::memory_order_acquire);
  }

  template <typename... Args>
  auto log(Level level, std::format_string<Args...> fmt, Args&&... args)
      -> void {
    if (level < level_.load(std::memory_order_acquire)) return;

    auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    auto tid =
        std::hash<std::thread::id>{}(std::this_thread::get_id()) % 1000000;

    auto& line = t_line;
    line.clear();
    std::format_to(std::back_inserter(line), "[{:%Y-%m-%d %H:%M:%S}] [{}] [{}] ",
                   now, level_name(level), tid);
    std::format_to(std::back_inserter(line), fmt, std::forward<Args>(args)...);
    line.push_back('\n');

    if (!accepting_.load(std::memory_order_acquire)) {
      std::print(out_.load(std::memory_order_acquire), "{}", line);
      return;
    }
    std::string owned{line};
    if (!queue_.push(owned)) {
      std::print(out_.load(std::memory_order_acquire), "{}", owned);
    }
  }
};

inline Logger& logger() {
  static Logger instance;
  return instance;
}

inline auto set_level(Level level) noexcept -> void {
  logger().set_level(level);
}

inline auto set_level(std::string_view name) noexcept -> void {
  logger().set_level(parse_level(name));
}

inline auto start() -> void {
  logger().start();
}

inline auto stop() -> void {
  logger().stop();
}

template <typename... Args>
auto trace(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto debug(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto info(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Info, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto warn(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args>
auto error(std::format_string<Args...> fmt, Args&&... args) -> void {
  logger().log(Level::Error, fmt, std::forward<Args>(args)...);
}

}  // namespace tamma::log
