#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace tamma {

struct StorageConfig {
  std::string db_file{"tamma.db"};
  int pool_size{4};
  int busy_timeout_ms{250};
  int max_retries{3};
  int retry_base_delay_ms{10};
  int retry_max_delay_ms{200};
};

struct QueueConfig {
  int default_max_retries{3};
  std::int64_t retry_base_delay_ms{1000};
  std::int64_t retry_max_delay_ms{60000};
  int stats_window{100};
};

struct WorkerConfig {
  std::int64_t heartbeat_timeout_ms{30000};
  int default_concurrency{1};
};

enum class PlatformMode { Standalone, Orchestrator, Worker };

[[nodiscard]] constexpr auto platform_mode_name(PlatformMode mode) noexcept
    -> std::string_view {
  switch (mode) {
    case PlatformMode::Standalone: return "standalone";
    case PlatformMode::Orchestrator: return "orchestrator";
    case PlatformMode::Worker: return "worker";
  }
  return "standalone";
}

[[nodiscard]] constexpr auto parse_platform_mode(std::string_view str) noexcept
    -> PlatformMode {
  if (str == "orchestrator") return PlatformMode::Orchestrator;
  if (str == "worker") return PlatformMode::Worker;
  return PlatformMode::Standalone;
}

// What startup recovery does with a running workflow that has no live task.
enum class RecoveryPolicy { Requeue, Fail, None };

[[nodiscard]] constexpr auto recovery_policy_name(RecoveryPolicy p) noexcept
    -> std::string_view {
  switch (p) {
    case RecoveryPolicy::Requeue: return "requeue";
    case RecoveryPolicy::Fail: return "fail";
    case RecoveryPolicy::None: return "none";
  }
  return "requeue";
}

[[nodiscard]] constexpr auto parse_recovery_policy(std::string_view str) noexcept
    -> RecoveryPolicy {
  if (str == "fail") return RecoveryPolicy::Fail;
  if (str == "none") return RecoveryPolicy::None;
  return RecoveryPolicy::Requeue;
}

struct OrchestratorConfig {
  PlatformMode mode{PlatformMode::Standalone};
  std::string log_level{"info"};
  std::string log_file;
  std::int64_t drain_timeout_ms{30000};
  std::int64_t drain_poll_interval_ms{100};
  RecoveryPolicy recovery{RecoveryPolicy::Requeue};
  bool reap_orphaned_tasks{false};
};

struct SystemConfig {
  StorageConfig storage;
  QueueConfig queue;
  WorkerConfig workers;
  OrchestratorConfig orchestrator;
};

}  // namespace tamma
