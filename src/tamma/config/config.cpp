#include "tamma/config/config.hpp"

#include "tamma/config/yaml_utils.hpp"
#include "tamma/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<tamma::StorageConfig> {
  static bool decode(const Node& node, tamma::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    tamma::StorageConfig d;
    s.db_file = tamma::yaml_get_or<std::string>(node, "db_file", d.db_file);
    s.pool_size = tamma::yaml_get_or(node, "pool_size", d.pool_size);
    s.busy_timeout_ms =
        tamma::yaml_get_or(node, "busy_timeout_ms", d.busy_timeout_ms);
    s.max_retries = tamma::yaml_get_or(node, "max_retries", d.max_retries);
    s.retry_base_delay_ms =
        tamma::yaml_get_or(node, "retry_base_delay_ms", d.retry_base_delay_ms);
    s.retry_max_delay_ms =
        tamma::yaml_get_or(node, "retry_max_delay_ms", d.retry_max_delay_ms);
    return true;
  }
};

template <>
struct convert<tamma::QueueConfig> {
  static bool decode(const Node& node, tamma::QueueConfig& q) {
    if (!node.IsMap()) {
      return false;
    }
    tamma::QueueConfig d;
    q.default_max_retries =
        tamma::yaml_get_or(node, "default_max_retries", d.default_max_retries);
    q.retry_base_delay_ms =
        tamma::yaml_get_or(node, "retry_base_delay_ms", d.retry_base_delay_ms);
    q.retry_max_delay_ms =
        tamma::yaml_get_or(node, "retry_max_delay_ms", d.retry_max_delay_ms);
    q.stats_window = tamma::yaml_get_or(node, "stats_window", d.stats_window);
    return true;
  }
};

template <>
struct convert<tamma::WorkerConfig> {
  static bool decode(const Node& node, tamma::WorkerConfig& w) {
    if (!node.IsMap()) {
      return false;
    }
    tamma::WorkerConfig d;
    w.heartbeat_timeout_ms = tamma::yaml_get_or(node, "heartbeat_timeout_ms",
                                                d.heartbeat_timeout_ms);
    w.default_concurrency =
        tamma::yaml_get_or(node, "default_concurrency", d.default_concurrency);
    return true;
  }
};

template <>
struct convert<tamma::OrchestratorConfig> {
  static bool decode(const Node& node, tamma::OrchestratorConfig& o) {
    if (!node.IsMap()) {
      return false;
    }
    tamma::OrchestratorConfig d;
    o.mode = tamma::parse_platform_mode(
        tamma::yaml_get_or<std::string>(node, "mode", "standalone"));
    o.log_level = tamma::yaml_get_or<std::string>(node, "log_level", "info");
    o.log_file = tamma::yaml_get_or<std::string>(node, "log_file", "");
    o.drain_timeout_ms =
        tamma::yaml_get_or(node, "drain_timeout_ms", d.drain_timeout_ms);
    o.drain_poll_interval_ms = tamma::yaml_get_or(
        node, "drain_poll_interval_ms", d.drain_poll_interval_ms);
    o.recovery = tamma::parse_recovery_policy(
        tamma::yaml_get_or<std::string>(node, "recovery", "requeue"));
    o.reap_orphaned_tasks =
        tamma::yaml_get_or(node, "reap_orphaned_tasks", d.reap_orphaned_tasks);
    return true;
  }
};

template <>
struct convert<tamma::SystemConfig> {
  static bool decode(const Node& node, tamma::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<tamma::StorageConfig>();
    }
    if (auto queue = node["queue"]) {
      c.queue = queue.as<tamma::QueueConfig>();
    }
    if (auto workers = node["workers"]) {
      c.workers = workers.as<tamma::WorkerConfig>();
    }
    if (auto orchestrator = node["orchestrator"]) {
      c.orchestrator = orchestrator.as<tamma::OrchestratorConfig>();
    }
    return true;
  }
};

}  // namespace YAML

namespace tamma {

namespace {

auto validate(const SystemConfig& c) -> Result<void> {
  auto reject = [](std::string_view what) {
    log::error("Invalid configuration: {}", what);
    return fail(Error::ValidationFailed);
  };
  if (c.storage.db_file.empty()) return reject("storage.db_file is empty");
  if (c.storage.pool_size < 1) return reject("storage.pool_size < 1");
  if (c.storage.max_retries < 0) return reject("storage.max_retries < 0");
  if (c.queue.default_max_retries < 0)
    return reject("queue.default_max_retries < 0");
  if (c.queue.retry_base_delay_ms <= 0 ||
      c.queue.retry_max_delay_ms < c.queue.retry_base_delay_ms)
    return reject("queue retry delays");
  if (c.queue.stats_window < 1) return reject("queue.stats_window < 1");
  if (c.workers.heartbeat_timeout_ms <= 0)
    return reject("workers.heartbeat_timeout_ms <= 0");
  if (c.workers.default_concurrency < 1)
    return reject("workers.default_concurrency < 1");
  if (c.orchestrator.drain_timeout_ms < 0)
    return reject("orchestrator.drain_timeout_ms < 0");
  if (c.orchestrator.drain_poll_interval_ms <= 0)
    return reject("orchestrator.drain_poll_interval_ms <= 0");
  return ok();
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::ifstream file{std::string(path)};
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  SystemConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    config = root.as<SystemConfig>();
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
  if (auto r = validate(config); !r) {
    return fail(r.error());
  }
  return ok(std::move(config));
}

}  // namespace tamma
