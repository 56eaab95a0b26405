#pragma once

#include "tamma/util/clock.hpp"
#include "tamma/util/id.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace tamma {

struct Worker {
  WorkerId id;
  std::vector<std::string> capabilities;  // sorted, unique
  int max_concurrency{1};
  std::vector<TaskId> current_tasks;
  TimePoint registered_at{};
  TimePoint last_heartbeat_at{};
  std::int64_t tasks_completed{0};
  std::int64_t tasks_failed{0};

  [[nodiscard]] auto has_capability(std::string_view tag) const -> bool {
    return std::ranges::binary_search(capabilities, tag, std::less<>{});
  }

  [[nodiscard]] auto has_capacity() const noexcept -> bool {
    return static_cast<int>(current_tasks.size()) < max_concurrency;
  }
};

[[nodiscard]] auto worker_to_json(const Worker& worker) -> nlohmann::json;

}  // namespace tamma
