#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace tamma {

struct ComponentHealth {
  std::string name;
  bool healthy{false};
  std::string detail;
};

// Binary by contract: healthy only when every component is.
struct HealthReport {
  bool healthy{false};
  std::vector<ComponentHealth> components;

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

}  // namespace tamma
