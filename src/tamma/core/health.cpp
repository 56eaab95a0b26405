#include "tamma/core/health.hpp"

namespace tamma {

auto HealthReport::to_json() const -> nlohmann::json {
  auto comps = nlohmann::json::array();
  for (const auto& c : components) {
    comps.push_back(
        {{"name", c.name}, {"healthy", c.healthy}, {"detail", c.detail}});
  }
  return {{"status", healthy ? "healthy" : "unhealthy"},
          {"components", std::move(comps)}};
}

}  // namespace tamma
