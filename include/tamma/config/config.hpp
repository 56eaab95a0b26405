#pragma once

#include "tamma/config/system_config.hpp"
#include "tamma/core/error.hpp"

#include <string_view>

namespace tamma {

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<SystemConfig>;
};

}  // namespace tamma
