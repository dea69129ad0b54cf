#pragma once

#include "planq/config/system_config.hpp"
#include "planq/core/error.hpp"

#include <string_view>

namespace planq {

using Config = SystemConfig;

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
};

} // namespace planq
