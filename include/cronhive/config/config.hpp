#pragma once

#include "cronhive/config/system_config.hpp"
#include "cronhive/core/error.hpp"

#include <string_view>

namespace cronhive {

using Config = SystemConfig;

/// TOML loader. Values from the file can be overridden by CRONHIVE_*
/// environment variables; the merged result is validated before it is
/// returned.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto validate(const SystemConfig &cfg) -> Result<void>;
};

} // namespace cronhive
