#pragma once

#include "simqueue/config/system_config.hpp"
#include "simqueue/core/error.hpp"

#include <string_view>

namespace simqueue {

using Config = SystemConfig;

/// Reads TOML, then applies SIMQUEUE_* environment overrides, then
/// validates. Any malformed value yields Error::ParseError.
class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<SystemConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<SystemConfig>;
};

} // namespace simqueue
